#include "command_line.hpp"
#include "client_session.hpp"
#include "delta_sync.hpp"
#include "server_mode.hpp"
#include "../common/log.hpp"
#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <iostream>
#include <map>
#include <sstream>

namespace {

    template<typename T>
    bool parseNumber(const std::string& text, T& value) {
        std::istringstream iss(text);
        iss >> value;
        return !iss.fail() && iss.eof() && text.find('-') == std::string::npos;
    }

    int fail(const Result<void>& result) {
        Log::error("Client", std::string(errorKindName(result.kind)) + ": " + result.message);
        return 1;
    }

    // streams into a new file, nothing is left behind when the stream fails
    Result<void> writeStream(ByteStream& stream, const std::string& path) {
        FileSink output(path);
        Result<void> opened = output.open();
        if (!opened.success) return opened;

        Result<void> written = Result<void>::Ok();
        while (written.success) {
            auto chunk = stream.next();
            if (!chunk.success) {
                written = Result<void>::Error(chunk);
                break;
            }
            if (!chunk.data) break;
            written = output.write(chunk.data->data(), chunk.data->size());
        }
        Result<void> closed = output.close();
        if (written.success && closed.success) return written;

        std::error_code ec;
        std::filesystem::remove(path, ec);
        return written.success ? closed : written;
    }
}

int CommandLine::run(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return run(args);
}

int CommandLine::run(const std::vector<std::string>& args) {
    if (std::find(args.begin(), args.end(), "--help") != args.end()) {
        printHelp(std::cout);
        return 0;
    }

    size_t index = 0;
    if (!parseOptions(args, index)) {
        printHelp(std::cerr);
        return 1;
    }
    if (index >= args.size()) {
        std::cerr << "Insufficient arguments\n";
        printHelp(std::cerr);
        return 1;
    }

    Result<void> valid = config_.validate();
    if (!valid.success) return fail(valid);

    std::vector<std::string> operands(args.begin() + static_cast<std::ptrdiff_t>(index) + 1, args.end());
    return handleCommand(args[index], operands);
}

bool CommandLine::parseOptions(const std::vector<std::string>& args, size_t& index) {
    while (index < args.size() && args[index].rfind("--", 0) == 0) {
        const std::string option = args[index++];
        if (option == "--verbose") {
            Log::setLevel(LogLevel::Debug);
            continue;
        }
        if (option == "--quiet") {
            Log::setLevel(LogLevel::Error);
            continue;
        }
        if (index >= args.size()) {
            std::cerr << "Missing value for " << option << "\n";
            return false;
        }
        const std::string value = args[index++];
        bool parsed = false;
        if (option == "--buffer-size") {
            parsed = parseNumber(value, config_.bufferSize);
        } else if (option == "--block-length") {
            parsed = parseNumber(value, config_.blockLength);
        } else if (option == "--strong-length") {
            parsed = parseNumber(value, config_.strongLength);
        } else if (option == "--format") {
            parsed = parseSignatureFormat(value, config_.signatureFormat);
        } else {
            std::cerr << "Unknown option " << option << "\n";
            return false;
        }
        if (!parsed) {
            std::cerr << "Invalid value for " << option << ": " << value << "\n";
            return false;
        }
    }
    return true;
}

int CommandLine::handleCommand(const std::string& command, const std::vector<std::string>& operands) {
    static const std::map<std::string, size_t> arity = {
        {"signature", 2}, {"delta", 3}, {"patch", 3}, {"sync", 2},
        {"push", 4}, {"pull", 4}
    };

    if (command == "server") {
        if (operands.size() > 1) {
            std::cerr << "Usage error: server takes at most 1 argument\n";
            printHelp(std::cerr);
            return 1;
        }
        return server(operands.empty() ? std::to_string(Config::DEFAULT_PORT) : operands[0]);
    }

    auto expected = arity.find(command);
    if (expected == arity.end()) {
        std::cerr << "Unknown command " << command << "\n";
        printHelp(std::cerr);
        return 1;
    }
    if (operands.size() != expected->second) {
        std::cerr << "Usage error: " << command << " takes " << expected->second << " arguments\n";
        printHelp(std::cerr);
        return 1;
    }

    const auto& a = operands;
    if (command == "signature") return signature(a[0], a[1]);
    if (command == "delta") return delta(a[0], a[1], a[2]);
    if (command == "patch") return patch(a[0], a[1], a[2]);
    if (command == "sync") return sync(a[0], a[1]);
    if (command == "push") return push(a[0], a[1], a[2], a[3]);
    return pull(a[0], a[1], a[2], a[3]);
}

int CommandLine::signature(const std::string& basisPath, const std::string& signaturePath) const {
    DeltaSync deltaSync(config_);
    SignatureStream stream = deltaSync.signatureStream(basisPath);
    Result<void> written = writeStream(stream, signaturePath);
    if (!written.success) return fail(written);
    Log::info("Client", "Signature of " + basisPath + " written to " + signaturePath);
    return 0;
}

int CommandLine::delta(const std::string& signaturePath, const std::string& newPath, const std::string& deltaPath) const {
    DeltaSync deltaSync(config_);
    auto handle = deltaSync.loadSignature(std::make_unique<FileSource>(signaturePath));
    if (!handle.success) return fail(Result<void>::Error(handle));

    DeltaStream stream = deltaSync.deltaStream(newPath, handle.data);
    Result<void> written = writeStream(stream, deltaPath);
    if (!written.success) return fail(written);
    Log::info("Client", "Delta of " + newPath + " written to " + deltaPath);
    return 0;
}

int CommandLine::patch(const std::string& basisPath, const std::string& deltaPath, const std::string& outputPath) const {
    DeltaSync deltaSync(config_);
    Result<void> patched = deltaSync.applyPatchFile(deltaPath, basisPath, outputPath);
    if (!patched.success) return fail(patched);
    Log::info("Client", "Patched " + basisPath + " into " + outputPath);
    return 0;
}

int CommandLine::sync(const std::string& sourcePath, const std::string& destPath) const {
    DeltaSync deltaSync(config_);
    Result<void> synced = deltaSync.syncFile(sourcePath, destPath);
    return synced.success ? 0 : fail(synced);
}

int CommandLine::server(const std::string& port) const {
    int portNumber = 0;
    if (!parseNumber(port, portNumber) || portNumber > 65535) {
        std::cerr << "Invalid port " << port << "\n";
        return 1;
    }
    ServerMode serverMode(portNumber, config_);
    Result<void> served = serverMode.startServer();
    return served.success ? 0 : fail(served);
}

int CommandLine::push(const std::string& host, const std::string& port,
                      const std::string& localPath, const std::string& remotePath) const {
    int portNumber = 0;
    if (!parseNumber(port, portNumber) || portNumber > 65535) {
        std::cerr << "Invalid port " << port << "\n";
        return 1;
    }
    ClientSession session(host, portNumber, 0, config_);
    Result<void> connected = session.connectToServer();
    if (!connected.success) return fail(connected);
    Result<void> pushed = session.push(localPath, remotePath);
    return pushed.success ? 0 : fail(pushed);
}

int CommandLine::pull(const std::string& host, const std::string& port,
                      const std::string& remotePath, const std::string& localPath) const {
    int portNumber = 0;
    if (!parseNumber(port, portNumber) || portNumber > 65535) {
        std::cerr << "Invalid port " << port << "\n";
        return 1;
    }
    ClientSession session(host, portNumber, 0, config_);
    Result<void> connected = session.connectToServer();
    if (!connected.success) return fail(connected);
    Result<void> pulled = session.pull(remotePath, localPath);
    return pulled.success ? 0 : fail(pulled);
}

void CommandLine::printHelp(std::ostream& out) {
    out << "Usage: deltasync [options] <command> <arguments>\n"
        << "Commands:\n"
        << " signature <basis> <signature>           Write the signature of basis\n"
        << " delta <signature> <new> <delta>         Write the delta turning the signed file into new\n"
        << " patch <basis> <delta> <output>          Rebuild the new file from basis and delta\n"
        << " sync <source> <dest>                    Make dest identical to source\n"
        << " server [port]                           Serve push and pull requests (default port "
        << Config::DEFAULT_PORT << ")\n"
        << " push <host> <port> <local> <remote>     Push the local content to the remote file\n"
        << " pull <host> <port> <remote> <local>     Pull the remote content to the local file\n"
        << "Options:\n"
        << " --buffer-size <bytes>                   Pipeline buffer size (default "
        << Config::DEFAULT_BUFFER_SIZE << ")\n"
        << " --block-length <bytes>                  Signature block length, 0 picks from file size\n"
        << " --strong-length <bytes>                 Strong hash length, 0 picks from file size\n"
        << " --format sha1|blake2                    Strong hash of new signatures (default blake2)\n"
        << " --verbose                               Debug output\n"
        << " --quiet                                 Errors only\n";
}
