#pragma once
#include <iosfwd>
#include <string>
#include <vector>
#include "../common/config.hpp"

// deltasync [options] <command> <arguments>
class CommandLine {
public:
    // exit status: 0 on success, 1 on failure or usage error
    int run(int argc, char** argv);
    int run(const std::vector<std::string>& args);

    static void printHelp(std::ostream& out);

private:
    // consumes leading options, false on a malformed one
    bool parseOptions(const std::vector<std::string>& args, size_t& index);
    int handleCommand(const std::string& command, const std::vector<std::string>& operands);

    int signature(const std::string& basisPath, const std::string& signaturePath) const;
    int delta(const std::string& signaturePath, const std::string& newPath, const std::string& deltaPath) const;
    int patch(const std::string& basisPath, const std::string& deltaPath, const std::string& outputPath) const;
    int sync(const std::string& sourcePath, const std::string& destPath) const;
    int server(const std::string& port) const;
    int push(const std::string& host, const std::string& port, const std::string& localPath, const std::string& remotePath) const;
    int pull(const std::string& host, const std::string& port, const std::string& remotePath, const std::string& localPath) const;

    SyncConfig config_;
};
