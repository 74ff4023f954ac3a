#include "patch_applier.hpp"
#include "../common/job_driver.hpp"
#include "../common/log.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

PatchApplier::PatchApplier(const SyncConfig& config, std::shared_ptr<TransformEngine> engine)
    : config_(config), engine_(std::move(engine)) {}

std::string PatchApplier::temporaryPathFor(const std::string& targetPath) {
    return targetPath + ".sync.tmp";
}

Result<void> PatchApplier::apply(std::unique_ptr<DataSource> delta, const std::string& basisPath, DataSink& sink) const {
    if (!engine_) return Result<void>::Error(ErrorKind::InvalidState, "No transform engine");
    Result<void> valid = config_.validate();
    if (!valid.success) return valid;

    auto basis = std::make_shared<FileBasis>(basisPath);
    Result<void> opened = basis->open();
    if (!opened.success) return opened;

    // a failed basis read reaches the driver only as an engine code, keep the real cause
    auto basisError = std::make_shared<Result<void>>(Result<void>::Ok());
    BasisReadCallback readBasis = [basis, basisError](uint64_t offset, size_t length, char* buffer, size_t& bytesRead) {
        Result<size_t> got = basis->readAt(offset, length, buffer);
        if (!got.success) {
            *basisError = Result<void>::Error(got);
            return EngineResult::IoError;
        }
        bytesRead = got.data;
        return EngineResult::Done;
    };

    std::shared_ptr<TransformEngine> engine = engine_;
    JobDriver driver(std::move(delta),
        [engine, readBasis](DataSource&) {
            return Result<std::unique_ptr<EngineJob>>::Ok(engine->beginPatchJob(readBasis));
        },
        config_.bufferSize * 2, config_.bufferSize * 4, ErrorKind::PatchApplicationFailed);

    uint64_t written = 0;
    while (true) {
        auto chunk = driver.next();
        if (!chunk.success) {
            basis->close();
            if (!basisError->success) return *basisError;
            return Result<void>::Error(chunk);
        }
        if (!chunk.data) break;
        Result<void> stored = sink.write(chunk.data->data(), chunk.data->size());
        if (!stored.success) {
            driver.close();
            basis->close();
            return stored;
        }
        written += chunk.data->size();
    }
    basis->close();
    Log::debug("Patch", "Wrote " + std::to_string(written) + " bytes from basis " + basisPath);
    return Result<void>::Ok();
}

Result<void> PatchApplier::applyToFile(std::unique_ptr<DataSource> delta, const std::string& basisPath,
                                       const std::string& outputPath) const {
    // nothing may be created when the basis is missing
    std::error_code ec;
    if (!fs::exists(basisPath, ec)) {
        return Result<void>::Error(ErrorKind::SourceNotFound, "File not found: " + basisPath);
    }

    FileSink output(outputPath);
    Result<void> opened = output.open();
    if (!opened.success) return opened;

    Result<void> applied = apply(std::move(delta), basisPath, output);
    Result<void> closed = output.close();
    if (!applied.success || !closed.success) {
        fs::remove(outputPath, ec);
        return applied.success ? closed : applied;
    }
    return Result<void>::Ok();
}

Result<void> PatchApplier::apply(Bytes delta, const std::string& basisPath, const std::string& outputPath) const {
    return applyToFile(std::make_unique<MemorySource>(std::move(delta)), basisPath, outputPath);
}

Result<void> PatchApplier::patchInPlace(const std::string& targetPath, std::unique_ptr<DataSource> delta) const {
    const std::string tempPath = temporaryPathFor(targetPath);

    Result<void> applied = applyToFile(std::move(delta), targetPath, tempPath);
    if (!applied.success) return applied;

    // rename is the single atomic step
    if (std::rename(tempPath.c_str(), targetPath.c_str()) != 0) {
        std::string reason = std::strerror(errno);
        std::error_code ec;
        fs::remove(tempPath, ec);
        return Result<void>::Error(ErrorKind::SinkWriteError,
            "Failed to move " + tempPath + " into place: " + reason);
    }
    return Result<void>::Ok();
}

Result<void> PatchApplier::patchInPlace(const std::string& targetPath, Bytes delta) const {
    return patchInPlace(targetPath, std::make_unique<MemorySource>(std::move(delta)));
}
