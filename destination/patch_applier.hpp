#pragma once
#include <memory>
#include <string>
#include "../common/byte_stream.hpp"
#include "../common/config.hpp"
#include "../common/data_io.hpp"
#include "../engine/transform_engine.hpp"

// Rebuilds new content from a basis file and a delta. The delta is the
// sequential input of the job, the basis is read at the offsets the delta
// asks for and stays open until the job is over.
class PatchApplier {
public:
    PatchApplier(const SyncConfig& config, std::shared_ptr<TransformEngine> engine);

    // patched bytes go to sink as they are produced
    Result<void> apply(std::unique_ptr<DataSource> delta, const std::string& basisPath, DataSink& sink) const;
    Result<void> apply(Bytes delta, const std::string& basisPath, const std::string& outputPath) const;
    // outputPath is removed again when patching fails
    Result<void> applyToFile(std::unique_ptr<DataSource> delta, const std::string& basisPath,
                             const std::string& outputPath) const;

    // patch targetPath with itself as basis, a reader sees either the old file or the new one
    Result<void> patchInPlace(const std::string& targetPath, std::unique_ptr<DataSource> delta) const;
    Result<void> patchInPlace(const std::string& targetPath, Bytes delta) const;

    static std::string temporaryPathFor(const std::string& targetPath);

private:
    SyncConfig config_;
    std::shared_ptr<TransformEngine> engine_;
};
