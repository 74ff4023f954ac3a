#pragma once
#include <memory>
#include <string>
#include "../common/byte_stream.hpp"
#include "../common/config.hpp"
#include "../common/data_io.hpp"
#include "../destination/patch_applier.hpp"
#include "../destination/signature_stream.hpp"
#include "../source/delta_stream.hpp"
#include "../source/signature_handle.hpp"

// Entry point of the library: one configuration and one engine, shared by
// every pipeline created from it.
class DeltaSync {
public:
    // engine defaults to BlockEngine
    explicit DeltaSync(const SyncConfig& config = SyncConfig{}, std::shared_ptr<TransformEngine> engine = nullptr);

    const SyncConfig& config() const { return config_; }
    const std::shared_ptr<TransformEngine>& engine() const { return engine_; }

    // streaming
    SignatureStream signatureStream(const std::string& path) const;
    SignatureStream signatureStream(std::unique_ptr<DataSource> source) const;
    DeltaStream deltaStream(const std::string& path, std::shared_ptr<SignatureHandle> signature) const;
    DeltaStream deltaStream(std::unique_ptr<DataSource> source, std::shared_ptr<SignatureHandle> signature) const;

    Result<std::shared_ptr<SignatureHandle>> loadSignature(ByteStream& stream) const;
    Result<std::shared_ptr<SignatureHandle>> loadSignature(const Bytes& data) const;
    Result<std::shared_ptr<SignatureHandle>> loadSignature(std::unique_ptr<DataSource> source) const;

    // whole results in memory
    Result<Bytes> generateSignature(const std::string& path) const;
    Result<Bytes> generateDelta(const std::string& path, std::shared_ptr<SignatureHandle> signature) const;
    // delta that turns oldPath into newPath
    Result<Bytes> delta(const std::string& newPath, const std::string& oldPath) const;

    Result<void> applyPatch(const Bytes& delta, const std::string& basisPath, const std::string& outputPath) const;
    Result<void> applyPatch(std::unique_ptr<DataSource> delta, const std::string& basisPath, DataSink& sink) const;
    Result<void> applyPatchFile(const std::string& deltaPath, const std::string& basisPath, const std::string& outputPath) const;
    // atomic replacement of path
    Result<void> patch(const std::string& path, const Bytes& delta) const;

    // make destPath identical to sourcePath, moving only what changed
    Result<void> syncFile(const std::string& sourcePath, const std::string& destPath) const;

private:
    SyncConfig config_;
    std::shared_ptr<TransformEngine> engine_;
};
