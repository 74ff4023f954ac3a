#include "delta_sync.hpp"
#include "../common/log.hpp"
#include "../engine/block_engine.hpp"
#include "../source/signature_loader.hpp"

DeltaSync::DeltaSync(const SyncConfig& config, std::shared_ptr<TransformEngine> engine)
    : config_(config), engine_(engine ? std::move(engine) : std::make_shared<BlockEngine>()) {}

SignatureStream DeltaSync::signatureStream(const std::string& path) const {
    return SignatureStream(std::make_unique<FileSource>(path), config_, engine_);
}

SignatureStream DeltaSync::signatureStream(std::unique_ptr<DataSource> source) const {
    return SignatureStream(std::move(source), config_, engine_);
}

DeltaStream DeltaSync::deltaStream(const std::string& path, std::shared_ptr<SignatureHandle> signature) const {
    return DeltaStream(std::make_unique<FileSource>(path), std::move(signature), config_);
}

DeltaStream DeltaSync::deltaStream(std::unique_ptr<DataSource> source, std::shared_ptr<SignatureHandle> signature) const {
    return DeltaStream(std::move(source), std::move(signature), config_);
}

Result<std::shared_ptr<SignatureHandle>> DeltaSync::loadSignature(ByteStream& stream) const {
    return ::loadSignature(stream, config_, engine_);
}

Result<std::shared_ptr<SignatureHandle>> DeltaSync::loadSignature(const Bytes& data) const {
    return ::loadSignature(data, config_, engine_);
}

Result<std::shared_ptr<SignatureHandle>> DeltaSync::loadSignature(std::unique_ptr<DataSource> source) const {
    return ::loadSignature(std::move(source), config_, engine_);
}

Result<Bytes> DeltaSync::generateSignature(const std::string& path) const {
    SignatureStream stream = signatureStream(path);
    return collectStream(stream);
}

Result<Bytes> DeltaSync::generateDelta(const std::string& path, std::shared_ptr<SignatureHandle> signature) const {
    DeltaStream stream = deltaStream(path, std::move(signature));
    return collectStream(stream);
}

Result<Bytes> DeltaSync::delta(const std::string& newPath, const std::string& oldPath) const {
    Result<Bytes> signature = generateSignature(oldPath);
    if (!signature.success) return signature;
    auto handle = loadSignature(signature.data);
    if (!handle.success) return Result<Bytes>::Error(handle);
    return generateDelta(newPath, handle.data);
}

Result<void> DeltaSync::applyPatch(const Bytes& delta, const std::string& basisPath, const std::string& outputPath) const {
    return PatchApplier(config_, engine_).apply(delta, basisPath, outputPath);
}

Result<void> DeltaSync::applyPatch(std::unique_ptr<DataSource> delta, const std::string& basisPath, DataSink& sink) const {
    return PatchApplier(config_, engine_).apply(std::move(delta), basisPath, sink);
}

Result<void> DeltaSync::applyPatchFile(const std::string& deltaPath, const std::string& basisPath,
                                       const std::string& outputPath) const {
    return PatchApplier(config_, engine_).applyToFile(std::make_unique<FileSource>(deltaPath), basisPath, outputPath);
}

Result<void> DeltaSync::patch(const std::string& path, const Bytes& delta) const {
    return PatchApplier(config_, engine_).patchInPlace(path, delta);
}

Result<void> DeltaSync::syncFile(const std::string& sourcePath, const std::string& destPath) const {
    Result<Bytes> deltaData = delta(sourcePath, destPath);
    if (!deltaData.success) return Result<void>::Error(deltaData);
    Result<void> patched = patch(destPath, deltaData.data);
    if (!patched.success) return patched;
    Log::info("Sync", "Sync Completed: " + sourcePath + " -> " + destPath + " (" +
              std::to_string(deltaData.data.size()) + " delta bytes)");
    return Result<void>::Ok();
}
