#include "signature_loader.hpp"
#include "../common/job_driver.hpp"
#include "../common/log.hpp"

Result<std::shared_ptr<SignatureHandle>> loadSignature(std::unique_ptr<DataSource> source, const SyncConfig& config,
                                                       std::shared_ptr<TransformEngine> engine) {
    using HandleResult = Result<std::shared_ptr<SignatureHandle>>;
    if (!engine) {
        return HandleResult::Error(ErrorKind::InvalidState, "No transform engine");
    }
    Result<void> valid = config.validate();
    if (!valid.success) return HandleResult::Error(valid);

    // the job writes here when it finishes, declared before the driver so it outlives the job
    std::unique_ptr<Signature> slot;
    JobDriver driver(std::move(source),
        [&engine, &slot](DataSource&) {
            return Result<std::unique_ptr<EngineJob>>::Ok(engine->beginLoadSignatureJob(slot));
        },
        config.bufferSize * 4, Config::MIN_BUFFER_SIZE, ErrorKind::SignatureLoadFailed);

    while (true) {
        auto chunk = driver.next();
        if (!chunk.success) {
            EngineResult code = static_cast<EngineResult>(chunk.engineCode);
            if (chunk.kind == ErrorKind::SignatureLoadFailed &&
                (code == EngineResult::BadMagic || code == EngineResult::Corrupt || code == EngineResult::InputEnded)) {
                return HandleResult::Error(ErrorKind::InvalidSignature,
                    std::string("Invalid signature data: ") + engineResultName(code), chunk.engineCode);
            }
            return HandleResult::Error(chunk);
        }
        if (!chunk.data) break;
        // load jobs write nothing, anything else is ignored
    }

    if (!slot) {
        return HandleResult::Error(ErrorKind::InvalidSignature, "Invalid signature data: no signature produced");
    }
    Log::debug("Signature", "Loaded " + std::to_string(slot->blockCount()) + " blocks of " +
               std::to_string(slot->blockLength()) + " bytes");
    return HandleResult::Ok(std::make_shared<SignatureHandle>(std::move(slot), std::move(engine)));
}

Result<std::shared_ptr<SignatureHandle>> loadSignature(ByteStream& stream, const SyncConfig& config,
                                                       std::shared_ptr<TransformEngine> engine) {
    return loadSignature(std::make_unique<StreamSource>(stream), config, std::move(engine));
}

Result<std::shared_ptr<SignatureHandle>> loadSignature(const Bytes& data, const SyncConfig& config,
                                                       std::shared_ptr<TransformEngine> engine) {
    return loadSignature(std::make_unique<MemorySource>(data), config, std::move(engine));
}
