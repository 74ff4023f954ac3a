#include "delta_stream.hpp"

namespace {
    JobDriver::JobFactory deltaJobFactory(const SyncConfig& config, std::shared_ptr<SignatureHandle> handle) {
        const size_t inputCapacity = config.bufferSize * 2;
        return [config, handle, inputCapacity](DataSource&) -> Result<std::unique_ptr<EngineJob>> {
            using JobResult = Result<std::unique_ptr<EngineJob>>;
            if (!handle) return JobResult::Error(ErrorKind::InvalidState, "No signature handle");
            Result<void> valid = config.validate();
            if (!valid.success) return JobResult::Error(valid);

            Result<void> built = handle->ensureHashTable();
            if (!built.success) return JobResult::Error(built);

            return handle->withSignature([&](const std::shared_ptr<Signature>& signature) -> JobResult {
                // the scan needs one whole block plus the next byte in view
                if (inputCapacity < signature->blockLength() + 1) {
                    return JobResult::Error(ErrorKind::InsufficientBuffer,
                        "Delta input window of " + std::to_string(inputCapacity) + " bytes cannot hold a block of " +
                        std::to_string(signature->blockLength()));
                }
                return JobResult::Ok(handle->engine()->beginDeltaJob(signature));
            });
        };
    }
}

DeltaStream::DeltaStream(std::unique_ptr<DataSource> source, std::shared_ptr<SignatureHandle> signature,
                         const SyncConfig& config)
    : signature_(signature),
      driver_(std::move(source), deltaJobFactory(config, std::move(signature)),
              config.bufferSize * 2, config.bufferSize * 2, ErrorKind::DeltaGenerationFailed) {}

Result<std::optional<Bytes>> DeltaStream::next() {
    return driver_.next();
}

void DeltaStream::close() {
    driver_.close();
}
