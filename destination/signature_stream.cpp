#include "signature_stream.hpp"
#include "../common/log.hpp"

namespace {
    JobDriver::JobFactory signatureJobFactory(const SyncConfig& config, std::shared_ptr<TransformEngine> engine,
                                              std::shared_ptr<SignatureParams> negotiated) {
        return [config, engine, negotiated](DataSource& source) -> Result<std::unique_ptr<EngineJob>> {
            using JobResult = Result<std::unique_ptr<EngineJob>>;
            if (!engine) return JobResult::Error(ErrorKind::InvalidState, "No transform engine");
            Result<void> valid = config.validate();
            if (!valid.success) return JobResult::Error(valid);

            Result<std::optional<uint64_t>> size = source.size();
            if (!size.success) return JobResult::Error(size);

            SignatureParams params;
            params.format = config.signatureFormat;
            params.blockLength = config.blockLength;
            params.strongLength = config.strongLength;
            // a delta run with the same config must fit one block plus one byte in its input window
            params.maxAutoBlockLength = config.bufferSize * 2 - 1;
            EngineResult result = engine->negotiateSignatureParams(size.data, params);
            if (result != EngineResult::Done) {
                return JobResult::Error(ErrorKind::SignatureGenerationFailed,
                    std::string("Cannot choose signature parameters for ") + source.describe() + ": " + engineResultName(result),
                    static_cast<int>(result));
            }
            *negotiated = params;
            Log::debug("Signature", source.describe() + ": " + signatureFormatName(params.format) + ", block " +
                       std::to_string(params.blockLength) + ", strong " + std::to_string(params.strongLength));
            return JobResult::Ok(engine->beginSignatureJob(params));
        };
    }
}

SignatureStream::SignatureStream(std::unique_ptr<DataSource> source, const SyncConfig& config,
                                 std::shared_ptr<TransformEngine> engine)
    : config_(config),
      params_(std::make_shared<SignatureParams>()),
      driver_(std::move(source), signatureJobFactory(config, std::move(engine), params_),
              config.bufferSize, config.bufferSize, ErrorKind::SignatureGenerationFailed) {}

Result<std::optional<Bytes>> SignatureStream::next() {
    return driver_.next();
}

void SignatureStream::close() {
    driver_.close();
}
