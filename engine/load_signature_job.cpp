#include "block_jobs.hpp"
#include "hash_utils.hpp"
#include "wire_format.hpp"

LoadSignatureJob::LoadSignatureJob(std::unique_ptr<Signature>& slot) : slot_(slot) {}

EngineResult LoadSignatureJob::step(BufferWindow& in, BufferWindow& /*out*/, bool inputExhausted) {
    if (finished_) return EngineResult::Done;

    while (true) {
        if (!signature_) {
            if (in.availableInput() < WireFormat::SIGNATURE_HEADER_SIZE) {
                return inputExhausted ? EngineResult::InputEnded : EngineResult::Running;
            }
            const char* header = in.readPtr();
            uint32_t magic = WireFormat::getU32(header);
            uint32_t blockLength = WireFormat::getU32(header + 4);
            uint32_t strongLength = WireFormat::getU32(header + 8);

            SignatureFormat format;
            if (magic == static_cast<uint32_t>(SignatureFormat::Sha1)) {
                format = SignatureFormat::Sha1;
            } else if (magic == static_cast<uint32_t>(SignatureFormat::Blake2)) {
                format = SignatureFormat::Blake2;
            } else {
                return EngineResult::BadMagic;
            }
            if (blockLength == 0 || blockLength > Config::MAX_BLOCK_LENGTH) return EngineResult::Corrupt;
            if (strongLength == 0 || strongLength > HashUtils::maxStrongLength(format)) return EngineResult::Corrupt;

            signature_ = std::make_unique<BlockSignature>(format, blockLength, strongLength);
            in.consume(WireFormat::SIGNATURE_HEADER_SIZE);
            continue;
        }

        const size_t entrySize = 4 + signature_->strongLength();
        if (in.availableInput() >= entrySize) {
            const char* entry = in.readPtr();
            uint32_t weak = WireFormat::getU32(entry);
            signature_->addBlock(weak, std::string(entry + 4, signature_->strongLength()));
            in.consume(entrySize);
            continue;
        }

        if (!inputExhausted) return EngineResult::Running;
        if (in.availableInput() > 0) return EngineResult::InputEnded;  // truncated entry

        slot_ = std::move(signature_);
        finished_ = true;
        return EngineResult::Done;
    }
}
