#include "block_jobs.hpp"
#include "hash_utils.hpp"
#include "wire_format.hpp"
#include <limits>

DeltaJob::DeltaJob(std::shared_ptr<const BlockSignature> signature)
    : signature_(std::move(signature)),
      blockLength_(signature_->blockLength()),
      blockPow_(HashUtils::basePower(blockLength_ - 1)) {}

void DeltaJob::addLiteral(char byte) {
    flushCopy();
    literal_.push_back(byte);
    if (literal_.size() >= Config::MAX_LITERAL_RUN) flushLiteral();
}

void DeltaJob::addCopy(uint64_t offset, size_t length) {
    flushLiteral();
    // adjacent matches become one COPY
    if (copyLength_ > 0 && copyOffset_ + copyLength_ == offset &&
        copyLength_ + length <= std::numeric_limits<uint32_t>::max()) {
        copyLength_ += length;
        return;
    }
    flushCopy();
    copyOffset_ = offset;
    copyLength_ = length;
}

void DeltaJob::flushLiteral() {
    if (literal_.empty()) return;
    std::vector<char>& pending = output_.buffer();
    pending.push_back(static_cast<char>(DeltaType::INSERT));
    WireFormat::putU32(pending, static_cast<uint32_t>(literal_.size()));
    pending.insert(pending.end(), literal_.begin(), literal_.end());
    literal_.clear();
}

void DeltaJob::flushCopy() {
    if (copyLength_ == 0) return;
    std::vector<char>& pending = output_.buffer();
    pending.push_back(static_cast<char>(DeltaType::COPY));
    WireFormat::putU64(pending, copyOffset_);
    WireFormat::putU32(pending, static_cast<uint32_t>(copyLength_));
    copyLength_ = 0;
}

// The scan window always starts at in.readPtr(); bytes are consumed only once
// they are emitted as a literal or covered by a COPY, so the driver keeps the
// rest of the window across steps.
EngineResult DeltaJob::step(BufferWindow& in, BufferWindow& out, bool inputExhausted) {
    if (!headerWritten_) {
        WireFormat::putU32(output_.buffer(), WireFormat::DELTA_MAGIC);
        headerWritten_ = true;
    }

    while (true) {
        if (!output_.drain(out)) return EngineResult::Blocked;
        if (finished_) return EngineResult::Done;

        const size_t available = in.availableInput();
        const char* window = in.readPtr();

        if (available >= blockLength_) {
            if (hashedLength_ != blockLength_) {
                weakHash_ = HashUtils::computeWeakHash(window, blockLength_);
                hashedLength_ = blockLength_;
            }
            auto match = signature_->findBlock(weakHash_, window, blockLength_);
            if (match) {
                addCopy(*match, blockLength_);
                in.consume(blockLength_);
                hashedLength_ = 0;
                continue;
            }
            if (available > blockLength_) {
                weakHash_ = HashUtils::rollWeakHash(weakHash_, window[0], window[blockLength_], blockPow_);
                addLiteral(window[0]);
                in.consume(1);
                continue;
            }
            if (!inputExhausted) return EngineResult::Running;

            // last full window did not match, continue with the short tail
            weakHash_ = HashUtils::dropLeadingByte(weakHash_, window[0], blockPow_);
            hashedLength_ = blockLength_ - 1;
            addLiteral(window[0]);
            in.consume(1);
            continue;
        }

        if (!inputExhausted) return EngineResult::Running;

        if (available > 0) {
            // the tail can still match the basis' short last block
            if (hashedLength_ != available) {
                weakHash_ = HashUtils::computeWeakHash(window, available);
                hashedLength_ = available;
            }
            auto match = signature_->findBlock(weakHash_, window, available);
            if (match) {
                addCopy(*match, available);
                in.consume(available);
                hashedLength_ = 0;
                continue;
            }
            weakHash_ = HashUtils::dropLeadingByte(weakHash_, window[0], HashUtils::basePower(available - 1));
            hashedLength_ = available - 1;
            addLiteral(window[0]);
            in.consume(1);
            continue;
        }

        flushCopy();
        flushLiteral();
        output_.buffer().push_back(static_cast<char>(DeltaType::END));
        finished_ = true;
    }
}
