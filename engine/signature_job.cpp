#include "block_jobs.hpp"
#include "hash_utils.hpp"
#include "wire_format.hpp"
#include <algorithm>

SignatureJob::SignatureJob(const SignatureParams& params) : params_(params) {
    block_.reserve(params_.blockLength);
}

bool SignatureJob::emitBlock(const char* data, size_t length) {
    std::string strong = HashUtils::computeStrongHash(params_.format, data, length, params_.strongLength);
    if (strong.empty()) return false;
    std::vector<char>& pending = output_.buffer();
    WireFormat::putU32(pending, HashUtils::computeWeakHash(data, length));
    pending.insert(pending.end(), strong.begin(), strong.end());
    return true;
}

EngineResult SignatureJob::step(BufferWindow& in, BufferWindow& out, bool inputExhausted) {
    if (!headerWritten_) {
        std::vector<char>& pending = output_.buffer();
        WireFormat::putU32(pending, static_cast<uint32_t>(params_.format));
        WireFormat::putU32(pending, static_cast<uint32_t>(params_.blockLength));
        WireFormat::putU32(pending, static_cast<uint32_t>(params_.strongLength));
        headerWritten_ = true;
    }

    const size_t blockLength = params_.blockLength;
    while (true) {
        if (!output_.drain(out)) return EngineResult::Blocked;
        if (finished_) return EngineResult::Done;

        // whole blocks straight from the window, no copy
        if (block_.empty() && in.availableInput() >= blockLength) {
            if (!emitBlock(in.readPtr(), blockLength)) return EngineResult::InternalError;
            in.consume(blockLength);
            continue;
        }

        size_t take = std::min(blockLength - block_.size(), in.availableInput());
        block_.insert(block_.end(), in.readPtr(), in.readPtr() + take);
        in.consume(take);

        if (block_.size() == blockLength) {
            if (!emitBlock(block_.data(), block_.size())) return EngineResult::InternalError;
            block_.clear();
            continue;
        }

        // window is empty here
        if (!inputExhausted) return EngineResult::Running;
        if (!block_.empty()) {
            // short last block
            if (!emitBlock(block_.data(), block_.size())) return EngineResult::InternalError;
            block_.clear();
            continue;
        }
        finished_ = true;
    }
}
