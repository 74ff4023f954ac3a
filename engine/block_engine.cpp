#include "block_engine.hpp"
#include "block_jobs.hpp"
#include "hash_utils.hpp"
#include <cmath>

namespace {
    // floor(log2(value)), 0 for 0 and 1
    size_t log2Floor(uint64_t value) {
        size_t bits = 0;
        while (value > 1) {
            value >>= 1;
            ++bits;
        }
        return bits;
    }

    size_t autoBlockLength(uint64_t sourceSize) {
        const uint64_t minBlock = Config::MIN_AUTO_BLOCK_LENGTH;
        if (sourceSize <= minBlock * minBlock) return Config::MIN_AUTO_BLOCK_LENGTH;

        uint64_t root = static_cast<uint64_t>(std::sqrt(static_cast<double>(sourceSize)));
        while (root * root < sourceSize) ++root;
        uint64_t rounded = ((root + 127) / 128) * 128;
        if (rounded > Config::MAX_AUTO_BLOCK_LENGTH) rounded = Config::MAX_AUTO_BLOCK_LENGTH;
        return static_cast<size_t>(rounded);
    }
}

EngineResult BlockEngine::negotiateSignatureParams(std::optional<uint64_t> sourceSize, SignatureParams& params) const {
    const size_t maxStrong = HashUtils::maxStrongLength(params.format);
    if (maxStrong == 0) return EngineResult::ParamError;

    if (params.blockLength == 0) {
        params.blockLength = sourceSize ? autoBlockLength(*sourceSize) : Config::DEFAULT_BLOCK_LENGTH;
        if (params.maxAutoBlockLength != 0 && params.blockLength > params.maxAutoBlockLength) {
            params.blockLength = params.maxAutoBlockLength;
        }
    } else if (params.blockLength > Config::MAX_BLOCK_LENGTH) {
        return EngineResult::ParamError;
    }

    if (params.strongLength == 0) {
        if (sourceSize) {
            // enough bits that a false block match over the whole file stays improbable
            size_t bits = log2Floor(*sourceSize + (uint64_t(1) << 24)) + log2Floor(*sourceSize / params.blockLength + 1);
            size_t wanted = 2 + (bits + 7) / 8;
            params.strongLength = wanted < maxStrong ? wanted : maxStrong;
        } else {
            params.strongLength = maxStrong;
        }
    } else if (params.strongLength > maxStrong) {
        return EngineResult::ParamError;
    }
    return EngineResult::Done;
}

std::unique_ptr<EngineJob> BlockEngine::beginSignatureJob(const SignatureParams& params) {
    const size_t maxStrong = HashUtils::maxStrongLength(params.format);
    if (params.blockLength == 0 || params.blockLength > Config::MAX_BLOCK_LENGTH) return nullptr;
    if (params.strongLength == 0 || params.strongLength > maxStrong) return nullptr;
    return std::make_unique<SignatureJob>(params);
}

std::unique_ptr<EngineJob> BlockEngine::beginLoadSignatureJob(std::unique_ptr<Signature>& slot) {
    return std::make_unique<LoadSignatureJob>(slot);
}

std::unique_ptr<EngineJob> BlockEngine::beginDeltaJob(std::shared_ptr<const Signature> signature) {
    auto blocks = std::dynamic_pointer_cast<const BlockSignature>(signature);
    if (!blocks || !blocks->hashTableBuilt()) return nullptr;
    return std::make_unique<DeltaJob>(std::move(blocks));
}

std::unique_ptr<EngineJob> BlockEngine::beginPatchJob(BasisReadCallback readBasis) {
    if (!readBasis) return nullptr;
    return std::make_unique<PatchJob>(std::move(readBasis));
}

EngineResult BlockEngine::buildHashTable(Signature& signature) {
    auto* blocks = dynamic_cast<BlockSignature*>(&signature);
    if (blocks == nullptr) return EngineResult::ParamError;
    blocks->buildHashTable();
    return EngineResult::Done;
}
