#pragma once
#include "transform_engine.hpp"

// Block matching engine: fixed size blocks, polynomial rolling weak hash,
// OpenSSL strong hash. Signatures it loads are immutable once the hash table
// is built, so delta jobs may read one signature from several threads.
class BlockEngine : public TransformEngine {
public:
    EngineResult negotiateSignatureParams(std::optional<uint64_t> sourceSize, SignatureParams& params) const override;

    std::unique_ptr<EngineJob> beginSignatureJob(const SignatureParams& params) override;
    std::unique_ptr<EngineJob> beginLoadSignatureJob(std::unique_ptr<Signature>& slot) override;
    std::unique_ptr<EngineJob> beginDeltaJob(std::shared_ptr<const Signature> signature) override;
    std::unique_ptr<EngineJob> beginPatchJob(BasisReadCallback readBasis) override;

    EngineResult buildHashTable(Signature& signature) override;
};
