#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include "../common/buffer_window.hpp"
#include "../common/config.hpp"

// result of one job step or one engine call
enum class EngineResult : int {
    Done = 0,
    Blocked = 1,        // more output space needed before the job can go on
    Running = 2,        // more input needed
    IoError = 100,
    SyntaxError = 101,
    MemError = 102,
    InputEnded = 103,   // input stopped in the middle of a record
    BadMagic = 104,
    Unimplemented = 105,
    Corrupt = 106,
    InternalError = 107,
    ParamError = 108
};

const char* engineResultName(EngineResult result);

inline bool isProgress(EngineResult result) {
    return result == EngineResult::Done || result == EngineResult::Blocked || result == EngineResult::Running;
}

struct SignatureParams {
    SignatureFormat format = SignatureFormat::Blake2;
    size_t blockLength = 0;     // 0 = auto
    size_t strongLength = 0;    // 0 = auto
    size_t maxAutoBlockLength = 0;  // upper bound for an auto block length, 0 = none
};

// loaded fingerprint of a basis, the concrete layout belongs to the engine
class Signature {
public:
    virtual ~Signature() = default;
    virtual SignatureFormat format() const = 0;
    virtual size_t blockLength() const = 0;
    virtual size_t strongLength() const = 0;
    virtual size_t blockCount() const = 0;
    virtual bool hashTableBuilt() const = 0;
};

// One running job. step() consumes from `in`, writes into the free tail of `out`
// and reports how far it got. `inputExhausted` is set once the source has no
// more data; the job must then finish with whatever is left in `in`.
class EngineJob {
public:
    virtual ~EngineJob() = default;
    virtual EngineResult step(BufferWindow& in, BufferWindow& out, bool inputExhausted) = 0;
};

// reads basis bytes [offset, offset + length) into buffer, bytesRead < length only at end of basis
using BasisReadCallback = std::function<EngineResult(uint64_t offset, size_t length, char* buffer, size_t& bytesRead)>;

// Jobs are released by destroying them; a null job means the engine could
// not create one.
class TransformEngine {
public:
    virtual ~TransformEngine() = default;

    // resolves auto block and strong lengths, sourceSize is nullopt when unknown
    virtual EngineResult negotiateSignatureParams(std::optional<uint64_t> sourceSize, SignatureParams& params) const = 0;

    virtual std::unique_ptr<EngineJob> beginSignatureJob(const SignatureParams& params) = 0;
    // the job stores the signature in `slot` when it finishes, slot must outlive the job
    virtual std::unique_ptr<EngineJob> beginLoadSignatureJob(std::unique_ptr<Signature>& slot) = 0;
    // requires buildHashTable() to have succeeded on the signature
    virtual std::unique_ptr<EngineJob> beginDeltaJob(std::shared_ptr<const Signature> signature) = 0;
    virtual std::unique_ptr<EngineJob> beginPatchJob(BasisReadCallback readBasis) = 0;

    virtual EngineResult buildHashTable(Signature& signature) = 0;
};
