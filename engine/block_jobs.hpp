#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include "block_signature.hpp"
#include "transform_engine.hpp"

// encoded bytes waiting for room in the job's output window
class PendingOutput {
public:
    std::vector<char>& buffer() { return pending_; }
    bool empty() const { return position_ == pending_.size(); }

    // returns true once everything pending has been handed to out
    bool drain(BufferWindow& out) {
        position_ += out.append(pending_.data() + position_, pending_.size() - position_);
        if (position_ == pending_.size()) {
            pending_.clear();
            position_ = 0;
            return true;
        }
        return false;
    }

private:
    std::vector<char> pending_;
    size_t position_ = 0;
};

class SignatureJob : public EngineJob {
public:
    explicit SignatureJob(const SignatureParams& params);
    EngineResult step(BufferWindow& in, BufferWindow& out, bool inputExhausted) override;

private:
    bool emitBlock(const char* data, size_t length);

    SignatureParams params_;
    PendingOutput output_;
    std::vector<char> block_;   // partial block carried across steps
    bool headerWritten_ = false;
    bool finished_ = false;
};

class LoadSignatureJob : public EngineJob {
public:
    explicit LoadSignatureJob(std::unique_ptr<Signature>& slot);
    EngineResult step(BufferWindow& in, BufferWindow& out, bool inputExhausted) override;

private:
    std::unique_ptr<Signature>& slot_;
    std::unique_ptr<BlockSignature> signature_;
    bool finished_ = false;
};

class DeltaJob : public EngineJob {
public:
    explicit DeltaJob(std::shared_ptr<const BlockSignature> signature);
    EngineResult step(BufferWindow& in, BufferWindow& out, bool inputExhausted) override;

private:
    void addLiteral(char byte);
    void addCopy(uint64_t offset, size_t length);
    void flushLiteral();
    void flushCopy();

    std::shared_ptr<const BlockSignature> signature_;
    size_t blockLength_;
    uint64_t blockPow_;          // BASE^(blockLength-1)
    PendingOutput output_;
    std::vector<char> literal_;
    uint64_t copyOffset_ = 0;
    uint64_t copyLength_ = 0;
    uint32_t weakHash_ = 0;
    size_t hashedLength_ = 0;    // length of the window weakHash_ covers, 0 = stale
    bool headerWritten_ = false;
    bool finished_ = false;
};

class PatchJob : public EngineJob {
public:
    explicit PatchJob(BasisReadCallback readBasis);
    EngineResult step(BufferWindow& in, BufferWindow& out, bool inputExhausted) override;

private:
    enum class State { Header, Command, Copy, Insert, Finished };

    BasisReadCallback readBasis_;
    State state_ = State::Header;
    uint64_t copyOffset_ = 0;
    uint64_t remaining_ = 0;
};
