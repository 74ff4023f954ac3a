#include "signature_handle.hpp"
#include "../common/log.hpp"

SignatureHandle::SignatureHandle(std::unique_ptr<Signature> signature, std::shared_ptr<TransformEngine> engine)
    : signature_(std::move(signature)), engine_(std::move(engine)) {}

Result<void> SignatureHandle::ensureHashTable() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!signature_ || !engine_) {
        return Result<void>::Error(ErrorKind::InvalidState, "Signature handle used after release");
    }
    if (hashTableBuilt_) return Result<void>::Ok();

    EngineResult result = engine_->buildHashTable(*signature_);
    if (result != EngineResult::Done) {
        return Result<void>::Error(ErrorKind::HashTableBuildFailed,
            std::string("Hash table build failed: ") + engineResultName(result), static_cast<int>(result));
    }
    hashTableBuilt_ = true;
    Log::debug("Signature", "Hash table built over " + std::to_string(signature_->blockCount()) + " blocks");
    return Result<void>::Ok();
}

void SignatureHandle::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    signature_.reset();
    hashTableBuilt_ = false;
}

bool SignatureHandle::released() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !signature_;
}

bool SignatureHandle::hashTableBuilt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hashTableBuilt_;
}
