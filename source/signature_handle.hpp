#pragma once
#include <memory>
#include <mutex>
#include <utility>
#include "../common/result.hpp"
#include "../engine/transform_engine.hpp"

// Owns one loaded signature, shared by every delta run against the same basis.
//
// All engine calls on the signature go through withSignature(), which holds
// the handle's lock for the duration of the call. The hash table is built at
// most once; whichever caller gets the lock first builds it and later callers
// see it built. Delta jobs keep their own reference to the signature and read
// the built table without the lock.
class SignatureHandle {
public:
    SignatureHandle(std::unique_ptr<Signature> signature, std::shared_ptr<TransformEngine> engine);

    SignatureHandle(const SignatureHandle&) = delete;
    SignatureHandle& operator=(const SignatureHandle&) = delete;

    Result<void> ensureHashTable();

    // body(const std::shared_ptr<Signature>&) must return a Result<...>
    template<typename F>
    auto withSignature(F&& body) -> decltype(body(std::declval<const std::shared_ptr<Signature>&>())) {
        using R = decltype(body(std::declval<const std::shared_ptr<Signature>&>()));
        std::lock_guard<std::mutex> lock(mutex_);
        if (!signature_) {
            return R::Error(ErrorKind::InvalidState, "Signature handle used after release");
        }
        return body(signature_);
    }

    // drops this handle's reference, running delta jobs keep theirs
    void release();
    bool released() const;
    bool hashTableBuilt() const;

    const std::shared_ptr<TransformEngine>& engine() const { return engine_; }

private:
    mutable std::mutex mutex_;
    std::shared_ptr<Signature> signature_;
    std::shared_ptr<TransformEngine> engine_;
    bool hashTableBuilt_ = false;
};
