#include "job_driver.hpp"
#include "log.hpp"

const char* driverStateName(DriverState state) {
    switch (state) {
        case DriverState::Uninitialized: return "uninitialized";
        case DriverState::Running: return "running";
        case DriverState::Blocked: return "blocked";
        case DriverState::Done: return "done";
        case DriverState::Failed: return "failed";
    }
    return "unknown";
}

JobDriver::JobDriver(std::unique_ptr<DataSource> source, JobFactory factory,
                     size_t inputCapacity, size_t outputCapacity, ErrorKind failureKind)
    : source_(std::move(source)), factory_(std::move(factory)),
      inputCapacity_(inputCapacity), outputCapacity_(outputCapacity), failureKind_(failureKind) {}

JobDriver::~JobDriver() {
    release();
}

void JobDriver::close() {
    release();
    if (state_ != DriverState::Failed) state_ = DriverState::Done;
}

void JobDriver::release() {
    job_.reset();
    input_.reset();
    output_.reset();
    if (source_ && sourceOpen_) {
        source_->close();
        sourceOpen_ = false;
    }
    source_.reset();
}

Result<std::optional<Bytes>> JobDriver::fail(ErrorKind kind, const std::string& message, int code) {
    Log::debug("JobDriver", std::string(driverStateName(state_)) + " -> failed: " + message);
    release();
    state_ = DriverState::Failed;
    return Result<std::optional<Bytes>>::Error(kind, message, code);
}

Result<void> JobDriver::initialize() {
    if (!source_) {
        return Result<void>::Error(ErrorKind::InvalidState, "Job driver has no data source");
    }
    if (inputCapacity_ == 0 || outputCapacity_ == 0) {
        return Result<void>::Error(ErrorKind::InsufficientBuffer, "Job driver needs non-empty buffers");
    }

    Result<void> opened = source_->open();
    if (!opened.success) return opened;
    sourceOpen_ = true;

    Result<std::unique_ptr<EngineJob>> job = factory_(*source_);
    if (!job.success) return Result<void>::Error(job);
    if (!job.data) {
        return Result<void>::Error(ErrorKind::JobCreationFailed, "Failed to create job for " + source_->describe());
    }
    job_ = std::move(job.data);

    input_ = std::make_unique<BufferWindow>(inputCapacity_);
    output_ = std::make_unique<BufferWindow>(outputCapacity_);
    return Result<void>::Ok();
}

Result<std::optional<Bytes>> JobDriver::next() {
    if (state_ == DriverState::Done) {
        return Result<std::optional<Bytes>>::Ok(std::nullopt);
    }
    if (state_ == DriverState::Failed) {
        return Result<std::optional<Bytes>>::Error(ErrorKind::InvalidState, "Stream already failed");
    }

    if (state_ == DriverState::Uninitialized) {
        Result<void> init = initialize();
        if (!init.success) {
            return fail(init.kind, init.message, init.engineCode);
        }
        state_ = DriverState::Running;
    }

    while (true) {
        // 1. refill, never after the source reported its end
        if (!inputExhausted_ && input_->availableInput() < input_->capacity()) {
            input_->compactIfNeeded();
            Result<size_t> filled = input_->fill(*source_);
            if (!filled.success) {
                return fail(filled.kind, filled.message, filled.engineCode);
            }
            if (filled.data == 0) {
                inputExhausted_ = true;
            }
        }

        // 2. exactly one step
        const size_t inputBefore = input_->availableInput();
        EngineResult result = job_->step(*input_, *output_, inputExhausted_);

        // 3. classify
        if (!isProgress(result)) {
            return fail(failureKind_,
                std::string(errorKindName(failureKind_)) + ": " + engineResultName(result) +
                " (" + std::to_string(static_cast<int>(result)) + ")",
                static_cast<int>(result));
        }
        state_ = (result == EngineResult::Blocked) ? DriverState::Blocked : DriverState::Running;

        // 4. output first, the final chunk of a finished job included
        if (output_->availableInput() > 0) {
            ByteSlice produced = output_->takeOutput();
            Bytes chunk(produced.data, produced.data + produced.size);
            output_->reset();
            // the chunk owns its bytes, so the job can go before it is handed out
            if (result == EngineResult::Done) {
                release();
                state_ = DriverState::Done;
            }
            return Result<std::optional<Bytes>>::Ok(std::move(chunk));
        }

        // 5. finished without output
        if (result == EngineResult::Done) {
            release();
            state_ = DriverState::Done;
            return Result<std::optional<Bytes>>::Ok(std::nullopt);
        }

        // a step that moved nothing will never move anything
        if (input_->availableInput() == inputBefore) {
            if (inputExhausted_) {
                return fail(failureKind_, std::string(errorKindName(failureKind_)) + ": job stalled at end of input",
                            static_cast<int>(EngineResult::InternalError));
            }
            if (input_->full()) {
                return fail(ErrorKind::InsufficientBuffer,
                    "Input window of " + std::to_string(input_->capacity()) + " bytes is too small for the job");
            }
        }
    }
}
