#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "buffer_window.hpp"
#include "byte_stream.hpp"
#include "data_io.hpp"
#include "result.hpp"
#include "../engine/transform_engine.hpp"

enum class DriverState { Uninitialized, Running, Blocked, Done, Failed };

const char* driverStateName(DriverState state);

// Drives one engine job from creation to completion and hands its output out
// as a lazy sequence of chunks.
//
// The first next() opens the source and calls the factory, which negotiates
// whatever the job needs and begins it. Every next() then loops
//   fill the input window -> one engine step -> take the output
// until a step produced bytes (returned at once, even on the final step),
// the job is done (end of sequence), or something failed.
//
// Job, windows and source are released when the job finishes or fails, on
// close(), and on destruction, so a caller may stop pulling at any point.
class JobDriver {
public:
    using JobFactory = std::function<Result<std::unique_ptr<EngineJob>>(DataSource& source)>;

    JobDriver(std::unique_ptr<DataSource> source, JobFactory factory,
              size_t inputCapacity, size_t outputCapacity, ErrorKind failureKind);
    ~JobDriver();

    JobDriver(JobDriver&&) = default;
    JobDriver& operator=(JobDriver&&) = default;
    JobDriver(const JobDriver&) = delete;
    JobDriver& operator=(const JobDriver&) = delete;

    Result<std::optional<Bytes>> next();
    void close();

    DriverState state() const { return state_; }
    bool inputExhausted() const { return inputExhausted_; }

private:
    Result<void> initialize();
    void release();
    Result<std::optional<Bytes>> fail(ErrorKind kind, const std::string& message, int code = 0);

    std::unique_ptr<DataSource> source_;
    JobFactory factory_;
    size_t inputCapacity_;
    size_t outputCapacity_;
    ErrorKind failureKind_;   // how engine failures of this pipeline are reported

    std::unique_ptr<EngineJob> job_;
    std::unique_ptr<BufferWindow> input_;
    std::unique_ptr<BufferWindow> output_;
    DriverState state_ = DriverState::Uninitialized;
    bool sourceOpen_ = false;
    bool inputExhausted_ = false;
};
