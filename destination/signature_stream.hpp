#pragma once
#include <memory>
#include "../common/byte_stream.hpp"
#include "../common/config.hpp"
#include "../common/data_io.hpp"
#include "../common/job_driver.hpp"
#include "../engine/transform_engine.hpp"

// Signature bytes of a basis, produced lazily. The block and strong lengths
// left at 0 in the config are chosen by the engine from the source size on
// the first next().
class SignatureStream : public ByteStream {
public:
    SignatureStream(std::unique_ptr<DataSource> source, const SyncConfig& config, std::shared_ptr<TransformEngine> engine);

    Result<std::optional<Bytes>> next() override;
    void close();
    DriverState state() const { return driver_.state(); }

    // parameters in use, valid after the first next()
    const SignatureParams& params() const { return *params_; }

private:
    SyncConfig config_;
    std::shared_ptr<SignatureParams> params_;
    JobDriver driver_;
};
