#pragma once
#include <memory>
#include "signature_handle.hpp"
#include "../common/byte_stream.hpp"
#include "../common/config.hpp"
#include "../common/data_io.hpp"
#include "../common/job_driver.hpp"

// Delta bytes of new data against a loaded signature, produced lazily.
// Windows are twice the configured buffer so a match can be searched across
// the boundary of one read.
class DeltaStream : public ByteStream {
public:
    DeltaStream(std::unique_ptr<DataSource> source, std::shared_ptr<SignatureHandle> signature, const SyncConfig& config);

    Result<std::optional<Bytes>> next() override;
    void close();
    DriverState state() const { return driver_.state(); }

private:
    std::shared_ptr<SignatureHandle> signature_;
    JobDriver driver_;
};
