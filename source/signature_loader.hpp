#pragma once
#include <memory>
#include "signature_handle.hpp"
#include "../common/byte_stream.hpp"
#include "../common/config.hpp"
#include "../common/data_io.hpp"

// Runs a load job over the signature bytes and wraps the result in a handle.
// The bytes may arrive in any chunking; the loaded signature is the same.
Result<std::shared_ptr<SignatureHandle>> loadSignature(std::unique_ptr<DataSource> source, const SyncConfig& config,
                                                       std::shared_ptr<TransformEngine> engine);

Result<std::shared_ptr<SignatureHandle>> loadSignature(ByteStream& stream, const SyncConfig& config,
                                                       std::shared_ptr<TransformEngine> engine);

Result<std::shared_ptr<SignatureHandle>> loadSignature(const Bytes& data, const SyncConfig& config,
                                                       std::shared_ptr<TransformEngine> engine);
