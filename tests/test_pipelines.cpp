#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "../sync/delta_sync.hpp"

using namespace testing_support;

namespace {

    SyncConfig smallBuffers() {
        SyncConfig config;
        config.bufferSize = Config::MIN_BUFFER_SIZE;
        return config;
    }

    std::string repeatedLines(size_t count) {
        std::string text;
        for (size_t i = 0; i < count; ++i) {
            text += "line " + std::to_string(i % 7) + ": the same words again and again\n";
        }
        return text;
    }

    // delta of newContent against basis, then patch, through files
    Bytes roundTrip(const DeltaSync& deltaSync, const TempDir& dir, const Bytes& basis, const Bytes& newContent) {
        writeFile(dir.file("basis"), basis);
        writeFile(dir.file("new"), newContent);

        Result<Bytes> delta = deltaSync.delta(dir.file("new"), dir.file("basis"));
        EXPECT_TRUE(delta.success) << delta.message;
        Result<void> patched = deltaSync.applyPatch(delta.data, dir.file("basis"), dir.file("out"));
        EXPECT_TRUE(patched.success) << patched.message;
        return readFile(dir.file("out"));
    }
}

TEST(Pipelines, RoundTripText) {
    TempDir dir;
    DeltaSync deltaSync;
    Bytes basis = toBytes(repeatedLines(400));
    std::string edited = repeatedLines(400);
    edited.insert(1000, "an inserted sentence that was not there before\n");
    edited.erase(5000, 300);
    edited += "and a new ending\n";

    EXPECT_EQ(roundTrip(deltaSync, dir, basis, toBytes(edited)), toBytes(edited));
}

TEST(Pipelines, RoundTripBinaryWithNulAndHighBytes) {
    TempDir dir;
    DeltaSync deltaSync(smallBuffers());
    Bytes basis = randomBytes(20000, 11);
    Bytes newContent = basis;
    newContent.insert(newContent.begin() + 333, 5, '\0');
    for (size_t i = 9000; i < 9100; ++i) newContent[i] = static_cast<char>(0xff);
    newContent.erase(newContent.begin() + 15000, newContent.begin() + 15500);

    EXPECT_EQ(roundTrip(deltaSync, dir, basis, newContent), newContent);
}

TEST(Pipelines, RoundTripEmptyFiles) {
    TempDir dir;
    DeltaSync deltaSync;
    EXPECT_EQ(roundTrip(deltaSync, dir, Bytes{}, toBytes("fresh content")), toBytes("fresh content"));
    EXPECT_EQ(roundTrip(deltaSync, dir, toBytes("old content"), Bytes{}), Bytes{});
}

TEST(Pipelines, RoundTripEveryFormat) {
    for (SignatureFormat format : {SignatureFormat::Sha1, SignatureFormat::Blake2}) {
        TempDir dir;
        SyncConfig config;
        config.signatureFormat = format;
        config.blockLength = 64;
        DeltaSync deltaSync(config);
        Bytes basis = randomBytes(5000, 5);
        Bytes newContent(basis.begin() + 100, basis.end());
        EXPECT_EQ(roundTrip(deltaSync, dir, basis, newContent), newContent) << signatureFormatName(format);
    }
}

TEST(Pipelines, IdentityDeltaIsSmall) {
    TempDir dir;
    DeltaSync deltaSync;
    const std::string text = repeatedLines(50);
    writeFile(dir.file("a"), text);

    Result<Bytes> delta = deltaSync.delta(dir.file("a"), dir.file("a"));
    ASSERT_TRUE(delta.success) << delta.message;
    EXPECT_LT(delta.data.size(), text.size());
}

TEST(Pipelines, StreamingEqualsBuffered) {
    TempDir dir;
    DeltaSync deltaSync(smallBuffers());
    writeFile(dir.file("basis"), randomBytes(30000, 1));
    Bytes newContent = randomBytes(30000, 1);
    newContent[20000] ^= 0x55;
    writeFile(dir.file("new"), newContent);

    Result<Bytes> buffered = deltaSync.generateSignature(dir.file("basis"));
    ASSERT_TRUE(buffered.success) << buffered.message;

    SignatureStream stream = deltaSync.signatureStream(dir.file("basis"));
    Bytes streamed;
    size_t chunks = 0;
    while (true) {
        auto chunk = stream.next();
        ASSERT_TRUE(chunk.success) << chunk.message;
        if (!chunk.data) break;
        ASSERT_FALSE(chunk.data->empty());
        streamed.insert(streamed.end(), chunk.data->begin(), chunk.data->end());
        ++chunks;
    }
    EXPECT_EQ(streamed, buffered.data);
    EXPECT_GT(chunks, 1u);

    auto handle = deltaSync.loadSignature(buffered.data);
    ASSERT_TRUE(handle.success) << handle.message;
    Result<Bytes> bufferedDelta = deltaSync.generateDelta(dir.file("new"), handle.data);
    ASSERT_TRUE(bufferedDelta.success) << bufferedDelta.message;

    DeltaStream deltaStream = deltaSync.deltaStream(dir.file("new"), handle.data);
    Result<Bytes> streamedDelta = collectStream(deltaStream);
    ASSERT_TRUE(streamedDelta.success) << streamedDelta.message;
    EXPECT_EQ(streamedDelta.data, bufferedDelta.data);
}

TEST(Pipelines, NegotiatedParamsAreReported) {
    TempDir dir;
    DeltaSync deltaSync;
    writeFile(dir.file("basis"), randomBytes(1000, 2));

    SignatureStream stream = deltaSync.signatureStream(dir.file("basis"));
    ASSERT_TRUE(collectStream(stream).success);
    EXPECT_EQ(stream.params().blockLength, 256u);
    EXPECT_EQ(stream.params().strongLength, 6u);
    EXPECT_EQ(stream.params().format, SignatureFormat::Blake2);
}

TEST(Pipelines, LargeBasisWithSmallBuffers) {
    TempDir dir;
    SyncConfig config;
    config.bufferSize = 1024;
    DeltaSync deltaSync(config);
    Bytes basis = randomBytes(5 << 20, 17);
    Bytes newContent = basis;
    newContent[2500000] = static_cast<char>(newContent[2500000] ^ 0x5a);
    writeFile(dir.file("basis"), basis);
    writeFile(dir.file("new"), newContent);

    SignatureStream signature = deltaSync.signatureStream(dir.file("basis"));
    ASSERT_TRUE(collectStream(signature).success);
    EXPECT_LT(signature.params().blockLength, 2 * config.bufferSize);

    Result<Bytes> delta = deltaSync.delta(dir.file("new"), dir.file("basis"));
    ASSERT_TRUE(delta.success) << delta.message;
    EXPECT_LT(delta.data.size(), newContent.size() / 10);

    ASSERT_TRUE(deltaSync.applyPatch(delta.data, dir.file("basis"), dir.file("out")).success);
    EXPECT_EQ(readFile(dir.file("out")), newContent);
}

TEST(Pipelines, SignatureOfUnknownSizeStreamUsesDefaults) {
    DeltaSync deltaSync;
    Bytes data = randomBytes(5000, 9);
    SignatureStream stream = deltaSync.signatureStream(
        std::make_unique<StreamSource>(std::make_unique<MemoryChunkStream>(data, 100)));
    Result<Bytes> signature = collectStream(stream);
    ASSERT_TRUE(signature.success) << signature.message;
    EXPECT_EQ(stream.params().blockLength, Config::DEFAULT_BLOCK_LENGTH);
    EXPECT_EQ(stream.params().strongLength, 32u);
}

TEST(Pipelines, ChunkingInvariance) {
    TempDir dir;
    DeltaSync deltaSync(smallBuffers());
    Bytes basis = randomBytes(12000, 21);
    Bytes newContent = basis;
    newContent.insert(newContent.begin() + 6000, 'x');
    writeFile(dir.file("basis"), basis);
    writeFile(dir.file("new"), newContent);

    Result<Bytes> signature = deltaSync.generateSignature(dir.file("basis"));
    ASSERT_TRUE(signature.success) << signature.message;

    auto whole = deltaSync.loadSignature(signature.data);
    ASSERT_TRUE(whole.success) << whole.message;
    Result<Bytes> expected = deltaSync.generateDelta(dir.file("new"), whole.data);
    ASSERT_TRUE(expected.success) << expected.message;

    for (size_t piece : {1u, 7u, 13u, 4096u}) {
        MemoryChunkStream chunks(signature.data, piece);
        auto split = deltaSync.loadSignature(chunks);
        ASSERT_TRUE(split.success) << split.message;
        Result<Bytes> delta = deltaSync.generateDelta(dir.file("new"), split.data);
        ASSERT_TRUE(delta.success) << delta.message;
        EXPECT_EQ(delta.data, expected.data) << "pieces of " << piece;
    }
}

TEST(Pipelines, PatchStreamsIntoSink) {
    TempDir dir;
    DeltaSync deltaSync(smallBuffers());
    Bytes basis = randomBytes(8000, 4);
    Bytes newContent(basis.rbegin(), basis.rend());
    writeFile(dir.file("basis"), basis);
    writeFile(dir.file("new"), newContent);

    Result<Bytes> delta = deltaSync.delta(dir.file("new"), dir.file("basis"));
    ASSERT_TRUE(delta.success) << delta.message;

    MemorySink sink;
    Result<void> patched = deltaSync.applyPatch(
        std::make_unique<MemorySource>(delta.data), dir.file("basis"), sink);
    ASSERT_TRUE(patched.success) << patched.message;
    EXPECT_EQ(sink.data(), newContent);
}

TEST(Pipelines, PatchInPlaceReplacesTarget) {
    TempDir dir;
    DeltaSync deltaSync;
    const std::string oldText = repeatedLines(100);
    const std::string newText = "header\n" + repeatedLines(100);
    writeFile(dir.file("target"), oldText);
    writeFile(dir.file("new"), newText);

    Result<Bytes> delta = deltaSync.delta(dir.file("new"), dir.file("target"));
    ASSERT_TRUE(delta.success) << delta.message;
    ASSERT_TRUE(deltaSync.patch(dir.file("target"), delta.data).success);

    EXPECT_EQ(readFile(dir.file("target")), toBytes(newText));
    EXPECT_FALSE(fs::exists(PatchApplier::temporaryPathFor(dir.file("target"))));
}

TEST(Pipelines, FailedPatchInPlaceLeavesTargetUntouched) {
    TempDir dir;
    DeltaSync deltaSync;
    writeFile(dir.file("target"), "original");

    ASSERT_FALSE(deltaSync.patch(dir.file("target"), toBytes("not a delta")).success);
    EXPECT_EQ(readFile(dir.file("target")), toBytes("original"));
    EXPECT_FALSE(fs::exists(PatchApplier::temporaryPathFor(dir.file("target"))));
}

TEST(Pipelines, SyncFileMakesCopiesEqual) {
    TempDir dir;
    DeltaSync deltaSync;
    Bytes source = randomBytes(70000, 8);
    Bytes dest = source;
    dest.resize(50000);
    writeFile(dir.file("source"), source);
    writeFile(dir.file("dest"), dest);

    Result<void> synced = deltaSync.syncFile(dir.file("source"), dir.file("dest"));
    ASSERT_TRUE(synced.success) << synced.message;
    EXPECT_EQ(readFile(dir.file("dest")), source);
}

TEST(PipelineErrors, SignatureOfMissingFile) {
    DeltaSync deltaSync;
    SignatureStream stream = deltaSync.signatureStream("/nonexistent/deltasync/basis");
    auto chunk = stream.next();
    ASSERT_FALSE(chunk.success);
    EXPECT_EQ(chunk.kind, ErrorKind::SourceNotFound);
    EXPECT_EQ(stream.state(), DriverState::Failed);
}

TEST(PipelineErrors, PatchAgainstMissingBasis) {
    TempDir dir;
    DeltaSync deltaSync;
    writeFile(dir.file("new"), "content");
    Result<Bytes> delta = deltaSync.delta(dir.file("new"), dir.file("new"));
    ASSERT_TRUE(delta.success);

    Result<void> patched = deltaSync.applyPatch(delta.data, dir.file("missing"), dir.file("out"));
    ASSERT_FALSE(patched.success);
    EXPECT_EQ(patched.kind, ErrorKind::SourceNotFound);
    EXPECT_FALSE(fs::exists(dir.file("out")));
}

TEST(PipelineErrors, MalformedSignatureBytes) {
    DeltaSync deltaSync;
    auto garbage = deltaSync.loadSignature(toBytes("definitely not a signature"));
    ASSERT_FALSE(garbage.success);
    EXPECT_EQ(garbage.kind, ErrorKind::InvalidSignature);

    auto empty = deltaSync.loadSignature(Bytes{});
    ASSERT_FALSE(empty.success);
    EXPECT_EQ(empty.kind, ErrorKind::InvalidSignature);
}

TEST(PipelineErrors, DeltaOfMissingFile) {
    TempDir dir;
    DeltaSync deltaSync;
    writeFile(dir.file("basis"), "basis");
    Result<Bytes> signature = deltaSync.generateSignature(dir.file("basis"));
    ASSERT_TRUE(signature.success);
    auto handle = deltaSync.loadSignature(signature.data);
    ASSERT_TRUE(handle.success);

    Result<Bytes> delta = deltaSync.generateDelta(dir.file("missing"), handle.data);
    ASSERT_FALSE(delta.success);
    EXPECT_EQ(delta.kind, ErrorKind::SourceNotFound);
}

TEST(PipelineErrors, CorruptDeltaIsPatchFailure) {
    TempDir dir;
    DeltaSync deltaSync;
    writeFile(dir.file("basis"), "basis");
    Result<void> patched = deltaSync.applyPatch(toBytes("junk"), dir.file("basis"), dir.file("out"));
    ASSERT_FALSE(patched.success);
    EXPECT_EQ(patched.kind, ErrorKind::PatchApplicationFailed);
    EXPECT_EQ(patched.engineCode, static_cast<int>(EngineResult::BadMagic));
    EXPECT_FALSE(fs::exists(dir.file("out")));
}

TEST(PipelineErrors, BufferTooSmallForBlock) {
    TempDir dir;
    SyncConfig config = smallBuffers();
    config.blockLength = 4096;
    DeltaSync deltaSync(config);
    writeFile(dir.file("basis"), randomBytes(10000, 1));

    Result<Bytes> signature = deltaSync.generateSignature(dir.file("basis"));
    ASSERT_TRUE(signature.success) << signature.message;
    auto handle = deltaSync.loadSignature(signature.data);
    ASSERT_TRUE(handle.success);

    Result<Bytes> delta = deltaSync.generateDelta(dir.file("basis"), handle.data);
    ASSERT_FALSE(delta.success);
    EXPECT_EQ(delta.kind, ErrorKind::InsufficientBuffer);
}

TEST(PipelineErrors, InvalidConfiguration) {
    SyncConfig config;
    config.bufferSize = 10;
    DeltaSync deltaSync(config);
    auto handle = deltaSync.loadSignature(toBytes("whatever"));
    ASSERT_FALSE(handle.success);
    EXPECT_EQ(handle.kind, ErrorKind::InsufficientBuffer);
}
