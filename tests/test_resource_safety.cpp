#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "../sync/delta_sync.hpp"

using namespace testing_support;

namespace {

    class ResourceSafety : public ::testing::Test {
    protected:
        void SetUp() override {
            config_.bufferSize = Config::MIN_BUFFER_SIZE;
            engine_ = std::make_shared<CountingEngine>();
            basis_ = randomBytes(40000, 17);
            writeFile(dir_.file("basis"), basis_);
            Bytes changed = basis_;
            changed[100] ^= 1;
            writeFile(dir_.file("new"), changed);
        }

        DeltaSync deltaSync() const { return DeltaSync(config_, engine_); }

        std::shared_ptr<SignatureHandle> loadedSignature() {
            Result<Bytes> signature = deltaSync().generateSignature(dir_.file("basis"));
            EXPECT_TRUE(signature.success) << signature.message;
            auto handle = deltaSync().loadSignature(signature.data);
            EXPECT_TRUE(handle.success) << handle.message;
            return handle.data;
        }

        TempDir dir_;
        SyncConfig config_;
        std::shared_ptr<CountingEngine> engine_;
        Bytes basis_;
    };
}

TEST_F(ResourceSafety, CompletedRunsReleaseEverything) {
    const size_t fdsBefore = openFdCount();

    auto handle = loadedSignature();
    ASSERT_TRUE(handle);
    Result<Bytes> delta = deltaSync().generateDelta(dir_.file("new"), handle);
    ASSERT_TRUE(delta.success) << delta.message;
    ASSERT_TRUE(deltaSync().applyPatch(delta.data, dir_.file("basis"), dir_.file("out")).success);

    EXPECT_EQ(engine_->createdJobs.load(), 4);
    EXPECT_EQ(engine_->liveJobs.load(), 0);
    EXPECT_EQ(openFdCount(), fdsBefore);
}

TEST_F(ResourceSafety, AbandonedSignatureStreamReleasesJobAndFile) {
    const size_t fdsBefore = openFdCount();
    {
        SignatureStream stream = deltaSync().signatureStream(dir_.file("basis"));
        auto chunk = stream.next();
        ASSERT_TRUE(chunk.success);
        ASSERT_TRUE(chunk.data.has_value());
        EXPECT_EQ(engine_->liveJobs.load(), 1);
        EXPECT_EQ(openFdCount(), fdsBefore + 1);
    }
    EXPECT_EQ(engine_->liveJobs.load(), 0);
    EXPECT_EQ(openFdCount(), fdsBefore);
}

TEST_F(ResourceSafety, ClosedDeltaStreamReleasesJobAndFile) {
    auto handle = loadedSignature();
    ASSERT_TRUE(handle);
    const size_t fdsBefore = openFdCount();

    Bytes reversed(basis_.rbegin(), basis_.rend());
    writeFile(dir_.file("reversed"), reversed);
    DeltaStream stream = deltaSync().deltaStream(dir_.file("reversed"), handle);
    auto chunk = stream.next();
    ASSERT_TRUE(chunk.success) << chunk.message;
    ASSERT_TRUE(chunk.data.has_value());
    EXPECT_EQ(engine_->liveJobs.load(), 1);

    stream.close();
    EXPECT_EQ(engine_->liveJobs.load(), 0);
    EXPECT_EQ(openFdCount(), fdsBefore);

    auto after = stream.next();
    ASSERT_TRUE(after.success);
    EXPECT_FALSE(after.data.has_value());
}

TEST_F(ResourceSafety, FailedPatchReleasesJobAndFiles) {
    const size_t fdsBefore = openFdCount();

    Bytes delta;
    delta.push_back('\x64');
    delta.push_back('\x73');
    delta.push_back('\x02');
    delta.push_back('\x36');
    delta.push_back('\x42');  // no such command
    Result<void> patched = deltaSync().applyPatch(delta, dir_.file("basis"), dir_.file("out"));
    ASSERT_FALSE(patched.success);
    EXPECT_EQ(patched.kind, ErrorKind::PatchApplicationFailed);

    EXPECT_EQ(engine_->createdJobs.load(), 1);
    EXPECT_EQ(engine_->liveJobs.load(), 0);
    EXPECT_EQ(openFdCount(), fdsBefore);
}

TEST_F(ResourceSafety, FailedSignatureLoadReleasesJob) {
    auto handle = deltaSync().loadSignature(toBytes("garbage that is long enough"));
    ASSERT_FALSE(handle.success);
    EXPECT_EQ(engine_->createdJobs.load(), 1);
    EXPECT_EQ(engine_->liveJobs.load(), 0);
}

TEST_F(ResourceSafety, MissingSourceCreatesNothing) {
    const size_t fdsBefore = openFdCount();

    SignatureStream stream = deltaSync().signatureStream(dir_.file("missing"));
    auto chunk = stream.next();
    ASSERT_FALSE(chunk.success);
    EXPECT_EQ(chunk.kind, ErrorKind::SourceNotFound);

    Result<void> patched = deltaSync().applyPatch(Bytes{}, dir_.file("missing"), dir_.file("out"));
    ASSERT_FALSE(patched.success);
    EXPECT_EQ(patched.kind, ErrorKind::SourceNotFound);

    EXPECT_EQ(engine_->createdJobs.load(), 0);
    EXPECT_EQ(openFdCount(), fdsBefore);
}

TEST_F(ResourceSafety, SourceReadErrorReleasesJob) {
    bool closed = false;
    SignatureStream stream = deltaSync().signatureStream(std::make_unique<FailingSource>(basis_, closed));
    Result<Bytes> collected = collectStream(stream);
    ASSERT_FALSE(collected.success);
    EXPECT_EQ(collected.kind, ErrorKind::SourceReadError);
    EXPECT_TRUE(closed);
    EXPECT_EQ(engine_->liveJobs.load(), 0);
}
