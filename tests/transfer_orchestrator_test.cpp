// tests/transfer_orchestrator_test.cpp
#include <gtest/gtest.h>

#include "chunk_config.hpp"
#include "chunk_engine.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"
#include "transfer_orchestrator.hpp"

using namespace ChunkStore;
using ChunkStore::Testing::FailingBackend;
using ChunkStore::Testing::MemoryBackend;
using ChunkStore::Testing::TempDir;
using ChunkStore::Testing::patternBytes;
using ChunkStore::Testing::readFile;
using ChunkStore::Testing::writeFile;

using Distribution::LoadBalancing;
using Distribution::Provider;
using Distribution::Target;

namespace {

const Target GDRIVE{Provider::GoogleDrive, "work"};
const Target DROPBOX{Provider::Dropbox, "home"};
const Target MEGA{Provider::Mega, "backup"};

class TransferOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        original_ = patternBytes(1000, 11);
        writeFile(dir_ / "input.bin", original_);
        manifest_ = Chunks::splitFile(dir_ / "input.bin", chunksDir(), "input.bin", Crypto::Cipher::disabled(), 100);
        ASSERT_EQ(manifest_.chunkCount(), 10u);
    }

    std::filesystem::path chunksDir() const { return dir_ / "chunks"; }

    template<class B>
    B* addBackend(Storage::BackendRegistry& registry, const Target& target) {
        auto backend = std::make_unique<B>();
        B* raw = backend.get();
        registry.add(target, std::move(backend));
        return raw;
    }

    void addDirectory(Storage::BackendRegistry& registry, const Target& target) {
        registry.add(target, std::make_unique<Storage::DirectoryBackend>(dir_ / ("remote_" + target.account)));
    }

    std::vector<char> assembleLocal(const Metadata::Manifest& m) {
        Chunks::assembleFile(m, chunksDir(), dir_ / "out.bin", Crypto::Cipher::disabled());
        return readFile(dir_ / "out.bin");
    }

    TempDir dir_;
    std::vector<char> original_;
    Metadata::Manifest manifest_;
};

} // namespace

TEST_F(TransferOrchestratorTest, UploadReplicatesEveryChunk) {
    Storage::BackendRegistry registry;
    MemoryBackend* g = addBackend<MemoryBackend>(registry, GDRIVE);
    MemoryBackend* d = addBackend<MemoryBackend>(registry, DROPBOX);
    MemoryBackend* m = addBackend<MemoryBackend>(registry, MEGA);

    Distribution::DistributionStrategy strategy({GDRIVE, DROPBOX, MEGA}, 2, LoadBalancing::RoundRobin);
    Transfer::TransferOrchestrator orchestrator(registry, Transfer::TransferOptions{3, false});

    Transfer::UploadReport report = orchestrator.upload(manifest_, chunksDir(), strategy);

    EXPECT_EQ(report.replicas_uploaded, 20u);
    EXPECT_TRUE(report.failures.empty());
    EXPECT_FALSE(report.cancelled);
    EXPECT_EQ(manifest_.distribution_mode, Metadata::DistributionMode::Cloud);
    EXPECT_EQ(g->uploadCalls() + d->uploadCalls() + m->uploadCalls(), 20u);

    for (const auto& c : manifest_.chunks) {
        ASSERT_EQ(c.destinations.size(), 2u);
        EXPECT_TRUE(c.hasReplicaAt(strategy.destinationsFor(c.index)[0]));
        EXPECT_TRUE(c.hasReplicaAt(strategy.destinationsFor(c.index)[1]));
        EXPECT_TRUE(c.uploaded_at.has_value());
    }
}

TEST_F(TransferOrchestratorTest, FailedReplicasAreSkippedAndReported) {
    Storage::BackendRegistry registry;
    addBackend<MemoryBackend>(registry, GDRIVE);
    FailingBackend* failing = addBackend<FailingBackend>(registry, DROPBOX);

    Distribution::DistributionStrategy strategy({GDRIVE, DROPBOX}, 1, LoadBalancing::RoundRobin);
    Transfer::TransferOrchestrator orchestrator(registry, Transfer::TransferOptions{4, false});

    Transfer::UploadReport report = orchestrator.upload(manifest_, chunksDir(), strategy);

    EXPECT_EQ(report.replicas_uploaded, 5u);
    EXPECT_EQ(report.failures.size(), 5u);
    EXPECT_EQ(failing->upload_calls.load(), 5u);
    for (const auto& f : report.failures) {
        EXPECT_EQ(f.target, DROPBOX);
        EXPECT_EQ(f.chunk_index % 2, 1u);
    }
    for (const auto& c : manifest_.chunks) {
        EXPECT_EQ(c.destinations.size(), c.index % 2 == 0 ? 1u : 0u);
    }
    EXPECT_EQ(manifest_.distribution_mode, Metadata::DistributionMode::Hybrid);
}

TEST_F(TransferOrchestratorTest, OneSurvivingReplicaPerChunkIsEnoughForCloudMode) {
    Storage::BackendRegistry registry;
    addBackend<MemoryBackend>(registry, GDRIVE);
    addBackend<FailingBackend>(registry, DROPBOX);

    Distribution::DistributionStrategy strategy({GDRIVE, DROPBOX}, 2, LoadBalancing::RoundRobin);
    Transfer::TransferOrchestrator orchestrator(registry, Transfer::TransferOptions{2, false});

    Transfer::UploadReport report = orchestrator.upload(manifest_, chunksDir(), strategy);
    EXPECT_EQ(report.replicas_uploaded, 10u);
    EXPECT_EQ(report.failures.size(), 10u);
    EXPECT_EQ(manifest_.distribution_mode, Metadata::DistributionMode::Cloud);
}

TEST_F(TransferOrchestratorTest, FailOnReplicaFailureThrowsButKeepsSuccesses) {
    Storage::BackendRegistry registry;
    addBackend<MemoryBackend>(registry, GDRIVE);
    addBackend<FailingBackend>(registry, DROPBOX);

    Distribution::DistributionStrategy strategy({GDRIVE, DROPBOX}, 1, LoadBalancing::RoundRobin);
    Transfer::TransferOrchestrator orchestrator(registry, Transfer::TransferOptions{4, true});

    EXPECT_THROW(orchestrator.upload(manifest_, chunksDir(), strategy), UploadFailure);
    EXPECT_EQ(manifest_.chunkAt(0).destinations.size(), 1u);
    EXPECT_EQ(manifest_.chunkAt(1).destinations.size(), 0u);
    EXPECT_EQ(manifest_.distribution_mode, Metadata::DistributionMode::Hybrid);
}

TEST_F(TransferOrchestratorTest, RerunOnlyFillsMissingReplicas) {
    {
        Storage::BackendRegistry first;
        addDirectory(first, GDRIVE);
        addBackend<FailingBackend>(first, DROPBOX);
        Distribution::DistributionStrategy strategy({GDRIVE, DROPBOX}, 2, LoadBalancing::RoundRobin);
        Transfer::TransferOrchestrator(first, Transfer::TransferOptions{4, false}).upload(manifest_, chunksDir(), strategy);
    }
    for (const auto& c : manifest_.chunks) {
        ASSERT_EQ(c.destinations.size(), 1u);
        EXPECT_EQ(c.destinations[0].target(), GDRIVE);
    }

    Storage::BackendRegistry second;
    addDirectory(second, GDRIVE);
    addDirectory(second, DROPBOX);
    Distribution::DistributionStrategy strategy({GDRIVE, DROPBOX}, 2, LoadBalancing::RoundRobin);
    Transfer::UploadReport report =
        Transfer::TransferOrchestrator(second, Transfer::TransferOptions{4, false}).upload(manifest_, chunksDir(), strategy);

    EXPECT_EQ(report.replicas_already_present, 10u);
    EXPECT_EQ(report.replicas_uploaded, 10u);
    for (const auto& c : manifest_.chunks) {
        EXPECT_EQ(c.destinations.size(), 2u);
        EXPECT_TRUE(c.hasReplicaAt(DROPBOX));
    }
}

TEST_F(TransferOrchestratorTest, EmptyPoolKeepsEverythingLocal) {
    Storage::BackendRegistry registry;
    Distribution::DistributionStrategy strategy({}, 1, LoadBalancing::RoundRobin);
    Transfer::TransferOrchestrator orchestrator(registry, Transfer::TransferOptions{});

    Transfer::UploadReport report = orchestrator.upload(manifest_, chunksDir(), strategy);
    EXPECT_EQ(report.chunks_kept_local, 10u);
    EXPECT_EQ(report.replicas_uploaded, 0u);
    EXPECT_TRUE(report.failures.empty());
    EXPECT_EQ(manifest_.distribution_mode, Metadata::DistributionMode::Local);
}

TEST_F(TransferOrchestratorTest, CancelledBeforeStartUploadsNothing) {
    Storage::BackendRegistry registry;
    MemoryBackend* g = addBackend<MemoryBackend>(registry, GDRIVE);
    Distribution::DistributionStrategy strategy({GDRIVE}, 1, LoadBalancing::RoundRobin);
    Transfer::TransferOrchestrator orchestrator(registry, Transfer::TransferOptions{2, false});

    Concurrency::CancellationToken cancel;
    cancel.cancel();
    Transfer::UploadReport report = orchestrator.upload(manifest_, chunksDir(), strategy, cancel);

    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.chunks_not_attempted, 10u);
    EXPECT_EQ(g->uploadCalls(), 0u);
    EXPECT_EQ(manifest_.distribution_mode, Metadata::DistributionMode::Local);
}

TEST_F(TransferOrchestratorTest, MissingLocalChunkIsFatal) {
    Storage::BackendRegistry registry;
    addBackend<MemoryBackend>(registry, GDRIVE);
    Distribution::DistributionStrategy strategy({GDRIVE}, 1, LoadBalancing::RoundRobin);
    Transfer::TransferOrchestrator orchestrator(registry, Transfer::TransferOptions{1, false});

    std::filesystem::remove(Config::ChunkConfig::chunkFilePath(chunksDir(), manifest_.chunkAt(4).id));
    EXPECT_THROW(orchestrator.upload(manifest_, chunksDir(), strategy), IOFailure);
    EXPECT_TRUE(manifest_.chunkAt(4).destinations.empty());
}

TEST_F(TransferOrchestratorTest, DownloadFallsBackToNextReplica) {
    {
        Storage::BackendRegistry registry;
        addDirectory(registry, GDRIVE);
        addDirectory(registry, DROPBOX);
        Distribution::DistributionStrategy strategy({GDRIVE, DROPBOX}, 2, LoadBalancing::RoundRobin);
        Transfer::TransferOrchestrator(registry, Transfer::TransferOptions{4, false}).upload(manifest_, chunksDir(), strategy);
    }
    Chunks::cleanupChunks(chunksDir());

    // Google Drive is down now; every chunk has a Dropbox copy.
    Storage::BackendRegistry registry;
    FailingBackend* failing = addBackend<FailingBackend>(registry, GDRIVE);
    addDirectory(registry, DROPBOX);
    Transfer::TransferOrchestrator orchestrator(registry, Transfer::TransferOptions{4, false});

    Transfer::DownloadReport report = orchestrator.download(manifest_, chunksDir());
    EXPECT_EQ(report.chunks_downloaded, 10u);
    EXPECT_EQ(failing->download_calls.load(), 5u);
    EXPECT_EQ(report.failed_attempts.size(), 5u);
    EXPECT_EQ(assembleLocal(manifest_), original_);
}

TEST_F(TransferOrchestratorTest, DownloadLooksUpObjectsWithoutRecordedId) {
    {
        Storage::BackendRegistry registry;
        addDirectory(registry, MEGA);
        Distribution::DistributionStrategy strategy({MEGA}, 1, LoadBalancing::RoundRobin);
        Transfer::TransferOrchestrator(registry, Transfer::TransferOptions{}).upload(manifest_, chunksDir(), strategy);
    }
    Chunks::cleanupChunks(chunksDir());
    for (auto& c : manifest_.chunks) {
        c.destinations[0].remote_id.clear();
    }

    Storage::BackendRegistry registry;
    addDirectory(registry, MEGA);
    Transfer::TransferOrchestrator orchestrator(registry, Transfer::TransferOptions{});
    EXPECT_EQ(orchestrator.download(manifest_, chunksDir()).chunks_downloaded, 10u);
    EXPECT_EQ(assembleLocal(manifest_), original_);
}

TEST_F(TransferOrchestratorTest, WrongSizedReplicaIsRejected) {
    Storage::BackendRegistry registry;
    MemoryBackend* g = addBackend<MemoryBackend>(registry, GDRIVE);
    Distribution::DistributionStrategy strategy({GDRIVE}, 1, LoadBalancing::RoundRobin);
    Transfer::TransferOrchestrator orchestrator(registry, Transfer::TransferOptions{2, false});
    orchestrator.upload(manifest_, chunksDir(), strategy);

    g->corrupt(manifest_.chunkAt(3).destinations[0].remote_id, {'x'});
    try {
        orchestrator.download(manifest_, dir_ / "fetched");
        FAIL() << "expected ChunkUnavailable";
    } catch (const ChunkUnavailable& e) {
        ASSERT_TRUE(e.context().chunk_index.has_value());
        EXPECT_EQ(*e.context().chunk_index, 3u);
        EXPECT_EQ(e.context().provider, "gdrive/work");
    }
}

TEST_F(TransferOrchestratorTest, ChunkWithoutDestinationsIsUnavailable) {
    Storage::BackendRegistry registry;
    addBackend<MemoryBackend>(registry, GDRIVE);
    Transfer::TransferOrchestrator orchestrator(registry, Transfer::TransferOptions{});

    EXPECT_THROW(orchestrator.download(manifest_, dir_ / "fetched"), ChunkUnavailable);
}

TEST_F(TransferOrchestratorTest, DownloadFailsWhenEveryReplicaFails) {
    {
        Storage::BackendRegistry registry;
        addBackend<MemoryBackend>(registry, GDRIVE);
        Distribution::DistributionStrategy strategy({GDRIVE}, 1, LoadBalancing::RoundRobin);
        Transfer::TransferOrchestrator(registry, Transfer::TransferOptions{}).upload(manifest_, chunksDir(), strategy);
    }

    // The objects lived in the in-memory backend that is gone now.
    Storage::BackendRegistry registry;
    addBackend<FailingBackend>(registry, GDRIVE);
    Transfer::TransferOrchestrator orchestrator(registry, Transfer::TransferOptions{});
    EXPECT_THROW(orchestrator.download(manifest_, dir_ / "fetched"), ChunkUnavailable);

    Storage::BackendRegistry unregistered;
    EXPECT_THROW(Transfer::TransferOrchestrator(unregistered, Transfer::TransferOptions{}).download(manifest_, dir_ / "f2"),
                 ChunkUnavailable);
}

TEST_F(TransferOrchestratorTest, CancelledDownloadReportsNotAttempted) {
    Storage::BackendRegistry registry;
    addBackend<MemoryBackend>(registry, GDRIVE);
    Distribution::DistributionStrategy strategy({GDRIVE}, 1, LoadBalancing::RoundRobin);
    Transfer::TransferOrchestrator orchestrator(registry, Transfer::TransferOptions{2, false});
    orchestrator.upload(manifest_, chunksDir(), strategy);

    Concurrency::CancellationToken cancel;
    cancel.cancel();
    Transfer::DownloadReport report = orchestrator.download(manifest_, dir_ / "fetched", cancel);
    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.chunks_downloaded, 0u);
    EXPECT_EQ(report.chunks_not_attempted, 10u);
}

TEST(TransferOrchestratorOptionsTest, ZeroWorkersIsRejected) {
    Storage::BackendRegistry registry;
    EXPECT_THROW(Transfer::TransferOrchestrator(registry, Transfer::TransferOptions{0, false}), ConfigurationError);
}
