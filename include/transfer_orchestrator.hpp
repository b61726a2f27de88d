// include/transfer_orchestrator.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "backend_registry.hpp"
#include "cancellation.hpp"
#include "distribution_strategy.hpp"
#include "manifest.hpp"

namespace ChunkStore {
namespace Transfer {

struct TransferOptions {
    size_t worker_count = 4;
    // Turn any skipped replica into an UploadFailure once the pass is over.
    bool fail_on_replica_failure = false;
};

// One replica that could not be stored or fetched.
struct ReplicaFailure {
    uint64_t chunk_index = 0;
    std::string chunk_id;
    Distribution::Target target;
    std::string reason;
};

struct UploadReport {
    size_t replicas_uploaded = 0;
    size_t replicas_already_present = 0;
    size_t chunks_kept_local = 0;   // Placed on the local-only sentinel
    size_t chunks_not_attempted = 0; // Skipped after cancellation
    bool cancelled = false;
    std::vector<ReplicaFailure> failures;
};

struct DownloadReport {
    size_t chunks_downloaded = 0;
    size_t chunks_not_attempted = 0;
    bool cancelled = false;
    std::vector<ReplicaFailure> failed_attempts; // Replicas that failed before another one succeeded
};

// Moves chunk files between local storage and the registered backends.
// Chunks are handled concurrently; manifest updates go through one mutex.
class TransferOrchestrator {
public:
    TransferOrchestrator(const Storage::BackendRegistry& registry, TransferOptions options);

    // Uploads every chunk of `manifest` from local_chunk_dir to the targets the
    // strategy picks, skipping targets already recorded for the chunk. The
    // manifest is updated in place with each replica that succeeded, also when
    // an exception leaves this function. Local read errors are rethrown after
    // in-flight work completes; UploadFailure is thrown when configured.
    UploadReport upload(Metadata::Manifest& manifest, const std::filesystem::path& local_chunk_dir,
                        const Distribution::DistributionStrategy& strategy,
                        const Concurrency::CancellationToken& cancel = {});

    // Fetches every chunk into local_chunk_dir, trying recorded destinations in
    // order. Throws ChunkUnavailable for the lowest-index chunk no destination
    // could supply.
    DownloadReport download(const Metadata::Manifest& manifest, const std::filesystem::path& local_chunk_dir,
                            const Concurrency::CancellationToken& cancel = {});

private:
    const Storage::BackendRegistry& registry_;
    TransferOptions options_;
};

} // namespace Transfer
} // namespace ChunkStore
