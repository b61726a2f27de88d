// src/transfer_orchestrator.cpp
#include "transfer_orchestrator.hpp"
#include "chunk.hpp"
#include "errors.hpp"
#include "thread_pool.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <iostream>
#include <mutex>

namespace fs = std::filesystem;

namespace ChunkStore {
namespace Transfer {

namespace {

bool isLocalSentinel(const Distribution::Target& target) {
    return target.provider == Distribution::Provider::Local && target.account.empty();
}

std::string describe(const Distribution::Target& target) {
    std::string out = Distribution::providerToString(target.provider);
    if (!target.account.empty()) {
        out += "/" + target.account;
    }
    return out;
}

// Waits for every future, then rethrows the first failure in submission order.
void collect(std::vector<std::future<void>>& futures) {
    std::exception_ptr first_error;
    for (auto& f : futures) {
        try {
            f.get();
        } catch (const std::exception&) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

// cloud once a full pass left every chunk with a replica, hybrid while only some have one.
void settleDistributionMode(Metadata::Manifest& manifest, bool pass_complete) {
    auto has_replica = [](const Metadata::ChunkRecord& c) { return !c.destinations.empty(); };
    const bool any_remote = std::any_of(manifest.chunks.begin(), manifest.chunks.end(), has_replica);
    const bool all_remote = std::all_of(manifest.chunks.begin(), manifest.chunks.end(), has_replica);

    if (any_remote && all_remote && pass_complete) {
        manifest.distribution_mode = Metadata::DistributionMode::Cloud;
    } else if (any_remote) {
        manifest.distribution_mode = Metadata::DistributionMode::Hybrid;
    } else {
        manifest.distribution_mode = Metadata::DistributionMode::Local;
    }
}

} // namespace

TransferOrchestrator::TransferOrchestrator(const Storage::BackendRegistry& registry, TransferOptions options)
    : registry_(registry), options_(options) {
    if (options_.worker_count == 0) {
        throw ConfigurationError("worker count must be at least 1");
    }
}

UploadReport TransferOrchestrator::upload(Metadata::Manifest& manifest, const fs::path& local_chunk_dir,
                                          const Distribution::DistributionStrategy& strategy,
                                          const Concurrency::CancellationToken& cancel) {
    manifest.sortChunks();

    UploadReport report;
    std::mutex manifest_mutex; // Guards `manifest` and `report`
    std::atomic<bool> aborted{false};

    std::cout << "Uploading " << manifest.chunkCount() << " chunks of '" << manifest.original_name << "' with "
              << options_.worker_count << " workers..." << std::endl;

    // Records are never added or removed during the pass, so copies of the
    // immutable fields can be handed to the workers.
    struct Job {
        uint64_t index;
        std::string id;
    };
    std::vector<Job> jobs;
    for (const auto& c : manifest.chunks) {
        jobs.push_back(Job{c.index, c.id});
    }

    {
        Concurrency::ThreadPool pool(std::min(options_.worker_count, std::max<size_t>(jobs.size(), 1)));
        std::vector<std::future<void>> futures;
        futures.reserve(jobs.size());

        for (const Job& job : jobs) {
            futures.push_back(pool.enqueue([&, job]() {
                if (cancel.isCancelled() || aborted.load()) {
                    std::lock_guard<std::mutex> lock(manifest_mutex);
                    ++report.chunks_not_attempted;
                    return;
                }

                std::vector<char> bytes;
                bool loaded = false;

                for (const Distribution::Target& target : strategy.destinationsFor(job.index)) {
                    if (isLocalSentinel(target)) {
                        std::lock_guard<std::mutex> lock(manifest_mutex);
                        ++report.chunks_kept_local;
                        continue;
                    }
                    {
                        std::lock_guard<std::mutex> lock(manifest_mutex);
                        if (manifest.chunkAt(job.index).hasReplicaAt(target)) {
                            ++report.replicas_already_present;
                            continue;
                        }
                    }

                    Storage::StorageBackend* backend = registry_.find(target);
                    if (backend == nullptr) {
                        std::cerr << "Warning: no backend registered for " << describe(target) << ", skipping chunk "
                                  << job.id << std::endl;
                        std::lock_guard<std::mutex> lock(manifest_mutex);
                        report.failures.push_back(ReplicaFailure{job.index, job.id, target, "no backend registered"});
                        continue;
                    }

                    if (cancel.isCancelled() || aborted.load()) {
                        std::lock_guard<std::mutex> lock(manifest_mutex);
                        report.cancelled = true;
                        break;
                    }

                    if (!loaded) {
                        try {
                            bytes = Chunks::Chunk::loadData(local_chunk_dir, job.id);
                        } catch (const IOFailure&) {
                            // Local I/O is fatal: stop handing out new work.
                            aborted.store(true);
                            throw IOFailure("cannot read local chunk for upload from " + local_chunk_dir.string(),
                                            ErrorContext{job.id, job.index, ""});
                        }
                        loaded = true;
                    }

                    const std::string remote_path = Distribution::remotePathFor(target.provider, job.id);
                    try {
                        std::string remote_id = backend->upload(bytes, remote_path);

                        Metadata::ChunkDestination destination;
                        destination.provider = target.provider;
                        destination.remote_path = remote_path;
                        destination.remote_id = remote_id;
                        destination.account = target.account;

                        std::lock_guard<std::mutex> lock(manifest_mutex);
                        manifest.updateDistribution(job.index, destination);
                        ++report.replicas_uploaded;
                    } catch (const std::exception& e) {
                        std::cerr << "Warning: failed to upload chunk " << job.id << " (index " << job.index
                                  << ") to " << describe(target) << ": " << e.what() << std::endl;
                        std::lock_guard<std::mutex> lock(manifest_mutex);
                        report.failures.push_back(ReplicaFailure{job.index, job.id, target, e.what()});
                    }
                }
            }));
        }

        // Any local I/O error is rethrown here, after every task has run.
        try {
            collect(futures);
        } catch (const std::exception&) {
            settleDistributionMode(manifest, false);
            throw;
        }
    }

    if (report.chunks_not_attempted > 0) {
        report.cancelled = true;
    }
    settleDistributionMode(manifest, !report.cancelled);

    std::cout << "Upload of '" << manifest.original_name << "' finished: " << report.replicas_uploaded
              << " replicas stored, " << report.failures.size() << " skipped, " << report.chunks_not_attempted
              << " chunks not attempted (mode " << Metadata::distributionModeToString(manifest.distribution_mode)
              << ")." << std::endl;

    if (options_.fail_on_replica_failure && !report.failures.empty()) {
        const ReplicaFailure& first = report.failures.front();
        throw UploadFailure(std::to_string(report.failures.size()) + " replica(s) failed to upload: " + first.reason,
                            ErrorContext{first.chunk_id, first.chunk_index,
                                         Distribution::providerToString(first.target.provider)});
    }
    return report;
}

DownloadReport TransferOrchestrator::download(const Metadata::Manifest& manifest, const fs::path& local_chunk_dir,
                                              const Concurrency::CancellationToken& cancel) {
    std::error_code ec;
    fs::create_directories(local_chunk_dir, ec);
    if (ec) {
        throw IOFailure("failed to create chunk directory " + local_chunk_dir.string() + ": " + ec.message());
    }

    std::vector<Metadata::ChunkRecord> ordered = manifest.chunks;
    std::sort(ordered.begin(), ordered.end(),
              [](const Metadata::ChunkRecord& a, const Metadata::ChunkRecord& b) { return a.index < b.index; });

    DownloadReport report;
    std::mutex report_mutex;
    std::atomic<bool> aborted{false};

    std::cout << "Downloading " << ordered.size() << " chunks of '" << manifest.original_name << "'..." << std::endl;

    {
        Concurrency::ThreadPool pool(std::min(options_.worker_count, std::max<size_t>(ordered.size(), 1)));
        std::vector<std::future<void>> futures;
        futures.reserve(ordered.size());

        for (const Metadata::ChunkRecord& record : ordered) {
            futures.push_back(pool.enqueue([&, record]() {
                ErrorContext ctx{record.id, record.index, ""};
                if (record.destinations.empty()) {
                    throw ChunkUnavailable("chunk has no recorded destinations", ctx);
                }

                std::vector<std::string> tried;
                for (const Metadata::ChunkDestination& dest : record.destinations) {
                    if (cancel.isCancelled() || aborted.load()) {
                        std::lock_guard<std::mutex> lock(report_mutex);
                        ++report.chunks_not_attempted;
                        report.cancelled = true;
                        return;
                    }

                    const Distribution::Target target = dest.target();
                    tried.push_back(describe(target));

                    auto fail = [&](const std::string& reason) {
                        std::cerr << "Failed to download chunk " << record.id << " from " << describe(target)
                                  << ": " << reason << std::endl;
                        std::lock_guard<std::mutex> lock(report_mutex);
                        report.failed_attempts.push_back(ReplicaFailure{record.index, record.id, target, reason});
                    };

                    Storage::StorageBackend* backend = registry_.find(target);
                    if (backend == nullptr) {
                        fail("no backend registered");
                        continue;
                    }

                    std::vector<char> bytes;
                    try {
                        std::string remote_id = dest.remote_id;
                        if (remote_id.empty()) {
                            remote_id = backend->findByName(fs::path(dest.remote_path).filename().string());
                        }
                        bytes = backend->download(remote_id);
                    } catch (const std::exception& e) {
                        fail(e.what());
                        continue;
                    }

                    if (bytes.size() != record.size_bytes) {
                        fail("replica has " + std::to_string(bytes.size()) + " bytes, expected " +
                             std::to_string(record.size_bytes));
                        continue;
                    }

                    try {
                        Chunks::Chunk(record.id, std::move(bytes)).save(local_chunk_dir);
                    } catch (const IOFailure&) {
                        aborted.store(true);
                        throw;
                    }
                    std::lock_guard<std::mutex> lock(report_mutex);
                    ++report.chunks_downloaded;
                    return;
                }

                std::string providers;
                for (const auto& t : tried) {
                    providers += (providers.empty() ? "" : ",") + t;
                }
                throw ChunkUnavailable("every recorded destination failed", ErrorContext{record.id, record.index, providers});
            }));
        }

        collect(futures);
    }

    std::cout << "Download of '" << manifest.original_name << "' finished: " << report.chunks_downloaded << " of "
              << ordered.size() << " chunks fetched." << std::endl;
    return report;
}

} // namespace Transfer
} // namespace ChunkStore
