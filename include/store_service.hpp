// include/store_service.hpp
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "backend_registry.hpp"
#include "cancellation.hpp"
#include "cipher.hpp"
#include "distribution_strategy.hpp"
#include "manifest.hpp"
#include "service_config.hpp"
#include "transfer_orchestrator.hpp"

namespace ChunkStore
{

    // File-level entry point used by the HTTP front-end. Each operation loads
    // the file's manifest, does its work and writes the manifest back.
    class StoreService
    {
    public:
        // Builds the backend registry from the configured accounts.
        explicit StoreService(Config::ServiceConfig config);

        // Uses a caller-built registry (tests, custom backends).
        StoreService(Config::ServiceConfig config, Storage::BackendRegistry registry);

        StoreService(const StoreService &) = delete;
        StoreService &operator=(const StoreService &) = delete;

        // Splits (and encrypts when a password is given) a file into local chunks
        // and writes its manifest.
        Metadata::Manifest splitFile(const std::string &input_filepath,
                                     const std::string &original_name,
                                     const std::optional<std::string> &password);

        // Pushes the file's chunks to the configured destinations. The manifest is
        // saved with every replica that succeeded, whatever the outcome.
        Transfer::UploadReport uploadFile(const std::string &original_name,
                                          const Concurrency::CancellationToken &cancel = {});

        // Fetches the file's chunks back into local chunk storage.
        Transfer::DownloadReport downloadFile(const std::string &original_name,
                                              const Concurrency::CancellationToken &cancel = {});

        // Rebuilds the original file at output_filepath from local chunks.
        void assembleFile(const std::string &original_name,
                          const std::string &output_filepath,
                          const std::optional<std::string> &password);

        Metadata::Manifest readManifest(const std::string &original_name) const;

        // Stored bytes of one chunk, as kept locally.
        std::vector<char> retrieveChunk(const std::string &original_name, const std::string &chunk_id) const;

        // Deletes the local chunk files of a file, typically after an upload.
        size_t cleanupLocalChunks(const std::string &original_name);

        const Config::ServiceConfig &config() const { return config_; }

    private:
        Config::ServiceConfig config_;
        Storage::BackendRegistry registry_;
        Distribution::DistributionStrategy strategy_;
        Transfer::TransferOrchestrator orchestrator_;

        std::mutex locks_mutex_;
        std::map<std::string, std::shared_ptr<std::mutex>> file_locks_;

        // Serializes operations on the same file.
        std::shared_ptr<std::mutex> lockFor(const std::string &original_name);

        static void checkName(const std::string &original_name);
        static Crypto::Cipher cipherFor(const Metadata::Manifest &manifest, const std::optional<std::string> &password);
    };

} // namespace ChunkStore
