// include/storage_backend.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ChunkStore
{
    namespace Storage
    {

        // What the orchestrator needs from one (provider, account) store.
        // Implementations throw BackendError; authentication, folder setup and
        // rate limiting stay inside the implementation.
        class StorageBackend
        {
        public:
            virtual ~StorageBackend() = default;

            // Stores bytes under remote_path and returns the id to fetch them with.
            virtual std::string upload(const std::vector<char> &bytes, const std::string &remote_path) = 0;

            virtual std::vector<char> download(const std::string &remote_id) = 0;

            // Looks an object up by its file name when the id was never recorded.
            virtual std::string findByName(const std::string &name) = 0;
        };

        // Keeps objects as plain files below a root directory, typically the
        // mount point or sync folder of a provider account. Remote ids are
        // paths relative to the root.
        class DirectoryBackend : public StorageBackend
        {
        public:
            // Creates the root if needed. Throws BackendError when it cannot.
            explicit DirectoryBackend(std::filesystem::path root);

            std::string upload(const std::vector<char> &bytes, const std::string &remote_path) override;
            std::vector<char> download(const std::string &remote_id) override;
            std::string findByName(const std::string &name) override;

        private:
            // Resolves a remote path or id under the root, rejecting anything that escapes it.
            std::filesystem::path resolve(const std::string &relative) const;

            std::filesystem::path root_;
            std::atomic<uint64_t> upload_counter_{0}; // Keeps concurrent temp files apart
        };

    } // namespace Storage
} // namespace ChunkStore
