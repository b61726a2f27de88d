// include/chunk_config.hpp
#pragma once

#include <string>
#include <cstdint>    // For int64_t
#include <filesystem> // For std::filesystem::path

namespace ChunkStore
{
    namespace Config
    {

        class ChunkConfig
        {
        public:
            // Default size of each chunk (1MB)
            static constexpr int64_t DEFAULT_CHUNK_SIZE = 1024 * 1024;

            // Extension of every local chunk file
            static const std::string CHUNK_EXTENSION;

            int64_t chunk_size = DEFAULT_CHUNK_SIZE;
            std::string chunks_dir = "chunks";
            std::string manifests_dir = "metadata";

            // Throws ConfigurationError for a non-positive chunk size or empty directory names.
            void validate() const;

            // Directory holding the chunk files of one original file.
            // This will create the directory if it doesn't exist
            std::filesystem::path getChunksDirPath(const std::string &original_name) const;

            // Directory holding the manifests.
            // This will create the directory if it doesn't exist
            std::filesystem::path getManifestsDirPath() const;

            std::filesystem::path getManifestPath(const std::string &original_name) const;

            // <dir>/<id>.chunk
            static std::filesystem::path chunkFilePath(const std::filesystem::path &dir, const std::string &chunk_id);

        private:
            // Helper to ensure directories exist
            static std::filesystem::path ensureDirectoryExists(const std::filesystem::path &dir_path);
        };

    } // namespace Config
} // namespace ChunkStore
