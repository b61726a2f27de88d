// src/chunk_config.cpp
#include "chunk_config.hpp"
#include "errors.hpp"
#include <iostream>

namespace fs = std::filesystem;

namespace ChunkStore
{
    namespace Config
    {

        const std::string ChunkConfig::CHUNK_EXTENSION = ".chunk";

        void ChunkConfig::validate() const
        {
            if (chunk_size <= 0)
            {
                throw ConfigurationError("chunk size must be positive, got " + std::to_string(chunk_size));
            }
            if (chunks_dir.empty() || manifests_dir.empty())
            {
                throw ConfigurationError("chunks_dir and manifests_dir must not be empty");
            }
        }

        fs::path ChunkConfig::ensureDirectoryExists(const fs::path &dir_path)
        {
            std::error_code ec;
            if (fs::exists(dir_path, ec))
            {
                return dir_path;
            }

            if (fs::create_directories(dir_path, ec))
            {
                std::cout << "Created directory: " << dir_path << std::endl;
            }
            else if (!fs::exists(dir_path))
            {
                // Another process may have created it in the meantime; only fail if it is still missing.
                throw IOFailure("failed to create directory " + dir_path.string() + ": " + ec.message());
            }
            return dir_path;
        }

        fs::path ChunkConfig::getChunksDirPath(const std::string &original_name) const
        {
            if (original_name.empty())
            {
                throw ConfigurationError("original file name must not be empty");
            }
            return ensureDirectoryExists(fs::path(chunks_dir) / original_name);
        }

        fs::path ChunkConfig::getManifestsDirPath() const
        {
            return ensureDirectoryExists(fs::path(manifests_dir));
        }

        fs::path ChunkConfig::getManifestPath(const std::string &original_name) const
        {
            return getManifestsDirPath() / (original_name + ".json");
        }

        fs::path ChunkConfig::chunkFilePath(const fs::path &dir, const std::string &chunk_id)
        {
            return dir / (chunk_id + CHUNK_EXTENSION);
        }

    } // namespace Config
} // namespace ChunkStore
