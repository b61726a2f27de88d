// src/chunk.cpp
#include "chunk.hpp"
#include "chunk_config.hpp"
#include "errors.hpp"
#include <fstream>

namespace fs = std::filesystem;

namespace ChunkStore
{
    namespace Chunks
    {

        void Chunk::save(const fs::path &dir) const
        {
            fs::path chunk_path = getFullPath(dir);

            // Identical plaintext chunks share an id; the later write wins, both decrypt the same.
            std::ofstream ofs(chunk_path, std::ios::binary | std::ios::trunc);
            if (!ofs.is_open())
            {
                throw IOFailure("failed to open file for writing chunk: " + chunk_path.string(), ErrorContext{id, {}, ""});
            }
            ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
            if (!ofs.good())
            {
                throw IOFailure("failed to write all data to chunk file: " + chunk_path.string(), ErrorContext{id, {}, ""});
            }
        }

        std::vector<char> Chunk::loadData(const fs::path &dir, const std::string &chunk_id)
        {
            fs::path chunk_path = Config::ChunkConfig::chunkFilePath(dir, chunk_id);
            ErrorContext ctx{chunk_id, {}, ""};

            std::error_code ec;
            if (!fs::exists(chunk_path, ec))
            {
                throw NotFound("chunk file not found: " + chunk_path.string(), ctx);
            }

            std::ifstream ifs(chunk_path, std::ios::binary | std::ios::ate);
            if (!ifs.is_open())
            {
                throw IOFailure("failed to open chunk file for reading: " + chunk_path.string(), ctx);
            }

            std::streamsize size = ifs.tellg();
            if (size == -1)
            {
                throw IOFailure("failed to determine chunk file size: " + chunk_path.string(), ctx);
            }
            ifs.seekg(0, std::ios::beg);

            std::vector<char> buffer(static_cast<size_t>(size));
            if (size > 0 && !ifs.read(buffer.data(), size))
            {
                throw IOFailure("failed to read all data from chunk file: " + chunk_path.string(), ctx);
            }
            return buffer;
        }

        fs::path Chunk::getFullPath(const fs::path &dir) const
        {
            return Config::ChunkConfig::chunkFilePath(dir, id);
        }

    } // namespace Chunks
} // namespace ChunkStore
