// include/chunk.hpp
#pragma once

#include <vector>
#include <string>
#include <filesystem>

namespace ChunkStore {
namespace Chunks {

// One chunk payload as it sits in local storage.
class Chunk {
public:
    std::string id;         // Short content id, also the filename stem
    std::vector<char> data; // Stored bytes (ciphertext when the file is encrypted)

    Chunk(std::string chunk_id, std::vector<char> payload) : id(std::move(chunk_id)), data(std::move(payload)) {}

    // Write the chunk to <dir>/<id>.chunk, replacing any earlier copy. Throws IOFailure.
    void save(const std::filesystem::path& dir) const;

    // Read the stored bytes of a chunk. Throws NotFound when missing, IOFailure when unreadable.
    static std::vector<char> loadData(const std::filesystem::path& dir, const std::string& chunk_id);

    // Get the full path where this chunk would be stored
    std::filesystem::path getFullPath(const std::filesystem::path& dir) const;
};

} // namespace Chunks
} // namespace ChunkStore
