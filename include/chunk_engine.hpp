// include/chunk_engine.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "cipher.hpp"
#include "manifest.hpp"

namespace ChunkStore {
namespace Chunks {

// A freshly cut piece of the input, before encryption.
struct SplitChunk {
    uint64_t index = 0;
    std::vector<char> plaintext;
    std::string content_hash;
    std::string id;
};

// Cuts a stream into fixed-size chunks one at a time; only one chunk
// buffer is held regardless of the input size.
class ChunkSplitter {
public:
    // Throws ConfigurationError when chunk_size <= 0.
    ChunkSplitter(std::istream& source, int64_t chunk_size);

    // Fills `out` with the next chunk. Returns false once the stream is exhausted.
    // Throws IOFailure on a read error.
    bool next(SplitChunk& out);

private:
    std::istream& source_;
    size_t chunk_size_;
    uint64_t next_index_ = 0;
    bool finished_ = false;
};

// Supplies the stored bytes for a chunk record.
using ChunkByteProvider = std::function<std::vector<char>(const Metadata::ChunkRecord&)>;

// Streams the original bytes to `out` in index order, decrypting and hash
// checking every chunk. Checks the manifest's encryption flag against the
// cipher before asking the provider for anything.
void assemble(const Metadata::Manifest& manifest, const ChunkByteProvider& provider,
              const Crypto::Cipher& cipher, std::ostream& out);

// Splits `input` into <chunks_dir>/<id>.chunk files and returns the manifest.
// `kdf` must be set exactly when the cipher is enabled.
Metadata::Manifest splitFile(const std::filesystem::path& input, const std::filesystem::path& chunks_dir,
                             const std::string& original_name, const Crypto::Cipher& cipher, int64_t chunk_size,
                             const std::optional<Metadata::KdfParameters>& kdf = std::nullopt);

// Rebuilds the original file from local chunk files. The output appears only
// when every chunk verified; on failure nothing is left at `output`.
void assembleFile(const Metadata::Manifest& manifest, const std::filesystem::path& chunks_dir,
                  const std::filesystem::path& output, const Crypto::Cipher& cipher);

// Removes every *.chunk file in `dir`. Returns how many were removed.
size_t cleanupChunks(const std::filesystem::path& dir);

// Removes the *.chunk files in `dir` that `keep` does not reference.
size_t pruneChunks(const std::filesystem::path& dir, const Metadata::Manifest& keep);

} // namespace Chunks
} // namespace ChunkStore
