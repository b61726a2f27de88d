// include/cid_utility.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ChunkStore
{
    namespace CID
    {

        class CIDUtility
        {
        public:
            // Number of digest bytes that make up a chunk id (rendered as 16 hex characters).
            static constexpr size_t ID_BYTES = 8;

            // Generates SHA-256 hash of data and returns as lowercase hex string.
            // This is the chunk's content hash.
            static std::string generateSHA256(const std::vector<char> &data_buffer);

            // Short identifier taken from the leading bytes of a hex content hash.
            static std::string chunkIdFromHash(const std::string &content_hash);

            // True for exactly 64 lowercase hex characters, the form generateSHA256 produces.
            static bool isContentHash(const std::string &value);

            static std::string toHex(const std::vector<unsigned char> &bytes);
            // Throws MalformedManifest on odd length or non-hex characters.
            static std::vector<unsigned char> fromHex(const std::string &hex);
        };

    } // namespace CID
} // namespace ChunkStore
