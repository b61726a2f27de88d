// src/cid_utility.cpp
#include "cid_utility.hpp"
#include "errors.hpp"
#include <iomanip> // For std::hex, std::setw, std::setfill
#include <sstream> // For std::stringstream

#include <openssl/evp.h>

namespace ChunkStore
{
    namespace CID
    {

        std::string CIDUtility::generateSHA256(const std::vector<char> &data_buffer)
        {
            unsigned char hash[EVP_MAX_MD_SIZE];
            unsigned int hash_len = 0;

            // EVP_Digest accepts a null pointer for zero-length input, giving SHA256("").
            if (EVP_Digest(data_buffer.data(), data_buffer.size(), hash, &hash_len, EVP_sha256(), nullptr) != 1)
            {
                throw EncryptionFailure("SHA-256 digest calculation failed");
            }

            std::stringstream ss;
            for (unsigned int i = 0; i < hash_len; i++)
            {
                ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
            }
            return ss.str();
        }

        std::string CIDUtility::chunkIdFromHash(const std::string &content_hash)
        {
            if (content_hash.size() < ID_BYTES * 2)
            {
                throw MalformedManifest("content hash too short to derive a chunk id: '" + content_hash + "'");
            }
            return content_hash.substr(0, ID_BYTES * 2);
        }

        bool CIDUtility::isContentHash(const std::string &value)
        {
            if (value.size() != 64)
            {
                return false;
            }
            for (char c : value)
            {
                if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
                {
                    return false;
                }
            }
            return true;
        }

        std::string CIDUtility::toHex(const std::vector<unsigned char> &bytes)
        {
            std::stringstream ss;
            for (unsigned char b : bytes)
            {
                ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
            }
            return ss.str();
        }

        std::vector<unsigned char> CIDUtility::fromHex(const std::string &hex)
        {
            if (hex.size() % 2 != 0)
            {
                throw MalformedManifest("hex string has odd length");
            }
            auto nibble = [&hex](char c) -> unsigned char
            {
                if (c >= '0' && c <= '9')
                    return static_cast<unsigned char>(c - '0');
                if (c >= 'a' && c <= 'f')
                    return static_cast<unsigned char>(c - 'a' + 10);
                if (c >= 'A' && c <= 'F')
                    return static_cast<unsigned char>(c - 'A' + 10);
                throw MalformedManifest("invalid hex string '" + hex + "'");
            };

            std::vector<unsigned char> out;
            out.reserve(hex.size() / 2);
            for (size_t i = 0; i < hex.size(); i += 2)
            {
                out.push_back(static_cast<unsigned char>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
            }
            return out;
        }

    } // namespace CID
} // namespace ChunkStore
