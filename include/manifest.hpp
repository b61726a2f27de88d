// include/manifest.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "distribution_strategy.hpp"

namespace ChunkStore {
namespace Metadata {

enum class DistributionMode { Local, Cloud, Hybrid };

std::string distributionModeToString(DistributionMode mode);
DistributionMode distributionModeFromString(const std::string& name);

// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
std::string currentTimestamp();

// One stored replica of a chunk.
struct ChunkDestination {
    Distribution::Provider provider = Distribution::Provider::Local;
    std::string remote_path;
    std::string remote_id;
    std::string account;

    Distribution::Target target() const { return Distribution::Target{provider, account}; }

    bool operator==(const ChunkDestination& o) const {
        return provider == o.provider && remote_path == o.remote_path && remote_id == o.remote_id &&
               account == o.account;
    }
};

class ChunkRecord {
public:
    std::string id;           // Leading bytes of content_hash, also the local filename stem
    std::string content_hash; // SHA-256 of the plaintext, fixed at split time
    uint64_t index = 0;
    bool encrypted = false;
    uint64_t size_bytes = 0;  // Stored (possibly encrypted) payload length
    std::vector<ChunkDestination> destinations;
    std::optional<std::string> uploaded_at;

    bool hasReplicaAt(const Distribution::Target& target) const;

    bool operator==(const ChunkRecord& o) const {
        return id == o.id && content_hash == o.content_hash && index == o.index && encrypted == o.encrypted &&
               size_bytes == o.size_bytes && destinations == o.destinations && uploaded_at == o.uploaded_at;
    }
};

// Parameters needed to re-derive the chunk key from a password.
struct KdfParameters {
    std::string algorithm = "pbkdf2-hmac-sha256";
    std::string salt_hex;
    uint32_t iterations = 0;

    std::vector<unsigned char> salt() const;

    bool operator==(const KdfParameters& o) const {
        return algorithm == o.algorithm && salt_hex == o.salt_hex && iterations == o.iterations;
    }
};

class Manifest {
public:
    static const std::string FORMAT_VERSION;

    std::string version = FORMAT_VERSION;
    std::string original_name;
    std::string created_at;
    bool encrypted = false;
    uint64_t chunk_size = 0;
    DistributionMode distribution_mode = DistributionMode::Local;
    std::optional<KdfParameters> kdf; // Present only for encrypted manifests
    std::vector<ChunkRecord> chunks;

    Manifest() = default;

    // Builds a fresh manifest in local mode. Throws MalformedManifest when the
    // indices are not 0..N-1 or a record disagrees with `encrypted`.
    static Manifest create(std::vector<ChunkRecord> chunks, std::string original_name, bool encrypted);

    // Both are always derived from `chunks`.
    uint64_t totalSize() const;
    uint64_t chunkCount() const { return chunks.size(); }

    void sortChunks();
    ChunkRecord& chunkAt(uint64_t index);
    const ChunkRecord& chunkAt(uint64_t index) const;

    // Records a new replica for a chunk and moves the manifest out of local mode.
    void updateDistribution(uint64_t chunk_index, const ChunkDestination& destination);

    // Fails before any chunk I/O when the caller's intent disagrees with the file.
    void requireEncryptionIntent(bool decrypt) const;

    std::string serialize() const;
    static Manifest deserialize(const std::string& document);

    // Written through a temporary file and renamed into place.
    void save(const std::filesystem::path& path) const;
    static Manifest load(const std::filesystem::path& path);

    bool operator==(const Manifest& o) const;
    bool operator!=(const Manifest& o) const { return !(*this == o); }

private:
    void validate() const;
};

} // namespace Metadata
} // namespace ChunkStore
