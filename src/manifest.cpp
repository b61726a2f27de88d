// src/manifest.cpp
#include "manifest.hpp"
#include "cid_utility.hpp"
#include "errors.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using nlohmann::json;

namespace ChunkStore {
namespace Metadata {

const std::string Manifest::FORMAT_VERSION = "1";

std::string distributionModeToString(DistributionMode mode) {
    switch (mode) {
    case DistributionMode::Local: return "local";
    case DistributionMode::Cloud: return "cloud";
    case DistributionMode::Hybrid: return "hybrid";
    }
    return "local";
}

DistributionMode distributionModeFromString(const std::string& name) {
    if (name == "local") return DistributionMode::Local;
    if (name == "cloud") return DistributionMode::Cloud;
    if (name == "hybrid") return DistributionMode::Hybrid;
    throw MalformedManifest("unknown distribution mode '" + name + "'");
}

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&now_c, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

bool ChunkRecord::hasReplicaAt(const Distribution::Target& target) const {
    return std::any_of(destinations.begin(), destinations.end(),
                       [&target](const ChunkDestination& d) { return d.target() == target; });
}

std::vector<unsigned char> KdfParameters::salt() const {
    return CID::CIDUtility::fromHex(salt_hex);
}

// nlohmann/json hooks, found by ADL.
void to_json(json& j, const ChunkDestination& d) {
    j = json{
        {"provider", Distribution::providerToString(d.provider)},
        {"remote_path", d.remote_path},
        {"remote_id", d.remote_id},
        {"account", d.account}
    };
}

void from_json(const json& j, ChunkDestination& d) {
    d.provider = Distribution::providerFromString(j.at("provider").get<std::string>());
    j.at("remote_path").get_to(d.remote_path);
    j.at("remote_id").get_to(d.remote_id);
    j.at("account").get_to(d.account);
}

void to_json(json& j, const ChunkRecord& c) {
    j = json{
        {"id", c.id},
        {"hash", c.content_hash},
        {"index", c.index},
        {"encrypted", c.encrypted},
        {"size", c.size_bytes},
        {"destinations", c.destinations},
        {"upload_time", c.uploaded_at ? json(*c.uploaded_at) : json(nullptr)}
    };
}

void from_json(const json& j, ChunkRecord& c) {
    j.at("id").get_to(c.id);
    j.at("hash").get_to(c.content_hash);
    j.at("index").get_to(c.index);
    j.at("encrypted").get_to(c.encrypted);
    j.at("size").get_to(c.size_bytes);
    j.at("destinations").get_to(c.destinations);
    auto it = j.find("upload_time");
    if (it != j.end() && !it->is_null()) {
        c.uploaded_at = it->get<std::string>();
    } else {
        c.uploaded_at.reset();
    }
}

void to_json(json& j, const KdfParameters& k) {
    j = json{{"algorithm", k.algorithm}, {"salt", k.salt_hex}, {"iterations", k.iterations}};
}

void from_json(const json& j, KdfParameters& k) {
    j.at("algorithm").get_to(k.algorithm);
    j.at("salt").get_to(k.salt_hex);
    j.at("iterations").get_to(k.iterations);
}

Manifest Manifest::create(std::vector<ChunkRecord> chunks, std::string original_name, bool encrypted) {
    Manifest m;
    m.original_name = std::move(original_name);
    m.created_at = currentTimestamp();
    m.encrypted = encrypted;
    m.distribution_mode = DistributionMode::Local;
    m.chunks = std::move(chunks);
    m.sortChunks();
    m.validate();
    return m;
}

uint64_t Manifest::totalSize() const {
    uint64_t total = 0;
    for (const auto& c : chunks) {
        total += c.size_bytes;
    }
    return total;
}

void Manifest::sortChunks() {
    std::sort(chunks.begin(), chunks.end(),
              [](const ChunkRecord& a, const ChunkRecord& b) { return a.index < b.index; });
}

ChunkRecord& Manifest::chunkAt(uint64_t index) {
    auto it = std::find_if(chunks.begin(), chunks.end(), [index](const ChunkRecord& c) { return c.index == index; });
    if (it == chunks.end()) {
        throw MalformedManifest("no chunk with index " + std::to_string(index) + " in manifest for " + original_name);
    }
    return *it;
}

const ChunkRecord& Manifest::chunkAt(uint64_t index) const {
    auto it = std::find_if(chunks.begin(), chunks.end(), [index](const ChunkRecord& c) { return c.index == index; });
    if (it == chunks.end()) {
        throw MalformedManifest("no chunk with index " + std::to_string(index) + " in manifest for " + original_name);
    }
    return *it;
}

void Manifest::updateDistribution(uint64_t chunk_index, const ChunkDestination& destination) {
    ChunkRecord& record = chunkAt(chunk_index);
    record.destinations.push_back(destination);
    record.uploaded_at = currentTimestamp();
    if (distribution_mode == DistributionMode::Local) {
        distribution_mode = DistributionMode::Hybrid;
    }
}

void Manifest::requireEncryptionIntent(bool decrypt) const {
    if (encrypted && !decrypt) {
        throw ConfigurationError("file '" + original_name + "' was encrypted but no decryption key was provided");
    }
    if (!encrypted && decrypt) {
        throw ConfigurationError("file '" + original_name + "' was not encrypted but a decryption key was provided");
    }
}

void Manifest::validate() const {
    // Callers sort first; indices must then read 0..N-1.
    for (size_t i = 0; i < chunks.size(); ++i) {
        const ChunkRecord& c = chunks[i];
        ErrorContext ctx{c.id, c.index, ""};
        if (c.index != i) {
            throw MalformedManifest("chunk indices are not contiguous, expected " + std::to_string(i), ctx);
        }
        if (c.encrypted != encrypted) {
            throw MalformedManifest("chunk encryption flag disagrees with manifest", ctx);
        }
        if (!CID::CIDUtility::isContentHash(c.content_hash)) {
            throw MalformedManifest("chunk content hash is not a SHA-256 hex digest", ctx);
        }
        // Ids become file names, so they must be derived from the hash and nothing else.
        if (c.id != CID::CIDUtility::chunkIdFromHash(c.content_hash)) {
            throw MalformedManifest("chunk id does not match its content hash", ctx);
        }
    }
}

std::string Manifest::serialize() const {
    std::vector<ChunkRecord> ordered = chunks;
    std::sort(ordered.begin(), ordered.end(),
              [](const ChunkRecord& a, const ChunkRecord& b) { return a.index < b.index; });

    json j = {
        {"version", version},
        {"original_name", original_name},
        {"created_time", created_at},
        {"encrypted", encrypted},
        {"chunk_size", chunk_size},
        {"distribution_mode", distributionModeToString(distribution_mode)},
        {"total_size", totalSize()},
        {"chunk_count", chunkCount()},
        {"chunks", ordered}
    };
    if (kdf) {
        j["kdf"] = *kdf;
    }
    return j.dump(4);
}

Manifest Manifest::deserialize(const std::string& document) {
    Manifest m;
    uint64_t declared_total = 0;
    uint64_t declared_count = 0;
    try {
        json j = json::parse(document);
        if (!j.is_object()) {
            throw MalformedManifest("manifest document is not a JSON object");
        }
        j.at("version").get_to(m.version);
        j.at("original_name").get_to(m.original_name);
        j.at("created_time").get_to(m.created_at);
        j.at("encrypted").get_to(m.encrypted);
        j.at("chunk_size").get_to(m.chunk_size);
        m.distribution_mode = distributionModeFromString(j.at("distribution_mode").get<std::string>());
        j.at("total_size").get_to(declared_total);
        j.at("chunk_count").get_to(declared_count);
        j.at("chunks").get_to(m.chunks);
        auto kdf_it = j.find("kdf");
        if (kdf_it != j.end() && !kdf_it->is_null()) {
            m.kdf = kdf_it->get<KdfParameters>();
        }
    } catch (const json::exception& e) {
        throw MalformedManifest(std::string("invalid manifest document: ") + e.what());
    } catch (const ConfigurationError& e) {
        // Unknown provider names surface here.
        throw MalformedManifest(e.what());
    }

    m.sortChunks();
    m.validate();
    if (m.encrypted && !m.kdf) {
        throw MalformedManifest("encrypted manifest is missing its key derivation parameters");
    }
    if (declared_count != m.chunkCount() || declared_total != m.totalSize()) {
        throw MalformedManifest("declared chunk_count/total_size (" + std::to_string(declared_count) + "/" +
                                std::to_string(declared_total) + ") disagree with chunk records (" +
                                std::to_string(m.chunkCount()) + "/" + std::to_string(m.totalSize()) + ")");
    }
    return m;
}

void Manifest::save(const fs::path& path) const {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw IOFailure("failed to create manifest directory " + path.parent_path().string() + ": " + ec.message());
        }
    }

    fs::path tmp_path = path;
    tmp_path += ".tmp";
    {
        std::ofstream ofs(tmp_path, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw IOFailure("failed to open file for writing manifest: " + tmp_path.string());
        }
        ofs << serialize();
        if (!ofs.good()) {
            throw IOFailure("failed to write manifest file: " + tmp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(tmp_path, ec);
        throw IOFailure("failed to move manifest into place at " + path.string() + ": " + reason);
    }
}

Manifest Manifest::load(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw NotFound("manifest file not found: " + path.string());
    }
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        throw IOFailure("failed to open manifest file: " + path.string());
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    if (ifs.bad()) {
        throw IOFailure("failed to read manifest file: " + path.string());
    }
    return deserialize(buffer.str());
}

bool Manifest::operator==(const Manifest& o) const {
    return version == o.version && original_name == o.original_name && created_at == o.created_at &&
           encrypted == o.encrypted && chunk_size == o.chunk_size && distribution_mode == o.distribution_mode &&
           kdf == o.kdf && chunks == o.chunks;
}

} // namespace Metadata
} // namespace ChunkStore
