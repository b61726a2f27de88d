// tests/manifest_test.cpp
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "cid_utility.hpp"
#include "errors.hpp"
#include "manifest.hpp"
#include "test_helpers.hpp"

using namespace ChunkStore;
using json = nlohmann::json;

namespace {

Metadata::ChunkRecord record(uint64_t index, uint64_t size, bool encrypted = false) {
    Metadata::ChunkRecord r;
    r.content_hash = CID::CIDUtility::generateSHA256(std::vector<char>(1, static_cast<char>(index)));
    r.id = CID::CIDUtility::chunkIdFromHash(r.content_hash);
    r.index = index;
    r.size_bytes = size;
    r.encrypted = encrypted;
    return r;
}

Metadata::Manifest sampleManifest() {
    return Metadata::Manifest::create({record(2, 2), record(0, 4), record(1, 4)}, "sample.txt", false);
}

} // namespace

TEST(ManifestTest, CreateSortsAndDerivesTotals) {
    Metadata::Manifest m = sampleManifest();

    ASSERT_EQ(m.chunkCount(), 3u);
    EXPECT_EQ(m.totalSize(), 10u);
    EXPECT_EQ(m.chunks[0].index, 0u);
    EXPECT_EQ(m.chunks[2].index, 2u);
    EXPECT_EQ(m.distribution_mode, Metadata::DistributionMode::Local);
    EXPECT_EQ(m.version, Metadata::Manifest::FORMAT_VERSION);
    EXPECT_FALSE(m.created_at.empty());
}

TEST(ManifestTest, CreateRejectsBrokenSequences) {
    EXPECT_THROW(Metadata::Manifest::create({record(0, 1), record(2, 1)}, "gap", false), MalformedManifest);
    EXPECT_THROW(Metadata::Manifest::create({record(0, 1), record(0, 1)}, "dup", false), MalformedManifest);
    EXPECT_THROW(Metadata::Manifest::create({record(0, 1, true), record(1, 1, false)}, "mixed", true),
                 MalformedManifest);
}

TEST(ManifestTest, SerializeRoundTrip) {
    Metadata::Manifest m = sampleManifest();
    m.chunk_size = 4;

    Metadata::ChunkDestination dest;
    dest.provider = Distribution::Provider::Dropbox;
    dest.account = "personal";
    dest.remote_path = Distribution::remotePathFor(dest.provider, m.chunkAt(1).id);
    dest.remote_id = "id:abc";
    m.updateDistribution(1, dest);

    Metadata::Manifest back = Metadata::Manifest::deserialize(m.serialize());
    EXPECT_EQ(back, m);
    EXPECT_EQ(back.distribution_mode, Metadata::DistributionMode::Hybrid);
    ASSERT_EQ(back.chunkAt(1).destinations.size(), 1u);
    EXPECT_EQ(back.chunkAt(1).destinations[0], dest);
    EXPECT_TRUE(back.chunkAt(1).uploaded_at.has_value());
    EXPECT_FALSE(back.chunkAt(0).uploaded_at.has_value());
}

TEST(ManifestTest, SerializedDocumentUsesExpectedKeys) {
    json j = json::parse(sampleManifest().serialize());

    EXPECT_EQ(j.at("original_name"), "sample.txt");
    EXPECT_EQ(j.at("total_size"), 10);
    EXPECT_EQ(j.at("chunk_count"), 3);
    EXPECT_EQ(j.at("distribution_mode"), "local");
    EXPECT_TRUE(j.contains("created_time"));
    EXPECT_FALSE(j.contains("kdf"));
    ASSERT_EQ(j.at("chunks").size(), 3u);
    EXPECT_EQ(j.at("chunks")[0].at("index"), 0);
    EXPECT_TRUE(j.at("chunks")[0].at("upload_time").is_null());
}

TEST(ManifestTest, DeserializeRejectsMalformedDocuments) {
    EXPECT_THROW(Metadata::Manifest::deserialize("{not json"), MalformedManifest);
    EXPECT_THROW(Metadata::Manifest::deserialize("[1,2,3]"), MalformedManifest);
    EXPECT_THROW(Metadata::Manifest::deserialize("{\"version\":\"1\"}"), MalformedManifest);

    json j = json::parse(sampleManifest().serialize());

    json gap = j;
    gap["chunks"][2]["index"] = 5;
    EXPECT_THROW(Metadata::Manifest::deserialize(gap.dump()), MalformedManifest);

    json mixed = j;
    mixed["chunks"][1]["encrypted"] = true;
    EXPECT_THROW(Metadata::Manifest::deserialize(mixed.dump()), MalformedManifest);

    json count = j;
    count["chunk_count"] = 4;
    EXPECT_THROW(Metadata::Manifest::deserialize(count.dump()), MalformedManifest);

    json total = j;
    total["total_size"] = 11;
    EXPECT_THROW(Metadata::Manifest::deserialize(total.dump()), MalformedManifest);

    json mode = j;
    mode["distribution_mode"] = "orbit";
    EXPECT_THROW(Metadata::Manifest::deserialize(mode.dump()), MalformedManifest);

    json escaping_id = j;
    escaping_id["chunks"][0]["id"] = "../../escaped";
    EXPECT_THROW(Metadata::Manifest::deserialize(escaping_id.dump()), MalformedManifest);

    json foreign_id = j;
    foreign_id["chunks"][0]["id"] = j["chunks"][1]["id"];
    EXPECT_THROW(Metadata::Manifest::deserialize(foreign_id.dump()), MalformedManifest);

    json short_hash = j;
    short_hash["chunks"][0]["hash"] = "0123456789abcdef0123";
    short_hash["chunks"][0]["id"] = "0123456789abcdef";
    EXPECT_THROW(Metadata::Manifest::deserialize(short_hash.dump()), MalformedManifest);

    json upper_hash = j;
    upper_hash["chunks"][0]["hash"] = std::string(64, 'A');
    upper_hash["chunks"][0]["id"] = std::string(16, 'A');
    EXPECT_THROW(Metadata::Manifest::deserialize(upper_hash.dump()), MalformedManifest);

    json provider = j;
    provider["chunks"][0]["destinations"] = json::array({{{"provider", "floppy"}, {"remote_path", "x"},
                                                          {"remote_id", "y"}, {"account", "a"}}});
    EXPECT_THROW(Metadata::Manifest::deserialize(provider.dump()), MalformedManifest);
}

TEST(ManifestTest, EncryptedManifestNeedsKdf) {
    Metadata::Manifest m = Metadata::Manifest::create({record(0, 30, true)}, "secret.bin", true);
    Metadata::KdfParameters kdf;
    kdf.salt_hex = "00112233445566778899aabbccddeeff";
    kdf.iterations = 1000;
    m.kdf = kdf;

    Metadata::Manifest back = Metadata::Manifest::deserialize(m.serialize());
    ASSERT_TRUE(back.kdf.has_value());
    EXPECT_EQ(*back.kdf, kdf);
    EXPECT_EQ(back.kdf->salt().size(), 16u);

    json j = json::parse(m.serialize());
    j.erase("kdf");
    EXPECT_THROW(Metadata::Manifest::deserialize(j.dump()), MalformedManifest);
}

TEST(ManifestTest, EncryptionIntentMustMatch) {
    Metadata::Manifest plain = sampleManifest();
    EXPECT_NO_THROW(plain.requireEncryptionIntent(false));
    EXPECT_THROW(plain.requireEncryptionIntent(true), ConfigurationError);

    Metadata::Manifest enc = Metadata::Manifest::create({record(0, 30, true)}, "secret.bin", true);
    EXPECT_NO_THROW(enc.requireEncryptionIntent(true));
    EXPECT_THROW(enc.requireEncryptionIntent(false), ConfigurationError);
}

TEST(ManifestTest, UpdateDistributionOnUnknownIndexThrows) {
    Metadata::Manifest m = sampleManifest();
    EXPECT_THROW(m.updateDistribution(7, Metadata::ChunkDestination{}), MalformedManifest);
}

TEST(ManifestTest, SaveAndLoad) {
    Testing::TempDir dir;
    Metadata::Manifest m = sampleManifest();

    m.save(dir / "meta" / "sample.txt.json");
    EXPECT_EQ(Metadata::Manifest::load(dir / "meta" / "sample.txt.json"), m);
    EXPECT_FALSE(std::filesystem::exists(dir / "meta" / "sample.txt.json.tmp"));
    EXPECT_THROW(Metadata::Manifest::load(dir / "missing.json"), NotFound);
}

TEST(DistributionModeTest, StringConversions) {
    EXPECT_EQ(Metadata::distributionModeToString(Metadata::DistributionMode::Cloud), "cloud");
    EXPECT_EQ(Metadata::distributionModeFromString("hybrid"), Metadata::DistributionMode::Hybrid);
    EXPECT_THROW(Metadata::distributionModeFromString("elsewhere"), MalformedManifest);
}
