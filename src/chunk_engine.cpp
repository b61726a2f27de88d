// src/chunk_engine.cpp
#include "chunk_engine.hpp"
#include "chunk.hpp"
#include "chunk_config.hpp"
#include "cid_utility.hpp"
#include "errors.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <set>

namespace fs = std::filesystem;

namespace ChunkStore {
namespace Chunks {

ChunkSplitter::ChunkSplitter(std::istream& source, int64_t chunk_size) : source_(source), chunk_size_(0) {
    if (chunk_size <= 0) {
        throw ConfigurationError("chunk size must be positive, got " + std::to_string(chunk_size));
    }
    chunk_size_ = static_cast<size_t>(chunk_size);
}

bool ChunkSplitter::next(SplitChunk& out) {
    if (finished_) {
        return false;
    }

    out.plaintext.resize(chunk_size_);
    source_.read(out.plaintext.data(), static_cast<std::streamsize>(chunk_size_));
    if (source_.bad()) {
        throw IOFailure("read error while splitting at chunk " + std::to_string(next_index_),
                        ErrorContext{"", next_index_, ""});
    }

    const auto got = static_cast<size_t>(source_.gcount());
    if (got < chunk_size_) {
        // Short read: end of stream. A partial final chunk is kept as is.
        finished_ = true;
        if (got == 0) {
            out.plaintext.clear();
            return false;
        }
        out.plaintext.resize(got);
    }

    out.index = next_index_++;
    out.content_hash = CID::CIDUtility::generateSHA256(out.plaintext);
    out.id = CID::CIDUtility::chunkIdFromHash(out.content_hash);
    return true;
}

void assemble(const Metadata::Manifest& manifest, const ChunkByteProvider& provider,
              const Crypto::Cipher& cipher, std::ostream& out) {
    manifest.requireEncryptionIntent(cipher.enabled());

    std::vector<Metadata::ChunkRecord> ordered = manifest.chunks;
    std::sort(ordered.begin(), ordered.end(),
              [](const Metadata::ChunkRecord& a, const Metadata::ChunkRecord& b) { return a.index < b.index; });

    for (size_t position = 0; position < ordered.size(); ++position) {
        const Metadata::ChunkRecord& record = ordered[position];
        ErrorContext ctx{record.id, record.index, ""};
        if (record.index != position) {
            throw MalformedManifest("chunk sequence has a gap or duplicate at position " + std::to_string(position), ctx);
        }

        std::vector<char> stored = provider(record);

        std::vector<char> plaintext;
        try {
            plaintext = cipher.decrypt(stored);
        } catch (const AuthenticationFailure&) {
            throw AuthenticationFailure("chunk failed authentication (wrong password or corrupted ciphertext)", ctx);
        } catch (const MalformedCiphertext&) {
            throw MalformedCiphertext("stored chunk is shorter than a nonce (" + std::to_string(stored.size()) +
                                      " bytes)", ctx);
        }

        if (CID::CIDUtility::generateSHA256(plaintext) != record.content_hash) {
            throw IntegrityFailure("hash mismatch, chunk contents cannot be trusted", ctx);
        }

        out.write(plaintext.data(), static_cast<std::streamsize>(plaintext.size()));
        if (!out.good()) {
            throw IOFailure("failed to write chunk data to output", ctx);
        }
    }
    out.flush();
}

Metadata::Manifest splitFile(const fs::path& input, const fs::path& chunks_dir, const std::string& original_name,
                             const Crypto::Cipher& cipher, int64_t chunk_size,
                             const std::optional<Metadata::KdfParameters>& kdf) {
    if (cipher.enabled() != kdf.has_value()) {
        throw ConfigurationError("key derivation parameters must accompany an enabled cipher");
    }

    if (chunk_size <= 0) {
        throw ConfigurationError("chunk size must be positive, got " + std::to_string(chunk_size));
    }

    std::ifstream ifs(input, std::ios::binary);
    if (!ifs.is_open()) {
        throw IOFailure("failed to open input file: " + input.string());
    }
    ChunkSplitter splitter(ifs, chunk_size);

    std::error_code ec;
    fs::create_directories(chunks_dir, ec);
    if (ec) {
        throw IOFailure("failed to create chunk directory " + chunks_dir.string() + ": " + ec.message());
    }

    std::cout << "Splitting file: " << input << " (chunk size " << chunk_size << " bytes"
              << (cipher.enabled() ? ", encrypted" : "") << ")" << std::endl;

    std::vector<Metadata::ChunkRecord> records;
    SplitChunk piece;
    while (splitter.next(piece)) {
        Chunk chunk(piece.id, cipher.encrypt(piece.plaintext));
        chunk.save(chunks_dir);

        Metadata::ChunkRecord record;
        record.id = piece.id;
        record.content_hash = piece.content_hash;
        record.index = piece.index;
        record.encrypted = cipher.enabled();
        record.size_bytes = chunk.data.size();
        records.push_back(std::move(record));
    }

    Metadata::Manifest manifest = Metadata::Manifest::create(std::move(records), original_name, cipher.enabled());
    manifest.chunk_size = static_cast<uint64_t>(chunk_size);
    manifest.kdf = kdf;

    std::cout << "Split '" << original_name << "' into " << manifest.chunkCount() << " chunks." << std::endl;
    return manifest;
}

void assembleFile(const Metadata::Manifest& manifest, const fs::path& chunks_dir, const fs::path& output,
                  const Crypto::Cipher& cipher) {
    manifest.requireEncryptionIntent(cipher.enabled());

    if (output.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(output.parent_path(), ec);
        if (ec) {
            throw IOFailure("failed to create output directory " + output.parent_path().string() + ": " + ec.message());
        }
    }

    fs::path partial = output;
    partial += ".partial";

    std::cout << "Assembling " << manifest.chunkCount() << " chunks into " << output << std::endl;
    try {
        std::ofstream ofs(partial, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw IOFailure("failed to open output file for writing: " + partial.string());
        }
        assemble(manifest, [&chunks_dir](const Metadata::ChunkRecord& record) {
            return Chunk::loadData(chunks_dir, record.id);
        }, cipher, ofs);
        ofs.close();
        if (ofs.fail()) {
            throw IOFailure("failed to close output file: " + partial.string());
        }

        std::error_code ec;
        fs::rename(partial, output, ec);
        if (ec) {
            throw IOFailure("failed to move assembled file into place at " + output.string() + ": " + ec.message());
        }
    } catch (const std::exception& e) {
        std::cerr << "Error assembling '" << manifest.original_name << "': " << e.what() << std::endl;
        std::error_code ec;
        fs::remove(partial, ec);
        throw;
    }
    std::cout << "File '" << manifest.original_name << "' assembled successfully." << std::endl;
}

namespace {

size_t removeChunkFiles(const fs::path& dir, const std::function<bool(const std::string&)>& should_remove) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw IOFailure("failed to read chunks directory " + dir.string() + ": " + ec.message());
    }

    std::vector<fs::path> targets;
    for (const auto& entry : it) {
        if (entry.is_regular_file() && entry.path().extension() == Config::ChunkConfig::CHUNK_EXTENSION &&
            should_remove(entry.path().stem().string())) {
            targets.push_back(entry.path());
        }
    }

    size_t removed = 0;
    for (const auto& path : targets) {
        if (!fs::remove(path, ec) || ec) {
            throw IOFailure("failed to remove chunk " + path.filename().string() + ": " + ec.message());
        }
        ++removed;
    }
    return removed;
}

} // namespace

size_t cleanupChunks(const fs::path& dir) {
    size_t removed = removeChunkFiles(dir, [](const std::string&) { return true; });
    std::cout << "Cleaned up " << removed << " chunk files in " << dir << std::endl;
    return removed;
}

size_t pruneChunks(const fs::path& dir, const Metadata::Manifest& keep) {
    std::set<std::string> referenced;
    for (const auto& record : keep.chunks) {
        referenced.insert(record.id);
    }
    return removeChunkFiles(dir, [&referenced](const std::string& id) { return referenced.count(id) == 0; });
}

} // namespace Chunks
} // namespace ChunkStore
