// src/store_service.cpp
#include "store_service.hpp"
#include "chunk.hpp"
#include "chunk_engine.hpp"
#include "cid_utility.hpp"
#include "errors.hpp"

#include <iostream>
#include <vector>

namespace fs = std::filesystem;

namespace ChunkStore
{

    StoreService::StoreService(Config::ServiceConfig config)
        : StoreService(config, Storage::BackendRegistry::fromConfig(config.cloud_config))
    {
    }

    StoreService::StoreService(Config::ServiceConfig config, Storage::BackendRegistry registry)
        : config_(std::move(config)),
          registry_(std::move(registry)),
          strategy_(registry_.poolFor(config_.cloud_config.providers),
                    config_.cloud_config.replication_count,
                    config_.cloud_config.load_balancing),
          orchestrator_(registry_, Transfer::TransferOptions{config_.cloud_config.worker_count,
                                                             config_.cloud_config.fail_on_replica_failure})
    {
        config_.validate();
        // Ensure the manifest directory exists on startup
        config_.chunk_config.getManifestsDirPath();
        std::cout << "StoreService initialized with " << strategy_.pool().size() << " destination(s), replication "
                  << strategy_.replicationCount() << "." << std::endl;
    }

    namespace
    {
        const char *const STAGING_DIR_NAME = ".staging";

        void removeStaging(const fs::path &staging_dir)
        {
            std::error_code ec;
            fs::remove_all(staging_dir, ec);
            if (ec)
            {
                throw IOFailure("failed to clear staging directory " + staging_dir.string() + ": " + ec.message());
            }
        }

        // Moves freshly written chunk files next to the ones they replace.
        void promoteStaged(const fs::path &staging_dir, const fs::path &chunks_dir)
        {
            std::error_code ec;
            fs::directory_iterator it(staging_dir, ec);
            if (ec)
            {
                throw IOFailure("failed to read staging directory " + staging_dir.string() + ": " + ec.message());
            }
            std::vector<fs::path> staged;
            for (const auto &entry : it)
            {
                staged.push_back(entry.path());
            }
            for (const auto &path : staged)
            {
                fs::rename(path, chunks_dir / path.filename(), ec);
                if (ec)
                {
                    throw IOFailure("failed to move chunk " + path.filename().string() + " into place: " +
                                    ec.message());
                }
            }
        }
    } // namespace

    std::shared_ptr<std::mutex> StoreService::lockFor(const std::string &original_name)
    {
        std::lock_guard<std::mutex> guard(locks_mutex_);
        auto &slot = file_locks_[original_name];
        if (!slot)
        {
            slot = std::make_shared<std::mutex>();
        }
        return slot;
    }

    void StoreService::checkName(const std::string &original_name)
    {
        if (original_name.empty() || original_name == "." || original_name == ".." ||
            original_name.find('/') != std::string::npos || original_name.find('\\') != std::string::npos)
        {
            throw ConfigurationError("invalid file name '" + original_name + "'");
        }
    }

    Crypto::Cipher StoreService::cipherFor(const Metadata::Manifest &manifest, const std::optional<std::string> &password)
    {
        // Cheap check first: no chunk is touched when the intent is wrong.
        manifest.requireEncryptionIntent(password.has_value());
        if (!password)
        {
            return Crypto::Cipher::disabled();
        }
        if (!manifest.kdf || manifest.kdf->algorithm != "pbkdf2-hmac-sha256")
        {
            throw MalformedManifest("unsupported key derivation for '" + manifest.original_name + "'");
        }
        return Crypto::Cipher::withKey(Crypto::deriveKey(*password, manifest.kdf->salt(), manifest.kdf->iterations));
    }

    Metadata::Manifest StoreService::splitFile(const std::string &input_filepath,
                                               const std::string &original_name,
                                               const std::optional<std::string> &password)
    {
        checkName(original_name);
        auto file_lock = lockFor(original_name);
        std::lock_guard<std::mutex> guard(*file_lock);

        std::cout << "Splitting file: " << original_name << std::endl;

        Crypto::Cipher cipher = Crypto::Cipher::disabled();
        std::optional<Metadata::KdfParameters> kdf;
        if (password)
        {
            Metadata::KdfParameters params;
            params.salt_hex = CID::CIDUtility::toHex(Crypto::generateSalt());
            params.iterations = config_.encryption.pbkdf2_iterations;
            cipher = Crypto::Cipher::withKey(Crypto::deriveKey(*password, params.salt(), params.iterations));
            kdf = params;
        }

        // The previous split stays intact until the new manifest is on disk.
        fs::path chunks_dir = config_.chunk_config.getChunksDirPath(original_name);
        fs::path staging_dir = chunks_dir / STAGING_DIR_NAME;
        removeStaging(staging_dir);

        Metadata::Manifest manifest;
        try
        {
            manifest = Chunks::splitFile(input_filepath, staging_dir, original_name, cipher,
                                         config_.chunk_config.chunk_size, kdf);
            promoteStaged(staging_dir, chunks_dir);
            manifest.save(config_.chunk_config.getManifestPath(original_name));
        }
        catch (const std::exception &e)
        {
            std::cerr << "Error splitting file '" << original_name << "': " << e.what() << std::endl;
            std::error_code ec;
            fs::remove_all(staging_dir, ec);
            throw;
        }
        removeStaging(staging_dir);

        size_t stale = Chunks::pruneChunks(chunks_dir, manifest);
        std::cout << "File '" << original_name << "' split successfully (" << stale
                  << " stale chunk(s) removed)." << std::endl;
        return manifest;
    }

    Transfer::UploadReport StoreService::uploadFile(const std::string &original_name,
                                                    const Concurrency::CancellationToken &cancel)
    {
        checkName(original_name);
        auto file_lock = lockFor(original_name);
        std::lock_guard<std::mutex> guard(*file_lock);

        fs::path manifest_path = config_.chunk_config.getManifestPath(original_name);
        Metadata::Manifest manifest = Metadata::Manifest::load(manifest_path);

        try
        {
            Transfer::UploadReport report =
                orchestrator_.upload(manifest, config_.chunk_config.getChunksDirPath(original_name), strategy_, cancel);
            manifest.save(manifest_path);
            return report;
        }
        catch (const std::exception &e)
        {
            // Keep the replicas that did make it so a rerun only retries the rest.
            std::cerr << "Error uploading file '" << original_name << "': " << e.what() << std::endl;
            manifest.save(manifest_path);
            throw;
        }
    }

    Transfer::DownloadReport StoreService::downloadFile(const std::string &original_name,
                                                        const Concurrency::CancellationToken &cancel)
    {
        checkName(original_name);
        auto file_lock = lockFor(original_name);
        std::lock_guard<std::mutex> guard(*file_lock);

        Metadata::Manifest manifest = Metadata::Manifest::load(config_.chunk_config.getManifestPath(original_name));
        return orchestrator_.download(manifest, config_.chunk_config.getChunksDirPath(original_name), cancel);
    }

    void StoreService::assembleFile(const std::string &original_name,
                                    const std::string &output_filepath,
                                    const std::optional<std::string> &password)
    {
        checkName(original_name);
        auto file_lock = lockFor(original_name);
        std::lock_guard<std::mutex> guard(*file_lock);

        Metadata::Manifest manifest = Metadata::Manifest::load(config_.chunk_config.getManifestPath(original_name));
        Crypto::Cipher cipher = cipherFor(manifest, password);
        Chunks::assembleFile(manifest, config_.chunk_config.getChunksDirPath(original_name), output_filepath, cipher);
    }

    Metadata::Manifest StoreService::readManifest(const std::string &original_name) const
    {
        checkName(original_name);
        return Metadata::Manifest::load(config_.chunk_config.getManifestPath(original_name));
    }

    std::vector<char> StoreService::retrieveChunk(const std::string &original_name, const std::string &chunk_id) const
    {
        checkName(original_name);
        checkName(chunk_id);
        return Chunks::Chunk::loadData(config_.chunk_config.getChunksDirPath(original_name), chunk_id);
    }

    size_t StoreService::cleanupLocalChunks(const std::string &original_name)
    {
        checkName(original_name);
        auto file_lock = lockFor(original_name);
        std::lock_guard<std::mutex> guard(*file_lock);

        return Chunks::cleanupChunks(config_.chunk_config.getChunksDirPath(original_name));
    }

} // namespace ChunkStore
