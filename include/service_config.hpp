// include/service_config.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunk_config.hpp"
#include "cipher.hpp"
#include "distribution_strategy.hpp"

namespace ChunkStore
{
    namespace Config
    {

        // One storage account. `root` is where the account's objects live locally
        // (a mounted drive or sync folder).
        struct AccountConfig
        {
            std::string name;
            Distribution::Provider provider = Distribution::Provider::Local;
            std::string root;
            bool enabled = true;
            std::string description;
        };

        struct CloudConfig
        {
            std::vector<AccountConfig> accounts;
            std::vector<Distribution::Provider> providers; // Providers chunks are spread across, in order
            int replication_count = 1;
            Distribution::LoadBalancing load_balancing = Distribution::LoadBalancing::RoundRobin;
            size_t worker_count = 4;
            bool fail_on_replica_failure = false;

            std::vector<AccountConfig> enabledAccounts(Distribution::Provider provider) const;
        };

        struct EncryptionConfig
        {
            uint32_t pbkdf2_iterations = Crypto::DEFAULT_PBKDF2_ITERATIONS;
        };

        struct ServerConfig
        {
            uint16_t port = 8080;
        };

        class ServiceConfig
        {
        public:
            std::string version = "1.0";
            ChunkConfig chunk_config;
            EncryptionConfig encryption;
            CloudConfig cloud_config;
            ServerConfig server;

            static ServiceConfig defaults();

            // Loads and validates a config file. A missing file is created with the defaults.
            // Throws ConfigurationError on unreadable, unparsable or invalid configuration.
            static ServiceConfig load(const std::filesystem::path &path);
            void save(const std::filesystem::path &path) const;

            static ServiceConfig fromJson(const nlohmann::json &j);
            nlohmann::json toJson() const;

            void validate() const;
        };

    } // namespace Config
} // namespace ChunkStore
