// src/service_config.cpp
#include "service_config.hpp"
#include "errors.hpp"

#include <fstream>
#include <iostream>
#include <set>

namespace fs = std::filesystem;
using nlohmann::json;

namespace ChunkStore
{
    namespace Config
    {

        std::vector<AccountConfig> CloudConfig::enabledAccounts(Distribution::Provider provider) const
        {
            std::vector<AccountConfig> enabled;
            for (const auto &account : accounts)
            {
                if (account.enabled && account.provider == provider)
                {
                    enabled.push_back(account);
                }
            }
            return enabled;
        }

        ServiceConfig ServiceConfig::defaults()
        {
            // No remote accounts: every chunk stays local until some are configured.
            return ServiceConfig();
        }

        ServiceConfig ServiceConfig::fromJson(const json &j)
        {
            ServiceConfig cfg;
            try
            {
                cfg.version = j.value("version", cfg.version);

                if (j.contains("chunk_config"))
                {
                    const json &c = j.at("chunk_config");
                    cfg.chunk_config.chunk_size = c.value("chunk_size", cfg.chunk_config.chunk_size);
                    cfg.chunk_config.chunks_dir = c.value("chunks_dir", cfg.chunk_config.chunks_dir);
                    cfg.chunk_config.manifests_dir = c.value("manifests_dir", cfg.chunk_config.manifests_dir);
                }

                if (j.contains("encryption"))
                {
                    cfg.encryption.pbkdf2_iterations =
                        j.at("encryption").value("pbkdf2_iterations", cfg.encryption.pbkdf2_iterations);
                }

                if (j.contains("cloud_config"))
                {
                    const json &cc = j.at("cloud_config");
                    if (cc.contains("accounts"))
                    {
                        for (const auto &a : cc.at("accounts"))
                        {
                            AccountConfig account;
                            a.at("name").get_to(account.name);
                            account.provider = Distribution::providerFromString(a.at("provider").get<std::string>());
                            a.at("root").get_to(account.root);
                            account.enabled = a.value("enabled", true);
                            account.description = a.value("description", std::string());
                            cfg.cloud_config.accounts.push_back(std::move(account));
                        }
                    }
                    if (cc.contains("providers"))
                    {
                        for (const auto &p : cc.at("providers"))
                        {
                            cfg.cloud_config.providers.push_back(Distribution::providerFromString(p.get<std::string>()));
                        }
                    }
                    cfg.cloud_config.replication_count = cc.value("replication_count", cfg.cloud_config.replication_count);
                    if (cc.contains("load_balancing"))
                    {
                        cfg.cloud_config.load_balancing =
                            Distribution::loadBalancingFromString(cc.at("load_balancing").get<std::string>());
                    }
                    cfg.cloud_config.worker_count = cc.value("worker_count", cfg.cloud_config.worker_count);
                    cfg.cloud_config.fail_on_replica_failure =
                        cc.value("fail_on_replica_failure", cfg.cloud_config.fail_on_replica_failure);
                }

                if (j.contains("server"))
                {
                    cfg.server.port = j.at("server").value("port", cfg.server.port);
                }
            }
            catch (const json::exception &e)
            {
                throw ConfigurationError(std::string("invalid configuration: ") + e.what());
            }
            return cfg;
        }

        json ServiceConfig::toJson() const
        {
            json accounts = json::array();
            for (const auto &a : cloud_config.accounts)
            {
                accounts.push_back({
                    {"name", a.name},
                    {"provider", Distribution::providerToString(a.provider)},
                    {"root", a.root},
                    {"enabled", a.enabled},
                    {"description", a.description}
                });
            }
            json providers = json::array();
            for (auto p : cloud_config.providers)
            {
                providers.push_back(Distribution::providerToString(p));
            }

            return json{
                {"version", version},
                {"chunk_config", {
                    {"chunk_size", chunk_config.chunk_size},
                    {"chunks_dir", chunk_config.chunks_dir},
                    {"manifests_dir", chunk_config.manifests_dir}
                }},
                {"encryption", {{"pbkdf2_iterations", encryption.pbkdf2_iterations}}},
                {"cloud_config", {
                    {"accounts", accounts},
                    {"providers", providers},
                    {"replication_count", cloud_config.replication_count},
                    {"load_balancing", Distribution::loadBalancingToString(cloud_config.load_balancing)},
                    {"worker_count", cloud_config.worker_count},
                    {"fail_on_replica_failure", cloud_config.fail_on_replica_failure}
                }},
                {"server", {{"port", server.port}}}
            };
        }

        void ServiceConfig::validate() const
        {
            chunk_config.validate();

            if (encryption.pbkdf2_iterations == 0)
            {
                throw ConfigurationError("pbkdf2_iterations must be positive");
            }
            if (cloud_config.replication_count < 1)
            {
                throw ConfigurationError("replication count must be at least 1");
            }
            if (cloud_config.worker_count < 1)
            {
                throw ConfigurationError("worker count must be at least 1");
            }

            std::set<std::string> names;
            for (size_t i = 0; i < cloud_config.accounts.size(); ++i)
            {
                const AccountConfig &account = cloud_config.accounts[i];
                if (account.name.empty())
                {
                    throw ConfigurationError("account " + std::to_string(i) + ": name cannot be empty");
                }
                if (!names.insert(account.name).second)
                {
                    throw ConfigurationError("duplicate account name: " + account.name);
                }
                if (account.root.empty())
                {
                    throw ConfigurationError("account " + account.name + ": root cannot be empty");
                }
            }

            for (auto provider : cloud_config.providers)
            {
                if (cloud_config.enabledAccounts(provider).empty())
                {
                    throw ConfigurationError("provider " + Distribution::providerToString(provider) +
                                             " is enabled but no accounts are configured");
                }
            }
        }

        ServiceConfig ServiceConfig::load(const fs::path &path)
        {
            if (!fs::exists(path))
            {
                std::cout << "Config file not found, creating default config at " << path << std::endl;
                ServiceConfig cfg = defaults();
                cfg.save(path);
                return cfg;
            }

            std::ifstream ifs(path);
            if (!ifs.is_open())
            {
                throw ConfigurationError("failed to read config file: " + path.string());
            }

            json j;
            try
            {
                ifs >> j;
            }
            catch (const json::parse_error &e)
            {
                throw ConfigurationError("failed to parse config file " + path.string() + ": " + e.what());
            }

            ServiceConfig cfg = fromJson(j);
            cfg.validate();
            return cfg;
        }

        void ServiceConfig::save(const fs::path &path) const
        {
            if (path.has_parent_path())
            {
                std::error_code ec;
                fs::create_directories(path.parent_path(), ec);
                if (ec)
                {
                    throw IOFailure("failed to create config directory: " + ec.message());
                }
            }

            std::ofstream ofs(path);
            if (!ofs.is_open())
            {
                throw IOFailure("failed to open file for writing config: " + path.string());
            }
            ofs << toJson().dump(2);
            if (!ofs.good())
            {
                throw IOFailure("failed to write config file: " + path.string());
            }
        }

    } // namespace Config
} // namespace ChunkStore
