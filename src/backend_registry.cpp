// src/backend_registry.cpp
#include "backend_registry.hpp"
#include "errors.hpp"

#include <iostream>

namespace ChunkStore
{
    namespace Storage
    {

        BackendRegistry BackendRegistry::fromConfig(const Config::CloudConfig &config)
        {
            BackendRegistry registry;
            for (const auto &account : config.accounts)
            {
                if (!account.enabled)
                {
                    continue;
                }
                Distribution::Target target{account.provider, account.name};
                try
                {
                    registry.add(target, std::make_unique<DirectoryBackend>(account.root));
                }
                catch (const BackendError &e)
                {
                    throw ConfigurationError("failed to initialize account '" + account.name + "': " + e.what(),
                                             ErrorContext{"", {}, Distribution::providerToString(account.provider)});
                }
                std::cout << "Registered " << Distribution::providerToString(account.provider) << " account '"
                          << account.name << "' at " << account.root << std::endl;
            }
            return registry;
        }

        void BackendRegistry::add(const Distribution::Target &target, std::unique_ptr<StorageBackend> backend)
        {
            if (!backend)
            {
                throw ConfigurationError("cannot register an empty backend for account '" + target.account + "'");
            }
            if (find(target) != nullptr)
            {
                throw ConfigurationError("duplicate backend for " + Distribution::providerToString(target.provider) +
                                         " account '" + target.account + "'");
            }
            entries_.emplace_back(target, std::move(backend));
        }

        StorageBackend *BackendRegistry::find(const Distribution::Target &target) const
        {
            for (const auto &entry : entries_)
            {
                if (entry.first == target)
                {
                    return entry.second.get();
                }
            }
            return nullptr;
        }

        std::vector<Distribution::Target> BackendRegistry::poolFor(const std::vector<Distribution::Provider> &providers) const
        {
            std::vector<Distribution::Target> pool;
            for (auto provider : providers)
            {
                for (const auto &entry : entries_)
                {
                    if (entry.first.provider == provider)
                    {
                        pool.push_back(entry.first);
                    }
                }
            }
            return pool;
        }

    } // namespace Storage
} // namespace ChunkStore
