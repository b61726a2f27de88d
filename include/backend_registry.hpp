// include/backend_registry.hpp
#pragma once

#include <memory>
#include <utility>
#include <vector>

#include "distribution_strategy.hpp"
#include "service_config.hpp"
#include "storage_backend.hpp"

namespace ChunkStore
{
    namespace Storage
    {

        // Owns one backend per (provider, account). Built once by the caller and
        // handed to the orchestrator; iteration order is registration order.
        class BackendRegistry
        {
        public:
            BackendRegistry() = default;
            BackendRegistry(const BackendRegistry &) = delete;
            BackendRegistry &operator=(const BackendRegistry &) = delete;
            BackendRegistry(BackendRegistry &&) = default;
            BackendRegistry &operator=(BackendRegistry &&) = default;

            // One DirectoryBackend per enabled account, in configuration order.
            static BackendRegistry fromConfig(const Config::CloudConfig &config);

            // Throws ConfigurationError if the target is already registered.
            void add(const Distribution::Target &target, std::unique_ptr<StorageBackend> backend);

            // nullptr when nothing is registered for the target.
            StorageBackend *find(const Distribution::Target &target) const;

            // Destination pool for a strategy: every registered account of each
            // listed provider, providers in the given order.
            std::vector<Distribution::Target> poolFor(const std::vector<Distribution::Provider> &providers) const;

            size_t size() const { return entries_.size(); }
            bool empty() const { return entries_.empty(); }

        private:
            std::vector<std::pair<Distribution::Target, std::unique_ptr<StorageBackend>>> entries_;
        };

    } // namespace Storage
} // namespace ChunkStore
