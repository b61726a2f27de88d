// include/distribution_strategy.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ChunkStore
{
    namespace Distribution
    {

        enum class Provider
        {
            GoogleDrive,
            Dropbox,
            OneDrive,
            Mega,
            Ipfs,
            Local
        };

        std::string providerToString(Provider provider);

        // Accepts the canonical names ("gdrive", "dropbox", ...) and common aliases.
        // Throws ConfigurationError for anything else.
        Provider providerFromString(const std::string &name);

        // Provider-specific remote path for a chunk.
        std::string remotePathFor(Provider provider, const std::string &chunk_id);

        // A (provider, account) pair able to store chunk bytes.
        struct Target
        {
            Provider provider = Provider::Local;
            std::string account;

            bool operator==(const Target &other) const
            {
                return provider == other.provider && account == other.account;
            }
            bool operator!=(const Target &other) const { return !(*this == other); }
        };

        enum class LoadBalancing
        {
            RoundRobin,
            Random,
            SizeBased
        };

        std::string loadBalancingToString(LoadBalancing policy);
        LoadBalancing loadBalancingFromString(const std::string &name);

        // Stateless placement of chunk index -> replica targets.
        class DistributionStrategy
        {
        public:
            // An empty pool degrades to a single local-only target.
            // Throws ConfigurationError when replication_count < 1.
            DistributionStrategy(std::vector<Target> pool, int replication_count, LoadBalancing policy);

            // Replica i of chunk c goes to pool[(c + i) % pool_size].
            std::vector<Target> destinationsFor(uint64_t chunk_index) const;

            const std::vector<Target> &pool() const { return pool_; }
            size_t replicationCount() const { return replication_; }
            LoadBalancing policy() const { return policy_; }

        private:
            std::vector<Target> pool_;
            size_t replication_;
            LoadBalancing policy_;
        };

    } // namespace Distribution
} // namespace ChunkStore
