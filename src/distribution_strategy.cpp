// src/distribution_strategy.cpp
#include "distribution_strategy.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace ChunkStore
{
    namespace Distribution
    {

        std::string providerToString(Provider provider)
        {
            switch (provider)
            {
            case Provider::GoogleDrive:
                return "gdrive";
            case Provider::Dropbox:
                return "dropbox";
            case Provider::OneDrive:
                return "onedrive";
            case Provider::Mega:
                return "mega";
            case Provider::Ipfs:
                return "ipfs";
            case Provider::Local:
                return "local";
            }
            return "local";
        }

        Provider providerFromString(const std::string &name)
        {
            std::string key;
            for (char c : name)
            {
                if (!std::isspace(static_cast<unsigned char>(c)))
                    key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }

            if (key == "gdrive" || key == "googledrive" || key == "google-drive")
                return Provider::GoogleDrive;
            if (key == "dropbox")
                return Provider::Dropbox;
            if (key == "onedrive" || key == "one-drive")
                return Provider::OneDrive;
            if (key == "mega")
                return Provider::Mega;
            if (key == "ipfs")
                return Provider::Ipfs;
            if (key == "local")
                return Provider::Local;
            throw ConfigurationError("unknown storage provider '" + name + "'");
        }

        std::string remotePathFor(Provider provider, const std::string &chunk_id)
        {
            switch (provider)
            {
            case Provider::GoogleDrive:
                return "distributed-chunks/" + chunk_id + ".chunk";
            case Provider::Dropbox:
                return "/Apps/DistributedChunks/" + chunk_id + ".chunk";
            case Provider::OneDrive:
                return "DistributedChunks/" + chunk_id + ".chunk";
            case Provider::Mega:
                return "chunks/" + chunk_id + ".chunk";
            case Provider::Ipfs:
                // Content addressed; the id is the path.
                return chunk_id;
            case Provider::Local:
                break;
            }
            return "chunks/" + chunk_id + ".chunk";
        }

        std::string loadBalancingToString(LoadBalancing policy)
        {
            switch (policy)
            {
            case LoadBalancing::RoundRobin:
                return "round_robin";
            case LoadBalancing::Random:
                return "random";
            case LoadBalancing::SizeBased:
                return "size_based";
            }
            return "round_robin";
        }

        LoadBalancing loadBalancingFromString(const std::string &name)
        {
            if (name == "round_robin")
                return LoadBalancing::RoundRobin;
            if (name == "random")
                return LoadBalancing::Random;
            if (name == "size_based")
                return LoadBalancing::SizeBased;
            throw ConfigurationError("invalid load balancing strategy: " + name);
        }

        DistributionStrategy::DistributionStrategy(std::vector<Target> pool, int replication_count, LoadBalancing policy)
            : pool_(std::move(pool)), replication_(0), policy_(policy)
        {
            if (replication_count < 1)
            {
                throw ConfigurationError("replication count must be at least 1, got " + std::to_string(replication_count));
            }

            if (pool_.empty())
            {
                std::cout << "No storage destinations configured, chunks stay local." << std::endl;
                pool_.push_back(Target{Provider::Local, ""});
            }

            // Two replicas on the same target are worthless.
            replication_ = std::min(static_cast<size_t>(replication_count), pool_.size());
            if (replication_ < static_cast<size_t>(replication_count))
            {
                std::cout << "Replication count " << replication_count << " exceeds " << pool_.size()
                          << " destinations, using " << replication_ << "." << std::endl;
            }

            if (policy_ != LoadBalancing::RoundRobin)
            {
                std::cout << "Load balancing '" << loadBalancingToString(policy_)
                          << "' is not implemented, falling back to round_robin." << std::endl;
            }
        }

        std::vector<Target> DistributionStrategy::destinationsFor(uint64_t chunk_index) const
        {
            // Random and size-based placement share the round-robin path for now.
            std::vector<Target> destinations;
            destinations.reserve(replication_);
            const uint64_t pool_size = pool_.size();
            for (size_t i = 0; i < replication_; ++i)
            {
                destinations.push_back(pool_[static_cast<size_t>((chunk_index + i) % pool_size)]);
            }
            return destinations;
        }

    } // namespace Distribution
} // namespace ChunkStore
