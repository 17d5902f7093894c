#include "include/NetworkConfig.h"

namespace EthereumService {

std::vector<NetworkConfig> DefaultNetworks() {
    return {
        NetworkConfig(1, "Ethereum", "https://api.etherscan.io/api", "https://eth.llamarpc.com"),
        NetworkConfig(137, "Polygon", "https://api.polygonscan.com/api", "https://polygon-rpc.com"),
        NetworkConfig(42161, "Arbitrum", "https://api.arbiscan.io/api", "https://arb1.arbitrum.io/rpc"),
        NetworkConfig(10, "Optimism", "https://api-optimistic.etherscan.io/api",
                      "https://mainnet.optimism.io"),
        NetworkConfig(8453, "Base", "https://api.basescan.org/api", "https://mainnet.base.org"),
        NetworkConfig(56, "BSC", "https://api.bscscan.com/api", "https://bsc-dataseed.binance.org"),
    };
}

std::vector<NetworkConfig> OrderNetworks(const std::vector<NetworkConfig>& networks,
                                         std::optional<uint64_t> preferredChainId) {
    if (!preferredChainId.has_value()) {
        return networks;
    }

    std::vector<NetworkConfig> ordered;
    ordered.reserve(networks.size());
    for (const auto& network : networks) {
        if (network.chainId == *preferredChainId) {
            ordered.push_back(network);
        }
    }
    for (const auto& network : networks) {
        if (network.chainId != *preferredChainId) {
            ordered.push_back(network);
        }
    }
    return ordered;
}

std::optional<NetworkConfig> FindNetwork(const std::vector<NetworkConfig>& networks,
                                         uint64_t chainId) {
    for (const auto& network : networks) {
        if (network.chainId == chainId) {
            return network;
        }
    }
    return std::nullopt;
}

} // namespace EthereumService
