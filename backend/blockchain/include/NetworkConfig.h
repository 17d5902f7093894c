#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace EthereumService {

/**
 * @brief Static per-chain endpoints
 *
 * Lists of these are passed by value into the clients that use them so
 * tests can substitute their own endpoints.
 */
struct NetworkConfig {
    uint64_t chainId;
    std::string name;
    std::string explorerApiBase;  // Etherscan-compatible API
    std::string rpcUrl;           // JSON-RPC endpoint

    NetworkConfig() : chainId(0) {}
    NetworkConfig(uint64_t id, const std::string& displayName, const std::string& apiBase,
                  const std::string& rpc)
        : chainId(id), name(displayName), explorerApiBase(apiBase), rpcUrl(rpc) {}
};

/**
 * @brief The supported networks, in default search order
 *
 * Ethereum, Polygon, Arbitrum, Optimism, Base, BSC.
 */
std::vector<NetworkConfig> DefaultNetworks();

/**
 * @brief Move the preferred chain (if listed) to the front, keeping the rest in order
 */
std::vector<NetworkConfig> OrderNetworks(const std::vector<NetworkConfig>& networks,
                                         std::optional<uint64_t> preferredChainId);

std::optional<NetworkConfig> FindNetwork(const std::vector<NetworkConfig>& networks,
                                         uint64_t chainId);

} // namespace EthereumService
