#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "address.hpp"
#include "chain_error.hpp"
#include "hex.hpp"
#include "http.hpp"

namespace tad::chain
{
    /**
     * @brief Sends one JSON-RPC request and returns the raw response object.
     *
     * std::nullopt signals a transport failure (already logged by the implementation).
     * Tests substitute an in-memory node through this seam.
     */
    using RpcCall = std::function<std::optional<nlohmann::json>(const std::string & rpc_url, const nlohmann::json & request)>;

    /**
     * @brief RpcCall posting requests through curl with the given timeout and retry policy.
     */
    RpcCall makeHttpRpcCall(net::http::RequestOptions options = {});

    class RpcClient
    {
    public:
        RpcClient(std::string rpc_url, RpcCall rpc_call);

        const std::string & url() const noexcept;

        /**
         * @brief Performs `method` and unwraps the `result` member.
         */
        Result<nlohmann::json> call(const std::string & method, nlohmann::json params) const;

        Result<std::uint64_t> blockNumber() const;

        /**
         * @brief eth_getLogs over [from_block, to_block] for one emitter and one topic0.
         *
         * Uses a plain range query. No filter is installed on the node.
         */
        Result<std::vector<nlohmann::json>> getLogs(const Address & address, std::uint64_t from_block, std::uint64_t to_block, const std::string & topic0) const;

        /**
         * @brief eth_call against the latest block.
         */
        Result<Bytes> ethCall(const Address & to, const Bytes & data) const;

    private:
        std::string _rpc_url;
        RpcCall _rpc_call;
    };
}
