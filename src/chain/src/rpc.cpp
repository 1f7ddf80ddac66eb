#include "rpc.hpp"

#include <format>
#include <utility>

#include <spdlog/spdlog.h>

namespace tad::chain
{
    using json = nlohmann::json;

    RpcCall makeHttpRpcCall(net::http::RequestOptions options)
    {
        return [options = std::move(options)](const std::string & rpc_url, const json & request) -> std::optional<json>
        {
            const auto response = net::http::postJson(rpc_url, request, {}, options);
            if(!response)
            {
                spdlog::error("Chain RPC call '{}' failed ({}): {}",
                    request.value("method", ""), std::format("{}", response.error().kind), response.error().message);
                return std::nullopt;
            }

            json parsed = json::parse(response->body, nullptr, false);
            if(parsed.is_discarded())
            {
                spdlog::error("Chain RPC call '{}' returned invalid JSON", request.value("method", ""));
                return std::nullopt;
            }
            return parsed;
        };
    }

    RpcClient::RpcClient(std::string rpc_url, RpcCall rpc_call)
        : _rpc_url(std::move(rpc_url)),
          _rpc_call(std::move(rpc_call))
    {
    }

    const std::string & RpcClient::url() const noexcept
    {
        return _rpc_url;
    }

    Result<json> RpcClient::call(const std::string & method, json params) const
    {
        if(_rpc_url.empty() || !_rpc_call)
        {
            return std::unexpected(ChainError{
                .kind = ChainError::Kind::INVALID_CONFIG,
                .message = "RPC endpoint is not configured"
            });
        }

        const json request{
            {"jsonrpc", "2.0"},
            {"id", 1},
            {"method", method},
            {"params", std::move(params)}
        };

        const auto response = _rpc_call(_rpc_url, request);
        if(!response)
        {
            return std::unexpected(ChainError{
                .kind = ChainError::Kind::RPC_ERROR,
                .message = std::format("RPC '{}' transport failure", method)
            });
        }

        if(response->contains("error"))
        {
            return std::unexpected(ChainError{
                .kind = ChainError::Kind::RPC_ERROR,
                .message = std::format("RPC '{}' error: {}", method, (*response)["error"].dump())
            });
        }

        if(!response->contains("result"))
        {
            return std::unexpected(ChainError{
                .kind = ChainError::Kind::RPC_MALFORMED,
                .message = std::format("RPC '{}' response missing result field", method)
            });
        }

        return (*response)["result"];
    }

    Result<std::uint64_t> RpcClient::blockNumber() const
    {
        const auto result = call("eth_blockNumber", json::array());
        if(!result)
        {
            return std::unexpected(result.error());
        }

        if(!result->is_string())
        {
            return std::unexpected(ChainError{
                .kind = ChainError::Kind::RPC_MALFORMED,
                .message = "eth_blockNumber returned non-string result"
            });
        }

        const auto height = parseHexQuantity(result->get<std::string>());
        if(!height)
        {
            return std::unexpected(ChainError{
                .kind = ChainError::Kind::RPC_MALFORMED,
                .message = std::format("eth_blockNumber returned unparsable quantity {}", result->dump())
            });
        }
        return *height;
    }

    Result<std::vector<json>> RpcClient::getLogs(const Address & address, const std::uint64_t from_block, const std::uint64_t to_block, const std::string & topic0) const
    {
        json filter{
            {"address", addressToHex(address)},
            {"fromBlock", toHexQuantity(from_block)},
            {"toBlock", toHexQuantity(to_block)},
            {"topics", json::array({topic0})}
        };

        const auto result = call("eth_getLogs", json::array({std::move(filter)}));
        if(!result)
        {
            return std::unexpected(result.error());
        }

        if(!result->is_array())
        {
            return std::unexpected(ChainError{
                .kind = ChainError::Kind::RPC_MALFORMED,
                .message = "eth_getLogs returned non-array result"
            });
        }

        return result->get<std::vector<json>>();
    }

    Result<Bytes> RpcClient::ethCall(const Address & to, const Bytes & data) const
    {
        json call_obj{
            {"to", addressToHex(to)},
            {"data", bytesToHex(data)}
        };

        const auto result = call("eth_call", json::array({std::move(call_obj), "latest"}));
        if(!result)
        {
            return std::unexpected(result.error());
        }

        if(!result->is_string())
        {
            return std::unexpected(ChainError{
                .kind = ChainError::Kind::RPC_MALFORMED,
                .message = "eth_call returned non-string result"
            });
        }

        const auto bytes = hexToBytes(result->get<std::string>());
        if(!bytes)
        {
            return std::unexpected(ChainError{
                .kind = ChainError::Kind::RPC_MALFORMED,
                .message = "eth_call returned invalid hex"
            });
        }
        return *bytes;
    }
}
