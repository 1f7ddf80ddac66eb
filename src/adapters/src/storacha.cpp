#include "storacha.hpp"

#include <algorithm>
#include <format>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include "utils.hpp"

namespace tad::adapters
{
    using json = nlohmann::json;

    namespace
    {
        pipeline::CollaboratorError _unavailable(std::string message)
        {
            return pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::UNAVAILABLE,
                .message = std::move(message)
            };
        }

        pipeline::CollaboratorError _invalid(std::string message)
        {
            return pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::INVALID_RESPONSE,
                .message = std::move(message)
            };
        }

        // Receipts come back as [{"p": {"out": {...}}}, ...]
        const json* _receiptOut(const json & response)
        {
            if(!response.is_array() || response.empty()) return nullptr;
            const json & first = response.front();
            if(!first.is_object() || !first.contains("p") || !first["p"].is_object()) return nullptr;
            if(!first["p"].contains("out") || !first["p"]["out"].is_object()) return nullptr;
            return &first["p"]["out"];
        }

        json _link(const std::string & cid)
        {
            return json{{"/", cid}};
        }
    }

    StorageTransport makeStorageTransport(const net::http::RequestOptions & options, const std::chrono::milliseconds process_timeout)
    {
        return StorageTransport{
            .run = makeProcessRunner(process_timeout),
            .run_to_file = makeProcessToFileRunner(process_timeout),
            .post_json = makeJsonPost(options),
            .put_file = makeFilePut(options),
            .post_multipart = makeMultipartPost(options)
        };
    }

    json bridgeTask(const std::string & ability, const std::string & space_did, json args)
    {
        return json{{"tasks", json::array({json::array({ability, space_did, std::move(args)})})}};
    }

    std::optional<net::http::Headers> parseBridgeTokens(const json & tokens)
    {
        if(!tokens.is_object()) return std::nullopt;
        if(!tokens.contains("X-Auth-Secret") || !tokens["X-Auth-Secret"].is_string()) return std::nullopt;
        if(!tokens.contains("Authorization") || !tokens["Authorization"].is_string()) return std::nullopt;

        return net::http::Headers{
            {"X-Auth-Secret", tokens["X-Auth-Secret"].get<std::string>()},
            {"Authorization", tokens["Authorization"].get<std::string>()}
        };
    }

    pipeline::Outcome<StoreAllocation> parseStoreAllocation(const json & response)
    {
        const json* out = _receiptOut(response);
        if(out == nullptr)
        {
            return std::unexpected(_invalid("store/add receipt missing"));
        }

        if(out->contains("error"))
        {
            const json & error = (*out)["error"];
            const std::string message = error.is_object() && error.contains("message") && error["message"].is_string()
                ? error["message"].get<std::string>()
                : error.dump();
            return std::unexpected(pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::REJECTED,
                .message = std::format("store/add failed: {}", message)
            });
        }

        StoreAllocation allocation;
        const json ok = out->value("ok", json::object());

        if(ok.contains("url") && ok["url"].is_string() && !ok["url"].get<std::string>().empty())
        {
            allocation.upload_url = ok["url"].get<std::string>();
            if(ok.contains("headers") && ok["headers"].is_object())
            {
                for(const auto & [name, value] : ok["headers"].items())
                {
                    allocation.upload_headers.emplace_back(name, value.is_string() ? value.get<std::string>() : value.dump());
                }
            }
        }
        allocation.already_stored = ok.value("status", "") == "done";
        return allocation;
    }

    std::optional<std::string> parseDealId(const json & response)
    {
        const json* out = _receiptOut(response);
        if(out == nullptr || !out->contains("dealId")) return std::nullopt;

        const json & deal_id = (*out)["dealId"];
        if(deal_id.is_string()) return deal_id.get<std::string>();
        if(deal_id.is_number_unsigned()) return std::to_string(deal_id.get<std::uint64_t>());
        if(deal_id.is_number_integer()) return std::to_string(deal_id.get<std::int64_t>());
        return std::nullopt;
    }

    std::optional<std::string> parsePinnedCid(const json & response)
    {
        if(!response.is_object() || !response.contains("IpfsHash") || !response["IpfsHash"].is_string())
        {
            return std::nullopt;
        }
        return response["IpfsHash"].get<std::string>();
    }

    StorachaStorage::StorachaStorage(StorachaConfig cfg, StorageTransport transport)
        : _cfg(std::move(cfg)),
          _transport(std::move(transport))
    {
    }

    pipeline::Outcome<std::string> StorachaStorage::_pin(const std::filesystem::path & local_path) const
    {
        const auto response = _transport.post_multipart(_cfg.pinata_url, "file", local_path, {{"Authorization", "Bearer " + _cfg.pinata_jwt}});
        if(!response)
        {
            return std::unexpected(_unavailable(std::format("Pinata pin failed: {}", response.error().message)));
        }

        const auto cid = parsePinnedCid(json::parse(response->body, nullptr, false));
        if(!cid)
        {
            return std::unexpected(_invalid("Pinata response has no IpfsHash"));
        }

        spdlog::info("Pinned to IPFS: {}", *cid);
        return *cid;
    }

    pipeline::Outcome<StorachaStorage::CarFile> StorachaStorage::_makeCar(const std::filesystem::path & local_path) const
    {
        CarFile car;

        const native::ProcessResult added = _transport.run("ipfs", {"add", "-Q", local_path.string()});
        if(added.exit_code != 0)
        {
            return std::unexpected(_unavailable(std::format("ipfs add failed ({}): {}", added.exit_code, describeFailure(added))));
        }
        car.root_cid = utils::trim(added.output);
        if(car.root_cid.empty())
        {
            return std::unexpected(_invalid("ipfs add printed no CID"));
        }

        car.path = local_path;
        car.path += ".car";

        const native::ProcessResult exported = _transport.run_to_file("ipfs", {"dag", "export", car.root_cid}, car.path);
        if(exported.exit_code != 0)
        {
            return std::unexpected(_unavailable(std::format("ipfs dag export failed ({}): {}", exported.exit_code, describeFailure(exported))));
        }

        const native::ProcessResult hashed = _transport.run("ipfs-car", {"hash", car.path.string()});
        if(hashed.exit_code != 0)
        {
            return std::unexpected(_unavailable(std::format("ipfs-car hash failed ({}): {}", hashed.exit_code, describeFailure(hashed))));
        }
        car.car_cid = utils::trim(hashed.output);
        if(car.car_cid.empty())
        {
            return std::unexpected(_invalid("ipfs-car hash printed no CID"));
        }

        std::error_code ec;
        car.size = std::filesystem::file_size(car.path, ec);
        if(ec)
        {
            return std::unexpected(_unavailable(std::format("cannot stat {}: {}", car.path.string(), ec.message())));
        }

        spdlog::info("CAR ready: root {} car {} ({} bytes)", car.root_cid, car.car_cid, car.size);
        return car;
    }

    pipeline::Outcome<net::http::Headers> StorachaStorage::_bridgeHeaders() const
    {
        const native::ProcessResult generated = _transport.run("w3", {
            "bridge", "generate-tokens", _cfg.space_did,
            "-c", "store/add",
            "-c", "upload/add",
            "-c", "deal/add",
            "-j"
        });
        if(generated.exit_code != 0)
        {
            return std::unexpected(_unavailable(std::format("w3 bridge generate-tokens failed ({}): {}", generated.exit_code, describeFailure(generated))));
        }

        const auto tokens = lastJsonObject(generated.output);
        if(!tokens)
        {
            return std::unexpected(_invalid("w3 printed no token object"));
        }

        auto headers = parseBridgeTokens(*tokens);
        if(!headers)
        {
            return std::unexpected(_invalid("w3 token object lacks X-Auth-Secret or Authorization"));
        }
        return std::move(*headers);
    }

    pipeline::Outcome<json> StorachaStorage::_invoke(const std::string & ability, json args) const
    {
        // Tokens are short-lived, one set per invocation
        const auto headers = _bridgeHeaders();
        if(!headers)
        {
            return std::unexpected(headers.error());
        }

        const auto response = _transport.post_json(_cfg.bridge_url, bridgeTask(ability, _cfg.space_did, std::move(args)), *headers);
        if(!response)
        {
            return std::unexpected(_unavailable(std::format("{} failed: {}", ability, response.error().message)));
        }

        json parsed = json::parse(response->body, nullptr, false);
        if(parsed.is_discarded())
        {
            return std::unexpected(_invalid(std::format("{} returned non-JSON body", ability)));
        }
        return parsed;
    }

    pipeline::Outcome<void> StorachaStorage::_uploadCar(const CarFile & car) const
    {
        const auto store_receipt = _invoke("store/add", json{{"link", _link(car.car_cid)}, {"size", car.size}});
        if(!store_receipt)
        {
            return std::unexpected(store_receipt.error());
        }

        auto allocation = parseStoreAllocation(*store_receipt);
        if(!allocation)
        {
            return std::unexpected(allocation.error());
        }

        if(allocation->upload_url)
        {
            net::http::Headers headers = allocation->upload_headers;
            const bool has_length = std::any_of(headers.begin(), headers.end(),
                [](const auto & header) { return utils::equalsIgnoreCase(header.first, "Content-Length"); });
            if(!has_length)
            {
                headers.emplace_back("Content-Length", std::to_string(car.size));
            }

            const auto put = _transport.put_file(*allocation->upload_url, car.path, headers);
            if(!put)
            {
                return std::unexpected(_unavailable(std::format("CAR upload failed: {}", put.error().message)));
            }
            spdlog::info("CAR uploaded");
        }
        else if(allocation->already_stored)
        {
            spdlog::info("CAR already stored, skipping upload");
        }
        else
        {
            spdlog::warn("Unexpected store/add receipt: {}", store_receipt->dump());
        }

        const auto upload_receipt = _invoke("upload/add", json{
            {"root", _link(car.root_cid)},
            {"shards", json::array({_link(car.car_cid)})}
        });
        if(!upload_receipt)
        {
            return std::unexpected(upload_receipt.error());
        }

        spdlog::info("CAR registered with space {}", _cfg.space_did);
        return {};
    }

    pipeline::Outcome<std::optional<std::string>> StorachaStorage::_createDeal(const CarFile & car) const
    {
        json args{{"root", _link(car.root_cid)}, {"car", _link(car.car_cid)}};
        if(_cfg.miner)
        {
            args["miner"] = *_cfg.miner;
        }
        if(_cfg.deal_duration)
        {
            args["duration"] = *_cfg.deal_duration;
        }

        const auto receipt = _invoke("deal/add", std::move(args));
        if(!receipt)
        {
            return std::unexpected(receipt.error());
        }

        auto deal_id = parseDealId(*receipt);
        if(!deal_id)
        {
            spdlog::warn("deal/add receipt carries no dealId");
        }
        return deal_id;
    }

    pipeline::Outcome<pipeline::StorageReceipt> StorachaStorage::store(const std::filesystem::path & local_path)
    {
        if(_cfg.space_did.empty() || _cfg.pinata_jwt.empty())
        {
            return std::unexpected(_unavailable("storage credentials not configured (PINATA_JWT, W3UP_SPACE_DID)"));
        }

        std::error_code ec;
        if(!std::filesystem::exists(local_path, ec))
        {
            return std::unexpected(pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::NOT_FOUND,
                .message = std::format("file not found: {}", local_path.string())
            });
        }

        spdlog::info("Archiving {}", local_path.string());

        const auto data_cid = _pin(local_path);
        if(!data_cid)
        {
            return std::unexpected(data_cid.error());
        }

        const auto car = _makeCar(local_path);
        if(!car)
        {
            return std::unexpected(car.error());
        }

        const auto uploaded = _uploadCar(*car);
        const auto deal_id = uploaded ? _createDeal(*car) : pipeline::Outcome<std::optional<std::string>>(std::unexpected(uploaded.error()));

        if(!std::filesystem::remove(car->path, ec) || ec)
        {
            spdlog::warn("Could not remove CAR file {}", car->path.string());
        }

        if(!deal_id)
        {
            return std::unexpected(deal_id.error());
        }

        return pipeline::StorageReceipt{
            .data_cid = *data_cid,
            .root_cid = car->root_cid,
            .car_cid = car->car_cid,
            .deal_id = *deal_id
        };
    }
}
