#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "collaborators.hpp"
#include "transport.hpp"

namespace tad::adapters
{
    struct StorachaConfig
    {
        std::string space_did;
        std::string pinata_jwt;
        std::string bridge_url = "https://up.storacha.network/bridge";
        std::string pinata_url = "https://api.pinata.cloud/pinning/pinFileToIPFS";

        std::optional<std::string> miner = std::nullopt;
        std::optional<std::uint64_t> deal_duration = std::nullopt;
    };

    /**
     * @brief Outbound seams used by the storage pipeline.
     */
    struct StorageTransport
    {
        ProcessRunner run;
        ProcessToFileRunner run_to_file;
        JsonPost post_json;
        FilePut put_file;
        MultipartPost post_multipart;
    };

    /**
     * @brief Transport over curl and local tools. Each tool run is bounded by `process_timeout`.
     */
    StorageTransport makeStorageTransport(const net::http::RequestOptions & options, std::chrono::milliseconds process_timeout);

    struct StoreAllocation
    {
        std::optional<std::string> upload_url;
        net::http::Headers upload_headers;
        bool already_stored = false;
    };

    /**
     * @brief Body of a single-task bridge invocation: {"tasks": [[ability, space, args]]}.
     */
    nlohmann::json bridgeTask(const std::string & ability, const std::string & space_did, nlohmann::json args);

    /**
     * @brief X-Auth-Secret and Authorization headers from `w3 bridge generate-tokens -j` output.
     */
    std::optional<net::http::Headers> parseBridgeTokens(const nlohmann::json & tokens);

    /**
     * @brief Reads the store/add receipt. A receipt carrying an error is rejected.
     */
    pipeline::Outcome<StoreAllocation> parseStoreAllocation(const nlohmann::json & response);

    /**
     * @brief Deal identifier from a deal/add receipt, numeric ids are rendered as decimal text.
     */
    std::optional<std::string> parseDealId(const nlohmann::json & response);

    std::optional<std::string> parsePinnedCid(const nlohmann::json & response);

    /**
     * @brief Archives a file to IPFS and Filecoin.
     *
     * Pins through Pinata for the data CID, packs the file into a CAR with the ipfs CLI,
     * then registers the CAR with a Storacha space and requests a Filecoin deal.
     */
    class StorachaStorage final : public pipeline::IStorage
    {
    public:
        StorachaStorage(StorachaConfig cfg, StorageTransport transport);

        pipeline::Outcome<pipeline::StorageReceipt> store(const std::filesystem::path & local_path) override;

    private:
        struct CarFile
        {
            std::string root_cid;
            std::string car_cid;
            std::filesystem::path path;
            std::uintmax_t size = 0;
        };

        pipeline::Outcome<std::string> _pin(const std::filesystem::path & local_path) const;
        pipeline::Outcome<CarFile> _makeCar(const std::filesystem::path & local_path) const;
        pipeline::Outcome<net::http::Headers> _bridgeHeaders() const;
        pipeline::Outcome<nlohmann::json> _invoke(const std::string & ability, nlohmann::json args) const;
        pipeline::Outcome<void> _uploadCar(const CarFile & car) const;
        pipeline::Outcome<std::optional<std::string>> _createDeal(const CarFile & car) const;

        StorachaConfig _cfg;
        StorageTransport _transport;
    };
}
