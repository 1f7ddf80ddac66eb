#include "registry_guard.hpp"

#include <exception>
#include <format>

#include <spdlog/spdlog.h>

#include "hex.hpp"

namespace tad::pipeline
{
    RegistryGuard::RegistryGuard(IRegistry * registry)
        : _registry(registry)
    {
    }

    bool RegistryGuard::exists(const evmc::bytes32 & content_hash) const
    {
        if(_registry == nullptr)
        {
            return false;
        }

        const std::string hash_hex = chain::bytesToHex(content_hash.bytes, sizeof(content_hash.bytes));
        try
        {
            const auto result = _registry->exists(content_hash);
            if(!result)
            {
                spdlog::warn("Registry existence check for {} failed ({}): {} - assuming not present",
                    hash_hex, std::format("{}", result.error().kind), result.error().message);
                return false;
            }
            return *result;
        }
        catch(const std::exception & e)
        {
            spdlog::warn("Registry existence check for {} threw: {} - assuming not present", hash_hex, e.what());
            return false;
        }
    }
}
