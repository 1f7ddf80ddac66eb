#pragma once

#include "collaborators.hpp"

namespace tad::pipeline
{
    /**
     * @brief Advisory existence check in front of registry writes.
     *
     * A failing lookup is logged and reported as "not present"; the contract still rejects
     * true duplicates.
     */
    class RegistryGuard
    {
    public:
        explicit RegistryGuard(IRegistry * registry);

        bool exists(const evmc::bytes32 & content_hash) const;

    private:
        IRegistry * _registry;
    };
}
