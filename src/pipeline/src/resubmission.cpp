#include "resubmission.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include "file.hpp"
#include "hex.hpp"
#include "utils.hpp"

namespace tad::pipeline
{
    using json = nlohmann::json;

    namespace
    {
        std::string _key(const evmc::bytes32 & content_hash)
        {
            return chain::bytesToHex(content_hash.bytes, sizeof(content_hash.bytes));
        }
    }

    ResubmissionLedger::ResubmissionLedger(std::filesystem::path path)
        : _path(std::move(path))
    {
        const auto content = file::loadTextFile(_path);
        if(!content)
        {
            return;
        }

        const json ledger = json::parse(*content, nullptr, false);
        if(ledger.is_discarded() || !ledger.is_object() || !ledger.contains("resubmitted") || !ledger["resubmitted"].is_array())
        {
            spdlog::warn("Resubmission ledger {} is unreadable, starting empty", _path.string());
            return;
        }

        for(const auto & entry : ledger["resubmitted"])
        {
            if(entry.is_string())
            {
                _hashes.insert(utils::toLower(entry.get<std::string>()));
            }
        }
        spdlog::debug("Loaded {} resubmitted hash(es) from {}", _hashes.size(), _path.string());
    }

    const std::filesystem::path & ResubmissionLedger::path() const noexcept
    {
        return _path;
    }

    bool ResubmissionLedger::contains(const evmc::bytes32 & content_hash) const
    {
        return _hashes.contains(_key(content_hash));
    }

    bool ResubmissionLedger::add(const evmc::bytes32 & content_hash)
    {
        _hashes.insert(_key(content_hash));
        return _persist();
    }

    std::size_t ResubmissionLedger::size() const noexcept
    {
        return _hashes.size();
    }

    bool ResubmissionLedger::_persist() const
    {
        std::vector<std::string> sorted(_hashes.begin(), _hashes.end());
        std::ranges::sort(sorted);

        const json ledger{{"resubmitted", sorted}};
        if(!file::writeTextFileAtomic(_path, ledger.dump(2)))
        {
            spdlog::error("Failed to persist resubmission ledger {}", _path.string());
            return false;
        }
        return true;
    }

    ResubmissionGate::ResubmissionGate(const double threshold, IResubmitter * resubmitter, ResubmissionLedger * ledger)
        : _threshold(threshold),
          _resubmitter(resubmitter),
          _ledger(ledger)
    {
    }

    double ResubmissionGate::threshold() const noexcept
    {
        return _threshold;
    }

    GateDecision ResubmissionGate::decide(const evmc::bytes32 & content_hash, const double score, const bool already_registered) const
    {
        if(score < _threshold)
        {
            return GateDecision::BELOW_THRESHOLD;
        }
        if(_resubmitter == nullptr)
        {
            return GateDecision::NOT_CONFIGURED;
        }
        if(_ledger != nullptr && _ledger->contains(content_hash))
        {
            return GateDecision::ALREADY_RESUBMITTED;
        }
        if(already_registered)
        {
            return GateDecision::ALREADY_REGISTERED;
        }
        return GateDecision::SUBMIT;
    }

    Outcome<std::string> ResubmissionGate::resubmit(const std::string & locator, const evmc::bytes32 & content_hash, const double score)
    {
        if(_resubmitter == nullptr)
        {
            return std::unexpected(CollaboratorError{
                .kind = CollaboratorError::Kind::UNAVAILABLE,
                .message = "no resubmission collaborator configured"
            });
        }

        auto tx_hash = _resubmitter->submit(locator, score);
        if(tx_hash && _ledger != nullptr && !_ledger->add(content_hash))
        {
            spdlog::warn("Resubmission of {} is only remembered until restart", locator);
        }
        return tx_hash;
    }
}
