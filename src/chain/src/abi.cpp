#include "abi.hpp"

#include <algorithm>
#include <cstring>
#include <ranges>
#include <utility>

#include "crypto.hpp"

namespace tad::chain::abi
{
    namespace
    {
        evmc::bytes32 _uintWord(std::uint64_t value)
        {
            evmc::bytes32 word{};
            for(int i = 0; i < 8; ++i)
            {
                word.bytes[31 - i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFu);
            }
            return word;
        }

        void _append(Bytes & out, const evmc::bytes32 & word)
        {
            out.insert(out.end(), word.bytes, word.bytes + 32);
        }

        void _appendPadded(Bytes & out, const Bytes & data)
        {
            _append(out, _uintWord(data.size()));
            out.insert(out.end(), data.begin(), data.end());
            const std::size_t pad = (32 - (data.size() % 32)) % 32;
            out.insert(out.end(), pad, 0);
        }

        Bytes _encodeValue(const Value & value);

        Bytes _encodeSequence(const std::vector<Value> & items)
        {
            std::vector<Bytes> encoded;
            encoded.reserve(items.size());

            std::size_t head_size = 0;
            for(const Value & item : items)
            {
                encoded.push_back(_encodeValue(item));
                head_size += isDynamic(item) ? 32 : encoded.back().size();
            }

            Bytes head;
            Bytes tail;
            head.reserve(head_size);

            for(std::size_t i = 0; i < items.size(); ++i)
            {
                if(isDynamic(items[i]))
                {
                    _append(head, _uintWord(head_size + tail.size()));
                    tail.insert(tail.end(), encoded[i].begin(), encoded[i].end());
                }
                else
                {
                    head.insert(head.end(), encoded[i].begin(), encoded[i].end());
                }
            }

            head.insert(head.end(), tail.begin(), tail.end());
            return head;
        }

        Bytes _encodeValue(const Value & value)
        {
            Bytes out;
            switch(value.type)
            {
                case Value::Type::UINT:
                case Value::Type::ADDRESS:
                case Value::Type::BOOL:
                case Value::Type::FIXED_BYTES:
                    _append(out, value.word);
                    break;

                case Value::Type::STRING:
                case Value::Type::BYTES:
                    _appendPadded(out, value.data);
                    break;

                case Value::Type::TUPLE:
                    out = _encodeSequence(value.items);
                    break;

                case Value::Type::ARRAY:
                {
                    _append(out, _uintWord(value.items.size()));
                    const Bytes elements = _encodeSequence(value.items);
                    out.insert(out.end(), elements.begin(), elements.end());
                    break;
                }
            }
            return out;
        }
    }

    Value uint256(std::uint64_t value)
    {
        return Value{.type = Value::Type::UINT, .word = _uintWord(value)};
    }

    Value address(const Address & value)
    {
        Value out{.type = Value::Type::ADDRESS};
        std::memcpy(out.word.bytes + 12, value.bytes, 20);
        return out;
    }

    Value boolean(bool value)
    {
        return Value{.type = Value::Type::BOOL, .word = _uintWord(value ? 1 : 0)};
    }

    Value fixedBytes(const std::uint8_t* data, std::size_t size)
    {
        Value out{.type = Value::Type::FIXED_BYTES};
        if(data != nullptr)
        {
            std::memcpy(out.word.bytes, data, std::min<std::size_t>(size, 32));
        }
        return out;
    }

    Value bytes32(const evmc::bytes32 & value)
    {
        return Value{.type = Value::Type::FIXED_BYTES, .word = value};
    }

    Value string(std::string value)
    {
        return Value{.type = Value::Type::STRING, .data = Bytes(value.begin(), value.end())};
    }

    Value bytes(Bytes value)
    {
        return Value{.type = Value::Type::BYTES, .data = std::move(value)};
    }

    Value tuple(std::vector<Value> items)
    {
        return Value{.type = Value::Type::TUPLE, .items = std::move(items)};
    }

    Value array(std::vector<Value> items)
    {
        return Value{.type = Value::Type::ARRAY, .items = std::move(items)};
    }

    bool isDynamic(const Value & value)
    {
        switch(value.type)
        {
            case Value::Type::STRING:
            case Value::Type::BYTES:
            case Value::Type::ARRAY:
                return true;
            case Value::Type::TUPLE:
                return std::ranges::any_of(value.items, [](const Value & item) { return isDynamic(item); });
            default:
                return false;
        }
    }

    Bytes encode(const std::vector<Value> & values)
    {
        return _encodeSequence(values);
    }

    Bytes encodeCall(const std::string & signature, const std::vector<Value> & values)
    {
        Bytes out = crypto::constructSelector(signature);
        const Bytes args = encode(values);
        out.insert(out.end(), args.begin(), args.end());
        return out;
    }
}
