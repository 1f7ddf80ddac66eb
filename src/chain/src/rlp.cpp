#include "rlp.hpp"

#include <algorithm>

namespace tad::chain::rlp
{
    namespace
    {
        Bytes _withLengthPrefix(const std::uint8_t short_base, const std::uint8_t long_base, const std::uint8_t* payload, const std::size_t size)
        {
            Bytes out;
            if(size <= 55)
            {
                out.reserve(1 + size);
                out.push_back(static_cast<std::uint8_t>(short_base + size));
            }
            else
            {
                const Bytes len_be = minimalBigEndian(static_cast<std::uint64_t>(size));
                out.reserve(1 + len_be.size() + size);
                out.push_back(static_cast<std::uint8_t>(long_base + len_be.size()));
                out.insert(out.end(), len_be.begin(), len_be.end());
            }

            out.insert(out.end(), payload, payload + size);
            return out;
        }
    }

    Bytes minimalBigEndian(std::uint64_t value)
    {
        Bytes out;
        while(value > 0)
        {
            out.push_back(static_cast<std::uint8_t>(value & 0xFFu));
            value >>= 8;
        }

        std::ranges::reverse(out);
        return out;
    }

    Bytes encodeBytes(const std::uint8_t* bytes, const std::size_t size)
    {
        if(size == 1 && bytes[0] < 0x80)
        {
            return Bytes{bytes[0]};
        }
        return _withLengthPrefix(0x80, 0xB7, bytes, size);
    }

    Bytes encodeBytes(const Bytes & bytes)
    {
        return encodeBytes(bytes.data(), bytes.size());
    }

    Bytes encodeUint64(const std::uint64_t value)
    {
        return encodeBytes(minimalBigEndian(value));
    }

    Bytes encodeBigInteger(const std::uint8_t* bytes, const std::size_t size)
    {
        std::size_t first = 0;
        while(first < size && bytes[first] == 0)
        {
            ++first;
        }
        return encodeBytes(bytes + first, size - first);
    }

    Bytes encodeList(const std::vector<Bytes> & encoded_items)
    {
        Bytes payload;
        for(const Bytes & item : encoded_items)
        {
            payload.insert(payload.end(), item.begin(), item.end());
        }
        return _withLengthPrefix(0xC0, 0xF7, payload.data(), payload.size());
    }
}
