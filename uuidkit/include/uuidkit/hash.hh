// uuidkit

#pragma once

#include "uuidkit/uuid.hh"

#include <cstddef>
#include <cstdint>
#include <functional>

namespace uuidkit {
    // 64-bit FNV-1a over the big-endian bytes
    [[nodiscard]] constexpr uint64_t ukHashUuid(ukUuid const& uuid) noexcept
    {
        uint64_t hash = 0xcbf2'9ce4'8422'2325ull;
        for (uint8_t const byte : uuid.bytes)
            hash = (hash ^ byte) * 0x0000'0100'0000'01b3ull;
        return hash;
    }
} // namespace uuidkit

template <>
struct std::hash<uuidkit::ukUuid>
{
    constexpr size_t operator()(uuidkit::ukUuid const& uuid) const noexcept { return static_cast<size_t>(uuidkit::ukHashUuid(uuid)); }
};
