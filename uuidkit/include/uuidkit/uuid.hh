// uuidkit

#pragma once

#include "uuidkit/export.hh"

#include <array>
#include <compare>
#include <cstdint>

namespace uuidkit {
    static constexpr uint32_t ukUuidLength = 16;

    using ukUuidBytes = std::array<uint8_t, ukUuidLength>;

    enum class ukVariant : uint8_t
    {
        // reserved for NCS backward compatibility
        Ncs,
        Rfc4122,
        // reserved for legacy Microsoft GUIDs
        Microsoft,
        // reserved for future definition
        Reserved,
    };

    enum class ukVersion : uint8_t
    {
        Nil,
        Time,
        Dce,
        Md5,
        Random,
        Sha1,
    };

    // RFC 4122 identifier; fields are always stored big-endian
    //
    //  0-3   time_low
    //  4-5   time_mid
    //  6-7   time_hi_and_version     (top nibble of byte 6 is the version)
    //  8     clock_seq_hi_and_reserved (top bits are the variant)
    //  9     clock_seq_low
    //  10-15 node
    //
    struct ukUuid final
    {
        constexpr ukUuid() = default;

        static constexpr uint32_t length = ukUuidLength;

        uint8_t bytes[length] = {};

        static constexpr ukUuid nil() noexcept { return ukUuid{}; }
        static constexpr ukUuid fromBytes(ukUuidBytes const& raw) noexcept;
        static constexpr ukUuid fromMixedEndianBytes(ukUuidBytes const& raw) noexcept;

        constexpr ukUuidBytes toBytes() const noexcept;
        constexpr ukUuidBytes toMixedEndianBytes() const noexcept;

        constexpr bool isNil() const noexcept;
        constexpr explicit operator bool() const noexcept { return !isNil(); }

        constexpr ukVariant variant() const noexcept;

        constexpr uint8_t versionBits() const noexcept { return bytes[6] >> 4; }
        constexpr bool hasKnownVersion() const noexcept { return versionBits() <= 5; }

        // fatal if the version nibble is not one of the named versions;
        // check hasKnownVersion() first when inspecting foreign identifiers
        UK_API [[nodiscard]] ukVersion version() const noexcept;

        constexpr uint32_t timeLow() const noexcept;
        constexpr uint16_t timeMid() const noexcept;
        constexpr uint16_t timeHiAndVersion() const noexcept;
        constexpr uint8_t clockSeqHiAndReserved() const noexcept { return bytes[8]; }
        constexpr uint8_t clockSeqLow() const noexcept { return bytes[9]; }
        constexpr uint64_t node() const noexcept;

        constexpr bool operator==(const ukUuid&) const = default;
        constexpr std::strong_ordering operator<=>(const ukUuid&) const = default;
    };

    namespace detail {
        constexpr void ukReverseBytes(uint8_t* first, uint8_t* last) noexcept
        {
            while (first < --last)
            {
                uint8_t const tmp = *first;
                *first++ = *last;
                *last = tmp;
            }
        }

        // first three fields swap between big-endian and little-endian,
        // clock_seq and node are byte strings and keep their order
        constexpr void ukSwapMixedEndian(uint8_t* bytes) noexcept
        {
            ukReverseBytes(bytes + 0, bytes + 4);
            ukReverseBytes(bytes + 4, bytes + 6);
            ukReverseBytes(bytes + 6, bytes + 8);
        }
    } // namespace detail

    constexpr ukUuid ukUuid::fromBytes(ukUuidBytes const& raw) noexcept
    {
        ukUuid result;
        for (uint32_t index = 0; index != length; ++index)
            result.bytes[index] = raw[index];
        return result;
    }

    constexpr ukUuid ukUuid::fromMixedEndianBytes(ukUuidBytes const& raw) noexcept
    {
        ukUuid result = fromBytes(raw);
        detail::ukSwapMixedEndian(result.bytes);
        return result;
    }

    constexpr ukUuidBytes ukUuid::toBytes() const noexcept
    {
        ukUuidBytes result{};
        for (uint32_t index = 0; index != length; ++index)
            result[index] = bytes[index];
        return result;
    }

    constexpr ukUuidBytes ukUuid::toMixedEndianBytes() const noexcept
    {
        ukUuidBytes result = toBytes();
        detail::ukSwapMixedEndian(result.data());
        return result;
    }

    constexpr bool ukUuid::isNil() const noexcept
    {
        for (uint32_t index = 0; index != length; ++index)
            if (bytes[index] != 0)
                return false;
        return true;
    }

    constexpr ukVariant ukUuid::variant() const noexcept
    {
        uint8_t const bits = bytes[8];
        if ((bits & 0x80) == 0)
            return ukVariant::Ncs;
        if ((bits & 0x40) == 0)
            return ukVariant::Rfc4122;
        if ((bits & 0x20) == 0)
            return ukVariant::Microsoft;
        return ukVariant::Reserved;
    }

    constexpr uint32_t ukUuid::timeLow() const noexcept
    {
        return (uint32_t{bytes[0]} << 24) | (uint32_t{bytes[1]} << 16) | (uint32_t{bytes[2]} << 8) | uint32_t{bytes[3]};
    }

    constexpr uint16_t ukUuid::timeMid() const noexcept { return static_cast<uint16_t>((bytes[4] << 8) | bytes[5]); }

    constexpr uint16_t ukUuid::timeHiAndVersion() const noexcept { return static_cast<uint16_t>((bytes[6] << 8) | bytes[7]); }

    constexpr uint64_t ukUuid::node() const noexcept
    {
        uint64_t result = 0;
        for (uint32_t index = 10; index != length; ++index)
            result = (result << 8) | bytes[index];
        return result;
    }
} // namespace uuidkit
