// uuidkit

#pragma once

#include "uuidkit/export.hh"
#include "uuidkit/uuid.hh"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace uuidkit {
    // 8-4-4-4-12 format
    // 32 digits, 4 dashes
    static constexpr uint32_t ukUuidStringLength = 36;

    static constexpr char ukUuidUrnPrefix[] = "urn:uuid:";
    static constexpr uint32_t ukUuidUrnPrefixLength = sizeof(ukUuidUrnPrefix) - 1;
    static constexpr uint32_t ukUuidUrnLength = ukUuidUrnPrefixLength + ukUuidStringLength;

    enum class ukUuidFormat : uint8_t
    {
        Canonical,
        Urn,
    };

    struct ukStringUuid final
    {
        // large enough for the urn form plus a nul byte
        char string[ukUuidUrnLength + 1] = {};

        std::string_view view() const noexcept { return std::string_view(string); }
        char const* cStr() const noexcept { return string; }
    };

    constexpr uint32_t ukUuidFormatLength(ukUuidFormat format) noexcept
    {
        return format == ukUuidFormat::Urn ? ukUuidUrnLength : ukUuidStringLength;
    }

    // writes lowercase hex into buffer and returns a view over the written characters;
    // capacity below ukUuidFormatLength(format) is fatal. no nul byte is written.
    UK_API std::string_view ukFormatUuid(ukUuid const& uuid, char* buffer, uint32_t capacity,
        ukUuidFormat format = ukUuidFormat::Canonical) noexcept;

    template <size_t Capacity>
    std::string_view ukFormatUuid(ukUuid const& uuid, char (&buffer)[Capacity], ukUuidFormat format = ukUuidFormat::Canonical) noexcept
    {
        return ukFormatUuid(uuid, buffer, static_cast<uint32_t>(Capacity), format);
    }

    UK_API ukStringUuid ukUuidToString(ukUuid const& uuid, ukUuidFormat format = ukUuidFormat::Canonical) noexcept;

    [[nodiscard]] constexpr bool ukParseUuid(char const* string, char const* stringEnd, ukUuid& out) noexcept;
    [[nodiscard]] constexpr bool ukParseUuid(std::string_view string, ukUuid& out) noexcept;

    namespace detail {
        constexpr int ukHexDigitValue(char ch) noexcept
        {
            return (ch >= '0' && ch <= '9')   ? ch - '0'
                   : (ch >= 'a' && ch <= 'f') ? 10 + (ch - 'a')
                   : (ch >= 'A' && ch <= 'F') ? 10 + (ch - 'A')
                                              : -1;
        }

        constexpr char ukAsciiLower(char ch) noexcept { return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch; }
    } // namespace detail

    constexpr bool ukParseUuid(char const* string, char const* stringEnd, ukUuid& out) noexcept
    {
        if (string == nullptr)
            return false;

        if (stringEnd == nullptr)
            stringEnd = string + std::char_traits<char>::length(string);

        if (stringEnd - string == ukUuidUrnLength)
        {
            for (uint32_t index = 0; index != ukUuidUrnPrefixLength; ++index)
                if (detail::ukAsciiLower(string[index]) != ukUuidUrnPrefix[index])
                    return false;
            string += ukUuidUrnPrefixLength;
        }

        if (stringEnd - string != ukUuidStringLength)
            return false;

        // a group's length picks the field it fills: 8 is a 32-bit field, 4 is a
        // 16-bit field and 12 is the 48-bit node. groups must appear in the
        // canonical order, so a length-correct but reordered string is rejected.
        constexpr uint32_t groupLengths[] = {8, 4, 4, 4, 12};
        constexpr uint32_t groupCount = sizeof(groupLengths) / sizeof(groupLengths[0]);

        ukUuid result;
        uint32_t byteIndex = 0;
        uint32_t groupIndex = 0;
        char const* groupStart = string;
        for (;;)
        {
            char const* groupEnd = groupStart;
            while (groupEnd != stringEnd && *groupEnd != '-')
                ++groupEnd;

            uint32_t const groupLength = static_cast<uint32_t>(groupEnd - groupStart);
            if (groupIndex == groupCount || groupLength != groupLengths[groupIndex])
                return false;

            uint64_t value = 0;
            for (char const* ch = groupStart; ch != groupEnd; ++ch)
            {
                int const digit = detail::ukHexDigitValue(*ch);
                if (digit == -1)
                    return false;
                value = (value << 4) | static_cast<uint64_t>(digit);
            }

            // big-endian, two digits per byte
            for (uint32_t shift = groupLength * 4; shift != 0;)
            {
                shift -= 8;
                result.bytes[byteIndex++] = static_cast<uint8_t>(value >> shift);
            }

            ++groupIndex;
            if (groupEnd == stringEnd)
                break;
            groupStart = groupEnd + 1;
        }

        if (groupIndex != groupCount)
            return false;

        out = result;
        return true;
    }

    constexpr bool ukParseUuid(std::string_view string, ukUuid& out) noexcept
    {
        return ukParseUuid(string.data(), string.data() + string.size(), out);
    }
} // namespace uuidkit
