// uuidkit

#pragma once

#include "assert.hh"

#include <cstdint>
#include <cstring>
#include <string_view>

namespace uuidkit {
    constexpr char ukHexDigitLower(uint32_t value) noexcept { return static_cast<char>(value < 10 ? '0' + value : 'a' + (value - 10)); }

    // bounded cursor over caller memory; a write that does not fit
    // writes nothing and reports failure
    class ukTextWriter
    {
    public:
        ukTextWriter(char* buffer, uint32_t capacity) noexcept : first_(buffer), cursor_(buffer), last_(buffer + capacity) {}

        uint32_t size() const noexcept { return static_cast<uint32_t>(cursor_ - first_); }
        uint32_t remaining() const noexcept { return static_cast<uint32_t>(last_ - cursor_); }

        std::string_view view() const noexcept { return std::string_view(first_, size()); }

        [[nodiscard]] inline bool write(char ch) noexcept;
        [[nodiscard]] inline bool write(char const* string, uint32_t length) noexcept;

        // fixed width, zero padded, lowercase
        [[nodiscard]] inline bool writeHex(uint64_t value, uint32_t digits) noexcept;

    private:
        char* first_ = nullptr;
        char* cursor_ = nullptr;
        char* last_ = nullptr;
    };

    bool ukTextWriter::write(char ch) noexcept
    {
        UK_GUARD_OR(remaining() >= 1, false);

        *cursor_++ = ch;
        return true;
    }

    bool ukTextWriter::write(char const* string, uint32_t length) noexcept
    {
        UK_GUARD_OR(remaining() >= length, false);

        std::memcpy(cursor_, string, length);
        cursor_ += length;
        return true;
    }

    bool ukTextWriter::writeHex(uint64_t value, uint32_t digits) noexcept
    {
        UK_ASSERT(digits <= 16, "uint64_t holds at most 16 hex digits");
        UK_GUARD_OR(remaining() >= digits, false);

        for (uint32_t index = digits; index != 0; --index)
        {
            cursor_[index - 1] = ukHexDigitLower(static_cast<uint32_t>(value & 0xf));
            value >>= 4;
        }
        cursor_ += digits;
        return true;
    }
} // namespace uuidkit
