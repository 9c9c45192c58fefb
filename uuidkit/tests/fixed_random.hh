// uuidkit

#pragma once

#include "uuidkit/random.hh"

#include <catch2/catch_test_macros.hpp>

#include <cstring>

namespace uuidkit::test {
    // repeats a single byte value and counts how much was requested
    class FixedRandomSource final : public uuidkit::ukRandomSource
    {
    public:
        explicit FixedRandomSource(uint8_t value) noexcept : value_(value) {}

        inline void fill(uint8_t* bytes, uint32_t length) override;

        uint32_t requested() const noexcept { return requested_; }

    private:
        uint8_t value_ = 0;
        uint32_t requested_ = 0;
    };

    void FixedRandomSource::fill(uint8_t* bytes, uint32_t length)
    {
        REQUIRE(bytes != nullptr);
        std::memset(bytes, value_, length);
        requested_ += length;
    }
} // namespace uuidkit::test
