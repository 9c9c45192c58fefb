// uuidkit

#include <catch2/catch_test_macros.hpp>

#include "uuidkit/generate.hh"
#include "uuidkit/random.hh"

#include "fixed_random.hh"

using namespace uuidkit;

TEST_CASE("UUID Generation", "[uuid][generate]")
{
    SECTION("All bits clear")
    {
        test::FixedRandomSource random(0x00);
        ukUuid const uuid = ukCreateUuid(random);

        CHECK(random.requested() == ukUuid::length);
        CHECK(uuid.version() == ukVersion::Random);
        CHECK(uuid.variant() == ukVariant::Rfc4122);
        CHECK(uuid.bytes[6] == 0x40);
        CHECK(uuid.bytes[8] == 0x80);
        CHECK(uuid.timeLow() == 0u);
        CHECK(uuid.node() == 0u);
    }

    SECTION("All bits set")
    {
        test::FixedRandomSource random(0xff);
        ukUuid const uuid = ukCreateUuid(random);

        CHECK(uuid.version() == ukVersion::Random);
        CHECK(uuid.variant() == ukVariant::Rfc4122);
        CHECK(uuid.bytes[6] == 0x4f);
        CHECK(uuid.bytes[8] == 0xbf);
        CHECK(uuid.timeLow() == 0xffffffffu);
        CHECK(uuid.clockSeqLow() == 0xffu);
        CHECK(uuid.node() == 0xffffffffffffull);
    }

    SECTION("Every byte pattern")
    {
        for (uint32_t value = 0; value != 256; ++value)
        {
            test::FixedRandomSource random(static_cast<uint8_t>(value));
            ukUuid const uuid = ukCreateUuid(random);

            CHECK(uuid.version() == ukVersion::Random);
            CHECK(uuid.variant() == ukVariant::Rfc4122);
            // untagged bits pass through
            CHECK(static_cast<uint32_t>(uuid.bytes[6] & 0x0f) == (value & 0x0fu));
            CHECK(static_cast<uint32_t>(uuid.bytes[8] & 0x3f) == (value & 0x3fu));
        }
    }

    SECTION("Default source")
    {
        ukUuid const first = ukCreateUuid();
        ukUuid const second = ukCreateUuid();

        CHECK(first.version() == ukVersion::Random);
        CHECK(first.variant() == ukVariant::Rfc4122);
        CHECK(second.version() == ukVersion::Random);
        CHECK(second.variant() == ukVariant::Rfc4122);
        CHECK_FALSE(first.isNil());
        CHECK(first != second);
    }

    SECTION("Explicit default source")
    {
        ukRandomSource& random = ukDefaultRandomSource();
        CHECK(&random == &ukDefaultRandomSource());

        ukUuid const uuid = ukCreateUuid(random);

        CHECK(uuid.version() == ukVersion::Random);
        CHECK(uuid.variant() == ukVariant::Rfc4122);
    }
}
