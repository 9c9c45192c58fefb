// uuidkit

#include <catch2/catch_test_macros.hpp>

#include "uuidkit/uuid.hh"
#include "uuidkit/uuid_string.hh"

#include <csignal>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace uuidkit;

namespace {
    // runs fn in a child process and reports whether the child died from abort()
    template <typename FunctionT>
    bool abortsInChild(FunctionT fn)
    {
        pid_t const pid = fork();
        REQUIRE(pid != -1);

        if (pid == 0)
        {
            fn();
            _exit(0);
        }

        int status = 0;
        REQUIRE(waitpid(pid, &status, 0) == pid);
        return WIFSIGNALED(status) && WTERMSIG(status) == SIGABRT;
    }
} // namespace

TEST_CASE("UUID Fatal Preconditions", "[uuid][fatal]")
{
    ukUuid uuid;
    uuid.bytes[0] = 0x66;

    SECTION("Urn buffer one byte short")
    {
        CHECK(abortsInChild([&uuid] {
            char buffer[ukUuidUrnLength - 1];
            ukFormatUuid(uuid, buffer, ukUuidFormat::Urn);
        }));
    }

    SECTION("Canonical buffer one byte short")
    {
        CHECK(abortsInChild([&uuid] {
            char buffer[ukUuidStringLength - 1];
            ukFormatUuid(uuid, buffer);
        }));
    }

    SECTION("Null buffer")
    {
        CHECK(abortsInChild([&uuid] { ukFormatUuid(uuid, nullptr, ukUuidUrnLength, ukUuidFormat::Urn); }));
    }

    SECTION("Exact buffer does not abort")
    {
        CHECK_FALSE(abortsInChild([&uuid] {
            char buffer[ukUuidUrnLength];
            ukFormatUuid(uuid, buffer, ukUuidFormat::Urn);
        }));
    }

    SECTION("Unrecognized version")
    {
        for (uint8_t bits = 6; bits != 16; ++bits)
        {
            uuid.bytes[6] = static_cast<uint8_t>(bits << 4);
            CHECK(abortsInChild([&uuid] { (void)uuid.version(); }));
        }
    }

    SECTION("Named version does not abort")
    {
        uuid.bytes[6] = 0x4f;
        CHECK_FALSE(abortsInChild([&uuid] { (void)uuid.version(); }));
    }
}
