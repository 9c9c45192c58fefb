// uuidkit

#include "uuidkit/generate.hh"
#include "uuidkit/random.hh"
#include "uuidkit/uuid.hh"

#include "assert.hh"

namespace uuidkit {
    ukVersion ukUuid::version() const noexcept
    {
        switch (versionBits())
        {
        case 0: return ukVersion::Nil;
        case 1: return ukVersion::Time;
        case 2: return ukVersion::Dce;
        case 3: return ukVersion::Md5;
        case 4: return ukVersion::Random;
        case 5: return ukVersion::Sha1;
        default: break;
        }

        UK_FATAL("unrecognized uuid version");
        return ukVersion::Nil;
    }

    ukUuid ukCreateUuid()
    {
        return ukCreateUuid(ukDefaultRandomSource());
    }

    ukUuid ukCreateUuid(ukRandomSource& random)
    {
        ukUuid uuid;
        random.fill(uuid.bytes, ukUuid::length);

        // variant 10xxxxxx
        uuid.bytes[8] = static_cast<uint8_t>((uuid.bytes[8] & 0x3f) | 0x80);

        // version 0100xxxx
        uuid.bytes[6] = static_cast<uint8_t>((uuid.bytes[6] & 0x0f) | 0x40);

        return uuid;
    }
} // namespace uuidkit
