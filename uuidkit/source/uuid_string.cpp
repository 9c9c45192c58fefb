// uuidkit

#include "uuidkit/uuid_string.hh"

#include "assert.hh"
#include "writer.hh"

namespace uuidkit {
    static bool writeCanonical(ukTextWriter& writer, ukUuid const& uuid) noexcept
    {
        // 8-4-4-4-12
        return writer.writeHex(uuid.timeLow(), 8) && writer.write('-') && writer.writeHex(uuid.timeMid(), 4) && writer.write('-') &&
               writer.writeHex(uuid.timeHiAndVersion(), 4) && writer.write('-') && writer.writeHex(uuid.clockSeqHiAndReserved(), 2) &&
               writer.writeHex(uuid.clockSeqLow(), 2) && writer.write('-') && writer.writeHex(uuid.node(), 12);
    }

    std::string_view ukFormatUuid(ukUuid const& uuid, char* buffer, uint32_t capacity, ukUuidFormat format) noexcept
    {
        UK_REQUIRE(buffer != nullptr, "null uuid format buffer");
        UK_REQUIRE(capacity >= ukUuidFormatLength(format), "buffer too small for uuid");

        ukTextWriter writer(buffer, capacity);

        if (format == ukUuidFormat::Urn)
        {
            if (!writer.write(ukUuidUrnPrefix, ukUuidUrnPrefixLength))
                UK_FATAL("buffer too small for uuid");
        }

        if (!writeCanonical(writer, uuid))
            UK_FATAL("buffer too small for uuid");

        return writer.view();
    }

    ukStringUuid ukUuidToString(ukUuid const& uuid, ukUuidFormat format) noexcept
    {
        ukStringUuid result;

        // leave the final byte as the nul terminator
        ukFormatUuid(uuid, result.string, ukUuidUrnLength, format);

        return result;
    }
} // namespace uuidkit
