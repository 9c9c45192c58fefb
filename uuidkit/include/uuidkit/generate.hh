// uuidkit

#pragma once

#include "uuidkit/export.hh"
#include "uuidkit/uuid.hh"

namespace uuidkit {
    class ukRandomSource;

    // version 4 (random) RFC 4122 identifiers
    UK_API [[nodiscard]] ukUuid ukCreateUuid();
    UK_API [[nodiscard]] ukUuid ukCreateUuid(ukRandomSource& random);
} // namespace uuidkit
