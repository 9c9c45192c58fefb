// uuidkit

#pragma once

#include "uuidkit/export.hh"

#include <cstdint>

namespace uuidkit {
    class ukRandomSource
    {
    public:
        // fills length bytes with independent, uniformly distributed values
        virtual void fill(uint8_t* bytes, uint32_t length) = 0;

    protected:
        ~ukRandomSource() = default;
    };

    // per-thread source seeded from the system entropy device
    UK_API ukRandomSource& ukDefaultRandomSource();
} // namespace uuidkit
