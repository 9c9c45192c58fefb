// uuidkit

#include "uuidkit/random.hh"

#include <random>

namespace uuidkit {
    namespace {
        class DefaultRandomSource final : public ukRandomSource
        {
        public:
            DefaultRandomSource();

            void fill(uint8_t* bytes, uint32_t length) override;

        private:
            std::mt19937 engine_;
            std::uniform_int_distribution<std::mt19937::result_type> dist8_{0, 255};
        };
    } // namespace

    ukRandomSource& ukDefaultRandomSource()
    {
        thread_local DefaultRandomSource random;
        return random;
    }

    DefaultRandomSource::DefaultRandomSource()
    {
        // a single 32-bit seed would limit the engine to 2^32 streams
        std::random_device device;
        uint32_t seeds[8] = {};
        for (uint32_t& seed : seeds)
            seed = device();

        std::seed_seq sequence(seeds, seeds + 8);
        engine_.seed(sequence);
    }

    void DefaultRandomSource::fill(uint8_t* bytes, uint32_t length)
    {
        for (uint32_t index = 0; index != length; ++index)
            bytes[index] = static_cast<uint8_t>(dist8_(engine_));
    }
} // namespace uuidkit
