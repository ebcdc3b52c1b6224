// File: ZeroCoding.hpp
#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace SimLink::Protocol {

    // Run-length coding of zero bytes: each run becomes 0x00 followed by a count (1..255).
    class ZeroCoding {
    public:
        static constexpr std::size_t DEFAULT_MAX_DECODED = 8192;

        // Appends the encoded form of [in, in+len) to `out`.
        static void Encode(const uint8_t* in, std::size_t len, std::vector<uint8_t>& out);

        // Appends the decoded form of [in, in+len) to `out`.
        // Fails on a dangling zero, a zero count, or output beyond `maxDecoded` bytes.
        static bool Decode(const uint8_t* in, std::size_t len, std::vector<uint8_t>& out,
            std::size_t maxDecoded = DEFAULT_MAX_DECODED);
    };

} // namespace SimLink::Protocol
