// File: ZeroCoding.cpp
#include "../../include/core/ZeroCoding.hpp"

namespace SimLink::Protocol {

    void ZeroCoding::Encode(const uint8_t* in, std::size_t len, std::vector<uint8_t>& out) {
        out.reserve(out.size() + len);

        std::size_t i = 0;
        while (i < len) {
            if (in[i] != 0x00) {
                out.push_back(in[i++]);
                continue;
            }

            uint8_t run = 0;
            while (i < len && in[i] == 0x00 && run < 0xFF) {
                ++run;
                ++i;
            }
            out.push_back(0x00);
            out.push_back(run);
        }
    }

    bool ZeroCoding::Decode(const uint8_t* in, std::size_t len, std::vector<uint8_t>& out,
        std::size_t maxDecoded)
    {
        const std::size_t start = out.size();

        std::size_t i = 0;
        while (i < len) {
            if (in[i] != 0x00) {
                if (out.size() - start >= maxDecoded) return false;
                out.push_back(in[i++]);
                continue;
            }

            if (i + 1 >= len) return false;   // zero without a count
            const uint8_t run = in[i + 1];
            if (run == 0) return false;
            if (out.size() - start + run > maxDecoded) return false;

            out.insert(out.end(), run, 0x00);
            i += 2;
        }
        return true;
    }

} // namespace SimLink::Protocol
