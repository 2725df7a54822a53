//
// Created by igor on 16/08/2025.
//

#include <cstdint>

#include "utf8.hh"

namespace pngme {
    namespace {
        bool is_continuation(std::uint8_t c) {
            return (c & 0xC0) == 0x80;
        }
    }

    bool is_valid_utf8(const std::byte* data, std::size_t size, std::size_t& error_offset) noexcept {
        std::size_t i = 0;
        while (i < size) {
            auto lead = static_cast<std::uint8_t>(data[i]);
            if (lead < 0x80) {
                i++;
                continue;
            }

            std::size_t extra;
            std::uint32_t cp;
            std::uint32_t min_cp;
            if ((lead & 0xE0) == 0xC0) {
                extra = 1;
                cp = lead & 0x1F;
                min_cp = 0x80;
            } else if ((lead & 0xF0) == 0xE0) {
                extra = 2;
                cp = lead & 0x0F;
                min_cp = 0x800;
            } else if ((lead & 0xF8) == 0xF0) {
                extra = 3;
                cp = lead & 0x07;
                min_cp = 0x10000;
            } else {
                error_offset = i;
                return false;
            }

            if (size - i <= extra) {
                error_offset = i;
                return false;
            }

            for (std::size_t k = 1; k <= extra; k++) {
                auto c = static_cast<std::uint8_t>(data[i + k]);
                if (!is_continuation(c)) {
                    error_offset = i;
                    return false;
                }
                cp = (cp << 6) | (c & 0x3F);
            }

            // overlong, surrogate or out of range
            if (cp < min_cp || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
                error_offset = i;
                return false;
            }
            i += extra + 1;
        }
        return true;
    }
}
