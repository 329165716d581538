//
// UTF-8 validation (internal).
//

#pragma once

#include <cstddef>
#include <cstdint>

namespace pngchunk {

    // Strict validation: rejects overlong forms, surrogates and code points above U+10FFFF
    inline bool is_valid_utf8(const std::byte* data, std::size_t size) noexcept {
        std::size_t i = 0;
        while (i < size) {
            const auto c0 = static_cast<std::uint8_t>(data[i]);
            if ((c0 & 0x80u) == 0) {
                i += 1;
                continue;
            }

            std::size_t needed;
            std::uint32_t min_cp;
            std::uint32_t cp;
            if ((c0 & 0xE0u) == 0xC0u) {
                needed = 1;
                min_cp = 0x80u;
                cp = c0 & 0x1Fu;
            } else if ((c0 & 0xF0u) == 0xE0u) {
                needed = 2;
                min_cp = 0x800u;
                cp = c0 & 0x0Fu;
            } else if ((c0 & 0xF8u) == 0xF0u) {
                needed = 3;
                min_cp = 0x10000u;
                cp = c0 & 0x07u;
            } else {
                return false;
            }

            if (i + needed >= size) {
                return false;
            }
            for (std::size_t j = 1; j <= needed; ++j) {
                const auto cx = static_cast<std::uint8_t>(data[i + j]);
                if ((cx & 0xC0u) != 0x80u) {
                    return false;
                }
                cp = (cp << 6) | (cx & 0x3Fu);
            }

            if (cp < min_cp || cp > 0x10FFFFu) {
                return false;
            }
            if (cp >= 0xD800u && cp <= 0xDFFFu) {
                return false;
            }
            i += 1 + needed;
        }
        return true;
    }

} // namespace pngchunk
