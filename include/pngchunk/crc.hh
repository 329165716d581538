/**
 * @file crc.hh
 * @brief CRC-32 (ISO-HDLC) as used by PNG chunks
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @class crc32
     * @brief Incremental CRC-32 (ISO-HDLC, polynomial 0x04C11DB7 reflected)
     *
     * A fresh instance holds the CRC of the empty sequence (0). Feeding data
     * in several update() calls yields the same value as one call over the
     * concatenation.
     */
    class PNGCHUNK_EXPORT crc32 {
    public:
        crc32() = default;

        crc32& update(const void* data, std::size_t size);

        [[nodiscard]] std::uint32_t value() const { return m_value; }

        // One-shot checksum of a single buffer
        static std::uint32_t compute(const void* data, std::size_t size) {
            return crc32().update(data, size).value();
        }

    private:
        std::uint32_t m_value = 0;
    };

} // namespace pngchunk
