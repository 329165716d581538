//
// CRC-32 backed by zlib.
//

#include <pngchunk/crc.hh>

#include <zlib.h>

namespace pngchunk {

    crc32& crc32::update(const void* data, std::size_t size) {
        if (size == 0) {
            return *this;
        }
        m_value = static_cast<std::uint32_t>(
            ::crc32_z(m_value, static_cast<const Bytef*>(data), static_cast<z_size_t>(size)));
        return *this;
    }

} // namespace pngchunk
