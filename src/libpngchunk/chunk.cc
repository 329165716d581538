//
// Chunk construction, parsing and serialization.
//

#include <pngchunk/chunk.hh>
#include <pngchunk/crc.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>

#include <cstring>
#include <ostream>
#include <utility>

#include "utf8.hh"

namespace pngchunk {

    chunk::chunk(chunk_type type, data_type data)
        : m_type(std::move(type))
        , m_data(std::move(data))
        , m_crc(0) {
        THROW_AS_IF(data_length_error, m_data.size() > max_length,
                    "Chunk '", m_type, "' data of ", m_data.size(),
                    " bytes exceeds the maximum length of ", max_length);
        m_crc = compute_crc(m_type, m_data.data(), m_data.size());
    }

    chunk::chunk(chunk_type type, data_type data, std::uint32_t crc)
        : m_type(std::move(type))
        , m_data(std::move(data))
        , m_crc(crc) {
    }

    std::uint32_t chunk::compute_crc(const chunk_type& type, const void* data, std::size_t size) {
        const auto type_bytes = type.bytes();
        return crc32()
            .update(type_bytes.data(), type_bytes.size())
            .update(data, size)
            .value();
    }

    chunk chunk::parse(const void* data, std::size_t size) {
        THROW_AS_IF(chunk_too_small_error, size < overhead,
                    "Chunk is too small: ", size, " bytes, need at least ", overhead);

        const auto* p = static_cast<const std::byte*>(data);

        const std::uint32_t length = load_be32(p);
        p += length_size;

        chunk_type type = chunk_type::from_bytes(p);
        p += chunk_type::size;

        // Room for the data plus the trailing CRC
        const std::uint64_t available = size - length_size - chunk_type::size;
        const std::uint64_t required = std::uint64_t(length) + crc_size;
        THROW_AS_IF(data_length_error, available < required,
                    "Invalid data length for chunk '", type, "': declared ", length,
                    " bytes, only ", available, " bytes remain for data and CRC");

        const std::uint32_t stored_crc = load_be32(p + length);
        const std::uint32_t actual_crc = compute_crc(type, p, length);
        THROW_AS_IF(crc_error, stored_crc != actual_crc,
                    "CRC check failed for chunk '", type, "': stored 0x", std::hex, stored_crc,
                    ", computed 0x", actual_crc);

        return chunk(std::move(type), data_type(p, p + length), stored_crc);
    }

    std::optional<std::string> chunk::data_as_string() const {
        if (!is_valid_utf8(m_data.data(), m_data.size())) {
            return std::nullopt;
        }
        return std::string(reinterpret_cast<const char*>(m_data.data()), m_data.size());
    }

    chunk::data_type chunk::to_bytes() const {
        data_type out(size());
        to_bytes(out.data());
        return out;
    }

    void chunk::to_bytes(void* dest) const {
        auto* p = static_cast<std::byte*>(dest);
        store_be32(p, length());
        p += length_size;
        m_type.to_bytes(p);
        p += chunk_type::size;
        if (!m_data.empty()) {
            std::memcpy(p, m_data.data(), m_data.size());
        }
        p += m_data.size();
        store_be32(p, m_crc);
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        if (auto text = c.data_as_string()) {
            os << *text;
        }
        return os;
    }

} // namespace pngchunk
