/**
 * @file chunk.hh
 * @brief Length-prefixed, typed, CRC-protected chunk record
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include <pngchunk/chunk_type.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @class chunk
     * @brief A single chunk record
     *
     * On-wire layout, big-endian throughout:
     *
     * | field  | size   |
     * |--------|--------|
     * | length | 4      |
     * | type   | 4      |
     * | data   | length |
     * | crc    | 4      |
     *
     * The CRC covers type and data. A chunk in memory always carries the CRC
     * of its own type and data: the constructor computes it, parse() verifies
     * it.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        using data_type = std::vector<std::byte>;

        static constexpr std::size_t length_size = 4;
        static constexpr std::size_t crc_size = 4;
        /// Framing bytes around the data (length + type + crc)
        static constexpr std::size_t overhead = length_size + chunk_type::size + crc_size;
        static constexpr std::uint64_t max_length = 0xFFFFFFFFu;

        /**
         * @brief Build a chunk and compute its CRC
         * @throws data_length_error if data is longer than max_length
         */
        chunk(chunk_type type, data_type data);

        /**
         * @brief Parse one chunk from the start of a buffer
         *
         * Bytes after the chunk's CRC are ignored.
         *
         * @throws chunk_too_small_error if size < overhead
         * @throws chunk_type_error if the type bytes are not letters
         * @throws data_length_error if the buffer cannot hold the declared data and CRC
         * @throws crc_error if the stored CRC does not match
         */
        static chunk parse(const void* data, std::size_t size);
        static chunk parse(const data_type& bytes) {
            return parse(bytes.data(), bytes.size());
        }

        /// CRC-32 of type bytes followed by data
        static std::uint32_t compute_crc(const chunk_type& type, const void* data, std::size_t size);

        [[nodiscard]] std::uint32_t length() const { return static_cast<std::uint32_t>(m_data.size()); }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const data_type& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /// Total serialized size, same as to_bytes().size()
        [[nodiscard]] std::size_t size() const { return m_data.size() + overhead; }

        /// Data as text, nullopt if it is not valid UTF-8
        [[nodiscard]] std::optional<std::string> data_as_string() const;

        /// Serialized form
        [[nodiscard]] data_type to_bytes() const;

        /// Serialize into dest, which must hold size() bytes
        void to_bytes(void* dest) const;

        bool operator==(const chunk& o) const {
            return m_type == o.m_type && m_crc == o.m_crc && m_data == o.m_data;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(chunk_type type, data_type data, std::uint32_t crc);

        chunk_type m_type;
        data_type m_data;
        std::uint32_t m_crc;
    };

    // Prints the data as text when it is UTF-8, nothing otherwise
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngchunk
