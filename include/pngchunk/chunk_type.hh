/**
 * @file chunk_type.hh
 * @brief Four letter chunk type code with PNG-style property bits
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @class chunk_type
     * @brief Validated 4-byte chunk type code
     *
     * Every byte is an ASCII letter. The case of each byte carries one
     * property: an uppercase letter (value <= 'Z') sets the bit.
     *
     * | byte | uppercase means          |
     * |------|--------------------------|
     * | 0    | critical                 |
     * | 1    | public                   |
     * | 2    | reserved bit valid       |
     * | 3    | unsafe to copy           |
     *
     * Once constructed a chunk_type never changes.
     */
    class PNGCHUNK_EXPORT chunk_type {
    public:
        static constexpr std::size_t size = 4;
        using bytes_type = std::array<std::uint8_t, size>;

        /**
         * @brief Construct from raw bytes
         * @throws chunk_type_error if any byte is not an ASCII letter
         */
        explicit chunk_type(const bytes_type& bytes);

        /**
         * @brief Construct from text
         * @throws chunk_type_error if text is not exactly 4 bytes or
         *         contains a byte that is not an ASCII letter
         */
        explicit chunk_type(std::string_view text);

        /**
         * @brief Construct from 4 bytes at the given address
         * @throws chunk_type_error if any byte is not an ASCII letter
         */
        static chunk_type from_bytes(const void* data) {
            bytes_type bytes;
            std::memcpy(bytes.data(), data, size);
            return chunk_type(bytes);
        }

        /**
         * @brief Non-throwing construction from text
         * @return chunk_type if text is a valid type code, nullopt otherwise
         */
        static std::optional<chunk_type> try_parse(std::string_view text);

        // True for 'A'-'Z' and 'a'-'z'
        static constexpr bool is_valid_byte(std::uint8_t b) {
            return (b >= 'A' && b <= 'Z') || (b >= 'a' && b <= 'z');
        }

        [[nodiscard]] bytes_type bytes() const { return m_bytes; }

        [[nodiscard]] bool is_critical() const { return is_upper(0); }
        [[nodiscard]] bool is_public() const { return is_upper(1); }
        [[nodiscard]] bool is_reserved_bit_valid() const { return is_upper(2); }
        [[nodiscard]] bool is_safe_to_copy() const { return !is_upper(3); }

        // The reserved bit is the only validity rule beyond the letter check
        [[nodiscard]] bool is_valid() const { return is_reserved_bit_valid(); }

        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(m_bytes.data()), size};
        }

        // Write the 4 bytes to dest
        void to_bytes(void* dest) const {
            std::memcpy(dest, m_bytes.data(), size);
        }

        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }

        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            return os.write(reinterpret_cast<const char*>(t.m_bytes.data()), size);
        }

    private:
        [[nodiscard]] bool is_upper(std::size_t pos) const {
            return m_bytes[pos] <= 'Z';
        }

        bytes_type m_bytes;
    };

    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            t.to_bytes(&v);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

} // namespace pngchunk

namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
