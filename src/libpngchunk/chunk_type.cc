//
// Chunk type construction and validation.
//

#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace pngchunk {

    namespace {
        std::string describe(const chunk_type::bytes_type& bytes) {
            std::ostringstream os;
            os << std::hex << std::setfill('0');
            for (std::size_t i = 0; i < bytes.size(); ++i) {
                if (i) {
                    os << ' ';
                }
                os << "0x" << std::setw(2) << static_cast<unsigned>(bytes[i]);
            }
            return os.str();
        }

        chunk_type::bytes_type to_array(std::string_view text) {
            THROW_AS_IF(chunk_type_error, text.size() != chunk_type::size,
                        "Chunk type must be exactly 4 bytes, got ", text.size());
            chunk_type::bytes_type bytes;
            std::memcpy(bytes.data(), text.data(), chunk_type::size);
            return bytes;
        }
    }

    chunk_type::chunk_type(const bytes_type& bytes)
        : m_bytes(bytes) {
        THROW_AS_IF(chunk_type_error,
                    !std::all_of(m_bytes.begin(), m_bytes.end(), is_valid_byte),
                    "Invalid chunk type [", describe(m_bytes), "]: every byte must be an ASCII letter");
    }

    chunk_type::chunk_type(std::string_view text)
        : chunk_type(to_array(text)) {
    }

    std::optional<chunk_type> chunk_type::try_parse(std::string_view text) {
        if (text.size() != size) {
            return std::nullopt;
        }
        if (!std::all_of(text.begin(), text.end(), [](char c) {
                return is_valid_byte(static_cast<std::uint8_t>(c));
            })) {
            return std::nullopt;
        }
        return chunk_type(text);
    }

} // namespace pngchunk
