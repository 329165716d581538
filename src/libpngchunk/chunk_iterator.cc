//
// Forward iteration over a stream of consecutive chunks.
//

#include <pngchunk/chunk_iterator.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <utility>

#include "input.hh"

namespace pngchunk {

    namespace {
        constexpr std::size_t header_size = chunk::length_size + chunk_type::size;

        // Declared lengths are not trusted for allocation, the buffer grows as data arrives
        constexpr std::size_t read_block_size = 64 * 1024;

        // Appends up to size bytes to buffer, returns how many arrived
        std::size_t read_into(reader& in, std::vector<std::byte>& buffer, std::size_t size) {
            std::size_t total = 0;
            while (total < size) {
                std::size_t step = std::min(size - total, read_block_size);
                std::size_t old_size = buffer.size();
                buffer.resize(old_size + step);
                std::size_t actual = in.read(buffer.data() + old_size, step);
                buffer.resize(old_size + actual);
                total += actual;
                if (actual != step) {
                    break;
                }
            }
            return total;
        }
    }

    chunk_iterator::chunk_iterator(std::istream& stream)
        : chunk_iterator(stream, parse_options{}) {
    }

    chunk_iterator::chunk_iterator(std::istream& stream, const parse_options& options)
        : m_reader(std::make_unique<reader>(stream))
        , m_options(options)
        , m_ended(false) {
        if (!read_next_chunk()) {
            m_ended = true;
        }
    }

    chunk_iterator::~chunk_iterator() = default;

    void chunk_iterator::advance() {
        if (m_ended) {
            return;
        }

        if (!read_next_chunk()) {
            m_ended = true;
            m_current.record.reset();
        }
    }

    void chunk_iterator::warn(std::uint64_t offset, std::string_view category, const std::string& message) const {
        if (m_options.on_warning) {
            m_options.on_warning(offset, category, message);
        }
    }

    bool chunk_iterator::read_next_chunk() {
        while (true) {
            const std::uint64_t start_pos = m_reader->tell();

            std::vector<std::byte> frame;
            frame.reserve(header_size);
            std::size_t got = read_into(*m_reader, frame, header_size);
            if (got == 0) {
                return false;
            }

            if (got < header_size) {
                auto msg = build_error_msg("Truncated chunk header at offset ", start_pos,
                                           ": ", got, " of ", header_size, " bytes");
                THROW_AS_IF(chunk_too_small_error, m_options.strict, msg);
                warn(start_pos, "truncated", msg);
                return false;
            }

            const std::uint32_t length = load_be32(frame.data());
            const std::uint64_t body_size = std::uint64_t(length) + chunk::crc_size;

            // Type is checked before the body is read so a strict reader fails fast
            std::optional<chunk_type> type;
            try {
                type = chunk_type::from_bytes(frame.data() + chunk::length_size);
            } catch (const chunk_type_error& e) {
                auto msg = build_error_msg(e.what(), " at offset ", start_pos);
                THROW_AS_IF(chunk_type_error, m_options.strict, msg);
                warn(start_pos, "chunk_type", msg + ", skipping");
                if (!m_reader->skip(body_size)) {
                    return false;
                }
                continue;
            }

            if (length > m_options.max_chunk_size) {
                auto msg = build_error_msg("Chunk '", *type, "' at offset ", start_pos,
                                           " has size ", length, " bytes, which exceeds maximum allowed size of ",
                                           m_options.max_chunk_size, " bytes");
                THROW_AS_IF(data_length_error, m_options.strict, msg);
                warn(start_pos, "size_limit", msg + ", skipping");
                if (!m_reader->skip(body_size)) {
                    return false;
                }
                continue;
            }

            got = read_into(*m_reader, frame, static_cast<std::size_t>(body_size));
            if (got < body_size) {
                auto msg = build_error_msg("Chunk '", *type, "' at offset ", start_pos,
                                           " declares ", length, " data bytes but the stream ends after ",
                                           got, " of ", body_size, " data and CRC bytes");
                THROW_AS_IF(data_length_error, m_options.strict, msg);
                warn(start_pos, "truncated", msg);
                return false;
            }

            try {
                chunk record = chunk::parse(frame);
                if (m_options.warn_reserved_bit && !record.type().is_reserved_bit_valid()) {
                    warn(start_pos, "reserved_bit",
                         build_error_msg("Chunk '", record.type(), "' at offset ", start_pos,
                                         " has the reserved bit set (third letter is lowercase)"));
                }
                m_current.offset = start_pos;
                m_current.record = std::move(record);
                return true;
            } catch (const crc_error& e) {
                auto msg = build_error_msg(e.what(), " at offset ", start_pos);
                THROW_AS_IF(crc_error, m_options.strict, msg);
                warn(start_pos, "crc", msg + ", skipping");
            }
        }
    }

    std::vector<chunk> read_chunks(std::istream& stream, const parse_options& options) {
        std::vector<chunk> chunks;
        chunk_iterator it(stream, options);
        while (it.has_next()) {
            chunks.push_back(*it.current().record);
            it.next();
        }
        return chunks;
    }

} // namespace pngchunk
