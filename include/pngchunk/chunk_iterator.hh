/**
 * @file chunk_iterator.hh
 * @brief Forward iteration over a stream of consecutive chunks
 */

#pragma once

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <pngchunk/chunk.hh>
#include <pngchunk/parse_options.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    class reader;

    /**
     * @class chunk_iterator
     * @brief Reads chunks one after another from an input stream
     *
     * The stream is read strictly forward, so pipes and sockets work.
     * The first chunk is read on construction; iteration ends cleanly when
     * the stream has no bytes left at a chunk boundary.
     *
     * In strict mode any malformed chunk throws (the message names its
     * offset). In lenient mode the problem goes to parse_options::on_warning;
     * a chunk with a bad type or CRC is skipped, a truncated chunk ends the
     * iteration.
     */
    class PNGCHUNK_EXPORT chunk_iterator {
    public:
        /**
         * @struct chunk_info
         * @brief The current chunk and where it starts in the stream
         */
        struct chunk_info {
            std::uint64_t offset = 0;   ///< Offset of the chunk's length field
            std::optional<chunk> record;///< Empty only once iteration has ended
        };

        explicit chunk_iterator(std::istream& stream);
        chunk_iterator(std::istream& stream, const parse_options& options);
        ~chunk_iterator();

        chunk_iterator(const chunk_iterator&) = delete;
        chunk_iterator& operator=(const chunk_iterator&) = delete;

        const chunk_info& current() const { return m_current; }

        /**
         * @brief Advance to the next chunk
         */
        void next() {
            advance();
        }

        bool has_next() const { return !m_ended; }
        bool at_end() const { return m_ended; }

    private:
        void advance();

        // Reads the chunk at the current position, false at end of stream
        bool read_next_chunk();

        void warn(std::uint64_t offset, std::string_view category, const std::string& message) const;

        std::unique_ptr<reader> m_reader;
        parse_options m_options;
        chunk_info m_current;
        bool m_ended;
    };

    /**
     * @brief Read every chunk of a stream
     * @param stream Input stream positioned at the first chunk
     * @param options Parse options
     * @return Chunks in stream order
     */
    PNGCHUNK_EXPORT std::vector<chunk> read_chunks(std::istream& stream, const parse_options& options = {});

} // namespace pngchunk
