/**
 * @file chunk_writer.hh
 * @brief Appends serialized chunks to an output stream
 */

#pragma once

#include <cstdint>
#include <iosfwd>
#include <vector>

#include <pngchunk/chunk.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @class chunk_writer
     * @brief Writes chunks back to back, the inverse of chunk_iterator
     *
     * The stream is borrowed and must outlive the writer.
     */
    class PNGCHUNK_EXPORT chunk_writer {
    public:
        explicit chunk_writer(std::ostream& stream);

        /**
         * @brief Append one chunk
         * @throws io_error if the stream fails
         */
        void write(const chunk& c);

        /**
         * @brief Build a chunk from type and data and append it
         * @return The chunk that was written
         * @throws io_error if the stream fails
         * @throws data_length_error if data is too long to frame
         */
        chunk write(const chunk_type& type, std::vector<std::byte> data);

        [[nodiscard]] std::uint64_t bytes_written() const { return m_bytes_written; }
        [[nodiscard]] std::size_t chunks_written() const { return m_chunks_written; }

    private:
        std::ostream& m_stream;
        std::uint64_t m_bytes_written = 0;
        std::size_t m_chunks_written = 0;
    };

} // namespace pngchunk
