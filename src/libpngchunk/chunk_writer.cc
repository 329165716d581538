//
// Appends serialized chunks to an output stream.
//

#include <pngchunk/chunk_writer.hh>
#include <pngchunk/exceptions.hh>

#include <ostream>
#include <utility>

namespace pngchunk {

    chunk_writer::chunk_writer(std::ostream& stream)
        : m_stream(stream) {
    }

    void chunk_writer::write(const chunk& c) {
        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state before writing chunk '", c.type(), "'");

        const auto bytes = c.to_bytes();
        m_stream.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        THROW_IO_UNLESS(m_stream.good(), "Failed to write chunk '", c.type(), "' of ", bytes.size(),
                        " bytes at output offset ", m_bytes_written);

        m_bytes_written += bytes.size();
        ++m_chunks_written;
    }

    chunk chunk_writer::write(const chunk_type& type, std::vector<std::byte> data) {
        chunk c(type, std::move(data));
        write(c);
        return c;
    }

} // namespace pngchunk
