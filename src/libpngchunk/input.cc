//
// Stream input used by the chunk iterator (internal).
//

#include <istream>
#include <algorithm>
#include <array>

#include "input.hh"

namespace pngchunk {

    reader::reader(std::istream& is)
        : m_stream(is), m_position(0) {
        auto pos = m_stream.tellg();
        if (pos != std::streampos(-1)) {
            m_position = static_cast<std::uint64_t>(pos);
        }
    }

    std::size_t reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        // A previous short read leaves eof set, which is a normal end of data
        if (m_stream.eof()) {
            return 0;
        }
        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state at offset ", m_position);

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed at offset ", m_position);
        m_position += bytes_read;
        return bytes_read;
    }

    bool reader::skip(std::uint64_t size) {
        // Read-and-discard keeps the reader usable on non-seekable streams
        std::array<char, 4096> scratch;
        while (size > 0) {
            auto step = static_cast<std::size_t>(std::min<std::uint64_t>(size, scratch.size()));
            std::size_t actual = read(scratch.data(), step);
            if (actual != step) {
                return false;
            }
            size -= actual;
        }
        return true;
    }
}
