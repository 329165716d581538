//
// Stream input used by the chunk iterator (internal).
//

#pragma once

#include <iosfwd>
#include <cstddef>
#include <cstdint>

#include <pngchunk/exceptions.hh>

namespace pngchunk {

    // Forward reader over an std::istream, throws io_error on stream failure
    class reader {
        public:
            explicit reader(std::istream& is);

            // Reads up to size bytes, returns the number actually read (short at EOF)
            std::size_t read(void* dst, std::size_t size);

            // Skips size bytes, returns false if the stream ended first
            bool skip(std::uint64_t size);

            std::uint64_t tell() const { return m_position; }

        private:
            std::istream& m_stream;
            std::uint64_t m_position;
    };
}
