/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the chunk library
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library. Every way a chunk can be rejected
 * has its own exception type so callers can tell the failures apart.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace pngchunk {

    /**
     * @class pngchunk_error
     * @brief Base exception class for all library errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every chunk-related error with a single catch block.
     */
    class pngchunk_error : public std::runtime_error {
    public:
        explicit pngchunk_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when reading from or writing to an underlying stream fails.
     */
    class io_error : public pngchunk_error {
    public:
        explicit io_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Base class for malformed chunk data
     *
     * Thrown (through one of the derived classes below) when bytes do not
     * form a well-formed chunk.
     */
    class parse_error : public pngchunk_error {
    public:
        explicit parse_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class chunk_type_error
     * @brief Chunk type is not four ASCII letters
     */
    class chunk_type_error : public parse_error {
    public:
        explicit chunk_type_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class chunk_too_small_error
     * @brief Input is shorter than the 12 byte chunk framing
     */
    class chunk_too_small_error : public parse_error {
    public:
        explicit chunk_too_small_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class data_length_error
     * @brief Declared data length does not fit the available bytes
     */
    class data_length_error : public parse_error {
    public:
        explicit data_length_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class crc_error
     * @brief Stored CRC does not match the recomputed one
     */
    class crc_error : public parse_error {
    public:
        explicit crc_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) \
        throw ::pngchunk::io_error(::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_AS
     * @brief Throw an exception of the given type with formatted message
     * @param type Exception class, e.g. ::pngchunk::crc_error
     */
    #define THROW_AS(type, ...) \
        throw type(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_AS_IF
     * @brief Conditionally throw an exception of the given type
     */
    #define THROW_AS_IF(type, condition, ...) \
        do { if (condition) THROW_AS(type, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
