/**
 * @file parse_options.hh
 * @brief Options for reading chunk streams
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @struct parse_options
     * @brief Configuration options for reading a stream of chunks
     *
     * Controls strictness, size limits, and warning handling.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, the first malformed chunk throws.
         * When false, malformed chunks are reported through on_warning
         * and skipped where the stream can be resynchronised.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed chunk data length in bytes
         *
         * Defaults to the PNG limit of 2^31 - 1.
         */
        std::uint32_t max_chunk_size = 0x7FFFFFFFu;

        /**
         * @brief Report chunk types whose reserved bit is not set
         *
         * Never fatal, only emits a "reserved_bit" warning.
         */
        bool warn_reserved_bit = true;

        /**
         * @typedef warning_handler
         * @param offset Stream offset of the chunk the warning is about
         * @param category One of "size_limit", "truncated", "chunk_type",
         *        "crc", "reserved_bit"
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
