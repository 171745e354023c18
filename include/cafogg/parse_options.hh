/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for CAF and Ogg streams
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace cafogg {

    /**
     * @enum utf8_mode
     * @brief How text fields (tags, vendor string, comments) are decoded
     */
    enum class utf8_mode {
        lossy,  ///< Invalid sequences are replaced with U+FFFD
        strict  ///< Invalid sequences raise malformed_field
    };

    /**
     * @struct parse_options
     * @brief Configuration options for decoding CAF and Ogg streams
     *
     * Controls text decoding, size limits, codec header decoding
     * and warning handling.
     */
    struct parse_options {
        /**
         * @brief UTF-8 decoding mode for text fields
         */
        utf8_mode text = utf8_mode::lossy;

        /**
         * @brief Maximum allowed CAF chunk body size in bytes
         *
         * Chunks larger than this are rejected before their body is read.
         * Default is 4GB.
         */
        std::uint64_t max_chunk_size = std::uint64_t(1) << 32;  // 4GB

        /**
         * @brief Decode Opus identification/comment headers
         *
         * When true, the first packet of the first two pages of an Ogg
         * stream is decoded as OpusHead and OpusTags respectively.
         */
        bool decode_opus_headers = true;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Stream offset where warning occurred
         * @param category Warning category (e.g., "checksum", "resync")
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
         * If set, will be called for non-fatal anomalies during parsing:
         * unknown chunks, skipped bytes before a capture pattern, checksum
         * mismatches, packet table inconsistencies and lossy text.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;

        void warn(std::uint64_t offset, std::string_view category, std::string_view message) const {
            if (on_warning) {
                on_warning(offset, category, message);
            }
        }
    };

} // namespace cafogg
