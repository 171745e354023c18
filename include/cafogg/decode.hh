/**
 * @file decode.hh
 * @brief Primitive field decoders shared by the CAF and Ogg parsers
 * @author Igor
 * @date 15/08/2025
 *
 * All decoders operate on a byte range and either return the decoded value
 * or throw. Fixed-width decoders throw invalid_field_length when the range
 * does not have exactly the width of the field.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <cafogg/export_cafogg.h>
#include <cafogg/parse_options.hh>

namespace cafogg {

    /**
     * @brief Decode a big-endian unsigned integer of 1 to 8 bytes
     *
     * Bytes are folded left to right: result = (result << 8) | byte.
     * @throws malformed_field if size is 0 or greater than 8 (the value
     *         would not fit in 64 bits)
     */
    CAFOGG_EXPORT std::uint64_t decode_unsigned_be(const std::byte* data, std::size_t size);

    CAFOGG_EXPORT std::uint16_t decode_uint16_be(const std::byte* data, std::size_t size);
    CAFOGG_EXPORT std::uint32_t decode_uint32_be(const std::byte* data, std::size_t size);
    CAFOGG_EXPORT std::int32_t decode_int32_be(const std::byte* data, std::size_t size);
    CAFOGG_EXPORT std::int64_t decode_int64_be(const std::byte* data, std::size_t size);

    /**
     * @brief Decode an IEEE-754 big-endian double
     * @throws invalid_field_length unless size == 8
     */
    CAFOGG_EXPORT double decode_float64_be(const std::byte* data, std::size_t size);

    CAFOGG_EXPORT std::uint16_t decode_uint16_le(const std::byte* data, std::size_t size);
    CAFOGG_EXPORT std::uint32_t decode_uint32_le(const std::byte* data, std::size_t size);

    /**
     * @brief Decode a little-endian 64-bit unsigned integer
     *
     * All 64 bits are decoded.
     * @throws invalid_field_length unless size == 8
     */
    CAFOGG_EXPORT std::uint64_t decode_uint64_le(const std::byte* data, std::size_t size);

    /**
     * @brief Check whether a byte range is well-formed UTF-8
     */
    CAFOGG_EXPORT bool is_valid_utf8(const std::byte* data, std::size_t size);

    /**
     * @brief Decode UTF-8 text
     * @param mode lossy replaces every invalid sequence with U+FFFD,
     *             strict throws malformed_field
     */
    CAFOGG_EXPORT std::string decode_text(const std::byte* data, std::size_t size, utf8_mode mode = utf8_mode::lossy);

    /**
     * @brief Decode a run of big-endian base-128 variable-length integers
     *
     * Each byte contributes its low 7 bits; bit 7 set means the value
     * continues in the next byte. A value left incomplete at the end of the
     * range is dropped.
     * @param incomplete_tail Optional out flag, set when a tail was dropped
     * @throws malformed_field if a single value exceeds 64 bits
     */
    CAFOGG_EXPORT std::vector<std::uint64_t> decode_packet_sizes(const std::byte* data, std::size_t size,
                                                                bool* incomplete_tail = nullptr);

    // std::vector convenience overloads
    inline std::uint64_t decode_unsigned_be(const std::vector<std::byte>& v) {
        return decode_unsigned_be(v.data(), v.size());
    }

    inline double decode_float64_be(const std::vector<std::byte>& v) {
        return decode_float64_be(v.data(), v.size());
    }

    inline std::int64_t decode_int64_be(const std::vector<std::byte>& v) {
        return decode_int64_be(v.data(), v.size());
    }

    inline std::int32_t decode_int32_be(const std::vector<std::byte>& v) {
        return decode_int32_be(v.data(), v.size());
    }

    inline std::uint32_t decode_uint32_le(const std::vector<std::byte>& v) {
        return decode_uint32_le(v.data(), v.size());
    }

    inline std::uint64_t decode_uint64_le(const std::vector<std::byte>& v) {
        return decode_uint64_le(v.data(), v.size());
    }

    inline std::string decode_text(const std::vector<std::byte>& v, utf8_mode mode = utf8_mode::lossy) {
        return decode_text(v.data(), v.size(), mode);
    }

    inline std::vector<std::uint64_t> decode_packet_sizes(const std::vector<std::byte>& v) {
        return decode_packet_sizes(v.data(), v.size());
    }

} // namespace cafogg
