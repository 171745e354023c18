/**
 * @file opus_headers.hh
 * @brief Opus identification ("OpusHead") and comment ("OpusTags") headers
 * @author Igor
 * @date 16/08/2025
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <cafogg/export_cafogg.h>
#include <cafogg/parse_options.hh>

namespace cafogg {

    inline constexpr std::array<char, 8> opus_head_magic = {'O', 'p', 'u', 's', 'H', 'e', 'a', 'd'};
    inline constexpr std::array<char, 8> opus_tags_magic = {'O', 'p', 'u', 's', 'T', 'a', 'g', 's'};

    /// Payload size up to and including the mapping family byte
    inline constexpr std::size_t opus_head_min_size = 19;

    /**
     * @struct opus_channel_mapping
     * @brief Optional channel mapping table of the identification header
     */
    struct opus_channel_mapping {
        std::uint8_t stream_count = 0;
        std::uint8_t coupled_count = 0;
        std::vector<std::uint8_t> mapping; ///< One entry per channel
    };

    /**
     * @struct opus_identification_header
     */
    struct opus_identification_header {
        std::uint8_t version = 0;
        std::uint8_t channel_count = 0;
        std::uint16_t pre_skip = 0;
        std::uint32_t input_sample_rate = 0;
        std::uint16_t output_gain = 0;  ///< Raw Q7.8 value
        std::uint8_t mapping_family = 0;
        std::optional<opus_channel_mapping> channel_mapping; ///< Present only if the payload is longer than 19 bytes
    };

    /**
     * @struct opus_comment_header
     */
    struct opus_comment_header {
        std::string vendor;
        std::vector<std::string> comments;
        std::size_t bytes_consumed = 0; ///< Bytes of the payload that were interpreted
    };

    /**
     * @brief Decode an "OpusHead" packet
     * @throws invalid_magic_signature if the first 8 bytes are not "OpusHead"
     * @throws truncated_record if fixed fields or the mapping table are cut short
     */
    CAFOGG_EXPORT opus_identification_header decode_opus_identification_header(const std::byte* data, std::size_t size);

    /**
     * @brief Decode an "OpusTags" packet
     *
     * After the vendor string comes a little-endian 32-bit value taken as
     * the byte budget of the comment list; entries, each prefixed by its
     * own 32-bit length, are read until the budget is used up.
     *
     * @throws invalid_magic_signature if the first 8 bytes are not "OpusTags"
     * @throws truncated_record if a length points past the end of the payload
     * @param base_offset Stream offset of the packet, used for warnings
     * @throws malformed_field for invalid UTF-8 when options.text is strict
     */
    CAFOGG_EXPORT opus_comment_header decode_opus_comment_header(const std::byte* data, std::size_t size,
                                                                 const parse_options& options = parse_options{},
                                                                 std::uint64_t base_offset = 0);

    inline opus_identification_header decode_opus_identification_header(const std::vector<std::byte>& packet) {
        return decode_opus_identification_header(packet.data(), packet.size());
    }

    inline opus_comment_header decode_opus_comment_header(const std::vector<std::byte>& packet,
                                                          const parse_options& options = parse_options{}) {
        return decode_opus_comment_header(packet.data(), packet.size(), options);
    }

} // namespace cafogg
