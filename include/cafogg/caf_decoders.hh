/**
 * @file caf_decoders.hh
 * @brief Decoders for individual CAF chunk bodies
 * @author Igor
 * @date 15/08/2025
 *
 * Each decoder receives exactly the body of one chunk. None of them
 * validates field value ranges; they are purely structural.
 */

#pragma once

#include <cstddef>
#include <vector>
#include <cafogg/export_cafogg.h>
#include <cafogg/caf_types.hh>

namespace cafogg {

    inline constexpr std::size_t caf_file_header_size = 8;
    inline constexpr std::size_t caf_chunk_header_size = 12;
    inline constexpr std::size_t audio_format_size = 32;
    inline constexpr std::size_t channel_description_size = 32;
    inline constexpr std::size_t channel_layout_header_size = 12;
    inline constexpr std::size_t packet_table_header_size = 24;

    /**
     * @brief Map a chunk tag to its kind
     * @return caf_chunk_kind::unknown for tags without a decoder
     */
    CAFOGG_EXPORT caf_chunk_kind classify_chunk(const fourcc& type);

    /**
     * @brief Decode the 8-byte file header
     * @throws invalid_field_length if size != 8
     */
    CAFOGG_EXPORT caf_file_header decode_file_header(const std::byte* data, std::size_t size);

    /**
     * @brief Decode the 12-byte chunk header (tag + signed 64-bit size)
     * @throws invalid_field_length if size != 12
     */
    CAFOGG_EXPORT caf_chunk_header decode_chunk_header(const std::byte* data, std::size_t size);

    /**
     * @brief Decode an audio description body
     * @throws invalid_field_length if size != 32
     */
    CAFOGG_EXPORT audio_format decode_audio_format(const std::byte* data, std::size_t size);

    /**
     * @throws invalid_field_length if size != 32
     */
    CAFOGG_EXPORT channel_description decode_channel_description(const std::byte* data, std::size_t size);

    /**
     * @brief Decode a channel layout body
     * @throws truncated_record if fewer than 12 + 32 * count bytes are given
     */
    CAFOGG_EXPORT channel_layout decode_channel_layout(const std::byte* data, std::size_t size);

    /**
     * @brief Decode an audio data body; the payload is moved out of body
     * @throws truncated_record if the body is shorter than 4 bytes
     */
    CAFOGG_EXPORT data_block decode_data_block(std::vector<std::byte>&& body);

    /**
     * @throws invalid_field_length if size != 24
     */
    CAFOGG_EXPORT packet_table_header decode_packet_table_header(const std::byte* data, std::size_t size);

    /**
     * @brief Decode a packet table body
     *
     * The bytes after the 24-byte header are a sequence of variable-length
     * packet sizes; an incomplete trailing value is dropped.
     * @param incomplete_tail Optional out flag, set when a tail was dropped
     * @throws truncated_record if the body is shorter than 24 bytes
     */
    CAFOGG_EXPORT packet_table decode_packet_table(const std::byte* data, std::size_t size,
                                                   bool* incomplete_tail = nullptr);

    /**
     * @brief Decode a chunk body according to its tag
     *
     * The body is consumed; unknown tags produce an unknown_chunk that owns it.
     */
    CAFOGG_EXPORT caf_record decode_chunk(const fourcc& type, std::vector<std::byte>&& body);

    inline audio_format decode_audio_format(const std::vector<std::byte>& body) {
        return decode_audio_format(body.data(), body.size());
    }

    inline channel_layout decode_channel_layout(const std::vector<std::byte>& body) {
        return decode_channel_layout(body.data(), body.size());
    }

    inline packet_table decode_packet_table(const std::vector<std::byte>& body) {
        return decode_packet_table(body.data(), body.size());
    }

} // namespace cafogg
