/**
 * @file caf_types.hh
 * @brief Records decoded from a Core Audio Format (CAF) stream
 * @author Igor
 * @date 15/08/2025
 *
 * Every record is built in full from the bytes of one chunk and is not
 * modified afterwards. All multi-byte CAF fields are big-endian.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>
#include <cafogg/fourcc.hh>

namespace cafogg {

    /**
     * @struct caf_file_header
     * @brief Fixed 8-byte header at the start of every CAF file
     */
    struct caf_file_header {
        fourcc file_type;              ///< Always 'caff'
        std::uint16_t file_version = 0;
        std::uint16_t file_flags = 0;
    };

    /**
     * @struct caf_chunk_header
     * @brief 12-byte header preceding every chunk body
     */
    struct caf_chunk_header {
        fourcc type;                   ///< Chunk tag ('desc', 'chan', 'data', 'pakt', ...)
        std::int64_t size = 0;         ///< Body size in bytes; 0 or -1 ends traversal
        std::uint64_t file_offset = 0; ///< Offset of this header in the stream
    };

    /**
     * @struct audio_format
     * @brief Audio description ('desc' chunk, 32 bytes)
     */
    struct audio_format {
        double sample_rate = 0.0;
        fourcc format_id;
        std::uint32_t format_flags = 0;
        std::uint32_t bytes_per_packet = 0;
        std::uint32_t frames_per_packet = 0;
        std::uint32_t channels_per_frame = 0;
        std::uint32_t bits_per_channel = 0;
    };

    /**
     * @struct channel_description
     * @brief One 32-byte entry of a channel layout
     */
    struct channel_description {
        std::uint32_t channel_label = 0;
        std::uint32_t channel_flags = 0;
        std::array<double, 3> coordinates{};
    };

    /**
     * @struct channel_layout
     * @brief Channel layout ('chan' chunk)
     */
    struct channel_layout {
        std::uint32_t channel_layout_tag = 0;
        std::uint32_t channel_bitmap = 0;
        std::uint32_t description_count = 0;
        std::vector<channel_description> descriptions; ///< size() == description_count
    };

    /**
     * @struct data_block
     * @brief Audio data ('data' chunk); samples are kept opaque
     */
    struct data_block {
        std::uint32_t edit_count = 0;
        std::vector<std::byte> payload;
    };

    /**
     * @struct packet_table_header
     * @brief Fixed 24-byte prefix of a 'pakt' chunk
     */
    struct packet_table_header {
        std::int64_t number_packets = 0;
        std::int64_t number_valid_frames = 0;
        std::int32_t priming_frames = 0;
        std::int32_t remainder_frames = 0;
    };

    /**
     * @struct packet_table
     * @brief Packet table ('pakt' chunk)
     */
    struct packet_table {
        packet_table_header header;
        std::vector<std::uint64_t> packet_sizes;
    };

    /**
     * @struct unknown_chunk
     * @brief Any chunk with a tag the library does not interpret
     */
    struct unknown_chunk {
        fourcc type;
        std::vector<std::byte> payload;
    };

    /**
     * @enum caf_chunk_kind
     * @brief Closed set of chunk kinds the traversal dispatches on
     */
    enum class caf_chunk_kind {
        audio_description, ///< 'desc'
        channel_layout,    ///< 'chan'
        audio_data,        ///< 'data'
        packet_table,      ///< 'pakt'
        unknown
    };

    using caf_record = std::variant<audio_format, channel_layout, data_block, packet_table, unknown_chunk>;

    namespace caf_id {
        inline constexpr fourcc caff = "caff"_4cc;
        inline constexpr fourcc desc = "desc"_4cc;
        inline constexpr fourcc chan = "chan"_4cc;
        inline constexpr fourcc data = "data"_4cc;
        inline constexpr fourcc pakt = "pakt"_4cc;
    }

} // namespace cafogg
