/**
 * @file ogg_types.hh
 * @brief Records produced by the Ogg page scanner
 * @author Igor
 * @date 16/08/2025
 *
 * All multi-byte Ogg fields are little-endian.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace cafogg {

    /// "OggS"
    inline constexpr std::array<std::byte, 4> ogg_capture_pattern = {
        std::byte{0x4F}, std::byte{0x67}, std::byte{0x67}, std::byte{0x53}
    };

    /// Capture pattern through checksum field
    inline constexpr std::size_t ogg_page_header_size = 26;

    namespace ogg_flags {
        inline constexpr std::uint8_t continued_packet = 0x01;
        inline constexpr std::uint8_t beginning_of_stream = 0x02;
        inline constexpr std::uint8_t end_of_stream = 0x04;
    }

    /**
     * @struct ogg_page_header
     * @brief Fixed part of a page following the capture pattern
     */
    struct ogg_page_header {
        std::uint8_t structure_version = 0;
        std::uint8_t header_type = 0;
        bool is_fresh_packet = false;         ///< bit 0 clear
        bool is_beginning_of_stream = false;  ///< bit 1
        bool is_end_of_stream = false;        ///< bit 2
        std::uint64_t granule_position = 0;
        std::uint32_t stream_serial_number = 0;
        std::uint32_t page_sequence_number = 0;
        std::uint32_t page_checksum = 0;      ///< As stored in the page
    };

    /**
     * @struct ogg_page
     * @brief One fully read page
     *
     * segments[i].size() == lacing_table[i], and the concatenation of all
     * segments is exactly the page body.
     */
    struct ogg_page {
        ogg_page_header header;
        std::uint8_t page_segments = 0;
        std::vector<std::uint8_t> lacing_table;
        std::vector<std::vector<std::byte>> segments;

        std::uint32_t computed_checksum = 0;
        bool checksum_passed = false;

        std::uint64_t file_offset = 0;   ///< Offset of the capture pattern
        std::uint64_t skipped_bytes = 0; ///< Bytes discarded before the capture pattern
        std::uint64_t page_size = 0;     ///< Raw bytes from capture pattern to last segment

        /**
         * @brief Total size of all segments
         */
        [[nodiscard]] std::size_t body_size() const {
            std::size_t total = 0;
            for (auto len : lacing_table) {
                total += len;
            }
            return total;
        }

        /**
         * @brief Bytes of the first packet that starts on this page
         *
         * Joins segments while their lacing value is 255. If the packet
         * continues on the next page only the part on this page is returned.
         */
        [[nodiscard]] std::vector<std::byte> first_packet() const {
            std::vector<std::byte> packet;
            for (std::size_t i = 0; i < segments.size(); i++) {
                packet.insert(packet.end(), segments[i].begin(), segments[i].end());
                if (lacing_table[i] < 255) {
                    break;
                }
            }
            return packet;
        }
    };

} // namespace cafogg
