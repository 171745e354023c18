//
// Created by igor on 15/08/2025.
//

#include <cafogg/caf_decoders.hh>
#include <cafogg/decode.hh>
#include <cafogg/exceptions.hh>
#include <unordered_map>
#include <utility>

#include "byte_cursor.hh"

namespace cafogg {

    namespace {
        const std::unordered_map<fourcc, caf_chunk_kind>& chunk_kinds() {
            static const std::unordered_map<fourcc, caf_chunk_kind> table = {
                {caf_id::desc, caf_chunk_kind::audio_description},
                {caf_id::chan, caf_chunk_kind::channel_layout},
                {caf_id::data, caf_chunk_kind::audio_data},
                {caf_id::pakt, caf_chunk_kind::packet_table}
            };
            return table;
        }

        void require_size(std::size_t size, std::size_t expected, const char* what) {
            THROW_FIELD_LENGTH_IF(size != expected, "Invalid ", what, " length: expected ",
                                  expected, " bytes, got ", size);
        }

        std::uint32_t take_u32(byte_cursor& c) {
            return decode_uint32_be(c.take(4), 4);
        }

        double take_f64(byte_cursor& c) {
            return decode_float64_be(c.take(8), 8);
        }
    }

    caf_chunk_kind classify_chunk(const fourcc& type) {
        const auto& table = chunk_kinds();
        auto it = table.find(type);
        return it == table.end() ? caf_chunk_kind::unknown : it->second;
    }

    caf_file_header decode_file_header(const std::byte* data, std::size_t size) {
        require_size(size, caf_file_header_size, "CAF file header");
        byte_cursor c(data, size, "CAF file header");

        caf_file_header header;
        header.file_type = fourcc::from_bytes(c.take(4));
        header.file_version = decode_uint16_be(c.take(2), 2);
        header.file_flags = decode_uint16_be(c.take(2), 2);
        return header;
    }

    caf_chunk_header decode_chunk_header(const std::byte* data, std::size_t size) {
        require_size(size, caf_chunk_header_size, "CAF chunk header");
        byte_cursor c(data, size, "CAF chunk header");

        caf_chunk_header header;
        header.type = fourcc::from_bytes(c.take(4));
        header.size = decode_int64_be(c.take(8), 8);
        return header;
    }

    audio_format decode_audio_format(const std::byte* data, std::size_t size) {
        require_size(size, audio_format_size, "audio description");
        byte_cursor c(data, size, "audio description");

        audio_format fmt;
        fmt.sample_rate = take_f64(c);
        fmt.format_id = fourcc::from_bytes(c.take(4));
        fmt.format_flags = take_u32(c);
        fmt.bytes_per_packet = take_u32(c);
        fmt.frames_per_packet = take_u32(c);
        fmt.channels_per_frame = take_u32(c);
        fmt.bits_per_channel = take_u32(c);
        return fmt;
    }

    channel_description decode_channel_description(const std::byte* data, std::size_t size) {
        require_size(size, channel_description_size, "channel description");
        byte_cursor c(data, size, "channel description");

        channel_description desc;
        desc.channel_label = take_u32(c);
        desc.channel_flags = take_u32(c);
        for (auto& coordinate : desc.coordinates) {
            coordinate = take_f64(c);
        }
        return desc;
    }

    channel_layout decode_channel_layout(const std::byte* data, std::size_t size) {
        THROW_TRUNCATED_IF(size < channel_layout_header_size, "Truncated channel layout: header needs ",
                           channel_layout_header_size, " bytes, got ", size);
        byte_cursor c(data, size, "channel layout");

        channel_layout layout;
        layout.channel_layout_tag = take_u32(c);
        layout.channel_bitmap = take_u32(c);
        layout.description_count = take_u32(c);

        const std::uint64_t needed = std::uint64_t(layout.description_count) * channel_description_size;
        THROW_TRUNCATED_IF(needed > c.remaining(), "Truncated channel layout: ", layout.description_count,
                           " descriptions need ", needed, " bytes, only ", c.remaining(), " available");

        layout.descriptions.reserve(layout.description_count);
        for (std::uint32_t i = 0; i < layout.description_count; i++) {
            layout.descriptions.push_back(
                decode_channel_description(c.take(channel_description_size), channel_description_size));
        }
        return layout;
    }

    data_block decode_data_block(std::vector<std::byte>&& body) {
        THROW_TRUNCATED_IF(body.size() < 4, "Truncated audio data chunk: ", body.size(),
                           " bytes, edit count needs 4");

        data_block block;
        block.edit_count = decode_uint32_be(body.data(), 4);
        body.erase(body.begin(), body.begin() + 4);
        block.payload = std::move(body);
        return block;
    }

    packet_table_header decode_packet_table_header(const std::byte* data, std::size_t size) {
        require_size(size, packet_table_header_size, "packet table header");
        byte_cursor c(data, size, "packet table header");

        packet_table_header header;
        header.number_packets = decode_int64_be(c.take(8), 8);
        header.number_valid_frames = decode_int64_be(c.take(8), 8);
        header.priming_frames = decode_int32_be(c.take(4), 4);
        header.remainder_frames = decode_int32_be(c.take(4), 4);
        return header;
    }

    packet_table decode_packet_table(const std::byte* data, std::size_t size, bool* incomplete_tail) {
        byte_cursor c(data, size, "packet table");

        packet_table table;
        table.header = decode_packet_table_header(c.take(packet_table_header_size), packet_table_header_size);
        table.packet_sizes = decode_packet_sizes(c.data(), c.remaining(), incomplete_tail);
        return table;
    }

    caf_record decode_chunk(const fourcc& type, std::vector<std::byte>&& body) {
        switch (classify_chunk(type)) {
            case caf_chunk_kind::audio_description:
                return decode_audio_format(body.data(), body.size());
            case caf_chunk_kind::channel_layout:
                return decode_channel_layout(body.data(), body.size());
            case caf_chunk_kind::audio_data:
                return decode_data_block(std::move(body));
            case caf_chunk_kind::packet_table:
                return decode_packet_table(body.data(), body.size());
            case caf_chunk_kind::unknown:
                break;
        }
        return unknown_chunk{type, std::move(body)};
    }

} // namespace cafogg
