//
// Created by igor on 16/08/2025.
//

#include <cafogg/opus_headers.hh>
#include <cafogg/decode.hh>
#include <cafogg/exceptions.hh>
#include <cstring>
#include <utility>

#include "byte_cursor.hh"

namespace cafogg {

    namespace {
        bool has_magic(const std::byte* data, std::size_t size, const std::array<char, 8>& magic) {
            return size >= magic.size() && std::memcmp(data, magic.data(), magic.size()) == 0;
        }

        std::uint32_t take_u32le(byte_cursor& c) {
            return decode_uint32_le(c.take(4), 4);
        }

        std::string take_text(byte_cursor& c, std::size_t len, const parse_options& options,
                              std::uint64_t base_offset, const char* what) {
            const std::uint64_t offset = base_offset + c.position();
            const std::byte* p = c.take(len);
            if (options.text == utf8_mode::lossy && !is_valid_utf8(p, len)) {
                options.warn(offset, "text",
                             build_error_msg("Invalid UTF-8 in ", what, ", replaced with U+FFFD"));
            }
            return decode_text(p, len, options.text);
        }
    }

    opus_identification_header decode_opus_identification_header(const std::byte* data, std::size_t size) {
        THROW_MAGIC_UNLESS(has_magic(data, size, opus_head_magic),
                           "Invalid magic signature: Opus identification header must start with 'OpusHead'");
        THROW_TRUNCATED_IF(size < opus_head_min_size, "Truncated Opus identification header: ", size,
                           " bytes, need at least ", opus_head_min_size);

        byte_cursor c(data, size, "Opus identification header");
        c.take(opus_head_magic.size());

        opus_identification_header head;
        head.version = c.take_u8();
        head.channel_count = c.take_u8();
        head.pre_skip = decode_uint16_le(c.take(2), 2);
        head.input_sample_rate = take_u32le(c);
        head.output_gain = decode_uint16_le(c.take(2), 2);
        head.mapping_family = c.take_u8();

        if (size > opus_head_min_size) {
            opus_channel_mapping mapping;
            mapping.stream_count = c.take_u8();
            mapping.coupled_count = c.take_u8();

            const std::byte* table = c.take(head.channel_count);
            mapping.mapping.reserve(head.channel_count);
            for (std::size_t i = 0; i < head.channel_count; i++) {
                mapping.mapping.push_back(std::to_integer<std::uint8_t>(table[i]));
            }
            head.channel_mapping = std::move(mapping);
        }
        return head;
    }

    opus_comment_header decode_opus_comment_header(const std::byte* data, std::size_t size,
                                                   const parse_options& options, std::uint64_t base_offset) {
        THROW_MAGIC_UNLESS(has_magic(data, size, opus_tags_magic),
                           "Invalid magic signature: Opus comment header must start with 'OpusTags'");

        byte_cursor c(data, size, "Opus comment header");
        c.take(opus_tags_magic.size());

        opus_comment_header tags;
        const std::uint32_t vendor_length = take_u32le(c);
        tags.vendor = take_text(c, vendor_length, options, base_offset, "vendor string");

        const std::uint32_t budget = take_u32le(c);
        std::uint64_t consumed = 0;

        while (consumed < budget) {
            const std::uint32_t length = take_u32le(c);
            tags.comments.push_back(take_text(c, length, options, base_offset, "user comment"));
            consumed += std::uint64_t(length) + 4;
        }

        if (consumed > budget) {
            options.warn(base_offset + c.position(), "comment_budget",
                         build_error_msg("Comment list overruns its declared budget of ", budget,
                                         " bytes by ", consumed - budget));
        }

        tags.bytes_consumed = c.position();
        return tags;
    }

} // namespace cafogg
