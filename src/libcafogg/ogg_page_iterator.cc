//
// Created by igor on 16/08/2025.
//

#include <cafogg/ogg_page_iterator.hh>
#include <cafogg/crc32.hh>
#include <cafogg/decode.hh>
#include <cafogg/exceptions.hh>
#include <algorithm>
#include <utility>

#include "input.hh"

namespace cafogg {

    namespace {
        // Raw bytes of the page being scanned, from the first byte of the
        // capture pattern on. Lives for exactly one page.
        struct page_context {
            std::vector<std::byte> raw;
            std::uint64_t offset = 0;
            std::uint64_t skipped = 0;

            const std::byte* append(reader& rd, std::size_t n, const char* what) {
                const std::size_t at = raw.size();
                rd.read_exact_into(raw, n, what);
                return raw.data() + at;
            }
        };

        // Slide a 4-byte window over the stream until it equals the capture
        // pattern. Returns false if the stream ends first.
        bool seek_capture(reader& rd, page_context& ctx, const parse_options& options) {
            std::array<std::byte, 4> window{};
            std::size_t filled = 0;
            std::uint64_t scanned = 0;
            const std::uint64_t start = rd.position();

            while (true) {
                std::byte b;
                if (!rd.read_byte(b)) {
                    if (scanned > 0) {
                        options.warn(start, "trailing_bytes",
                                     build_error_msg(scanned, " bytes after the last page contain no capture pattern"));
                    }
                    return false;
                }
                scanned++;

                std::rotate(window.begin(), window.begin() + 1, window.end());
                window[3] = b;
                filled = std::min<std::size_t>(filled + 1, window.size());

                if (filled == window.size() && window == ogg_capture_pattern) {
                    break;
                }
            }

            ctx.skipped = scanned - ogg_capture_pattern.size();
            ctx.offset = rd.position() - ogg_capture_pattern.size();
            ctx.raw.assign(ogg_capture_pattern.begin(), ogg_capture_pattern.end());

            if (ctx.skipped > 0) {
                options.warn(start, "resync",
                             build_error_msg("Skipped ", ctx.skipped, " bytes before capture pattern at offset ", ctx.offset));
            }
            return true;
        }

        void read_header(reader& rd, page_context& ctx, ogg_page& page, const parse_options& options) {
            const std::byte* p = ctx.append(rd, ogg_page_header_size - ogg_capture_pattern.size(), "Ogg page header");

            ogg_page_header& h = page.header;
            h.structure_version = std::to_integer<std::uint8_t>(p[0]);
            h.header_type = std::to_integer<std::uint8_t>(p[1]);
            h.is_fresh_packet = (h.header_type & ogg_flags::continued_packet) == 0;
            h.is_beginning_of_stream = (h.header_type & ogg_flags::beginning_of_stream) != 0;
            h.is_end_of_stream = (h.header_type & ogg_flags::end_of_stream) != 0;
            h.granule_position = decode_uint64_le(p + 2, 8);
            h.stream_serial_number = decode_uint32_le(p + 10, 4);
            h.page_sequence_number = decode_uint32_le(p + 14, 4);
            h.page_checksum = decode_uint32_le(p + 18, 4);

            // Checksum field is part of the input, as received
            page.computed_checksum = crc32(ctx.raw.data(), ctx.raw.size());
            page.checksum_passed = page.computed_checksum == h.page_checksum;

            if (!page.checksum_passed) {
                options.warn(ctx.offset, "checksum",
                             build_error_msg("Page ", h.page_sequence_number, " stores checksum 0x", std::hex,
                                             h.page_checksum, ", computed 0x", page.computed_checksum));
            }
        }

        void read_lacing(reader& rd, page_context& ctx, ogg_page& page) {
            page.page_segments = std::to_integer<std::uint8_t>(*ctx.append(rd, 1, "Ogg segment count"));

            const std::byte* table = ctx.append(rd, page.page_segments, "Ogg lacing table");
            page.lacing_table.reserve(page.page_segments);
            for (std::size_t i = 0; i < page.page_segments; i++) {
                page.lacing_table.push_back(std::to_integer<std::uint8_t>(table[i]));
            }
        }

        void read_segments(reader& rd, page_context& ctx, ogg_page& page) {
            page.segments.reserve(page.lacing_table.size());
            for (auto length : page.lacing_table) {
                const std::byte* segment = ctx.append(rd, length, "Ogg segment");
                page.segments.emplace_back(segment, segment + length);
            }
        }
    }

    ogg_page_iterator::ogg_page_iterator(std::istream& stream)
        : ogg_page_iterator(stream, parse_options{}) {
    }

    ogg_page_iterator::ogg_page_iterator(std::istream& stream, const parse_options& options)
        : m_reader(std::make_unique<reader>(stream))
        , m_options(options) {
        m_ended = false;
        advance();
    }

    ogg_page_iterator::~ogg_page_iterator() = default;

    std::uint64_t ogg_page_iterator::bytes_consumed() const {
        return m_reader->position();
    }

    void ogg_page_iterator::advance() {
        if (m_ended) {
            return;
        }

        try {
            if (!read_next_page()) {
                m_state = state::done;
                m_ended = true;
                return;
            }
            decode_codec_headers();
        } catch (const cafogg_error&) {
            m_state = state::error;
            m_ended = true;
            throw;
        }
    }

    bool ogg_page_iterator::read_next_page() {
        page_context ctx;
        page_info info;

        m_state = state::seeking;
        if (!seek_capture(*m_reader, ctx, m_options)) {
            return false;
        }

        m_state = state::reading_header;
        read_header(*m_reader, ctx, info.page, m_options);

        m_state = state::reading_lacing;
        read_lacing(*m_reader, ctx, info.page);

        m_state = state::reading_segments;
        read_segments(*m_reader, ctx, info.page);

        info.page.file_offset = ctx.offset;
        info.page.skipped_bytes = ctx.skipped;
        info.page.page_size = ctx.raw.size();
        info.page_index = m_pages_read++;

        m_current = std::move(info);
        m_state = state::seeking;
        return true;
    }

    void ogg_page_iterator::decode_codec_headers() {
        if (!m_options.decode_opus_headers || m_current.page_index > 1 || m_current.page.segments.empty()) {
            return;
        }

        const auto packet = m_current.page.first_packet();
        if (m_current.page_index == 0) {
            m_current.identification = decode_opus_identification_header(packet);
        } else {
            const std::uint64_t body_offset = m_current.page.file_offset + ogg_page_header_size + 1 +
                                              m_current.page.page_segments;
            m_current.comments = decode_opus_comment_header(packet.data(), packet.size(), m_options, body_offset);
        }
    }

} // namespace cafogg
