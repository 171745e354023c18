//
// Created by igor on 15/08/2025.
//

#include <cafogg/caf_chunk_iterator.hh>
#include <cafogg/caf_decoders.hh>
#include <cafogg/exceptions.hh>
#include <array>
#include <string>
#include <utility>

#include "input.hh"

namespace cafogg {

    namespace {
        // Size value CAF uses for a 'data' chunk whose length is not known
        constexpr std::int64_t unknown_chunk_size = -1;
    }

    caf_chunk_iterator::caf_chunk_iterator(std::istream& stream)
        : caf_chunk_iterator(stream, parse_options{}) {
    }

    caf_chunk_iterator::caf_chunk_iterator(std::istream& stream, const parse_options& options)
        : m_reader(std::make_unique<reader>(stream))
        , m_options(options) {
        m_ended = false;

        try {
            read_file_header();
            if (!read_next_chunk()) {
                m_ended = true;
            }
        } catch (const cafogg_error&) {
            m_state = state::terminal;
            m_ended = true;
            throw;
        }
    }

    caf_chunk_iterator::~caf_chunk_iterator() = default;

    std::uint64_t caf_chunk_iterator::bytes_consumed() const {
        return m_reader->position();
    }

    void caf_chunk_iterator::advance() {
        if (m_ended) {
            return;
        }

        try {
            if (!read_next_chunk()) {
                m_ended = true;
            }
        } catch (const cafogg_error&) {
            // Partial chunks are never reported
            m_state = state::terminal;
            m_ended = true;
            throw;
        }
    }

    void caf_chunk_iterator::read_file_header() {
        auto bytes = m_reader->read_exact(caf_file_header_size, "CAF file header");
        m_file_header = decode_file_header(bytes.data(), bytes.size());

        THROW_MAGIC_UNLESS(m_file_header.file_type == caf_id::caff,
                           "Not a CAF stream: file type is ", m_file_header.file_type, ", expected 'caff'");

        m_state = state::reading_chunk;
    }

    bool caf_chunk_iterator::read_next_chunk() {
        if (m_state != state::reading_chunk) {
            return false;
        }

        const std::uint64_t start_pos = m_reader->position();

        std::array<std::byte, caf_chunk_header_size> raw{};
        const std::size_t got = m_reader->read(raw.data(), raw.size());
        if (got == 0) {
            // Clean end of stream between chunks
            m_state = state::terminal;
            return false;
        }
        THROW_EOS_IF(got != raw.size(), "Unexpected end of stream in CAF chunk header at offset ",
                     start_pos, ": requested ", raw.size(), " bytes, got ", got);

        caf_chunk_header header = decode_chunk_header(raw.data(), raw.size());
        header.file_offset = start_pos;

        if (header.size == 0 || header.size == unknown_chunk_size) {
            m_state = state::terminal;
            return false;
        }

        THROW_MALFORMED_IF(header.size < 0, "Chunk ", header.type, " at offset ", start_pos,
                           " has negative size ", header.size);
        THROW_MALFORMED_IF(static_cast<std::uint64_t>(header.size) > m_options.max_chunk_size,
                           "Chunk ", header.type, " at offset ", start_pos, " has size ", header.size,
                           " bytes, which exceeds maximum allowed size of ", m_options.max_chunk_size, " bytes");

        const std::string what = "CAF chunk '" + header.type.to_string() + "' body";
        auto body = m_reader->read_exact(static_cast<std::size_t>(header.size), what.c_str());

        const caf_chunk_kind kind = classify_chunk(header.type);
        if (kind == caf_chunk_kind::packet_table) {
            bool incomplete_tail = false;
            packet_table table = decode_packet_table(body.data(), body.size(), &incomplete_tail);
            check_packet_table(header, table, incomplete_tail);
            m_current.record = std::move(table);
        } else {
            if (kind == caf_chunk_kind::unknown) {
                m_options.warn(start_pos, "unknown_chunk",
                               build_error_msg("Chunk ", header.type, " of ", header.size,
                                               " bytes has no decoder, kept as opaque bytes"));
            }
            m_current.record = decode_chunk(header.type, std::move(body));
        }

        m_current.header = header;
        m_current.kind = kind;
        return true;
    }

    void caf_chunk_iterator::check_packet_table(const caf_chunk_header& header, const packet_table& table,
                                                bool incomplete_tail) const {
        if (incomplete_tail) {
            m_options.warn(header.file_offset, "packet_table",
                           "Packet table ends inside a variable-length value, trailing bytes dropped");
        }
        if (table.header.number_packets >= 0 &&
            static_cast<std::uint64_t>(table.header.number_packets) != table.packet_sizes.size()) {
            m_options.warn(header.file_offset, "packet_table",
                           build_error_msg("Packet table declares ", table.header.number_packets,
                                           " packets but holds ", table.packet_sizes.size(), " entries"));
        }
    }

} // namespace cafogg
