/**
 * @file caf_inspector.cpp
 * @brief Example CAF file inspector using cafogg
 *
 * Prints the file header and every chunk of a Core Audio Format file,
 * together with the decoded audio description, channel layout, packet
 * table and audio data summary.
 */

#include <cafogg/caf_parser.hh>
#include <cafogg/handler_registry.hh>
#include <iostream>
#include <fstream>
#include <algorithm>
#include <variant>

namespace {

    void print_chunk_header(const cafogg::chunk_event& event) {
        std::cout << "\nChunk " << event.header.type << " at offset " << event.header.file_offset
                  << " (" << event.header.size << " bytes)\n";
    }

    void print_audio_format(const cafogg::audio_format& fmt) {
        std::cout << "  Sample rate:        " << fmt.sample_rate << " Hz\n";
        std::cout << "  Format:             " << fmt.format_id << "\n";
        std::cout << "  Format flags:       0x" << std::hex << fmt.format_flags << std::dec << "\n";
        std::cout << "  Bytes per packet:   " << fmt.bytes_per_packet << "\n";
        std::cout << "  Frames per packet:  " << fmt.frames_per_packet << "\n";
        std::cout << "  Channels per frame: " << fmt.channels_per_frame << "\n";
        std::cout << "  Bits per channel:   " << fmt.bits_per_channel << "\n";
    }

    void print_channel_layout(const cafogg::channel_layout& layout) {
        std::cout << "  Layout tag:   " << layout.channel_layout_tag << "\n";
        std::cout << "  Bitmap:       0x" << std::hex << layout.channel_bitmap << std::dec << "\n";
        std::cout << "  Descriptions: " << layout.description_count << "\n";
        for (const auto& d : layout.descriptions) {
            std::cout << "    label " << d.channel_label << ", flags " << d.channel_flags
                      << ", coordinates (" << d.coordinates[0] << ", " << d.coordinates[1]
                      << ", " << d.coordinates[2] << ")\n";
        }
    }

    void print_packet_table(const cafogg::packet_table& table) {
        std::cout << "  Packets:         " << table.header.number_packets << "\n";
        std::cout << "  Valid frames:    " << table.header.number_valid_frames << "\n";
        std::cout << "  Priming frames:  " << table.header.priming_frames << "\n";
        std::cout << "  Remainder:       " << table.header.remainder_frames << "\n";

        const std::size_t shown = std::min<std::size_t>(table.packet_sizes.size(), 8);
        std::cout << "  First sizes:    ";
        for (std::size_t i = 0; i < shown; i++) {
            std::cout << " " << table.packet_sizes[i];
        }
        if (shown < table.packet_sizes.size()) {
            std::cout << " ...";
        }
        std::cout << "\n";
    }

}

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <file.caf>\n";
        std::cout << "\n";
        std::cout << "Lists the chunks of a Core Audio Format file.\n";
        return 1;
    }

    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
        return 1;
    }

    cafogg::parse_options options;
    options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
    };

    cafogg::handler_registry handlers;

    handlers.on_chunk(cafogg::caf_id::desc, [](const cafogg::chunk_event& event) {
        print_chunk_header(event);
        print_audio_format(std::get<cafogg::audio_format>(event.record));
    });

    handlers.on_chunk(cafogg::caf_id::chan, [](const cafogg::chunk_event& event) {
        print_chunk_header(event);
        print_channel_layout(std::get<cafogg::channel_layout>(event.record));
    });

    handlers.on_chunk(cafogg::caf_id::pakt, [](const cafogg::chunk_event& event) {
        print_chunk_header(event);
        print_packet_table(std::get<cafogg::packet_table>(event.record));
    });

    handlers.on_chunk(cafogg::caf_id::data, [](const cafogg::chunk_event& event) {
        print_chunk_header(event);
        const auto& block = std::get<cafogg::data_block>(event.record);
        std::cout << "  Edit count: " << block.edit_count << "\n";
        std::cout << "  Payload:    " << block.payload.size() << " bytes\n";
    });

    handlers.on_any_chunk([](const cafogg::chunk_event& event) {
        if (event.kind == cafogg::caf_chunk_kind::unknown) {
            print_chunk_header(event);
            std::cout << "  Opaque:     " << std::get<cafogg::unknown_chunk>(event.record).payload.size()
                      << " bytes\n";
        }
    });

    std::cout << "Parsing: " << argv[1] << "\n";
    std::cout << "====================\n";

    try {
        const auto header = cafogg::parse(file, handlers, options);
        std::cout << "\nFile type " << header.file_type << ", version " << header.file_version
                  << ", flags " << header.file_flags << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
