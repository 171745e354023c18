/**
 * @file ogg_inspector.cpp
 * @brief Example Ogg/Opus page inspector using cafogg
 *
 * Scans an Ogg stream page by page, printing each page header together
 * with the Opus identification and comment headers found on the first
 * two pages. Scanning stops after the page whose sequence number equals
 * the optional second argument (3 by default).
 */

#include <cafogg/ogg_parser.hh>
#include <iostream>
#include <fstream>
#include <iomanip>
#include <string>

namespace {

    void print_identification(const cafogg::opus_identification_header& head) {
        std::cout << "  OpusHead: version " << unsigned(head.version)
                  << ", channels " << unsigned(head.channel_count)
                  << ", pre-skip " << head.pre_skip
                  << ", input rate " << head.input_sample_rate << " Hz"
                  << ", gain " << head.output_gain
                  << ", mapping family " << unsigned(head.mapping_family) << "\n";
        if (head.channel_mapping) {
            std::cout << "    streams " << unsigned(head.channel_mapping->stream_count)
                      << ", coupled " << unsigned(head.channel_mapping->coupled_count) << ", map";
            for (auto m : head.channel_mapping->mapping) {
                std::cout << " " << unsigned(m);
            }
            std::cout << "\n";
        }
    }

    void print_comments(const cafogg::opus_comment_header& tags) {
        std::cout << "  OpusTags: vendor \"" << tags.vendor << "\"\n";
        for (const auto& c : tags.comments) {
            std::cout << "    " << c << "\n";
        }
    }

}

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        std::cout << "Usage: " << argv[0] << " <file.ogg> [max-sequence]\n";
        std::cout << "\n";
        std::cout << "Lists the pages of an Ogg stream and decodes Opus headers.\n";
        return 1;
    }

    std::uint32_t max_sequence = 3;
    if (argc == 3) {
        try {
            max_sequence = static_cast<std::uint32_t>(std::stoul(argv[2]));
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid sequence number '" << argv[2] << "'\n";
            return 1;
        }
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

    std::cout << "Scanning: " << argv[1] << "\n";
    std::cout << "====================\n";

    try {
        const auto pages = cafogg::for_each_page(file, [max_sequence](const cafogg::ogg_page_iterator::page_info& info) {
            const auto& page = info.page;
            const auto& h = page.header;

            std::cout << "\nPage " << h.page_sequence_number << " at offset " << page.file_offset
                      << " (" << page.page_size << " bytes)\n";
            std::cout << "  Version " << unsigned(h.structure_version)
                      << ", type 0x" << std::hex << unsigned(h.header_type) << std::dec
                      << (h.is_fresh_packet ? " fresh" : " continued")
                      << (h.is_beginning_of_stream ? " bos" : "")
                      << (h.is_end_of_stream ? " eos" : "") << "\n";
            std::cout << "  Granule " << h.granule_position << ", serial " << h.stream_serial_number << "\n";
            std::cout << "  Checksum 0x" << std::hex << std::setw(8) << std::setfill('0') << h.page_checksum
                      << " computed 0x" << std::setw(8) << page.computed_checksum
                      << std::dec << std::setfill(' ')
                      << (page.checksum_passed ? " (match)" : " (mismatch)") << "\n";
            std::cout << "  Segments " << unsigned(page.page_segments) << ", body " << page.body_size() << " bytes\n";

            if (info.identification) {
                print_identification(*info.identification);
            }
            if (info.comments) {
                print_comments(*info.comments);
            }

            return h.page_sequence_number != max_sequence;
        }, options);

        std::cout << "\n" << pages << " page(s) scanned\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
