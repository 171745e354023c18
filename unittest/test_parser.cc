//
// Created by igor on 16/08/2025.
//

#include <doctest/doctest.h>
#include <string>
#include <vector>

#include <cafogg/caf_parser.hh>
#include <cafogg/ogg_parser.hh>
#include "test_utils.hh"

using namespace cafogg;
using test_data::builder;
using test_data::bytes;

namespace {
    bytes small_caf() {
        return builder()
            .append(test_data::caf_file_header(1, 0))
            .append(test_data::caf_chunk("desc", test_data::lpcm_desc_body()))
            .append(test_data::caf_chunk("free", builder().fill(4)))
            .append(test_data::caf_chunk("data", builder().be32(0).fill(8)));
    }

    bytes three_pages() {
        test_data::page_fields f;
        f.serial = 7;
        bytes out;
        for (std::uint32_t seq = 0; seq < 3; seq++) {
            f.sequence = seq;
            const bytes page = test_data::ogg_page(f, {builder().fill(3, seq)});
            out.insert(out.end(), page.begin(), page.end());
        }
        return out;
    }
}

TEST_CASE("handler registry dispatch") {
    SUBCASE("tag handlers run before catch-all handlers") {
        handler_registry handlers;
        std::vector<std::string> calls;

        handlers.on_any_chunk([&](const chunk_event& e) {
            calls.push_back("any:" + e.header.type.to_string());
        });
        handlers.on_chunk(caf_id::desc, [&](const chunk_event& e) {
            calls.push_back("desc1:" + std::to_string(std::get<audio_format>(e.record).bits_per_channel));
        });
        handlers.on_chunk(caf_id::desc, [&](const chunk_event&) {
            calls.push_back("desc2");
        });

        auto stream = test_data::make_stream(small_caf());
        auto header = parse(stream, handlers);

        CHECK(header.file_type == caf_id::caff);
        CHECK(calls == std::vector<std::string>{"desc1:16", "desc2", "any:desc", "any:free", "any:data"});
    }

    SUBCASE("events carry file header and kind") {
        handler_registry handlers;
        std::vector<caf_chunk_kind> kinds;
        std::uint16_t version = 0;

        handlers.on_any_chunk([&](const chunk_event& e) {
            kinds.push_back(e.kind);
            version = e.file_header.file_version;
        });

        auto stream = test_data::make_stream(small_caf());
        parse(stream, handlers);

        CHECK(version == 1);
        CHECK(kinds == std::vector<caf_chunk_kind>{caf_chunk_kind::audio_description,
                                                   caf_chunk_kind::unknown,
                                                   caf_chunk_kind::audio_data});
    }

    SUBCASE("empty registry") {
        handler_registry handlers;
        CHECK(handlers.empty());

        auto stream = test_data::make_stream(small_caf());
        CHECK_NOTHROW(parse(stream, handlers));

        handlers.on_chunk(caf_id::pakt, [](const chunk_event&) {});
        CHECK_FALSE(handlers.empty());
    }
}

TEST_CASE("for_each_chunk") {
    auto stream = test_data::make_stream(small_caf());

    int chunk_count = 0;
    std::int64_t total = 0;
    CHECK_NOTHROW(
        for_each_chunk(stream, [&](const caf_chunk_iterator::chunk_info& chunk) {
            chunk_count++;
            total += chunk.header.size;
        })
    );
    CHECK(chunk_count == 3);
    CHECK(total == 32 + 4 + 12);
}

TEST_CASE("for_each_page") {
    parse_options opts;
    opts.decode_opus_headers = false;

    SUBCASE("visits every page") {
        auto stream = test_data::make_stream(three_pages());
        std::vector<std::uint32_t> sequences;

        auto pages = for_each_page(stream, [&](const ogg_page_iterator::page_info& info) {
            sequences.push_back(info.page.header.page_sequence_number);
        }, opts);

        CHECK(pages == 3);
        CHECK(sequences == std::vector<std::uint32_t>{0, 1, 2});
    }

    SUBCASE("returning false stops the scan") {
        auto stream = test_data::make_stream(three_pages());
        std::vector<std::size_t> indices;

        auto pages = for_each_page(stream, [&](const ogg_page_iterator::page_info& info) {
            indices.push_back(info.page_index);
            return info.page.header.page_sequence_number != 1;
        }, opts);

        CHECK(pages == 2);
        CHECK(indices == std::vector<std::size_t>{0, 1});
    }
}
