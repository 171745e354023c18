//
// Test Opus identification and comment header decoding
//

#include <doctest/doctest.h>
#include <cafogg/opus_headers.hh>
#include <cafogg/exceptions.hh>
#include <string>
#include <vector>

#include "test_utils.hh"

using namespace cafogg;
using test_data::builder;
using test_data::bytes;

TEST_SUITE("Opus headers") {
    TEST_CASE("identification header") {
        SUBCASE("family 0 without mapping table") {
            auto head = decode_opus_identification_header(test_data::opus_head(2, 312, 48000, 0x0100, 0));
            CHECK(head.version == 1);
            CHECK(head.channel_count == 2);
            CHECK(head.pre_skip == 312);
            CHECK(head.input_sample_rate == 48000);
            CHECK(head.output_gain == 0x0100);
            CHECK(head.mapping_family == 0);
            CHECK_FALSE(head.channel_mapping.has_value());
        }

        SUBCASE("family 1 with mapping table") {
            const bytes packet = builder().append(test_data::opus_head(3, 0, 44100, 0, 1)).raw({2, 1, 0, 2, 1});
            auto head = decode_opus_identification_header(packet);

            REQUIRE(head.channel_mapping.has_value());
            CHECK(head.channel_mapping->stream_count == 2);
            CHECK(head.channel_mapping->coupled_count == 1);
            CHECK(head.channel_mapping->mapping == std::vector<std::uint8_t>{0, 2, 1});
        }

        SUBCASE("mapping table shorter than channel count") {
            const bytes packet = builder().append(test_data::opus_head(3, 0, 44100, 0, 1)).raw({2, 1, 0, 2});
            CHECK_THROWS_AS(decode_opus_identification_header(packet), truncated_record);
        }

        SUBCASE("wrong magic") {
            bytes packet = test_data::opus_head();
            packet[4] = std::byte('T');
            CHECK_THROWS_AS(decode_opus_identification_header(packet), invalid_magic_signature);

            const bytes tags = test_data::opus_tags("v", {});
            CHECK_THROWS_AS(decode_opus_identification_header(tags), invalid_magic_signature);
        }

        SUBCASE("shorter than the fixed fields") {
            const bytes packet = builder().text("OpusHead").raw({1, 2, 0x38, 0x01});
            CHECK_THROWS_AS(decode_opus_identification_header(packet), truncated_record);
        }

        SUBCASE("shorter than the magic") {
            const bytes packet = builder().text("Opus");
            CHECK_THROWS_AS(decode_opus_identification_header(packet), invalid_magic_signature);
        }
    }

    TEST_CASE("comment header") {
        SUBCASE("vendor only") {
            const bytes packet = test_data::opus_tags("hello", {});
            auto tags = decode_opus_comment_header(packet);
            CHECK(tags.vendor == "hello");
            CHECK(tags.comments.empty());
            CHECK(tags.bytes_consumed == 21);
        }

        SUBCASE("vendor and comments") {
            const bytes packet = test_data::opus_tags("libopus 1.4", {"TITLE=Song", "ARTIST=Band", "EMPTY="});
            auto tags = decode_opus_comment_header(packet);
            CHECK(tags.vendor == "libopus 1.4");
            CHECK(tags.comments == std::vector<std::string>{"TITLE=Song", "ARTIST=Band", "EMPTY="});
            CHECK(tags.bytes_consumed == packet.size());
        }

        SUBCASE("trailing bytes past the comment list are not interpreted") {
            const bytes packet = builder().append(test_data::opus_tags("v", {"A=1"})).fill(6, 0x01);
            auto tags = decode_opus_comment_header(packet);
            CHECK(tags.comments.size() == 1);
            CHECK(tags.bytes_consumed == packet.size() - 6);
        }

        SUBCASE("entry crossing the budget is still read") {
            // Budget of 5 bytes, first entry takes 4 + 7
            const bytes packet = builder()
                .text("OpusTags").le32(1).text("v").le32(5)
                .le32(7).text("TITLE=x")
                .le32(3).text("B=2");
            auto tags = decode_opus_comment_header(packet);
            CHECK(tags.comments == std::vector<std::string>{"TITLE=x"});
            CHECK(tags.bytes_consumed == 8 + 4 + 1 + 4 + 4 + 7);
        }

        SUBCASE("length pointing past the payload") {
            const bytes packet = builder().text("OpusTags").le32(100).text("short");
            CHECK_THROWS_AS(decode_opus_comment_header(packet), truncated_record);

            const bytes list = builder().text("OpusTags").le32(0).le32(20).le32(16).text("X=1");
            CHECK_THROWS_AS(decode_opus_comment_header(list), truncated_record);
        }

        SUBCASE("wrong magic") {
            const bytes packet = builder().text("OpusTagz").le32(0).le32(0);
            CHECK_THROWS_AS(decode_opus_comment_header(packet), invalid_magic_signature);
        }

        SUBCASE("invalid UTF-8") {
            const bytes packet = builder()
                .text("OpusTags").le32(3).raw({'v', 0xFF, 'x'})
                .le32(4).le32(0);

            auto tags = decode_opus_comment_header(packet);
            CHECK(tags.vendor == "v\xEF\xBF\xBDx");
            CHECK(tags.comments == std::vector<std::string>{""});

            parse_options strict;
            strict.text = utf8_mode::strict;
            CHECK_THROWS_AS(decode_opus_comment_header(packet, strict), malformed_field);
        }
    }
}
