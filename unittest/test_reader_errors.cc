//
// Test error conditions in the forward-only reader
//

#include <doctest/doctest.h>
#include <cafogg/caf_chunk_iterator.hh>
#include <cafogg/exceptions.hh>
#include <algorithm>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "input.hh"
#include "test_utils.hh"

using namespace cafogg;
using test_data::builder;
using test_data::bytes;

// Custom stream buffer that simulates an I/O error after some bytes
class failing_streambuf : public std::streambuf {
public:
    failing_streambuf(const bytes& data, std::size_t fail_after)
        : m_data(data)
        , m_fail_after(fail_after) {
        setg(nullptr, nullptr, nullptr);
    }

protected:
    int_type underflow() override {
        throw std::runtime_error("device error");
    }

    std::streamsize xsgetn(char_type* s, std::streamsize count) override {
        if (m_pos >= m_fail_after) {
            throw std::runtime_error("device error");
        }
        const std::size_t n = std::min({static_cast<std::size_t>(count), m_fail_after - m_pos, m_data.size() - m_pos});
        std::memcpy(s, m_data.data() + m_pos, n);
        m_pos += n;
        return static_cast<std::streamsize>(n);
    }

private:
    bytes m_data;
    std::size_t m_fail_after;
    std::size_t m_pos = 0;
};

TEST_CASE("reader") {
    SUBCASE("counts consumed bytes") {
        auto stream = test_data::make_stream(builder().raw({1, 2, 3, 4, 5}));
        reader rd(stream);

        auto first = rd.read_exact(2, "test prefix");
        CHECK(first == bytes{std::byte(1), std::byte(2)});
        CHECK(rd.position() == 2);

        std::byte b;
        REQUIRE(rd.read_byte(b));
        CHECK(b == std::byte(3));
        CHECK(rd.position() == 3);

        std::vector<std::byte> out = {std::byte(9)};
        rd.read_exact_into(out, 2, "test tail");
        CHECK(out.size() == 3);
        CHECK(out.back() == std::byte(5));

        CHECK_FALSE(rd.read_byte(b));
        CHECK(rd.position() == 5);
    }

    SUBCASE("short read raises unexpected_end_of_stream") {
        auto stream = test_data::make_stream(builder().raw({1, 2, 3}));
        reader rd(stream);
        CHECK_THROWS_AS(rd.read_exact(4, "record"), unexpected_end_of_stream);
        CHECK(rd.position() == 3);
    }

    SUBCASE("zero-length read") {
        std::istringstream stream;
        reader rd(stream);
        CHECK(rd.read_exact(0, "nothing").empty());
    }

    SUBCASE("null buffer") {
        auto stream = test_data::make_stream(builder().raw({1}));
        reader rd(stream);
        CHECK_THROWS_AS(rd.read(nullptr, 1), io_error);
    }

    SUBCASE("stream already failed") {
        auto stream = test_data::make_stream(builder().raw({1, 2}));
        stream.setstate(std::ios::failbit);
        reader rd(stream);
        CHECK_THROWS_AS(rd.read_exact(1, "record"), io_error);
    }
}

TEST_CASE("Device errors surface as io_error") {
    const bytes data = builder()
        .append(test_data::caf_file_header())
        .append(test_data::caf_chunk("desc", test_data::lpcm_desc_body()));

    failing_streambuf buf(data, 20);
    std::istream stream(&buf);

    try {
        caf_chunk_iterator it(stream);
        FAIL("Should have thrown exception");
    } catch (const unexpected_end_of_stream&) {
        FAIL("Device error reported as end of stream");
    } catch (const io_error& e) {
        CHECK(e.kind() == error_kind::io);
    }
}
