#include <doctest/doctest.h>
#include <cafogg/crc32.hh>

#include "test_utils.hh"

using namespace cafogg;
using test_data::builder;
using test_data::bytes;

TEST_CASE("crc32 check value") {
    const bytes check = builder().text("123456789");
    CHECK(crc32(check) == 0xCBF43926u);
}

TEST_CASE("crc32 of empty input") {
    CHECK(crc32(nullptr, 0) == 0u);
}

TEST_CASE("crc32 incremental update matches one-shot") {
    const bytes data = builder().text("The quick brown fox jumps over the lazy dog");
    CHECK(crc32(data) == 0x414FA339u);

    std::uint32_t reg = crc32_initial;
    reg = crc32_update(reg, data.data(), 10);
    reg = crc32_update(reg, data.data() + 10, data.size() - 10);
    CHECK((reg ^ 0xFFFFFFFFu) == crc32(data));
}
