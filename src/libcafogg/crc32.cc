//
// Created by igor on 15/08/2025.
//

#include <cafogg/crc32.hh>
#include <array>

namespace cafogg {

    namespace {
        constexpr std::uint32_t reflected_polynomial = 0xEDB88320u;

        constexpr std::array<std::uint32_t, 256> make_crc_table() {
            std::array<std::uint32_t, 256> table{};
            for (std::uint32_t n = 0; n < 256; n++) {
                std::uint32_t c = n;
                for (int k = 0; k < 8; k++) {
                    c = (c & 1) ? (reflected_polynomial ^ (c >> 1)) : (c >> 1);
                }
                table[n] = c;
            }
            return table;
        }

        constexpr auto crc_table = make_crc_table();
    }

    std::uint32_t crc32_update(std::uint32_t reg, const std::byte* data, std::size_t size) {
        for (std::size_t i = 0; i < size; i++) {
            reg = (reg >> 8) ^ crc_table[(reg ^ std::to_integer<std::uint32_t>(data[i])) & 0xFF];
        }
        return reg;
    }

    std::uint32_t crc32(const std::byte* data, std::size_t size) {
        return crc32_update(crc32_initial, data, size) ^ 0xFFFFFFFFu;
    }
}
