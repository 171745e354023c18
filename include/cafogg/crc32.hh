//
// Created by igor on 15/08/2025.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include <cafogg/export_cafogg.h>

namespace cafogg {
    // CRC-32 as used by zlib/Ethernet: reflected polynomial 0xEDB88320
    // (0x04C11DB7 bit-reversed), initial value 0xFFFFFFFF, final value inverted.
    // crc32("123456789") == 0xCBF43926

    inline constexpr std::uint32_t crc32_initial = 0xFFFFFFFFu;

    // Feed more bytes into a running (non-inverted) register value
    CAFOGG_EXPORT std::uint32_t crc32_update(std::uint32_t reg, const std::byte* data, std::size_t size);

    CAFOGG_EXPORT std::uint32_t crc32(const std::byte* data, std::size_t size);

    inline std::uint32_t crc32(const std::vector<std::byte>& data) {
        return crc32(data.data(), data.size());
    }
}
