/**
 * @file byte_order.hh
 * @brief Byte order (endianness) utilities for CAF and Ogg fields
 * @author Igor
 * @date 12/08/2025
 */

#pragma once

#include <cstring>
#include <cafogg/endian.hh>

namespace cafogg {
    /**
     * @enum byte_order
     * @brief Byte order (endianness) of a multi-byte field
     */
    enum class byte_order {
        little, ///< Little-endian (used by Ogg and Opus headers)
        big     ///< Big-endian (used by CAF)
    };

    /**
     * @brief Check if given byte order matches the native system byte order
     * @param bo Byte order to check
     * @return True if the byte order matches the system's native byte order
     */
    inline bool byte_order_native(byte_order bo) {
        switch (bo) {
            case byte_order::little:
                return is_little_endian;
            case byte_order::big:
                return is_big_endian;
        }
        // make compiler happy
        return false;
    }

    /**
     * @brief Load a fixed-width value stored in the given byte order
     * @tparam T Integral type or double
     * @param src Pointer to at least sizeof(T) bytes
     * @param bo Byte order of the stored value
     * @return Value converted to native byte order
     */
    template<typename T>
    T load(const void* src, byte_order bo) {
        T value;
        std::memcpy(&value, src, sizeof(T));
        if constexpr (sizeof(T) > 1) {
            if (!byte_order_native(bo)) {
                value = swap_byte_order(value);
            }
        }
        return value;
    }
}
