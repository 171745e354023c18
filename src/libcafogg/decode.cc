//
// Created by igor on 15/08/2025.
//

#include <cafogg/decode.hh>
#include <cafogg/byte_order.hh>
#include <cafogg/exceptions.hh>

namespace cafogg {

    namespace {
        template<typename T>
        T load_fixed(const std::byte* data, std::size_t size, byte_order bo, const char* what) {
            THROW_FIELD_LENGTH_IF(size != sizeof(T), "Invalid field length for ", what,
                                  ": expected ", sizeof(T), " bytes, got ", size);
            return load<T>(data, bo);
        }

        // Scan one UTF-8 sequence starting at p.
        // Returns the number of bytes that belong to it; 'valid' tells whether
        // they form a complete, well-formed code point. On failure the count is
        // the maximal valid prefix (at least 1), which is what a lossy decoder
        // replaces with a single U+FFFD.
        std::size_t scan_utf8(const unsigned char* p, std::size_t n, bool& valid) {
            const unsigned char lead = p[0];
            valid = false;

            if (lead < 0x80) {
                valid = true;
                return 1;
            }

            std::size_t need;
            unsigned char lo = 0x80;
            unsigned char hi = 0xBF;

            if (lead >= 0xC2 && lead <= 0xDF) {
                need = 1;
            } else if (lead >= 0xE0 && lead <= 0xEF) {
                need = 2;
                if (lead == 0xE0) lo = 0xA0;
                if (lead == 0xED) hi = 0x9F;
            } else if (lead >= 0xF0 && lead <= 0xF4) {
                need = 3;
                if (lead == 0xF0) lo = 0x90;
                if (lead == 0xF4) hi = 0x8F;
            } else {
                return 1;
            }

            std::size_t i = 1;
            for (; i <= need; i++) {
                if (i >= n) {
                    return i;
                }
                const unsigned char c = p[i];
                if (c < lo || c > hi) {
                    return i;
                }
                lo = 0x80;
                hi = 0xBF;
            }
            valid = true;
            return i;
        }
    }

    std::uint64_t decode_unsigned_be(const std::byte* data, std::size_t size) {
        THROW_MALFORMED_IF(size == 0 || size > 8,
                           "Unsigned big-endian field of ", size, " bytes does not fit in 1..8 bytes");

        std::uint64_t result = 0;
        for (std::size_t i = 0; i < size; i++) {
            result = (result << 8) | std::to_integer<std::uint64_t>(data[i]);
        }
        return result;
    }

    std::uint16_t decode_uint16_be(const std::byte* data, std::size_t size) {
        return load_fixed<std::uint16_t>(data, size, byte_order::big, "uint16be");
    }

    std::uint32_t decode_uint32_be(const std::byte* data, std::size_t size) {
        return load_fixed<std::uint32_t>(data, size, byte_order::big, "uint32be");
    }

    std::int32_t decode_int32_be(const std::byte* data, std::size_t size) {
        return load_fixed<std::int32_t>(data, size, byte_order::big, "int32be");
    }

    std::int64_t decode_int64_be(const std::byte* data, std::size_t size) {
        return load_fixed<std::int64_t>(data, size, byte_order::big, "int64be");
    }

    double decode_float64_be(const std::byte* data, std::size_t size) {
        return load_fixed<double>(data, size, byte_order::big, "float64be");
    }

    std::uint16_t decode_uint16_le(const std::byte* data, std::size_t size) {
        return load_fixed<std::uint16_t>(data, size, byte_order::little, "uint16le");
    }

    std::uint32_t decode_uint32_le(const std::byte* data, std::size_t size) {
        return load_fixed<std::uint32_t>(data, size, byte_order::little, "uint32le");
    }

    std::uint64_t decode_uint64_le(const std::byte* data, std::size_t size) {
        return load_fixed<std::uint64_t>(data, size, byte_order::little, "uint64le");
    }

    bool is_valid_utf8(const std::byte* data, std::size_t size) {
        const auto* p = reinterpret_cast<const unsigned char*>(data);
        std::size_t pos = 0;
        while (pos < size) {
            bool valid;
            pos += scan_utf8(p + pos, size - pos, valid);
            if (!valid) {
                return false;
            }
        }
        return true;
    }

    std::string decode_text(const std::byte* data, std::size_t size, utf8_mode mode) {
        static constexpr char replacement[] = "\xEF\xBF\xBD";

        const auto* p = reinterpret_cast<const unsigned char*>(data);
        std::string result;
        result.reserve(size);

        std::size_t pos = 0;
        while (pos < size) {
            bool valid;
            std::size_t len = scan_utf8(p + pos, size - pos, valid);
            if (valid) {
                result.append(reinterpret_cast<const char*>(p + pos), len);
            } else {
                THROW_MALFORMED_IF(mode == utf8_mode::strict,
                                   "Invalid UTF-8 sequence at byte ", pos, " of ", size);
                result.append(replacement, 3);
            }
            pos += len;
        }
        return result;
    }

    std::vector<std::uint64_t> decode_packet_sizes(const std::byte* data, std::size_t size,
                                                   bool* incomplete_tail) {
        std::vector<std::uint64_t> values;
        std::uint64_t current = 0;
        bool pending = false;
        bool overflowed = false;

        for (std::size_t i = 0; i < size; i++) {
            const auto byte = std::to_integer<std::uint8_t>(data[i]);
            if (current > (UINT64_MAX >> 7)) {
                overflowed = true;
            }

            current = (current << 7) | (byte & 0x7F);
            pending = true;

            if ((byte & 0x80) == 0) {
                THROW_MALFORMED_IF(overflowed,
                                   "Variable-length integer ending at byte ", i, " exceeds 64 bits");
                values.push_back(current);
                current = 0;
                pending = false;
            }
        }

        if (incomplete_tail) {
            *incomplete_tail = pending;
        }
        return values;
    }

} // namespace cafogg
