//
// Created by igor on 10/08/2025.
//
#pragma once
#include <array>
#include <cstring>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>
#include <iomanip>
#include <stdexcept>

namespace cafogg {
    // Four character code, used for CAF file/chunk tags and audio format IDs
    struct fourcc {
        std::array<char, 4> b{' ', ' ', ' ', ' '};

        // Default constructor - creates "    " (four spaces)
        constexpr fourcc() = default;

        constexpr fourcc(char c0, char c1, char c2, char c3)
            : b{ c0, c1, c2, c3 } {}

        // Constructor from string_view with padding (runtime)
        explicit fourcc(std::string_view sv) : b{' ', ' ', ' ', ' '} {
            std::copy_n(sv.begin(), std::min(sv.size(), size_t(4)), b.begin());
        }

        fourcc(const char* str) : fourcc(std::string_view(str)) {}

        // Constructor from raw bytes (no padding)
        static fourcc from_bytes(const void* data) {
            fourcc result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        // Big-endian numeric value, as CAF stores format IDs ('lpcm' == 0x6C70636D)
        [[nodiscard]] std::uint32_t to_uint32_be() const {
            return (std::uint32_t(static_cast<unsigned char>(b[0])) << 24) |
                   (std::uint32_t(static_cast<unsigned char>(b[1])) << 16) |
                   (std::uint32_t(static_cast<unsigned char>(b[2])) << 8) |
                   std::uint32_t(static_cast<unsigned char>(b[3]));
        }

        [[nodiscard]] std::string to_string() const {
            return {b.data(), 4};
        }

        [[nodiscard]] std::string_view to_string_view() const {
            return {b.data(), 4};
        }

        constexpr char operator[](std::size_t i) const { return b[i]; }

        bool operator==(const fourcc& o) const { return b == o.b; }
        bool operator!=(const fourcc& o) const { return !(*this == o); }
        bool operator<(const fourcc& o) const { return b < o.b; }

        static constexpr bool is_printable_char(char c) { return c >= 32 && c <= 126; }

        // Check if contains only printable ASCII
        [[nodiscard]] bool is_printable() const {
            return std::all_of(b.begin(), b.end(), is_printable_char);
        }

        friend std::ostream& operator<<(std::ostream& os, const fourcc& f) {
            os << '\'';
            if (f.is_printable()) {
                os.write(f.b.data(), static_cast<std::streamsize>(f.b.size()));
                return os << '\'';
            }
            for (char c : f.b) {
                if (is_printable_char(c)) {
                    os << c;
                } else {
                    // Escape non-printable characters
                    auto flags = os.flags();
                    auto fill = os.fill();
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(static_cast<unsigned char>(c));
                    os.flags(flags);
                    os.fill(fill);
                }
            }
            os << '\'';
            return os;
        }
    };

    struct fourcc_hash {
        std::size_t operator()(const fourcc& f) const noexcept {
            return (static_cast<std::size_t>(f.to_uint32_be()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal for compile-time fourcc creation
    constexpr fourcc operator""_4cc(const char* str, std::size_t len) {
        if (len > 4) {
            throw std::invalid_argument("FourCC literal must be 4 characters or less");
        }
        return {
            len > 0 ? str[0] : ' ',
            len > 1 ? str[1] : ' ',
            len > 2 ? str[2] : ' ',
            len > 3 ? str[3] : ' '
        };
    }
}

namespace std {
    template<>
    struct hash<cafogg::fourcc> {
        std::size_t operator()(const cafogg::fourcc& f) const noexcept {
            return cafogg::fourcc_hash{}(f);
        }
    };
}
