//
// Created by igor on 15/08/2025.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <cafogg/exceptions.hh>

namespace cafogg {

    // Bounded view over a record's bytes.
    // A take() past the end raises truncated_record, so a decoder working
    // through a cursor can never read beyond the record it was handed.
    class byte_cursor {
        public:
            byte_cursor(const std::byte* data, std::size_t size, const char* record)
                : m_data(data), m_size(size), m_record(record) {}

            explicit byte_cursor(const std::vector<std::byte>& v, const char* record)
                : byte_cursor(v.data(), v.size(), record) {}

            const std::byte* take(std::size_t n) {
                THROW_TRUNCATED_IF(n > remaining(), "Truncated ", m_record, ": need ", n,
                                   " bytes at offset ", m_position, ", only ", remaining(), " available");
                const std::byte* p = m_data + m_position;
                m_position += n;
                return p;
            }

            std::uint8_t take_u8() {
                return std::to_integer<std::uint8_t>(*take(1));
            }

            [[nodiscard]] const std::byte* data() const { return m_data + m_position; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }
            [[nodiscard]] std::size_t position() const { return m_position; }

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position = 0;
            const char* m_record;
    };
}
