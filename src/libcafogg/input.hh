//
// Created by igor on 12/08/2025.
//

#pragma once

#include <iosfwd>
#include <cstdint>
#include <cstddef>
#include <vector>

#include <cafogg/exceptions.hh>

namespace cafogg {

    // Forward-only reader over an input stream.
    // Never seeks; keeps its own count of consumed bytes so that
    // non-seekable streams (pipes, sockets) work the same as files.
    class reader {
        public:
            explicit reader(std::istream& is);

            reader(const reader&) = delete;
            reader& operator = (const reader&) = delete;

            // Read up to size bytes, returns the number actually read.
            // Throws io_error if the stream reports a hard failure.
            std::size_t read(void* dst, std::size_t size);

            // Read exactly size bytes or throw unexpected_end_of_stream.
            // 'what' names the structure being read for the error message.
            std::vector<std::byte> read_exact(std::size_t size, const char* what);

            // Append exactly size bytes to out or throw unexpected_end_of_stream
            void read_exact_into(std::vector<std::byte>& out, std::size_t size, const char* what);

            // Read a single byte; returns false on clean end of stream
            bool read_byte(std::byte& out);

            // Number of bytes consumed since construction
            [[nodiscard]] std::uint64_t position() const { return m_position; }

        private:
            std::istream& m_stream;
            std::uint64_t m_position = 0;
    };
}
