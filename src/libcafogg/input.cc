//
// Created by igor on 12/08/2025.
//

#include <istream>
#include <algorithm>

#include "input.hh"

namespace cafogg {
    namespace {
        // Large bodies are pulled in blocks so that a bogus size on a short
        // stream fails before the whole size is allocated
        constexpr std::size_t read_block_size = 64 * 1024;
    }

    reader::reader(std::istream& is) : m_stream(is) {}

    std::size_t reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        if (m_stream.eof()) {
            return 0;
        }

        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state at offset ", m_position);

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed at offset ", m_position);
        m_position += bytes_read;
        return bytes_read;
    }

    std::vector<std::byte> reader::read_exact(std::size_t size, const char* what) {
        std::vector<std::byte> buffer;
        read_exact_into(buffer, size, what);
        return buffer;
    }

    void reader::read_exact_into(std::vector<std::byte>& out, std::size_t size, const char* what) {
        const std::uint64_t start = m_position;
        std::size_t done = 0;

        while (done < size) {
            const std::size_t chunk = std::min(size - done, read_block_size);
            const std::size_t old_size = out.size();
            out.resize(old_size + chunk);

            const std::size_t actual = read(out.data() + old_size, chunk);
            done += actual;

            if (actual != chunk) {
                out.resize(old_size + actual);
                THROW_EOS("Unexpected end of stream in ", what, " at offset ", start,
                          ": requested ", size, " bytes, got ", done);
            }
        }
    }

    bool reader::read_byte(std::byte& out) {
        char c;
        if (read(&c, 1) != 1) {
            return false;
        }
        out = static_cast<std::byte>(static_cast<unsigned char>(c));
        return true;
    }
}
