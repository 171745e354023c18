#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <ios>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

// Byte builders for in-memory CAF and Ogg fixtures
namespace test_data {

    using bytes = std::vector<std::byte>;

    class builder {
        public:
            builder& u8(unsigned v) {
                m_data.push_back(std::byte(v & 0xFF));
                return *this;
            }

            builder& raw(std::initializer_list<unsigned> values) {
                for (auto v : values) {
                    u8(v);
                }
                return *this;
            }

            builder& append(const bytes& other) {
                m_data.insert(m_data.end(), other.begin(), other.end());
                return *this;
            }

            builder& text(const std::string& s) {
                for (char c : s) {
                    u8(static_cast<unsigned char>(c));
                }
                return *this;
            }

            builder& be16(std::uint16_t v) { return be(v, 2); }
            builder& be32(std::uint32_t v) { return be(v, 4); }
            builder& be64(std::uint64_t v) { return be(v, 8); }

            builder& f64be(double d) {
                std::uint64_t bits;
                std::memcpy(&bits, &d, sizeof(bits));
                return be64(bits);
            }

            builder& le16(std::uint16_t v) { return le(v, 2); }
            builder& le32(std::uint32_t v) { return le(v, 4); }
            builder& le64(std::uint64_t v) { return le(v, 8); }

            builder& fill(std::size_t n, unsigned v = 0) {
                for (std::size_t i = 0; i < n; i++) {
                    u8(v);
                }
                return *this;
            }

            [[nodiscard]] const bytes& data() const { return m_data; }
            [[nodiscard]] std::size_t size() const { return m_data.size(); }

            operator bytes() const { return m_data; }

        private:
            builder& be(std::uint64_t v, int n) {
                for (int i = n - 1; i >= 0; i--) {
                    u8(static_cast<unsigned>(v >> (8 * i)));
                }
                return *this;
            }

            builder& le(std::uint64_t v, int n) {
                for (int i = 0; i < n; i++) {
                    u8(static_cast<unsigned>(v >> (8 * i)));
                }
                return *this;
            }

            bytes m_data;
    };

    inline std::istringstream make_stream(const bytes& data) {
        return std::istringstream(std::string(reinterpret_cast<const char*>(data.data()), data.size()));
    }

    // ---- CAF ---------------------------------------------------------------

    inline bytes caf_file_header(std::uint16_t version = 1, std::uint16_t flags = 0) {
        return builder().text("caff").be16(version).be16(flags);
    }

    inline bytes caf_chunk(const char* type, std::int64_t size, const bytes& body = {}) {
        return builder().text(type).be64(static_cast<std::uint64_t>(size)).append(body);
    }

    inline bytes caf_chunk(const char* type, const bytes& body) {
        return caf_chunk(type, static_cast<std::int64_t>(body.size()), body);
    }

    // 44.1 kHz stereo 16-bit linear PCM
    inline bytes lpcm_desc_body() {
        return builder()
            .f64be(44100.0)
            .text("lpcm")
            .be32(0x0C)
            .be32(4)
            .be32(1)
            .be32(2)
            .be32(16);
    }

    inline bytes channel_description_body(std::uint32_t label, std::uint32_t flags,
                                          double x, double y, double z) {
        return builder().be32(label).be32(flags).f64be(x).f64be(y).f64be(z);
    }

    inline bytes packet_table_body(std::int64_t packets, std::int64_t frames,
                                   std::int32_t priming, std::int32_t remainder,
                                   const bytes& sizes) {
        return builder()
            .be64(static_cast<std::uint64_t>(packets))
            .be64(static_cast<std::uint64_t>(frames))
            .be32(static_cast<std::uint32_t>(priming))
            .be32(static_cast<std::uint32_t>(remainder))
            .append(sizes);
    }

    // ---- Ogg ---------------------------------------------------------------

    struct page_fields {
        std::uint8_t version = 0;
        std::uint8_t header_type = 0;
        std::uint64_t granule = 0;
        std::uint32_t serial = 0;
        std::uint32_t sequence = 0;
        std::uint32_t checksum = 0;
    };

    // Page with one segment per entry of 'segments'; each must be <= 255 bytes
    inline bytes ogg_page(const page_fields& f, const std::vector<bytes>& segments = {}) {
        builder b;
        b.text("OggS").u8(f.version).u8(f.header_type)
         .le64(f.granule).le32(f.serial).le32(f.sequence).le32(f.checksum)
         .u8(static_cast<unsigned>(segments.size()));
        for (const auto& s : segments) {
            b.u8(static_cast<unsigned>(s.size()));
        }
        for (const auto& s : segments) {
            b.append(s);
        }
        return b;
    }

    // Page CRC as defined for Ogg: polynomial 0x04C11DB7, unreflected,
    // zero initial value, over the whole page with the checksum field zeroed
    inline std::uint32_t ogg_page_crc(const bytes& page) {
        std::uint32_t crc = 0;
        for (std::size_t i = 0; i < page.size(); i++) {
            const std::uint32_t b = (i >= 22 && i < 26) ? 0u : std::to_integer<std::uint32_t>(page[i]);
            crc ^= b << 24;
            for (int k = 0; k < 8; k++) {
                crc = (crc & 0x80000000u) ? (crc << 1) ^ 0x04C11DB7u : (crc << 1);
            }
        }
        return crc;
    }

    inline bytes opus_head(std::uint8_t channels = 2, std::uint16_t pre_skip = 312,
                           std::uint32_t rate = 48000, std::uint16_t gain = 0,
                           std::uint8_t family = 0) {
        return builder().text("OpusHead").u8(1).u8(channels).le16(pre_skip).le32(rate).le16(gain).u8(family);
    }

    inline bytes opus_tags(const std::string& vendor, const std::vector<std::string>& comments) {
        std::uint32_t budget = 0;
        for (const auto& c : comments) {
            budget += static_cast<std::uint32_t>(c.size()) + 4;
        }

        builder b;
        b.text("OpusTags").le32(static_cast<std::uint32_t>(vendor.size())).text(vendor).le32(budget);
        for (const auto& c : comments) {
            b.le32(static_cast<std::uint32_t>(c.size())).text(c);
        }
        return b;
    }
}

// Stream buffer that passes reads through and records any seek request
class forward_only_streambuf : public std::streambuf {
    public:
        explicit forward_only_streambuf(std::streambuf* underlying)
            : m_underlying(underlying) {
            setg(nullptr, nullptr, nullptr);
        }

        [[nodiscard]] bool seek_attempted() const { return m_seek_attempted; }
        [[nodiscard]] std::streamoff bytes_delivered() const { return m_delivered; }

    protected:
        int_type underflow() override {
            if (gptr() < egptr()) {
                return traits_type::to_int_type(*gptr());
            }

            int_type ch = m_underlying->sbumpc();
            if (ch != traits_type::eof()) {
                m_buffer = traits_type::to_char_type(ch);
                setg(&m_buffer, &m_buffer, &m_buffer + 1);
                m_delivered++;
            }
            return ch;
        }

        std::streamsize xsgetn(char_type* s, std::streamsize count) override {
            std::streamsize done = 0;
            if (gptr() < egptr() && count > 0) {
                *s++ = *gptr();
                gbump(1);
                done = 1;
            }
            std::streamsize got = m_underlying->sgetn(s, count - done);
            m_delivered += got;
            return done + got;
        }

        pos_type seekoff(off_type, std::ios_base::seekdir, std::ios_base::openmode) override {
            m_seek_attempted = true;
            return pos_type(off_type(-1));
        }

        pos_type seekpos(pos_type, std::ios_base::openmode) override {
            m_seek_attempted = true;
            return pos_type(off_type(-1));
        }

    private:
        std::streambuf* m_underlying;
        std::streamoff m_delivered = 0;
        bool m_seek_attempted = false;
        char m_buffer = 0;
};
