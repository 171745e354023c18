/**
 * @file ogg_page_iterator.hh
 * @brief Forward iterator over the pages of an Ogg stream
 * @author Igor
 * @date 16/08/2025
 */

#pragma once

#include <iosfwd>
#include <memory>
#include <optional>
#include <cafogg/ogg_types.hh>
#include <cafogg/opus_headers.hh>
#include <cafogg/parse_options.hh>
#include <cafogg/export_cafogg.h>

namespace cafogg {

    class reader;

    /**
     * @class ogg_page_iterator
     * @brief Single-pass page scanner with byte-level resynchronization
     *
     * Every page is located by scanning for the "OggS" capture pattern; any
     * bytes before it are skipped (reported through the warning handler).
     * The page header, lacing table and segments are then read in order.
     *
     * The stored checksum is compared with crc32() of the 26 header bytes
     * (capture pattern through the checksum field, as received). A mismatch
     * is reported in ogg_page::checksum_passed and does not stop iteration.
     *
     * There is no page limit; iteration ends when the stream ends between
     * pages. A stream ending inside a page raises unexpected_end_of_stream.
     */
    class CAFOGG_EXPORT ogg_page_iterator {
    public:
        /**
         * @enum state
         * @brief Scanner state; between pages the scanner is seeking
         */
        enum class state {
            seeking,          ///< Looking for the capture pattern
            reading_header,   ///< Reading version through checksum
            reading_lacing,   ///< Reading segment count and lacing table
            reading_segments, ///< Reading segment payloads
            done,             ///< Stream ended between pages
            error             ///< A fatal error ended the run
        };

        /**
         * @struct page_info
         * @brief Report for the page the iterator currently points at
         */
        struct page_info {
            ogg_page page;
            std::size_t page_index = 0;  ///< 0 for the first page found
            std::optional<opus_identification_header> identification; ///< Decoded from page 0
            std::optional<opus_comment_header> comments;               ///< Decoded from page 1
        };

        /**
         * @brief Start scanning a stream
         * @param stream Input stream; must outlive the iterator
         * @throws unexpected_end_of_stream if the first page is cut short
         * @throws invalid_magic_signature if Opus header decoding is enabled
         *         and the first page does not carry an Opus stream
         */
        explicit ogg_page_iterator(std::istream& stream);
        ogg_page_iterator(std::istream& stream, const parse_options& options);

        ~ogg_page_iterator();

        ogg_page_iterator(const ogg_page_iterator&) = delete;
        ogg_page_iterator& operator=(const ogg_page_iterator&) = delete;

        const page_info& current() const { return m_current; }
        page_info& current() { return m_current; }

        /**
         * @brief Advance to the next page
         */
        void next() {
            advance();
        }

        bool has_next() const { return !m_ended; }
        bool at_end() const { return m_ended; }

        [[nodiscard]] state current_state() const { return m_state; }

        /**
         * @brief Number of bytes consumed from the stream so far
         */
        [[nodiscard]] std::uint64_t bytes_consumed() const;

    private:
        void advance();

        // Read the next page; false on a clean end of stream
        bool read_next_page();

        void decode_codec_headers();

        std::unique_ptr<reader> m_reader;
        parse_options m_options;
        page_info m_current;
        std::size_t m_pages_read = 0;
        state m_state = state::seeking;
        bool m_ended = true;
    };

} // namespace cafogg
