/**
 * @file caf_chunk_iterator.hh
 * @brief Forward iterator over the chunks of a CAF stream
 * @author Igor
 * @date 15/08/2025
 */

#pragma once

#include <iosfwd>
#include <memory>
#include <cafogg/caf_types.hh>
#include <cafogg/parse_options.hh>
#include <cafogg/export_cafogg.h>

namespace cafogg {

    class reader;

    /**
     * @class caf_chunk_iterator
     * @brief Single-pass traversal of a CAF stream
     *
     * The constructor reads the 8-byte file header and the first chunk.
     * Each call to next() reads one more 12-byte chunk header and its body,
     * decodes the body and makes it available through current().
     *
     * Traversal ends when a chunk header declares size 0 or -1 (nothing
     * after that header is read) or when the stream ends exactly at a chunk
     * boundary. A stream ending anywhere else raises unexpected_end_of_stream.
     */
    class CAFOGG_EXPORT caf_chunk_iterator {
    public:
        /**
         * @enum state
         * @brief Traversal state
         */
        enum class state {
            reading_header, ///< File header not yet consumed
            reading_chunk,  ///< Positioned before a chunk header
            terminal        ///< Traversal finished (sentinel, end of stream or error)
        };

        /**
         * @struct chunk_info
         * @brief The chunk the iterator currently points at
         */
        struct chunk_info {
            caf_chunk_header header;   ///< Header of the chunk
            caf_chunk_kind kind = caf_chunk_kind::unknown;
            caf_record record;         ///< Decoded body
        };

        /**
         * @brief Start traversal of a stream
         * @param stream Input positioned at the 'caff' file header; must outlive the iterator
         * @throws invalid_magic_signature if the stream does not start with 'caff'
         * @throws unexpected_end_of_stream if the header or first chunk is cut short
         */
        explicit caf_chunk_iterator(std::istream& stream);
        caf_chunk_iterator(std::istream& stream, const parse_options& options);

        ~caf_chunk_iterator();

        caf_chunk_iterator(const caf_chunk_iterator&) = delete;
        caf_chunk_iterator& operator=(const caf_chunk_iterator&) = delete;

        [[nodiscard]] const caf_file_header& file_header() const { return m_file_header; }

        const chunk_info& current() const { return m_current; }
        chunk_info& current() { return m_current; }

        /**
         * @brief Advance to the next chunk
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
        void read_file_header();

        // Read the next chunk; false when traversal has finished
        bool read_next_chunk();

        void check_packet_table(const caf_chunk_header& header, const packet_table& table, bool incomplete_tail) const;

        std::unique_ptr<reader> m_reader;
        parse_options m_options;
        caf_file_header m_file_header;
        chunk_info m_current;
        state m_state = state::reading_header;
        bool m_ended = true;
    };

} // namespace cafogg
