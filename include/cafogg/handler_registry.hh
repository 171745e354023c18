/**
 * @file handler_registry.hh
 * @brief Event handler registry for CAF chunk processing
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <functional>
#include <unordered_map>
#include <vector>
#include <cafogg/export_cafogg.h>
#include <cafogg/fourcc.hh>
#include <cafogg/caf_types.hh>

namespace cafogg {

    /**
     * @struct chunk_event
     * @brief Event data passed to chunk handlers
     *
     * Contains the file header, the chunk header and the decoded record.
     * The references are only valid for the duration of the handler call.
     */
    struct chunk_event {
        const caf_file_header& file_header; ///< Header of the file being parsed
        const caf_chunk_header& header;     ///< Chunk header information
        caf_chunk_kind kind;                ///< Kind the chunk was dispatched as
        const caf_record& record;           ///< Decoded chunk body

        chunk_event() = delete;

        chunk_event(const caf_file_header& fh,
                    const caf_chunk_header& h,
                    caf_chunk_kind k,
                    const caf_record& r)
            : file_header(fh), header(h), kind(k), record(r) {}
    };

    /**
     * @typedef chunk_handler
     * @brief Function type for chunk event handlers
     */
    using chunk_handler = std::function<void(const chunk_event& event)>;

    /**
     * @class handler_registry
     * @brief Registry for chunk event handlers with precedence rules
     *
     * Supports two levels of handler specificity:
     * 1. Chunk-tag specific handlers (called first)
     * 2. Catch-all handlers (called for every chunk)
     *
     * Multiple handlers can be registered for the same chunk tag.
     */
    class CAFOGG_EXPORT handler_registry {
    public:
        /**
         * @brief Register handler for a chunk tag
         * @param chunk_id Chunk tag to handle
         * @param handler Handler function to call
         */
        void on_chunk(fourcc chunk_id, chunk_handler handler);

        /**
         * @brief Register handler called for every chunk
         * @param handler Handler function to call
         */
        void on_any_chunk(chunk_handler handler);

        /**
         * @brief Emit an event to all matching handlers
         * @param event Event to emit
         *
         * Handlers are called in precedence order: tag-specific first,
         * then catch-all, each group in registration order.
         */
        void emit(const chunk_event& event) const;

        [[nodiscard]] bool empty() const;

    private:
        std::unordered_map<fourcc, std::vector<chunk_handler>> m_chunk_handlers;
        std::vector<chunk_handler> m_any_handlers;
    };

} // namespace cafogg
