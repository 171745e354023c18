/**
 * @file caf_parser.hh
 * @brief CAF stream parsing utilities
 * @author Igor
 * @date 15/08/2025
 */

#pragma once

#include <iosfwd>
#include <cafogg/handler_registry.hh>
#include <cafogg/caf_chunk_iterator.hh>
#include <cafogg/parse_options.hh>

namespace cafogg {

    /**
     * @brief Parse a CAF stream with handler registry and custom options
     *
     * Iterates through chunks in the stream and emits one event per chunk
     * to the registered handlers.
     *
     * @param stream Input stream containing CAF data
     * @param handlers Registry of event handlers to process chunks
     * @param options Parse options for controlling parsing behavior
     * @return The file header of the stream
     */
    inline caf_file_header parse(std::istream& stream, const handler_registry& handlers, const parse_options& options) {
        caf_chunk_iterator it(stream, options);

        while (it.has_next()) {
            const auto& chunk = it.current();
            handlers.emit(chunk_event(it.file_header(), chunk.header, chunk.kind, chunk.record));
            it.next();
        }
        return it.file_header();
    }

    /**
     * @brief Parse a CAF stream with handler registry, using default options
     */
    inline caf_file_header parse(std::istream& stream, const handler_registry& handlers) {
        return parse(stream, handlers, parse_options{});
    }

    /**
     * @brief Simple functional interface for iterating chunks with custom options
     *
     * @tparam Func Callable type accepting caf_chunk_iterator::chunk_info&
     * @param stream Input stream containing CAF data
     * @param func Function to call for each chunk
     * @param options Parse options for controlling parsing behavior
     */
    template<typename Func>
    void for_each_chunk(std::istream& stream, Func func, const parse_options& options) {
        caf_chunk_iterator it(stream, options);

        while (it.has_next()) {
            func(it.current());
            it.next();
        }
    }

    template<typename Func>
    void for_each_chunk(std::istream& stream, Func func) {
        for_each_chunk(stream, func, parse_options{});
    }

} // namespace cafogg
