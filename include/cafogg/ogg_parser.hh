/**
 * @file ogg_parser.hh
 * @brief Ogg stream parsing utilities
 * @author Igor
 * @date 16/08/2025
 */

#pragma once

#include <iosfwd>
#include <type_traits>
#include <cafogg/ogg_page_iterator.hh>
#include <cafogg/parse_options.hh>

namespace cafogg {

    /**
     * @brief Call a function for each page of an Ogg stream
     *
     * If the callable returns bool, returning false stops the scan before
     * the next page is read. Any other return type is ignored.
     *
     * @tparam Func Callable accepting ogg_page_iterator::page_info&
     * @param stream Input stream containing Ogg data
     * @param func Function to call for each page
     * @param options Parse options for controlling parsing behavior
     * @return Number of pages passed to func
     */
    template<typename Func>
    std::size_t for_each_page(std::istream& stream, Func func, const parse_options& options) {
        ogg_page_iterator it(stream, options);
        std::size_t pages = 0;

        while (it.has_next()) {
            pages++;
            if constexpr (std::is_same_v<std::invoke_result_t<Func&, ogg_page_iterator::page_info&>, bool>) {
                if (!func(it.current())) {
                    break;
                }
            } else {
                func(it.current());
            }
            it.next();
        }
        return pages;
    }

    template<typename Func>
    std::size_t for_each_page(std::istream& stream, Func func) {
        return for_each_page(stream, func, parse_options{});
    }

} // namespace cafogg
