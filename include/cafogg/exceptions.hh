/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for cafogg
 * @author Igor
 * @date 14/08/2025
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library. Every error is fatal for the
 * parsing run that raised it.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace cafogg {

    /**
     * @enum error_kind
     * @brief Classification of a decoding failure
     */
    enum class error_kind {
        io,                       ///< Underlying stream reported a failure
        unexpected_end_of_stream, ///< Source exhausted in the middle of a structure
        invalid_field_length,     ///< Fixed-size field received a wrong byte count
        invalid_magic_signature,  ///< Expected signature bytes are absent
        truncated_record,         ///< Declared length exceeds the available bytes
        malformed_field           ///< Field value cannot be represented or is out of range
    };

    /**
     * @brief Human readable name of an error kind
     */
    inline const char* to_string(error_kind k) {
        switch (k) {
            case error_kind::io: return "io";
            case error_kind::unexpected_end_of_stream: return "unexpected_end_of_stream";
            case error_kind::invalid_field_length: return "invalid_field_length";
            case error_kind::invalid_magic_signature: return "invalid_magic_signature";
            case error_kind::truncated_record: return "truncated_record";
            case error_kind::malformed_field: return "malformed_field";
        }
        return "unknown";
    }

    /**
     * @class cafogg_error
     * @brief Base exception class for all cafogg errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch all decoding errors with a single catch block.
     */
    class cafogg_error : public std::runtime_error {
    public:
        cafogg_error(error_kind kind, const std::string& msg)
            : std::runtime_error(msg), m_kind(kind) {}

        [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    private:
        error_kind m_kind;
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     */
    class io_error : public cafogg_error {
    public:
        explicit io_error(const std::string& msg)
            : cafogg_error(error_kind::io, msg) {}

    protected:
        io_error(error_kind kind, const std::string& msg)
            : cafogg_error(kind, msg) {}
    };

    /**
     * @class unexpected_end_of_stream
     * @brief The stream ended while a structure was only partially read
     */
    class unexpected_end_of_stream : public io_error {
    public:
        explicit unexpected_end_of_stream(const std::string& msg)
            : io_error(error_kind::unexpected_end_of_stream, msg) {}
    };

    /**
     * @class parse_error
     * @brief Base for structural decoding errors
     */
    class parse_error : public cafogg_error {
    public:
        explicit parse_error(const std::string& msg)
            : cafogg_error(error_kind::malformed_field, msg) {}

    protected:
        parse_error(error_kind kind, const std::string& msg)
            : cafogg_error(kind, msg) {}
    };

    class invalid_field_length : public parse_error {
    public:
        explicit invalid_field_length(const std::string& msg)
            : parse_error(error_kind::invalid_field_length, msg) {}
    };

    class invalid_magic_signature : public parse_error {
    public:
        explicit invalid_magic_signature(const std::string& msg)
            : parse_error(error_kind::invalid_magic_signature, msg) {}
    };

    class truncated_record : public parse_error {
    public:
        explicit truncated_record(const std::string& msg)
            : parse_error(error_kind::truncated_record, msg) {}
    };

    class malformed_field : public parse_error {
    public:
        explicit malformed_field(const std::string& msg)
            : parse_error(error_kind::malformed_field, msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    #define THROW_IO(...) \
        throw ::cafogg::io_error(::cafogg::build_error_msg(__VA_ARGS__))

    #define THROW_PARSE(...) \
        throw ::cafogg::parse_error(::cafogg::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_EOS
     * @brief Throw unexpected_end_of_stream with formatted message
     */
    #define THROW_EOS(...) \
        throw ::cafogg::unexpected_end_of_stream(::cafogg::build_error_msg(__VA_ARGS__))

    #define THROW_EOS_IF(condition, ...) \
        do { if (condition) THROW_EOS(__VA_ARGS__); } while(0)

    /**
     * @def THROW_FIELD_LENGTH_IF
     * @brief Throw invalid_field_length if the condition holds
     */
    #define THROW_FIELD_LENGTH_IF(condition, ...) \
        do { if (condition) throw ::cafogg::invalid_field_length(::cafogg::build_error_msg(__VA_ARGS__)); } while(0)

    /**
     * @def THROW_MAGIC_UNLESS
     * @brief Throw invalid_magic_signature unless the signature matched
     */
    #define THROW_MAGIC_UNLESS(condition, ...) \
        do { if (!(condition)) throw ::cafogg::invalid_magic_signature(::cafogg::build_error_msg(__VA_ARGS__)); } while(0)

    /**
     * @def THROW_TRUNCATED_IF
     * @brief Throw truncated_record if the condition holds
     */
    #define THROW_TRUNCATED_IF(condition, ...) \
        do { if (condition) throw ::cafogg::truncated_record(::cafogg::build_error_msg(__VA_ARGS__)); } while(0)

    /**
     * @def THROW_MALFORMED_IF
     * @brief Throw malformed_field if the condition holds
     */
    #define THROW_MALFORMED_IF(condition, ...) \
        do { if (condition) throw ::cafogg::malformed_field(::cafogg::build_error_msg(__VA_ARGS__)); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace cafogg
