/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for chunkstream
 * @author Igor
 * @date 14/08/2025
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the chunkstream library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>
#include <chunkstream/export_chunkstream.h>

namespace chunkstream {

    /**
     * @class chunkstream_error
     * @brief Base exception class for all chunkstream errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every chunkstream-specific error with a single catch block.
     */
    class CHUNKSTREAM_EXPORT chunkstream_error : public std::runtime_error {
    public:
        explicit chunkstream_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @enum io_errc
     * @brief Reason an I/O operation on a chunk or byte source failed
     */
    enum class io_errc {
        unavailable_source, ///< The reader has no source, or the source is unusable
        end_of_data,        ///< The chunk payload has been fully consumed
        short_source,       ///< The source ended before supplying the bytes needed
        decode              ///< The bytes obtained do not form a valid value
    };

    /**
     * @brief Human readable name of an error code
     */
    inline const char* to_string(io_errc code) {
        switch (code) {
            case io_errc::unavailable_source:
                return "unavailable source";
            case io_errc::end_of_data:
                return "end of data";
            case io_errc::short_source:
                return "short source";
            case io_errc::decode:
                return "decode error";
        }
        return "unknown";
    }

    /**
     * @class io_error
     * @brief Exception for failed reads, skips and decodes
     *
     * Thrown when a chunk or byte source cannot deliver the requested data.
     * code() tells the failure kinds apart.
     */
    class CHUNKSTREAM_EXPORT io_error : public chunkstream_error {
    public:
        io_error(io_errc code, const std::string& msg)
            : chunkstream_error(msg), m_code(code) {}

        [[nodiscard]] io_errc code() const noexcept { return m_code; }

    private:
        io_errc m_code;
    };

    /**
     * @class config_error
     * @brief Exception for readers built against their options
     *
     * Thrown in strict mode when a declared chunk size exceeds the
     * configured limit.
     */
    class CHUNKSTREAM_EXPORT config_error : public chunkstream_error {
    public:
        explicit config_error(const std::string& msg)
            : chunkstream_error(msg) {}
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

    /**
     * @def THROW_IO
     * @brief Throw an io_error with the given code and formatted message
     * @param code io_errc value
     * @param ... Variable arguments to format into error message
     */
    #define THROW_IO(code, ...) \
        throw ::chunkstream::io_error((code), ::chunkstream::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_CONFIG
     * @brief Throw a config_error with formatted message
     * @param ... Variable arguments to format into error message
     */
    #define THROW_CONFIG(...) \
        throw ::chunkstream::config_error(::chunkstream::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     * @param condition Condition to check
     * @param code io_errc value
     * @param ... Variable arguments for error message if condition is true
     */
    #define THROW_IO_IF(condition, code, ...) \
        do { if (condition) THROW_IO(code, __VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     * @param condition Condition that must be true to avoid throwing
     * @param code io_errc value
     * @param ... Variable arguments for error message if condition is false
     */
    #define THROW_IO_UNLESS(condition, code, ...) \
        do { if (!(condition)) THROW_IO(code, __VA_ARGS__); } while(0)

    /**
     * @def THROW_CONFIG_IF
     * @brief Conditionally throw a config_error
     * @param condition Condition to check
     * @param ... Variable arguments for error message if condition is true
     */
    #define THROW_CONFIG_IF(condition, ...) \
        do { if (condition) THROW_CONFIG(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace chunkstream
