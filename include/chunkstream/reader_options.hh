/**
 * @file reader_options.hh
 * @brief Configuration options for chunk readers
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace chunkstream {

    /**
     * @struct reader_options
     * @brief Configuration options for chunk readers
     *
     * Controls how strictly declared chunk sizes are checked and where
     * non-fatal diagnostics go.
     */
    struct reader_options {
        /**
         * @brief Strict mode
         *
         * When true, a declared size above max_chunk_size is rejected with
         * config_error. When false, a "size_limit" warning is reported and the
         * reader is built anyway.
         */
        bool strict = true;

        /**
         * @brief Maximum accepted declared chunk size in bytes
         *
         * Default is 4GB.
         */
        std::uint64_t max_chunk_size = std::uint64_t(1) << 32;  // 4GB

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Offset within the chunk payload where the warning occurred
         * @param category Warning category ("size_limit", "skip_overrun")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace chunkstream
