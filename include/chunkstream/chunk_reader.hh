/**
 * @file chunk_reader.hh
 * @brief Bounded reader over the payload of a single chunk
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <array>
#include <optional>
#include <vector>
#include <string>
#include <string_view>
#include <cstdint>
#include <cstddef>
#include <chunkstream/export_chunkstream.h>
#include <chunkstream/byte_order.hh>
#include <chunkstream/byte_source.hh>
#include <chunkstream/fourcc.hh>
#include <chunkstream/reader_options.hh>

namespace chunkstream {

    /**
     * @class chunk_reader
     * @brief Reads the payload of one chunk from a shared forward-only source
     *
     * The container parser reads a chunk header (id + size) from the source,
     * builds a chunk_reader for the payload and hands it to a chunk decoder.
     * Whatever the decoder consumed, finalize() leaves the source positioned
     * at the end of the payload. Padding after odd-sized chunks belongs to
     * the container format and is not handled here.
     *
     * The reader does not own the source. Only one reader may consume from a
     * source at a time, and a reader is not thread safe.
     */
    class CHUNKSTREAM_EXPORT chunk_reader {
    public:
        /**
         * @brief Reader without a source; exhausted from the start
         */
        chunk_reader() = default;

        /**
         * @brief Create a reader for a chunk payload
         * @param id Chunk identifier
         * @param size Declared payload size in bytes
         * @param source Source positioned at the first payload byte (may be null)
         * @throws config_error if size exceeds the default max_chunk_size
         */
        chunk_reader(fourcc id, std::uint64_t size, byte_source* source);

        /**
         * @brief Create a reader for a chunk payload with custom options
         * @param id Chunk identifier
         * @param size Declared payload size in bytes
         * @param source Source positioned at the first payload byte (may be null)
         * @param options Size limit and warning handler
         * @throws config_error in strict mode if size exceeds options.max_chunk_size
         */
        chunk_reader(fourcc id, std::uint64_t size, byte_source* source, const reader_options& options);

        ~chunk_reader() = default;

        chunk_reader(const chunk_reader&) = delete;
        chunk_reader& operator = (const chunk_reader&) = delete;

        chunk_reader(chunk_reader&& other);
        chunk_reader& operator = (chunk_reader&& other);

        [[nodiscard]] const fourcc& id() const { return m_id; }

        /**
         * @brief Declared payload size
         */
        [[nodiscard]] std::uint64_t size() const { return m_size; }

        /**
         * @brief Bytes consumed so far by reads and skips
         */
        [[nodiscard]] std::uint64_t offset() const { return m_consumed; }

        /**
         * @brief Bytes left before the declared end of the payload
         */
        [[nodiscard]] std::uint64_t remaining() const;

        [[nodiscard]] bool has_source() const { return m_source != nullptr; }

        /**
         * @brief True if there is no source or the whole payload has been consumed
         */
        [[nodiscard]] bool is_exhausted() const;

        /**
         * @brief Read up to size bytes of payload
         * @param dst Destination buffer
         * @param size Buffer size; requests are clamped to remaining()
         * @return Bytes obtained from a single pull, 0 when exhausted
         * @throws io_error with io_errc::unavailable_source if there is no source
         */
        std::size_t read(void* dst, std::size_t size);

        /**
         * @brief Read a fixed-layout value
         * @tparam T Scalar or std::array of scalars
         * @param bo Byte order the value is stored in
         * @throws io_error unavailable_source, end_of_data, short_source or decode
         *
         * offset() advances by sizeof(T) on success and is left untouched on
         * any failure.
         */
        template<typename T>
        T read_value(byte_order bo) {
            static_assert(is_fixed_layout_v<T>,
                          "read_value supports swappable scalars and std::array of them");
            std::array<std::byte, sizeof(T)> buff;
            fetch_fixed(buff.data(), sizeof(T));
            T value = decode_value<T>(buff.data(), bo);
            m_consumed += sizeof(T);
            return value;
        }

        template<typename T>
        T read_le() { return read_value<T>(byte_order::little); }

        template<typename T>
        T read_be() { return read_value<T>(byte_order::big); }

        /**
         * @brief Read one byte
         * @throws io_error with io_errc::end_of_data when exhausted
         */
        std::uint8_t read_byte();

        /**
         * @brief Discard count bytes from the source
         * @param count Bytes to drop; zero or negative is a no-op
         * @throws io_error with io_errc::short_source if the source ends first
         *
         * The count is not clamped to remaining(). Skipping past the declared
         * end reports a "skip_overrun" warning.
         */
        void skip(std::int64_t count);

        /**
         * @brief Discard the unread rest of the payload
         * @throws io_error with io_errc::short_source if the source ends first
         *
         * Must be called before the next chunk header is read from the same
         * source. No-op on an exhausted reader.
         */
        void finalize();

        /**
         * @brief Read a string of specified size
         * @param size Number of bytes to read
         * @return String up to the first NUL, nullopt on a short read or size 0
         */
        std::optional<std::string> read_string(std::size_t size);

        /**
         * @brief Read a FourCC code
         * @return FourCC if 4 bytes were obtained, nullopt otherwise
         */
        std::optional<fourcc> read_fourcc();

        /**
         * @brief Read all remaining data in chunk
         */
        std::vector<std::byte> read_all();

        /**
         * @brief Read up to n bytes
         * @param n Number of bytes wanted; clamped to remaining()
         */
        std::vector<std::byte> read_bytes(std::size_t n);

    private:
        // Checks and pulls exactly size bytes without touching m_consumed
        void fetch_fixed(std::byte* dst, std::size_t size);
        void drain(std::uint64_t count);
        // Repeats read() until size bytes or the source ends
        std::size_t read_full(void* dst, std::size_t size);
        void warn(std::string_view category, const std::string& message) const;

        fourcc m_id;
        std::uint64_t m_size = 0;
        std::uint64_t m_consumed = 0;
        byte_source* m_source = nullptr;  // Non-owning
        reader_options m_options;
    };

} // namespace chunkstream
