/**
 * @file byte_source.hh
 * @brief Forward-only byte sources that chunk readers consume from
 * @author Igor
 * @date 12/08/2025
 */

#pragma once

#include <iosfwd>
#include <cstddef>
#include <cstdint>
#include <chunkstream/export_chunkstream.h>

namespace chunkstream {

    /**
     * @class byte_source
     * @brief Sequential, forward-only producer of bytes
     *
     * The only capability a chunk reader needs from the underlying data:
     * pull up to N bytes, or drop up to N bytes. No seeking, no length query.
     */
    class CHUNKSTREAM_EXPORT byte_source {
    public:
        virtual ~byte_source() = default;

        /**
         * @brief Pull up to size bytes
         * @param dst Destination buffer of at least size bytes
         * @param size Maximum number of bytes to pull
         * @return Number of bytes obtained, 0 once the source is exhausted
         * @throws io_error with io_errc::unavailable_source if the source is unusable
         *
         * May deliver fewer than size bytes without being exhausted. When the
         * source fails after some bytes arrived, those bytes are returned and
         * the next call throws.
         */
        virtual std::size_t read(void* dst, std::size_t size) = 0;

        /**
         * @brief Drop up to count bytes
         * @param count Number of bytes to drop
         * @return Number of bytes actually dropped, less than count if the source
         *         ended or failed partway (the next call then throws)
         *
         * The default implementation reads into a scratch buffer until count
         * bytes are gone or read() returns 0.
         */
        virtual std::uint64_t discard(std::uint64_t count);
    };

    /**
     * @class stream_source
     * @brief byte_source over a std::istream
     *
     * Never seeks, so pipes and other non-seekable streambufs work.
     * read() keeps pulling until size bytes arrive or the stream ends, so on
     * a pipe it blocks until then. The stream must outlive the source.
     */
    class CHUNKSTREAM_EXPORT stream_source : public byte_source {
    public:
        explicit stream_source(std::istream& is);
        ~stream_source() override = default;

        std::size_t read(void* dst, std::size_t size) override;
        std::uint64_t discard(std::uint64_t count) override;

        std::istream& get_stream() { return m_stream; }

    private:
        std::istream& m_stream;
    };

    /**
     * @class memory_source
     * @brief byte_source over a contiguous block of memory
     *
     * Does not copy; the memory must outlive the source.
     */
    class CHUNKSTREAM_EXPORT memory_source : public byte_source {
    public:
        memory_source(const void* data, std::size_t size);
        ~memory_source() override = default;

        std::size_t read(void* dst, std::size_t size) override;
        std::uint64_t discard(std::uint64_t count) override;

        [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }
        [[nodiscard]] std::size_t position() const { return m_position; }

    private:
        const std::byte* m_data;
        std::size_t m_size;
        std::size_t m_position;
    };
}
