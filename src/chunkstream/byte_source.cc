//
// Created by igor on 12/08/2025.
//

#include <istream>
#include <array>
#include <algorithm>
#include <limits>
#include <cstring>

#include <chunkstream/byte_source.hh>
#include <chunkstream/exceptions.hh>

namespace chunkstream {
    static constexpr std::size_t DISCARD_BUFFER_SIZE = 4096;

    // byte_source implementation
    std::uint64_t byte_source::discard(std::uint64_t count) {
        std::array<std::byte, DISCARD_BUFFER_SIZE> scratch;
        std::uint64_t total = 0;

        while (total < count) {
            std::size_t want = static_cast<std::size_t>(
                std::min<std::uint64_t>(count - total, scratch.size()));
            std::size_t got = read(scratch.data(), want);
            if (got == 0) {
                break;  // Source ended
            }
            total += got;
        }

        return total;
    }

    // stream_source implementation
    stream_source::stream_source(std::istream& is) : m_stream(is) {}

    std::size_t stream_source::read(void* dst, std::size_t size) {
        if (!dst || size == 0) {
            return 0;
        }

        THROW_IO_IF(m_stream.bad(), io_errc::unavailable_source, "Stream in bad state");
        if (m_stream.eof()) {
            return 0;
        }
        THROW_IO_IF(m_stream.fail(), io_errc::unavailable_source, "Stream in failed state");

        auto* out = static_cast<char*>(dst);
        std::size_t total = 0;
        while (total < size) {
            // Take what the streambuf already holds, then refill one character
            std::streamsize n = m_stream.readsome(out + total, static_cast<std::streamsize>(size - total));
            if (n > 0) {
                total += static_cast<std::size_t>(n);
                continue;
            }
            if (!m_stream.good()) {
                break;
            }
            auto c = m_stream.get();
            if (c == std::istream::traits_type::eof()) {
                break;
            }
            out[total++] = std::istream::traits_type::to_char_type(c);
        }

        // Bytes that arrived before a device failure are returned, the
        // failure surfaces on the next call
        THROW_IO_IF(total == 0 && m_stream.bad(), io_errc::unavailable_source,
                    "Stream read of ", size, " bytes failed");
        return total;
    }

    std::uint64_t stream_source::discard(std::uint64_t count) {
        // ignore() treats max() as "no limit"
        constexpr auto max_step = static_cast<std::uint64_t>(std::numeric_limits<std::streamsize>::max() - 1);
        std::uint64_t total = 0;

        while (total < count) {
            THROW_IO_IF(m_stream.bad(), io_errc::unavailable_source, "Stream in bad state");
            if (m_stream.eof()) {
                break;
            }
            THROW_IO_IF(m_stream.fail(), io_errc::unavailable_source, "Stream in failed state");

            std::uint64_t step = std::min(count - total, max_step);
            m_stream.ignore(static_cast<std::streamsize>(step));
            std::uint64_t skipped = static_cast<std::uint64_t>(m_stream.gcount());
            total += skipped;

            THROW_IO_IF(total == 0 && m_stream.bad(), io_errc::unavailable_source,
                        "Stream discard of ", count, " bytes failed");
            if (skipped < step) {
                break;
            }
        }

        return total;
    }

    // memory_source implementation
    memory_source::memory_source(const void* data, std::size_t size)
        : m_data(static_cast<const std::byte*>(data))
        , m_size(data ? size : 0)
        , m_position(0) {}

    std::size_t memory_source::read(void* dst, std::size_t size) {
        if (!dst || size == 0) {
            return 0;
        }

        std::size_t to_read = std::min(size, remaining());
        if (to_read == 0) {
            return 0;
        }

        std::memcpy(dst, m_data + m_position, to_read);
        m_position += to_read;
        return to_read;
    }

    std::uint64_t memory_source::discard(std::uint64_t count) {
        std::size_t to_skip = static_cast<std::size_t>(
            std::min<std::uint64_t>(count, remaining()));
        m_position += to_skip;
        return to_skip;
    }
}
