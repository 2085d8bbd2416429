//
// Created by igor on 14/08/2025.
//

#include <chunkstream/chunk_reader.hh>
#include <chunkstream/exceptions.hh>
#include <algorithm>
#include <utility>

namespace chunkstream {

    chunk_reader::chunk_reader(fourcc id, std::uint64_t size, byte_source* source)
        : chunk_reader(id, size, source, reader_options{}) {
    }

    chunk_reader::chunk_reader(fourcc id, std::uint64_t size, byte_source* source, const reader_options& options)
        : m_id(id)
        , m_size(size)
        , m_consumed(0)
        , m_source(source)
        , m_options(options) {
        if (m_size > m_options.max_chunk_size) {
            auto msg = build_error_msg("Chunk ", m_id, " declares ", m_size,
                                       " bytes, exceeding max_chunk_size of ", m_options.max_chunk_size);
            THROW_CONFIG_IF(m_options.strict, msg);
            warn("size_limit", msg);
        }
    }

    chunk_reader::chunk_reader(chunk_reader&& other)
        : m_id(other.m_id)
        , m_size(other.m_size)
        , m_consumed(other.m_consumed)
        , m_source(std::exchange(other.m_source, nullptr))
        , m_options(std::move(other.m_options)) {
    }

    chunk_reader& chunk_reader::operator = (chunk_reader&& other) {
        if (this != &other) {
            m_id = other.m_id;
            m_size = other.m_size;
            m_consumed = other.m_consumed;
            m_source = std::exchange(other.m_source, nullptr);
            m_options = std::move(other.m_options);
        }
        return *this;
    }

    std::uint64_t chunk_reader::remaining() const {
        // skip() may carry the offset past the declared size
        return m_consumed >= m_size ? 0 : m_size - m_consumed;
    }

    bool chunk_reader::is_exhausted() const {
        return !m_source || m_consumed >= m_size;
    }

    std::size_t chunk_reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(m_source, io_errc::unavailable_source, "No source for chunk ", m_id);

        if (is_exhausted() || !dst || size == 0) {
            return 0;
        }

        // Limit read to remaining bytes in chunk
        std::size_t to_read = static_cast<std::size_t>(
            std::min(static_cast<std::uint64_t>(size), remaining()));

        std::size_t bytes_read = m_source->read(dst, to_read);
        m_consumed += bytes_read;
        return bytes_read;
    }

    void chunk_reader::fetch_fixed(std::byte* dst, std::size_t size) {
        THROW_IO_UNLESS(m_source, io_errc::unavailable_source, "No source for chunk ", m_id);
        THROW_IO_IF(is_exhausted(), io_errc::end_of_data,
                    "Chunk ", m_id, " fully read at offset ", m_consumed);
        THROW_IO_IF(size > remaining(), io_errc::short_source,
                    "Value of ", size, " bytes exceeds the ", remaining(),
                    " bytes remaining in chunk ", m_id);

        std::size_t actual = 0;
        while (actual < size) {
            std::size_t got = m_source->read(dst + actual, size - actual);
            if (got == 0) {
                break;
            }
            actual += got;
        }

        THROW_IO_IF(actual != size, io_errc::short_source,
                    "Failed to read ", size, " bytes from chunk ", m_id,
                    " at offset ", m_consumed, ": source ended after ", actual);
    }

    std::uint8_t chunk_reader::read_byte() {
        THROW_IO_IF(is_exhausted(), io_errc::end_of_data,
                    "Chunk ", m_id, " fully read at offset ", m_consumed);
        return read_value<std::uint8_t>(byte_order::little);
    }

    void chunk_reader::skip(std::int64_t count) {
        if (count <= 0) {
            return;
        }

        drain(static_cast<std::uint64_t>(count));

        if (m_consumed > m_size) {
            warn("skip_overrun", build_error_msg("Skip of ", count, " bytes moved chunk ", m_id,
                                                 " to offset ", m_consumed, " past its size of ", m_size));
        }
    }

    void chunk_reader::finalize() {
        if (is_exhausted()) {
            return;
        }
        drain(remaining());
    }

    void chunk_reader::drain(std::uint64_t count) {
        THROW_IO_UNLESS(m_source, io_errc::unavailable_source, "No source for chunk ", m_id);

        // A source may stop early on a device failure and throw on the next call
        std::uint64_t discarded = 0;
        while (discarded < count) {
            std::uint64_t n = m_source->discard(count - discarded);
            if (n == 0) {
                break;
            }
            discarded += n;
            m_consumed += n;
        }

        THROW_IO_IF(discarded < count, io_errc::short_source,
                    "Source ended after discarding ", discarded, " of ", count,
                    " bytes in chunk ", m_id);
    }

    std::size_t chunk_reader::read_full(void* dst, std::size_t size) {
        auto* out = static_cast<std::byte*>(dst);
        std::size_t total = 0;

        while (total < size) {
            std::size_t got = read(out + total, size - total);
            if (got == 0) {
                break;
            }
            total += got;
        }

        return total;
    }

    std::optional<std::string> chunk_reader::read_string(std::size_t size) {
        if (size == 0) {
            return std::nullopt;
        }

        std::string result(size, '\0');
        if (read_full(result.data(), size) != size) {
            return std::nullopt;
        }

        // Trim null terminators if present
        auto null_pos = result.find('\0');
        if (null_pos != std::string::npos) {
            result.resize(null_pos);
        }

        return result;
    }

    std::optional<fourcc> chunk_reader::read_fourcc() {
        std::array<char, 4> data{};
        if (read_full(data.data(), 4) != 4) {
            return std::nullopt;
        }
        return fourcc(data[0], data[1], data[2], data[3]);
    }

    std::vector<std::byte> chunk_reader::read_all() {
        return read_bytes(static_cast<std::size_t>(remaining()));
    }

    std::vector<std::byte> chunk_reader::read_bytes(std::size_t n) {
        std::size_t to_read = static_cast<std::size_t>(
            std::min(static_cast<std::uint64_t>(n), remaining()));
        std::vector<std::byte> result(to_read);

        if (to_read > 0) {
            std::size_t actual = read_full(result.data(), to_read);
            result.resize(actual);
        }

        return result;
    }

    void chunk_reader::warn(std::string_view category, const std::string& message) const {
        if (m_options.on_warning) {
            m_options.on_warning(m_consumed, category, message);
        }
    }

} // namespace chunkstream
