//
// Test error conditions in chunk readers and byte sources
//

#include <doctest/doctest.h>
#include <chunkstream/chunk_reader.hh>
#include <chunkstream/exceptions.hh>
#include <chunkstream/fourcc.hh>
#include <chunkstream/reader_options.hh>
#include <sstream>
#include <string>
#include <vector>
#include <cstring>
#include <algorithm>
#include <utility>

using namespace chunkstream;

// Stream that reports end of file after fail_after bytes
class failing_streambuf : public std::streambuf {
public:
    failing_streambuf(const std::string& data, std::size_t fail_after)
        : m_data(data)
        , m_fail_after(fail_after)
        , m_bytes_read(0) {
        setg(nullptr, nullptr, nullptr);
    }

protected:
    int_type underflow() override {
        if (m_bytes_read >= m_fail_after || m_pos >= m_data.size()) {
            return traits_type::eof();
        }

        m_buffer = m_data[m_pos++];
        m_bytes_read++;
        setg(&m_buffer, &m_buffer, &m_buffer + 1);
        return traits_type::to_int_type(m_buffer);
    }

    std::streamsize xsgetn(char_type* s, std::streamsize count) override {
        std::streamsize to_read = std::min(
            static_cast<std::streamsize>(m_fail_after - m_bytes_read),
            std::min(count, static_cast<std::streamsize>(m_data.size() - m_pos))
        );

        if (to_read > 0) {
            std::memcpy(s, m_data.data() + m_pos, static_cast<std::size_t>(to_read));
            m_pos += static_cast<std::size_t>(to_read);
            m_bytes_read += static_cast<std::size_t>(to_read);
        }

        return std::max<std::streamsize>(to_read, 0);
    }

private:
    std::string m_data;
    std::size_t m_fail_after;
    std::size_t m_bytes_read;
    std::size_t m_pos = 0;
    char m_buffer = 0;
};

// Stream whose device fails with an exception, which std::istream turns into badbit
class throwing_streambuf : public std::streambuf {
protected:
    int_type underflow() override {
        throw std::runtime_error("device failure");
    }
};

// Device that serves a prefix from its get area, then fails on refill
class failing_device_streambuf : public std::streambuf {
public:
    explicit failing_device_streambuf(std::string prefix)
        : m_prefix(std::move(prefix)) {
        setg(m_prefix.data(), m_prefix.data(), m_prefix.data() + m_prefix.size());
    }

protected:
    int_type underflow() override {
        throw std::runtime_error("device failure");
    }

private:
    std::string m_prefix;
};

TEST_CASE("Reader error handling") {
    SUBCASE("Source ends inside the chunk") {
        failing_streambuf buf("abcdefghij", 4);
        std::istream stream(&buf);
        stream_source src(stream);
        chunk_reader ch("data"_4cc, 10, &src);

        char out[10];
        CHECK(ch.read(out, 10) == 4);
        CHECK(ch.offset() == 4);
        CHECK(ch.read(out, 10) == 0);
        CHECK_FALSE(ch.is_exhausted());

        try {
            ch.finalize();
            FAIL("Should have thrown exception");
        } catch (const io_error& e) {
            CHECK(e.code() == io_errc::short_source);
        }
        CHECK(ch.offset() == 4);
    }

    SUBCASE("Typed read over a truncated stream") {
        failing_streambuf buf("\x01\x02\x03\x04", 2);
        std::istream stream(&buf);
        stream_source src(stream);
        chunk_reader ch("fmt "_4cc, 8, &src);

        try {
            ch.read_le<std::uint32_t>();
            FAIL("Should have thrown exception");
        } catch (const io_error& e) {
            CHECK(e.code() == io_errc::short_source);
        }
        CHECK(ch.offset() == 0);
    }

    SUBCASE("Device failure during read") {
        throwing_streambuf buf;
        std::istream stream(&buf);
        stream_source src(stream);
        chunk_reader ch("data"_4cc, 16, &src);

        char out[4];
        try {
            ch.read(out, 4);
            FAIL("Should have thrown exception");
        } catch (const io_error& e) {
            CHECK(e.code() == io_errc::unavailable_source);
        }
        CHECK(ch.offset() == 0);
    }

    SUBCASE("Device failure during finalize") {
        throwing_streambuf buf;
        std::istream stream(&buf);
        stream_source src(stream);
        chunk_reader ch("data"_4cc, 16, &src);

        CHECK_THROWS_AS(ch.finalize(), io_error);
        CHECK(ch.offset() == 0);
    }

    SUBCASE("Device failure partway through finalize") {
        failing_device_streambuf buf("abc");
        std::istream stream(&buf);
        stream_source src(stream);
        chunk_reader ch("data"_4cc, 16, &src);

        try {
            ch.finalize();
            FAIL("Should have thrown exception");
        } catch (const io_error& e) {
            CHECK(e.code() == io_errc::unavailable_source);
        }
        CHECK(ch.offset() == 3);
        CHECK(ch.remaining() == 13);
        CHECK_FALSE(ch.is_exhausted());
    }

    SUBCASE("Device failure partway through a read") {
        failing_device_streambuf buf("abc");
        std::istream stream(&buf);
        stream_source src(stream);
        chunk_reader ch("data"_4cc, 16, &src);

        char out[8] = {};
        CHECK(ch.read(out, 8) == 3);
        CHECK(std::string(out, 3) == "abc");
        CHECK(ch.offset() == 3);

        try {
            ch.read(out, 8);
            FAIL("Should have thrown exception");
        } catch (const io_error& e) {
            CHECK(e.code() == io_errc::unavailable_source);
        }
        CHECK(ch.offset() == 3);
    }

    SUBCASE("Device failure partway through a skip") {
        failing_device_streambuf buf("abcde");
        std::istream stream(&buf);
        stream_source src(stream);
        chunk_reader ch("data"_4cc, 16, &src);

        CHECK_THROWS_AS(ch.skip(8), io_error);
        CHECK(ch.offset() == 5);
    }

    SUBCASE("Stream already in a bad state") {
        std::istringstream stream("abcd");
        stream.setstate(std::ios::badbit);
        stream_source src(stream);
        chunk_reader ch("data"_4cc, 4, &src);

        CHECK_THROWS_AS(ch.read_byte(), io_error);
        CHECK_THROWS_AS(ch.skip(2), io_error);
        CHECK(ch.offset() == 0);
    }

    SUBCASE("All library errors share a base class") {
        chunk_reader ch;
        bool caught = false;
        try {
            char c;
            ch.read(&c, 1);
        } catch (const chunkstream_error&) {
            caught = true;
        }
        CHECK(caught);

        reader_options opts;
        opts.max_chunk_size = 4;
        CHECK_THROWS_AS(chunk_reader("data"_4cc, 5, nullptr, opts), chunkstream_error);
    }
}

TEST_CASE("Reader size limits") {
    SUBCASE("strict mode rejects oversized chunks") {
        reader_options opts;
        opts.max_chunk_size = 1024;

        CHECK_NOTHROW(chunk_reader("data"_4cc, 1024, nullptr, opts));
        CHECK_THROWS_AS(chunk_reader("data"_4cc, 1025, nullptr, opts), config_error);
    }

    SUBCASE("default limit is 4GB") {
        CHECK_NOTHROW(chunk_reader("data"_4cc, 0xFFFFFFFFull, nullptr));
        CHECK_THROWS_AS(chunk_reader("data"_4cc, (1ull << 32) + 1, nullptr), config_error);
    }

    SUBCASE("lenient mode builds the reader anyway") {
        std::string text = "abcdef";
        memory_source src(text.data(), text.size());

        reader_options opts;
        opts.strict = false;
        opts.max_chunk_size = 2;

        chunk_reader ch("data"_4cc, 6, &src, opts);
        CHECK(ch.size() == 6);
        CHECK(ch.read_all().size() == 6);
    }
}

TEST_CASE("Error messages") {
    SUBCASE("end of data names the chunk and offset") {
        memory_source src(nullptr, 0);
        chunk_reader ch("LIST"_4cc, 0, &src);
        try {
            ch.read_byte();
            FAIL("Should have thrown exception");
        } catch (const io_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("'LIST'") != std::string::npos);
            CHECK(msg.find("offset 0") != std::string::npos);
            INFO("Error message: " << msg);
        }
    }

    SUBCASE("short source shows the byte counts") {
        std::string text = "xyz";
        memory_source src(text.data(), text.size());
        chunk_reader ch("data"_4cc, 100, &src);
        try {
            ch.finalize();
            FAIL("Should have thrown exception");
        } catch (const io_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("3 of 100") != std::string::npos);
            CHECK(msg.find("'data'") != std::string::npos);
            INFO("Error message: " << msg);
        }
    }

    SUBCASE("short typed read shows sizes") {
        std::vector<std::byte> data = {std::byte(1)};
        memory_source src(data.data(), data.size());
        chunk_reader ch("fmt "_4cc, 8, &src);
        try {
            ch.read_le<std::uint64_t>();
            FAIL("Should have thrown exception");
        } catch (const io_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("8 bytes") != std::string::npos);
            CHECK(msg.find("ended after 1") != std::string::npos);
        }
    }

    SUBCASE("missing source names the chunk") {
        chunk_reader ch("JUNK"_4cc, 4, nullptr);
        try {
            ch.skip(1);
            FAIL("Should have thrown exception");
        } catch (const io_error& e) {
            CHECK(e.code() == io_errc::unavailable_source);
            CHECK(std::string(e.what()).find("'JUNK'") != std::string::npos);
        }
    }

    SUBCASE("size limit shows size and limit") {
        reader_options opts;
        opts.max_chunk_size = 1024;
        try {
            chunk_reader ch("DATA"_4cc, 10000000, nullptr, opts);
            FAIL("Should have thrown exception");
        } catch (const config_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("DATA") != std::string::npos);
            CHECK(msg.find("10000000") != std::string::npos);
            CHECK(msg.find("1024") != std::string::npos);
        }
    }

    SUBCASE("error code names") {
        CHECK(std::string(to_string(io_errc::unavailable_source)) == "unavailable source");
        CHECK(std::string(to_string(io_errc::end_of_data)) == "end of data");
        CHECK(std::string(to_string(io_errc::short_source)) == "short source");
        CHECK(std::string(to_string(io_errc::decode)) == "decode error");
    }
}
