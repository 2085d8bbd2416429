#include <doctest/doctest.h>
#include <chunkstream/fourcc.hh>

#include <sstream>
#include <unordered_map>
#include <set>
#include <cstring>

using namespace chunkstream;

// Common chunk identifiers
namespace chunk_id {
    inline constexpr fourcc RIFF('R', 'I', 'F', 'F');
    inline constexpr fourcc FORM('F', 'O', 'R', 'M');
    inline constexpr fourcc WAVE('W', 'A', 'V', 'E');
    inline constexpr fourcc fmt_('f', 'm', 't', ' ');
    inline constexpr fourcc data('d', 'a', 't', 'a');
}

TEST_SUITE("FOURCC") {
    TEST_CASE("fourcc construction") {
        SUBCASE("default construction") {
            fourcc f;
            CHECK(f.to_string() == "    ");
            CHECK(f[0] == ' ');
            CHECK(f[3] == ' ');
        }

        SUBCASE("individual char construction") {
            fourcc test('T', 'E', 'S', 'T');
            CHECK(test.to_string() == "TEST");

            fourcc mixed('A', ' ', 'B', ' ');
            CHECK(mixed.to_string() == "A B ");
        }

        SUBCASE("std::byte construction") {
            fourcc f(std::byte('d'), std::byte('a'), std::byte('t'), std::byte('a'));
            CHECK(f == chunk_id::data);
        }

        SUBCASE("string_view construction with padding") {
            CHECK(fourcc(std::string_view("ABC")).to_string() == "ABC ");
            CHECK(fourcc(std::string_view("A")).to_string() == "A   ");
            CHECK(fourcc(std::string_view("")).to_string() == "    ");
            CHECK(fourcc(std::string_view("TOOLONG")).to_string() == "TOOL");
        }

        SUBCASE("C-string construction") {
            fourcc wave("WAVE");
            CHECK(wave == chunk_id::WAVE);

            fourcc fmt("fmt");
            CHECK(fmt == chunk_id::fmt_);
        }

        SUBCASE("from_bytes keeps non-printable bytes") {
            unsigned char binary[4] = {0x01, 0x02, 0x03, 0x04};
            fourcc bin = fourcc::from_bytes(binary);
            CHECK(bin[0] == 0x01);
            CHECK(bin[3] == 0x04);
            CHECK_FALSE(bin.is_printable());
        }
    }

    TEST_CASE("fourcc user-defined literal") {
        CHECK("WAVE"_4cc.to_string() == "WAVE");
        CHECK("fmt"_4cc == chunk_id::fmt_);
        CHECK(""_4cc.to_string() == "    ");

        constexpr auto form = "FORM"_4cc;
        CHECK(form == chunk_id::FORM);
    }

    TEST_CASE("fourcc conversions") {
        fourcc test("TEST");
        std::string_view sv = test.to_string_view();
        CHECK(sv == "TEST");
        CHECK(sv.size() == 4);

        unsigned char raw[4] = {'T', 'E', 'S', 'T'};
        std::uint32_t expected;
        std::memcpy(&expected, raw, 4);
        CHECK(test.to_uint32() == expected);
    }

    TEST_CASE("fourcc comparison") {
        CHECK(chunk_id::RIFF == "RIFF"_4cc);
        CHECK(chunk_id::RIFF != chunk_id::FORM);
        CHECK(chunk_id::FORM < chunk_id::RIFF);

        std::set<fourcc> ordered{chunk_id::data, chunk_id::RIFF, chunk_id::FORM};
        CHECK(*ordered.begin() == chunk_id::FORM);
    }

    TEST_CASE("fourcc hashing") {
        std::unordered_map<fourcc, int> counts;
        counts[chunk_id::fmt_]++;
        counts["fmt "_4cc]++;
        counts[chunk_id::data]++;

        CHECK(counts.size() == 2);
        CHECK(counts[chunk_id::fmt_] == 2);
        CHECK(std::hash<fourcc>{}(chunk_id::WAVE) == fourcc_hash{}("WAVE"_4cc));
    }

    TEST_CASE("fourcc stream output") {
        SUBCASE("printable id is quoted") {
            std::ostringstream oss;
            oss << chunk_id::fmt_;
            CHECK(oss.str() == "'fmt '");
        }

        SUBCASE("non-printable bytes are escaped") {
            std::ostringstream oss;
            oss << fourcc('A', '\x01', 'B', '\xff');
            CHECK(oss.str() == "'A\\x01B\\xff'");
        }

        SUBCASE("stream flags are restored") {
            std::ostringstream oss;
            oss << fourcc('\x0a', 'b', 'c', 'd') << ' ' << 10;
            CHECK(oss.str() == "'\\x0abcd' 10");
        }
    }
}
