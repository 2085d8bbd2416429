//
// Created by igor on 10/08/2025.
//
#pragma once
#include <array>
#include <cstring>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <stdexcept>
#include <algorithm>
#include <functional>
#include <ostream>
#include <iomanip>

namespace chunkstream {
    // Four-character chunk identifier. The bytes are opaque to the reader.
    struct fourcc {
        std::array<char, 4> b{' ', ' ', ' ', ' '};

        // Default constructor - creates "    " (four spaces)
        constexpr fourcc() = default;

        constexpr fourcc(char c0, char c1, char c2, char c3)
            : b{ c0, c1, c2, c3 } {}

        constexpr fourcc(std::byte c0, std::byte c1, std::byte c2, std::byte c3)
            : b{ static_cast<char>(c0), static_cast<char>(c1), static_cast<char>(c2), static_cast<char>(c3) } {}

        // Short strings are padded with spaces, long ones truncated
        explicit fourcc(std::string_view sv) : b{' ', ' ', ' ', ' '} {
            std::copy_n(sv.begin(), std::min(sv.size(), std::size_t(4)), b.begin());
        }

        fourcc(const char* str) : fourcc(std::string_view(str)) {}

        // Raw bytes, no padding
        static fourcc from_bytes(const void* data) {
            fourcc result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        [[nodiscard]] std::string to_string() const {
            return {b.data(), 4};
        }

        [[nodiscard]] std::string_view to_string_view() const {
            return {b.data(), 4};
        }

        // Native byte order
        [[nodiscard]] std::uint32_t to_uint32() const {
            std::uint32_t result;
            std::memcpy(&result, b.data(), 4);
            return result;
        }

        constexpr char operator[](std::size_t i) const { return b[i]; }

        bool operator==(const fourcc& o) const { return b == o.b; }
        bool operator!=(const fourcc& o) const { return !(*this == o); }
        bool operator<(const fourcc& o) const { return b < o.b; }

        [[nodiscard]] bool is_printable() const {
            return std::all_of(b.begin(), b.end(), [](char c) {
                return c >= 32 && c <= 126;
            });
        }

        // Quoted, with non-printable bytes escaped as \xNN
        friend std::ostream& operator<<(std::ostream& os, const fourcc& f) {
            auto flags = os.flags();
            auto fill = os.fill();
            os << '\'';
            for (char c : f.b) {
                if (c >= 32 && c <= 126) {
                    os << c;
                } else {
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(static_cast<unsigned char>(c));
                    os.flags(flags);
                }
            }
            os << '\'';
            os.flags(flags);
            os.fill(fill);
            return os;
        }
    };

    struct fourcc_hash {
        std::size_t operator()(const fourcc& f) const noexcept {
            return (static_cast<std::size_t>(f.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // Compile-time fourcc, padded with spaces
    constexpr fourcc operator""_4cc(const char* str, std::size_t len) {
        if (len > 4) {
            throw std::invalid_argument("FourCC literal must be 4 characters or less");
        }
        return {
            len > 0 ? str[0] : ' ',
            len > 1 ? str[1] : ' ',
            len > 2 ? str[2] : ' ',
            len > 3 ? str[3] : ' '
        };
    }

}

namespace std {
    template<>
    struct hash<chunkstream::fourcc> {
        std::size_t operator()(const chunkstream::fourcc& f) const noexcept {
            return chunkstream::fourcc_hash{}(f);
        }
    };
}
