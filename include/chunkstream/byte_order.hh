/**
 * @file byte_order.hh
 * @brief Byte order (endianness) utilities and fixed-width value decoding
 * @author Igor
 * @date 12/08/2025
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstring>
#include <type_traits>

#include <chunkstream/endian.hh>
#include <chunkstream/exceptions.hh>

namespace chunkstream {
    /**
     * @enum byte_order
     * @brief Byte order (endianness) for reading multi-byte values
     */
    enum class byte_order {
        little, ///< Little-endian (used by RIFF, RF64 formats)
        big     ///< Big-endian (used by IFF-85, AIFF, RIFX formats)
    };

    /**
     * @brief Check if given byte order matches the native system byte order
     * @param bo Byte order to check
     * @return True if the byte order matches the system's native byte order
     */
    inline bool byte_order_native(byte_order bo) {
        switch (bo) {
            case byte_order::little:
                return is_little_endian;
            case byte_order::big:
                return is_big_endian;
        }
        // make compiler happy
        return false;
    }

    /**
     * @struct is_fixed_layout
     * @brief Types that can be decoded from a fixed number of raw bytes
     *
     * Scalars accepted by swap_byte_order, and std::array of such scalars
     * (decoded element by element, each in the requested byte order).
     */
    template<typename T>
    struct is_fixed_layout : std::bool_constant<is_byte_swappable_v<T>> {};

    template<typename T, std::size_t N>
    struct is_fixed_layout<std::array<T, N>> : std::bool_constant<is_byte_swappable_v<T>> {};

    template<typename T>
    inline constexpr bool is_fixed_layout_v = is_fixed_layout<T>::value;

    namespace detail {
        template<typename T>
        T decode_scalar(const std::byte* src, byte_order bo) {
            if constexpr (std::is_same_v<T, bool>) {
                const auto raw = std::to_integer<unsigned>(src[0]);
                THROW_IO_IF(raw > 1, io_errc::decode, "Invalid boolean byte 0x", std::hex, raw);
                return raw == 1;
            } else {
                T value;
                std::memcpy(&value, src, sizeof(T));
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                return value;
            }
        }

        template<typename T>
        struct value_decoder {
            static T decode(const std::byte* src, byte_order bo) {
                return decode_scalar<T>(src, bo);
            }
        };

        template<typename T, std::size_t N>
        struct value_decoder<std::array<T, N>> {
            static std::array<T, N> decode(const std::byte* src, byte_order bo) {
                std::array<T, N> result{};
                for (std::size_t i = 0; i < N; i++) {
                    result[i] = decode_scalar<T>(src + i * sizeof(T), bo);
                }
                return result;
            }
        };
    }

    /**
     * @brief Decode a fixed-layout value from raw bytes
     * @tparam T Scalar or std::array of scalars
     * @param src At least sizeof(T) bytes
     * @param bo Byte order the bytes are stored in
     * @return Decoded value in native representation
     * @throws io_error with io_errc::decode if the bytes are not a valid T
     */
    template<typename T>
    T decode_value(const std::byte* src, byte_order bo) {
        static_assert(is_fixed_layout_v<T>,
                      "decode_value supports swappable scalars and std::array of them");
        return detail::value_decoder<T>::decode(src, bo);
    }
}
