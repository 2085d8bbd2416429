/**
 * @file riff_walk.cpp
 * @brief Walk the top-level chunks of a RIFF file with chunkstream
 *
 * Every chunk gets its own chunk_reader over the shared file stream.
 * Known chunks are decoded partially, unknown ones not at all; finalize()
 * keeps the stream aligned on the next chunk header either way.
 */

#include <chunkstream/chunk_reader.hh>
#include <chunkstream/byte_source.hh>
#include <chunkstream/exceptions.hh>
#include <iostream>
#include <fstream>
#include <iomanip>
#include <algorithm>
#include <array>
#include <string_view>

using namespace chunkstream;

namespace {
    bool read_chunk_header(byte_source& src, byte_order bo, fourcc& id, std::uint32_t& size) {
        std::array<std::byte, 8> raw;
        std::size_t got = 0;
        while (got < raw.size()) {
            std::size_t n = src.read(raw.data() + got, raw.size() - got);
            if (n == 0) {
                break;
            }
            got += n;
        }

        if (got == 0) {
            return false;  // Clean end of file
        }
        THROW_IO_IF(got != raw.size(), io_errc::short_source,
                    "Truncated chunk header: got ", got, " of 8 bytes");

        id = fourcc::from_bytes(raw.data());
        size = decode_value<std::uint32_t>(raw.data() + 4, bo);
        return true;
    }

    const char* format_name(std::uint16_t tag) {
        switch (tag) {
            case 0x0001: return "PCM";
            case 0x0003: return "IEEE Float";
            case 0x0006: return "A-law";
            case 0x0007: return "mu-law";
            case 0xFFFE: return "Extensible";
            default: return "Unknown";
        }
    }

    void print_format(chunk_reader& ch) {
        auto tag = ch.read_le<std::uint16_t>();
        auto channels = ch.read_le<std::uint16_t>();
        auto sample_rate = ch.read_le<std::uint32_t>();
        ch.skip(6);  // avg bytes/sec, block align
        auto bits = ch.read_le<std::uint16_t>();

        std::cout << "    " << format_name(tag) << ", " << channels << " channel(s), "
                  << sample_rate << " Hz, " << bits << " bits\n";
    }

    void print_preview(chunk_reader& ch) {
        auto preview = ch.read_bytes(16);
        std::cout << "    First " << preview.size() << " bytes (hex):";
        for (auto b : preview) {
            std::cout << ' ' << std::hex << std::setw(2) << std::setfill('0')
                      << std::to_integer<int>(b);
        }
        std::cout << std::dec << std::setfill(' ') << "\n";
    }

    void print_info_list(chunk_reader& ch) {
        auto type = ch.read_fourcc();
        if (type) {
            std::cout << "    List type: " << *type << "\n";
        }
    }
}

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <file.wav|file.avi|...>\n";
        return 1;
    }

    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Failed to open file: " << argv[1] << "\n";
        return 1;
    }

    reader_options options;
    options.strict = false;
    options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "warning [" << category << "] at " << offset << ": " << message << "\n";
    };

    try {
        stream_source src(file);

        fourcc root_id;
        std::uint32_t root_size = 0;
        if (!read_chunk_header(src, byte_order::little, root_id, root_size)) {
            std::cerr << "Empty file\n";
            return 1;
        }

        byte_order bo = byte_order::little;
        if (root_id == "RIFX"_4cc) {
            bo = byte_order::big;
            root_size = swap_byte_order(root_size);
        } else if (root_id != "RIFF"_4cc) {
            std::cerr << "Not a RIFF file: " << root_id << "\n";
            return 1;
        }

        chunk_reader root(root_id, 4, &src, options);
        auto form = root.read_fourcc();
        root.finalize();
        std::cout << root_id << " " << (form ? *form : fourcc()) << ", " << root_size << " bytes\n";

        fourcc id;
        std::uint32_t size = 0;
        while (read_chunk_header(src, bo, id, size)) {
            std::cout << "  " << id << ": " << size << " bytes\n";

            chunk_reader ch(id, size, &src, options);
            if (id == "fmt "_4cc && size >= 16) {
                print_format(ch);
            } else if (id == "data"_4cc) {
                print_preview(ch);
            } else if (id == "LIST"_4cc) {
                print_info_list(ch);
            }
            ch.finalize();

            // RIFF pads odd-sized chunks to an even boundary
            if ((size & 1) && src.discard(1) != 1) {
                break;
            }
        }
    } catch (const chunkstream_error& e) {
        std::cerr << "Error reading file: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
