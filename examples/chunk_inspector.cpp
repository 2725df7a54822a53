/**
 * @file chunk_inspector.cpp
 * @brief Inspect a sequence of raw chunk frames stored in a file
 *
 * The file holds back-to-back chunk frames (for example the bytes of a PNG
 * file after its 8-byte signature). Each frame is verified and its type
 * properties are printed.
 *
 * Usage: chunk_inspector [--lenient] [--skip N] <file>
 */

#include <pngme/chunk.hh>
#include <pngme/exceptions.hh>

#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
    void print_usage(const char* program) {
        std::cout << "Usage: " << program << " [--lenient] [--skip N] <file>\n";
        std::cout << "\n";
        std::cout << "Options:\n";
        std::cout << "  --lenient  Report size problems as warnings instead of errors\n";
        std::cout << "  --skip N   Skip N leading bytes (use 8 for a PNG file)\n";
    }

    // Accepts plain decimal digits only
    bool parse_skip(const std::string& text, std::size_t& value) {
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
            return false;
        }
        try {
            value = std::stoul(text);
        } catch (const std::out_of_range&) {
            return false;
        }
        return true;
    }

    const char* yes_no(bool v) {
        return v ? "yes" : "no";
    }

    void print_chunk(std::size_t index, std::size_t offset, const pngme::chunk& c) {
        const auto& type = c.chunk_type();
        std::cout << "#" << index << " at offset " << offset << ": " << type
                  << " (" << c.length() << " bytes, CRC " << c.crc() << ")\n";
        std::cout << "    critical: " << yes_no(type.is_critical())
                  << ", public: " << yes_no(type.is_public())
                  << ", reserved bit valid: " << yes_no(type.is_reserved_bit_valid())
                  << ", safe to copy: " << yes_no(type.is_safe_to_copy()) << "\n";
    }
}

int main(int argc, char* argv[]) {
    pngme::parse_options options;
    std::size_t skip = 0;
    const char* path = nullptr;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--lenient") == 0) {
            options.strict = false;
        } else if (std::strcmp(argv[i], "--skip") == 0 && i + 1 < argc) {
            if (!parse_skip(argv[++i], skip)) {
                std::cerr << "Error: Invalid value for --skip: '" << argv[i] << "'\n";
                print_usage(argv[0]);
                return 1;
            }
        } else if (!path) {
            path = argv[i];
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!path) {
        print_usage(argv[0]);
        return 1;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << path << "'\n";
        return 1;
    }

    std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (skip > raw.size()) {
        std::cerr << "Error: file is shorter than " << skip << " bytes\n";
        return 1;
    }

    options.on_warning = [](std::uint64_t, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "]: " << message << "\n";
    };

    std::size_t offset = skip;
    std::size_t index = 0;
    while (offset < raw.size()) {
        try {
            auto [c, used] = pngme::chunk::read_frame(raw.data() + offset, raw.size() - offset, options);
            print_chunk(index, offset, c);
            offset += used;
            index++;
        } catch (const pngme::pngme_error& e) {
            std::cerr << "Error in chunk #" << index << " at offset " << offset
                      << " (" << pngme::to_string(e.kind()) << "): " << e.what() << "\n";
            return 1;
        }
    }

    std::cout << "\n" << index << " chunk(s) verified\n";
    return 0;
}
