/**
 * @file simple_example.cpp
 * @brief Simple example demonstrating basic pngme usage
 *
 * Lists every chunk of a PNG file together with its CRC and property bits.
 */

#include <pngme/parser.hh>
#include <pngme/exceptions.hh>
#include <iostream>
#include <fstream>
#include <iterator>
#include <vector>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <file>\n";
        std::cout << "\n";
        std::cout << "Simple example that lists all chunks in a PNG file.\n";
        return 1;
    }

    // Read the whole file
    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
        return 1;
    }
    std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    std::cout << "Parsing: " << argv[1] << "\n";
    std::cout << "====================\n\n";

    pngme::parse_options options;
    options.strict = false;
    options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
    };

    try {
        pngme::for_each_chunk(raw.data(), raw.size(), [](const auto& info) {
            const auto& type = info.record.type();
            std::cout << "Chunk: " << type.to_string()
                      << " at offset " << info.offset
                      << " (" << info.record.length() << " bytes, crc " << info.record.crc() << ")\n";
            std::cout << "  " << (type.is_critical() ? "critical" : "ancillary")
                      << ", " << (type.is_public() ? "public" : "private")
                      << ", " << (type.is_safe_to_copy() ? "safe to copy" : "unsafe to copy")
                      << (type.is_valid() ? "" : ", reserved bit set") << "\n";
        }, options);

        std::cout << "\nParsing completed successfully!\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
