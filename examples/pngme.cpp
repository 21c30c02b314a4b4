/**
 * @file pngme.cpp
 * @brief Hide text messages in PNG files
 *
 * Messages are stored as the payload of a chunk with a user chosen type.
 * Decoders skip ancillary chunks they do not know, so a lowercase first
 * letter keeps the image viewable.
 *
 * Commands:
 *   encode <file> <type> <message> [output]
 *   decode <file> <type>
 *   remove <file> <type>
 *   print  <file>
 */

#include <pngme/png_file.hh>
#include <pngme/chunk.hh>
#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>
#include <iostream>
#include <filesystem>
#include <string>
#include <vector>

namespace {

    void print_usage(const char* prog) {
        std::cout << "Usage: " << prog << " <command> [arguments]\n";
        std::cout << "\n";
        std::cout << "Commands:\n";
        std::cout << "  encode <file> <type> <message> [output]  Store message in a new chunk\n";
        std::cout << "  decode <file> <type>                     Print the message of the first chunk of type\n";
        std::cout << "  remove <file> <type>                     Delete the first chunk of type\n";
        std::cout << "  print  <file>                            List all chunks\n";
        std::cout << "\n";
        std::cout << "Type is a 4 letter chunk type, e.g. ruSt.\n";
    }

    pngme::parse_options cli_options() {
        pngme::parse_options options;
        // encode appends after IEND, every encoded file would warn
        options.warn_after_iend = false;
        options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
        };
        return options;
    }

    int encode_command(const std::vector<std::string>& args) {
        if (args.size() != 3 && args.size() != 4) {
            std::cerr << "encode expects <file> <type> <message> [output]\n";
            return 1;
        }
        const std::filesystem::path input = args[0];
        const std::filesystem::path output = args.size() == 4 ? std::filesystem::path(args[3]) : input;

        auto type = pngme::chunk_type::from_string(args[1]);
        if (!type.is_valid()) {
            std::cerr << "Warning: chunk type " << type << " has the reserved bit set\n";
        }
        if (type.is_critical()) {
            std::cerr << "Warning: chunk type " << type << " is critical, decoders will reject the file\n";
        }

        auto png = pngme::png_file::load(input, cli_options());
        png.append_chunk(pngme::chunk(type, std::string_view(args[2])));
        png.save(output);

        std::cout << "Stored " << args[2].size() << " bytes in chunk " << type << " of " << output.string() << "\n";
        return 0;
    }

    int decode_command(const std::vector<std::string>& args) {
        if (args.size() != 2) {
            std::cerr << "decode expects <file> <type>\n";
            return 1;
        }
        const auto type = pngme::chunk_type::from_string(args[1]);
        const auto png = pngme::png_file::load(std::filesystem::path(args[0]), cli_options());

        const auto* c = png.chunk_by_type(type);
        if (!c) {
            std::cerr << "No chunk of type " << type << " in " << args[0] << "\n";
            return 1;
        }
        std::cout << c->data_as_text() << "\n";
        return 0;
    }

    int remove_command(const std::vector<std::string>& args) {
        if (args.size() != 2) {
            std::cerr << "remove expects <file> <type>\n";
            return 1;
        }
        const std::filesystem::path path = args[0];
        const auto type = pngme::chunk_type::from_string(args[1]);

        auto png = pngme::png_file::load(path, cli_options());
        const auto removed = png.remove_first_chunk(type);
        png.save(path);

        std::cout << "Removed " << removed << "\n";
        return 0;
    }

    int print_command(const std::vector<std::string>& args) {
        if (args.size() != 1) {
            std::cerr << "print expects <file>\n";
            return 1;
        }
        const auto png = pngme::png_file::load(std::filesystem::path(args[0]), cli_options());
        for (const auto& c : png.chunks()) {
            std::cout << c << "\n";
        }
        return 0;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    try {
        if (command == "encode") {
            return encode_command(args);
        } else if (command == "decode") {
            return decode_command(args);
        } else if (command == "remove") {
            return remove_command(args);
        } else if (command == "print") {
            return print_command(args);
        }
        std::cerr << "Unknown command: " << command << "\n\n";
        print_usage(argv[0]);
        return 1;

    } catch (const pngme::parse_error& e) {
        std::cerr << "Error [" << pngme::to_string(e.kind()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
