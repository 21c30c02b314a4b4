#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "unittest_config.h"

// Load a file from unittest/data as a byte vector
inline std::vector<std::byte> load_test_data(const std::string& name) {
    static std::filesystem::path root(UNITTEST_PATH_TO_DATA);
    std::ifstream stream(root / name, std::ios::binary);
    if (!stream.good()) {
        throw std::runtime_error("Cannot open test file: " + name);
    }

    stream.seekg(0, std::ios::end);
    auto size = stream.tellg();
    stream.seekg(0, std::ios::beg);

    std::vector<std::byte> data(static_cast<std::size_t>(size));
    stream.read(reinterpret_cast<char*>(data.data()), size);
    return data;
}

inline std::vector<std::byte> to_bytes(std::string_view s) {
    std::vector<std::byte> out;
    for (char c : s) {
        out.push_back(static_cast<std::byte>(c));
    }
    return out;
}

inline void append_be32(std::vector<std::byte>& out, std::uint32_t v) {
    out.push_back(static_cast<std::byte>(v >> 24));
    out.push_back(static_cast<std::byte>(v >> 16));
    out.push_back(static_cast<std::byte>(v >> 8));
    out.push_back(static_cast<std::byte>(v));
}

// Hand-assembled record: the length and crc fields are taken as given
inline std::vector<std::byte> make_record(std::uint32_t length, std::string_view type,
                                          std::string_view payload, std::uint32_t crc) {
    std::vector<std::byte> out;
    append_be32(out, length);
    for (char c : type) {
        out.push_back(static_cast<std::byte>(c));
    }
    for (char c : payload) {
        out.push_back(static_cast<std::byte>(c));
    }
    append_be32(out, crc);
    return out;
}

inline const std::string secret_message = "This is where your secret message will be!";
inline constexpr std::uint32_t secret_message_crc = 2882656334u;
