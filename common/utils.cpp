#include "utils.hpp"
#include <cctype>

std::string decode_padded(const char* buffer, size_t width) {
    std::string result;
    result.reserve(width);
    for (size_t i = 0; i < width; ++i) {
        if (buffer[i] != '\0') result.push_back(buffer[i]);
    }
    return result;
}

std::vector<char> encode_padded(const std::string& s, size_t width) {
    if (s.size() > width) {
        throw FieldTooLongError("Text '" + s + "' is " + std::to_string(s.size()) +
                                " bytes, field holds at most " + std::to_string(width));
    }
    for (char c : s) {
        auto uc = static_cast<unsigned char>(c);
        if (uc == 0 || uc > 0x7f) {
            throw FieldTooLongError("Text '" + s + "' contains a null or non-ASCII byte");
        }
    }
    std::vector<char> buffer(width, 0);
    std::copy(s.begin(), s.end(), buffer.begin());
    return buffer;
}

std::string bytes_to_hex(const std::vector<uint8_t>& bytes) {
    return bytes_to_hex(bytes.data(), bytes.size());
}

std::string bytes_to_hex(const uint8_t* bytes, size_t size) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(bytes[i]);
    }
    return oss.str();
}

std::vector<uint8_t> unhexlify(const std::string& hex_str) {
    if (hex_str.length() % 2 != 0) {
        throw std::invalid_argument("Hex string has odd length: " + hex_str);
    }
    std::vector<uint8_t> bytes;
    bytes.reserve(hex_str.length() / 2);
    for (size_t i = 0; i < hex_str.length(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(hex_str[i])) ||
            !std::isxdigit(static_cast<unsigned char>(hex_str[i + 1]))) {
            throw std::invalid_argument("Invalid hex digit in: " + hex_str);
        }
        std::string byteString = hex_str.substr(i, 2);
        uint8_t byte = static_cast<uint8_t>(strtol(byteString.c_str(), nullptr, 16));
        bytes.push_back(byte);
    }
    return bytes;
}

std::vector<char> read_filepath(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }
    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);
    std::vector<char> buffer(size);
    if (size > 0 && !file.read(buffer.data(), size)) {
        throw std::runtime_error("Failed to read file: " + path.string());
    }
    return buffer;
}

void write_filepath(const std::filesystem::path& path, const std::vector<char>& data) {
    std::ofstream out_f(path, std::ios::binary | std::ios::trunc);
    if (!out_f) {
        throw std::runtime_error("Failed to open output file: " + path.string());
    }
    out_f.write(data.data(), data.size());
    if (!out_f) {
        throw std::runtime_error("Failed to write file: " + path.string());
    }
}
