#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <type_traits>
#include <nlohmann/json.hpp>
#include "errors.hpp"

// Use nlohmann::ordered_json to preserve the order of elements in the chunk metadata files
using json = nlohmann::ordered_json;

// Decodes a null-padded string from a fixed-width field. Every null byte is dropped,
// not only the trailing ones.
std::string decode_padded(const char* buffer, size_t width);

// Encodes a string into a null-padded vector of chars of exactly `width` bytes.
// Throws FieldTooLongError if the text does not fit or is not plain ASCII.
std::vector<char> encode_padded(const std::string& s, size_t width);

// Converts a vector of bytes to a hex string.
std::string bytes_to_hex(const std::vector<uint8_t>& bytes);
std::string bytes_to_hex(const uint8_t* bytes, size_t size);

// Decodes a hex string into a vector of bytes. Throws std::invalid_argument on malformed input.
std::vector<uint8_t> unhexlify(const std::string& hex_str);

// Reads the entire content of a file into a vector of chars.
std::vector<char> read_filepath(const std::filesystem::path& path);

// Writes a buffer to a file, replacing any previous content.
void write_filepath(const std::filesystem::path& path, const std::vector<char>& data);

// Interprets the in-memory bytes of `value` as little-endian, whatever the host order.
template<typename T>
T from_le(T value) {
    static_assert(std::is_unsigned<T>::value, "from_le expects an unsigned integer");
    uint8_t bytes[sizeof(T)];
    std::memcpy(bytes, &value, sizeof(T));
    T result = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        result |= static_cast<T>(static_cast<T>(bytes[i]) << (8 * i));
    }
    return result;
}

// Produces a value whose in-memory bytes are the little-endian encoding of `value`.
template<typename T>
T to_le(T value) {
    static_assert(std::is_unsigned<T>::value, "to_le expects an unsigned integer");
    uint8_t bytes[sizeof(T)];
    for (size_t i = 0; i < sizeof(T); ++i) {
        bytes[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    T result;
    std::memcpy(&result, bytes, sizeof(T));
    return result;
}

// Copies a packed wire record out of a buffer. Throws TruncatedInputError if fewer than
// sizeof(T) bytes remain after `offset`.
template<typename T>
T read_record(const char* data, size_t size, size_t offset) {
    static_assert(std::is_trivially_copyable<T>::value, "wire records must be trivially copyable");
    if (offset > size || size - offset < sizeof(T)) {
        throw TruncatedInputError("Truncated input: need " + std::to_string(sizeof(T)) +
                                  " bytes at offset " + std::to_string(offset) + ", only " +
                                  std::to_string(offset > size ? 0 : size - offset) + " available");
    }
    T record;
    std::memcpy(&record, data + offset, sizeof(T));
    return record;
}

// Appends the raw bytes of a packed wire record to a buffer.
template<typename T>
void append_record(std::vector<char>& buffer, const T& record) {
    static_assert(std::is_trivially_copyable<T>::value, "wire records must be trivially copyable");
    const char* p = reinterpret_cast<const char*>(&record);
    buffer.insert(buffer.end(), p, p + sizeof(T));
}
#endif // UTILS_HPP
