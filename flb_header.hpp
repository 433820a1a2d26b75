#ifndef FLB_HEADER_HPP
#define FLB_HEADER_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "shared_structure.hpp"
#include "reporter.hpp"

// The 98-byte header at the start of every FLB3 chunk.
class FlbHeader {
public:
    std::vector<uint8_t> magic;  // 4 bytes, normally "FLB3"
    uint32_t header_length = 0;  // header + PCI details + device list
    uint8_t unknown1 = 0;
    uint32_t data_length = 0;
    uint16_t delimiter = 0;
    std::string description;
    uint8_t version1 = 0;
    uint8_t version2 = 0;
    uint8_t version3 = 0;

    // Decodes exactly FLB_HEADER_SIZE bytes from the start of `data`.
    static FlbHeader parse(const char* data, size_t size);

    bool has_expected_magic() const;

    // Appends the 98-byte encoding to `out`.
    void write(std::vector<char>& out) const;

    void print_info(Reporter& reporter) const;
};

#endif // FLB_HEADER_HPP
