#ifndef SHARED_STRUCTURE_HPP
#define SHARED_STRUCTURE_HPP

#include <cstdint>
#include <cstddef>

// Disable padding for all structures for binary compatibility
#pragma pack(push, 1)

struct FlbHeaderRecord {
    char magic[4];
    uint32_t header_length;
    uint8_t unknown1;
    uint32_t data_length;
    uint16_t delimiter; // usually 0x8086
    char description[80];
    uint8_t version[3];
};

struct FlbPciDetailsRecord {
    uint32_t flb_type;
    uint8_t unknown[37];
};

struct FlbPciDeviceRecord {
    uint16_t vendor;
    uint16_t device;
    uint16_t subvendor;
    uint16_t subdevice;
    uint16_t unk1;
    uint16_t unk2;
};

// Restore default packing alignment
#pragma pack(pop)

constexpr size_t FLB_HEADER_SIZE = 98;
constexpr size_t FLB_PCI_DETAILS_SIZE = 41;
constexpr size_t FLB_PCI_DEVICE_SIZE = 12;
constexpr size_t FLB_FIXED_HEADERS_SIZE = FLB_HEADER_SIZE + FLB_PCI_DETAILS_SIZE;
constexpr size_t FLB_DESCRIPTION_SIZE = 80;
constexpr size_t FLB_PCI_DETAILS_UNKNOWN_SIZE = 37;
constexpr char FLB_MAGIC[4] = {'F', 'L', 'B', '3'};

static_assert(sizeof(FlbHeaderRecord) == FLB_HEADER_SIZE, "FLB header must be 98 bytes");
static_assert(sizeof(FlbPciDetailsRecord) == FLB_PCI_DETAILS_SIZE, "PCI details must be 41 bytes");
static_assert(sizeof(FlbPciDeviceRecord) == FLB_PCI_DEVICE_SIZE, "PCI device entry must be 12 bytes");
#endif
