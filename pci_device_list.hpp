#ifndef PCI_DEVICE_LIST_HPP
#define PCI_DEVICE_LIST_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "shared_structure.hpp"
#include "reporter.hpp"

// One supported PCI device, e.g. 8086:1563 subsys 15d9:0903.
struct PciDevice {
    uint16_t vendor = 0;
    uint16_t device = 0;
    uint16_t subvendor = 0;
    uint16_t subdevice = 0;
    uint16_t unk1 = 0;  // almost always 0
    uint16_t unk2 = 0;  // 0, occasionally 0x4100

    // Every device list ends with an all-zero entry, which is the only invalid one.
    bool is_valid() const;

    std::string to_string() const;

    bool operator==(const PciDevice& other) const;
    bool operator!=(const PciDevice& other) const { return !(*this == other); }
};

// The device entries between the PCI details block and the firmware payload.
// Its size on the wire is not stored anywhere; it is derived from the header length.
class PciDeviceList {
public:
    std::vector<PciDevice> devices;

    // Decodes every 12-byte entry in the first `byte_length` bytes of `data`,
    // including entries that follow an all-zero one.
    static PciDeviceList parse(const char* data, size_t size, size_t byte_length);

    size_t byte_size() const { return devices.size() * FLB_PCI_DEVICE_SIZE; }

    // Appends the entries in order. No sentinel is added.
    void write(std::vector<char>& out) const;

    void print_info(Reporter& reporter) const;
};

#endif // PCI_DEVICE_LIST_HPP
