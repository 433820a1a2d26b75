#ifndef FLB_CHUNK_HPP
#define FLB_CHUNK_HPP

#include <cstdint>
#include <vector>
#include "flb_header.hpp"
#include "pci_details.hpp"
#include "pci_device_list.hpp"
#include "reporter.hpp"

// One header + PCI details + device list + firmware unit of an FLB3 container.
class FlbChunk {
public:
    struct Parsed;

    size_t index = 0;
    FlbHeader header;
    PciDetails pci_details;
    PciDeviceList pci_devices;
    std::vector<char> firmware;

    FlbChunk() = default;
    FlbChunk(size_t index, FlbHeader header, PciDetails pci_details, PciDeviceList pci_devices,
             std::vector<char> firmware);

    // Decodes one chunk from the start of `data`. The device list size is
    // header_length - 98 - 41 and the payload size is data_length, so
    // Parsed::consumed = header_length + data_length.
    static Parsed parse(const char* data, size_t size, size_t index, Reporter& reporter);

    // Sets data_length and header_length from the current payload and device list.
    // Must be called after editing either, before write().
    void recalculate_lengths();

    // Size of the bytes write() produces.
    size_t serialized_size() const;

    // Appends header, PCI details, device list and firmware, in that order.
    // Header fields are written as they are; lengths are not recomputed here.
    void write(std::vector<char>& out) const;

    void print_info(Reporter& reporter) const;
};

struct FlbChunk::Parsed {
    FlbChunk chunk;
    size_t consumed;
};

#endif // FLB_CHUNK_HPP
