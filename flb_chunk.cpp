#include "flb_chunk.hpp"
#include "utils.hpp"
#include <algorithm>
#include <limits>
#include <sstream>
#include <utility>

FlbChunk::FlbChunk(size_t index, FlbHeader header, PciDetails pci_details, PciDeviceList pci_devices,
                   std::vector<char> firmware)
    : index(index), header(std::move(header)), pci_details(std::move(pci_details)),
      pci_devices(std::move(pci_devices)), firmware(std::move(firmware)) {}

FlbChunk::Parsed FlbChunk::parse(const char* data, size_t size, size_t index, Reporter& reporter) {
    reporter.info("FLB3 chunk " + std::to_string(index));

    size_t pos = 0;
    FlbHeader header = FlbHeader::parse(data, size);
    pos += FLB_HEADER_SIZE;

    if (header.header_length < FLB_FIXED_HEADERS_SIZE) {
        throw NegativeDeviceListLengthError("Chunk " + std::to_string(index) + " declares header length " +
                                            std::to_string(header.header_length) + ", less than the " +
                                            std::to_string(FLB_FIXED_HEADERS_SIZE) + " bytes of fixed headers");
    }
    if (!header.has_expected_magic()) {
        reporter.warning("Chunk " + std::to_string(index) + " has unexpected magic 0x" +
                         bytes_to_hex(header.magic) + ", continuing anyway");
    }
    header.print_info(reporter);

    PciDetails details = PciDetails::parse(data + pos, size - pos);
    pos += FLB_PCI_DETAILS_SIZE;
    details.print_info(reporter);
    if (!details.kind().has_value()) {
        std::ostringstream oss;
        oss << "Chunk " << index << " has unrecognized FLB type 0x" << std::hex << details.flb_type;
        reporter.warning(oss.str());
    }

    size_t device_list_size = header.header_length - FLB_FIXED_HEADERS_SIZE;
    PciDeviceList devices = PciDeviceList::parse(data + pos, size - pos, device_list_size);
    pos += device_list_size;
    devices.print_info(reporter);

    // This is the actual firmware (or whatever else is in the blob)
    if (size - pos < header.data_length) {
        throw TruncatedInputError("Chunk " + std::to_string(index) + " declares " +
                                  std::to_string(header.data_length) + " bytes of firmware, only " +
                                  std::to_string(size - pos) + " available");
    }
    std::vector<char> firmware(data + pos, data + pos + header.data_length);
    pos += header.data_length;

    size_t preview = std::min<size_t>(firmware.size(), 8);
    reporter.debug("Firmware starts with " +
                   bytes_to_hex(reinterpret_cast<const uint8_t*>(firmware.data()), preview));

    return {FlbChunk(index, std::move(header), std::move(details), std::move(devices), std::move(firmware)), pos};
}

void FlbChunk::recalculate_lengths() {
    constexpr size_t max_field = std::numeric_limits<uint32_t>::max();
    if (firmware.size() > max_field) {
        throw FieldTooLongError("Chunk " + std::to_string(index) + " firmware is " +
                                std::to_string(firmware.size()) + " bytes, too large for the data length field");
    }
    size_t header_size = FLB_FIXED_HEADERS_SIZE + pci_devices.byte_size();
    if (header_size > max_field) {
        throw FieldTooLongError("Chunk " + std::to_string(index) + " has too many PCI devices (" +
                                std::to_string(pci_devices.devices.size()) + ")");
    }
    header.data_length = static_cast<uint32_t>(firmware.size());
    header.header_length = static_cast<uint32_t>(header_size);
}

size_t FlbChunk::serialized_size() const {
    return FLB_FIXED_HEADERS_SIZE + pci_devices.byte_size() + firmware.size();
}

void FlbChunk::write(std::vector<char>& out) const {
    header.write(out);
    pci_details.write(out);
    pci_devices.write(out);
    out.insert(out.end(), firmware.begin(), firmware.end());
}

void FlbChunk::print_info(Reporter& reporter) const {
    reporter.info("FLB3 chunk " + std::to_string(index));
    header.print_info(reporter);
    pci_details.print_info(reporter);
    pci_devices.print_info(reporter);
}
