#include "pci_device_list.hpp"
#include "utils.hpp"
#include <cstdio>

bool PciDevice::is_valid() const {
    return vendor != 0 || device != 0 || subvendor != 0 || subdevice != 0 || unk1 != 0 || unk2 != 0;
}

std::string PciDevice::to_string() const {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04x:%04x subsys %04x:%04x unk %04x:%04x",
                  vendor, device, subvendor, subdevice, unk1, unk2);
    return buf;
}

bool PciDevice::operator==(const PciDevice& other) const {
    return vendor == other.vendor && device == other.device && subvendor == other.subvendor &&
           subdevice == other.subdevice && unk1 == other.unk1 && unk2 == other.unk2;
}

PciDeviceList PciDeviceList::parse(const char* data, size_t size, size_t byte_length) {
    if (byte_length % FLB_PCI_DEVICE_SIZE != 0) {
        throw MisalignedDeviceListError("PCI device list is " + std::to_string(byte_length) +
                                        " bytes, not a multiple of " + std::to_string(FLB_PCI_DEVICE_SIZE));
    }
    if (byte_length > size) {
        throw TruncatedInputError("PCI device list needs " + std::to_string(byte_length) +
                                  " bytes, only " + std::to_string(size) + " available");
    }

    PciDeviceList list;
    list.devices.reserve(byte_length / FLB_PCI_DEVICE_SIZE);
    for (size_t pos = 0; pos < byte_length; pos += FLB_PCI_DEVICE_SIZE) {
        auto rec = read_record<FlbPciDeviceRecord>(data, byte_length, pos);
        PciDevice dev;
        dev.vendor = from_le(rec.vendor);
        dev.device = from_le(rec.device);
        dev.subvendor = from_le(rec.subvendor);
        dev.subdevice = from_le(rec.subdevice);
        dev.unk1 = from_le(rec.unk1);
        dev.unk2 = from_le(rec.unk2);
        list.devices.push_back(dev);
    }
    return list;
}

void PciDeviceList::write(std::vector<char>& out) const {
    for (const auto& dev : devices) {
        FlbPciDeviceRecord rec{};
        rec.vendor = to_le(dev.vendor);
        rec.device = to_le(dev.device);
        rec.subvendor = to_le(dev.subvendor);
        rec.subdevice = to_le(dev.subdevice);
        rec.unk1 = to_le(dev.unk1);
        rec.unk2 = to_le(dev.unk2);
        append_record(out, rec);
    }
}

void PciDeviceList::print_info(Reporter& reporter) const {
    reporter.info("Supported PCI Devices:");
    for (const auto& dev : devices) {
        if (dev.is_valid()) {
            reporter.info("  " + dev.to_string());
        }
    }
}
