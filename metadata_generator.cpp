#include "metadata_generator.hpp"
#include <algorithm>
#include <fstream>
#include <zlib.h>

uint32_t firmware_crc32(const std::vector<char>& firmware) {
    uLong crc = crc32(0L, Z_NULL, 0);
    // zlib takes a uInt length, so feed large payloads in slices.
    constexpr size_t slice = 1 << 30;
    for (size_t pos = 0; pos < firmware.size(); pos += slice) {
        size_t len = std::min(slice, firmware.size() - pos);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(firmware.data() + pos), static_cast<uInt>(len));
    }
    return static_cast<uint32_t>(crc);
}

json chunk_metadata(const FlbChunk& chunk) {
    json metadata;

    const FlbHeader& hdr = chunk.header;
    json header_json;
    header_json["magic"] = bytes_to_hex(hdr.magic);
    header_json["header_length"] = hdr.header_length;
    header_json["unknown1"] = hdr.unknown1;
    header_json["data_length"] = hdr.data_length;
    header_json["delimiter"] = hdr.delimiter;
    header_json["description"] = hdr.description;
    header_json["version1"] = hdr.version1;
    header_json["version2"] = hdr.version2;
    header_json["version3"] = hdr.version3;
    metadata["header"] = header_json;

    json details_json;
    details_json["flb_type"] = chunk.pci_details.flb_type;
    details_json["unknown"] = bytes_to_hex(chunk.pci_details.unknown);
    metadata["pcidetails"] = details_json;

    json devices_json = json::array();
    for (const auto& dev : chunk.pci_devices.devices) {
        devices_json.push_back({
            {"vendor", dev.vendor},
            {"device", dev.device},
            {"subvendor", dev.subvendor},
            {"subdevice", dev.subdevice},
            {"unk1", dev.unk1},
            {"unk2", dev.unk2}
        });
    }
    metadata["pcidevices"] = {{"devices", devices_json}};

    metadata["firmware_crc32"] = firmware_crc32(chunk.firmware);
    return metadata;
}

void generate_metadata(const std::filesystem::path& metadata_path, const FlbChunk& chunk) {
    std::ofstream out_f(metadata_path);
    if (!out_f) {
        throw std::runtime_error("Failed to open output file: " + metadata_path.string());
    }
    // Non-ASCII description bytes are dumped as U+FFFD; rebuild rejects them.
    out_f << chunk_metadata(chunk).dump(4, ' ', false, json::error_handler_t::replace);
    if (!out_f) {
        throw std::runtime_error("Failed to write file: " + metadata_path.string());
    }
}
