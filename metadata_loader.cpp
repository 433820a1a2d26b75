#include "metadata_loader.hpp"
#include <fstream>
#include <limits>

namespace {

[[noreturn]] void invalid(const std::string& source, const std::string& reason) {
    throw MissingOrInvalidMetadataError("Invalid metadata in '" + source + "': " + reason);
}

const json& section(const json& parent, const char* key, const std::string& source) {
    if (!parent.is_object() || !parent.contains(key)) {
        invalid(source, std::string("missing '") + key + "'");
    }
    return parent.at(key);
}

template<typename T>
T get_uint(const json& obj, const char* key, const std::string& source) {
    const json& value = section(obj, key, source);
    if (!value.is_number_integer() || (!value.is_number_unsigned() && value.get<int64_t>() < 0)) {
        invalid(source, std::string("'") + key + "' must be a non-negative integer");
    }
    uint64_t raw = value.get<uint64_t>();
    if (raw > std::numeric_limits<T>::max()) {
        invalid(source, std::string("'") + key + "' = " + std::to_string(raw) + " does not fit in " +
                            std::to_string(sizeof(T) * 8) + " bits");
    }
    return static_cast<T>(raw);
}

std::string get_string(const json& obj, const char* key, const std::string& source) {
    const json& value = section(obj, key, source);
    if (!value.is_string()) {
        invalid(source, std::string("'") + key + "' must be a string");
    }
    return value.get<std::string>();
}

std::vector<uint8_t> get_hex(const json& obj, const char* key, size_t expected_size, const std::string& source) {
    std::string hex = get_string(obj, key, source);
    std::vector<uint8_t> bytes;
    try {
        bytes = unhexlify(hex);
    } catch (const std::invalid_argument& e) {
        invalid(source, std::string("'") + key + "': " + e.what());
    }
    if (bytes.size() != expected_size) {
        invalid(source, std::string("'") + key + "' must hold " + std::to_string(expected_size) +
                            " bytes, got " + std::to_string(bytes.size()));
    }
    return bytes;
}

} // namespace

ChunkMetadata parse_chunk_metadata(const json& metadata, const std::string& source) {
    if (!metadata.is_object()) {
        invalid(source, "top level must be an object");
    }

    ChunkMetadata result;

    const json& hdr = section(metadata, "header", source);
    result.header.magic = get_hex(hdr, "magic", sizeof(FlbHeaderRecord::magic), source);
    result.header.header_length = get_uint<uint32_t>(hdr, "header_length", source);
    result.header.unknown1 = get_uint<uint8_t>(hdr, "unknown1", source);
    result.header.data_length = get_uint<uint32_t>(hdr, "data_length", source);
    result.header.delimiter = get_uint<uint16_t>(hdr, "delimiter", source);
    result.header.description = get_string(hdr, "description", source);
    // Same FieldTooLongError FlbHeader::write would raise.
    encode_padded(result.header.description, FLB_DESCRIPTION_SIZE);
    result.header.version1 = get_uint<uint8_t>(hdr, "version1", source);
    result.header.version2 = get_uint<uint8_t>(hdr, "version2", source);
    result.header.version3 = get_uint<uint8_t>(hdr, "version3", source);

    const json& details = section(metadata, "pcidetails", source);
    result.pci_details.flb_type = get_uint<uint32_t>(details, "flb_type", source);
    result.pci_details.unknown = get_hex(details, "unknown", FLB_PCI_DETAILS_UNKNOWN_SIZE, source);

    const json& devices = section(section(metadata, "pcidevices", source), "devices", source);
    if (!devices.is_array()) {
        invalid(source, "'devices' must be an array");
    }
    for (const auto& entry : devices) {
        PciDevice dev;
        dev.vendor = get_uint<uint16_t>(entry, "vendor", source);
        dev.device = get_uint<uint16_t>(entry, "device", source);
        dev.subvendor = get_uint<uint16_t>(entry, "subvendor", source);
        dev.subdevice = get_uint<uint16_t>(entry, "subdevice", source);
        dev.unk1 = get_uint<uint16_t>(entry, "unk1", source);
        dev.unk2 = get_uint<uint16_t>(entry, "unk2", source);
        result.pci_devices.devices.push_back(dev);
    }

    if (metadata.contains("firmware_crc32")) {
        result.firmware_crc32 = get_uint<uint32_t>(metadata, "firmware_crc32", source);
    }
    return result;
}

ChunkMetadata load_chunk_metadata(const std::filesystem::path& metadata_path) {
    if (!std::filesystem::exists(metadata_path)) {
        throw MissingOrInvalidMetadataError("Metadata file not found: " + metadata_path.string());
    }

    std::ifstream meta_file(metadata_path);
    if (!meta_file) {
        throw MissingOrInvalidMetadataError("Cannot open metadata file: " + metadata_path.string());
    }

    json metadata;
    try {
        metadata = json::parse(meta_file);
    } catch (const json::parse_error& e) {
        throw MissingOrInvalidMetadataError("Malformed metadata file " + metadata_path.string() + ": " + e.what());
    }
    return parse_chunk_metadata(metadata, metadata_path.string());
}
