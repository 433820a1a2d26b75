#ifndef METADATA_LOADER_HPP
#define METADATA_LOADER_HPP

#include "flb_header.hpp"
#include "pci_details.hpp"
#include "pci_device_list.hpp"
#include "utils.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

// The decoded content of one chunk_NNN.json file.
struct ChunkMetadata {
    FlbHeader header;
    PciDetails pci_details;
    PciDeviceList pci_devices;
    std::optional<uint32_t> firmware_crc32;
};

// Decodes a metadata document against the fixed chunk schema. `source` names the
// document in error messages. Throws MissingOrInvalidMetadataError on any mismatch.
ChunkMetadata parse_chunk_metadata(const json& metadata, const std::string& source);

// Reads and decodes a chunk metadata file.
ChunkMetadata load_chunk_metadata(const std::filesystem::path& metadata_path);

#endif // METADATA_LOADER_HPP
