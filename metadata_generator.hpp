#ifndef METADATA_GENERATOR_HPP
#define METADATA_GENERATOR_HPP

#include "flb_chunk.hpp"
#include "utils.hpp"
#include <cstdint>
#include <filesystem>
#include <vector>

// CRC-32 of a payload, as recorded in the chunk metadata.
uint32_t firmware_crc32(const std::vector<char>& firmware);

// Builds the metadata document of one chunk: header, pcidetails and pcidevices sections.
json chunk_metadata(const FlbChunk& chunk);

// Writes chunk_metadata() to `metadata_path`, indented by 4.
void generate_metadata(const std::filesystem::path& metadata_path, const FlbChunk& chunk);

#endif // METADATA_GENERATOR_HPP
