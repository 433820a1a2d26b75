#include "flb_builder.hpp"
#include "metadata_generator.hpp"
#include "metadata_loader.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace fs = std::filesystem;

size_t FlbBuilder::chunk_index_from_name(const fs::path& bin_path) {
    const std::string prefix = "chunk_";
    std::string stem = bin_path.stem().string();
    std::string digits = stem.size() > prefix.size() ? stem.substr(prefix.size()) : "";

    if (stem.compare(0, prefix.size(), prefix) != 0 || digits.empty() || digits.size() > 9 ||
        !std::all_of(digits.begin(), digits.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        throw MissingOrInvalidMetadataError("Unexpected payload file name '" + bin_path.filename().string() +
                                            "', expected chunk_NNN.bin");
    }
    return static_cast<size_t>(std::stoul(digits));
}

FlbChunk FlbBuilder::load_chunk(const fs::path& bin_path, Reporter& reporter) const {
    reporter.debug("Processing " + bin_path.string());

    size_t index = chunk_index_from_name(bin_path);
    fs::path metadata_path = bin_path;
    metadata_path.replace_extension(".json");

    ChunkMetadata metadata = load_chunk_metadata(metadata_path);
    std::vector<char> firmware = read_filepath(bin_path);

    if (metadata.firmware_crc32.has_value() && *metadata.firmware_crc32 != firmware_crc32(firmware)) {
        reporter.info("Chunk " + std::to_string(index) + " payload modified since extraction");
    }

    FlbChunk chunk(index, std::move(metadata.header), std::move(metadata.pci_details),
                   std::move(metadata.pci_devices), std::move(firmware));
    chunk.print_info(reporter);
    return chunk;
}

FlbContainer FlbBuilder::load(Reporter& reporter) const {
    if (!fs::is_directory(input_dir)) {
        throw std::runtime_error("Input directory not found: " + input_dir.string());
    }

    std::vector<std::pair<size_t, fs::path>> bin_files;
    for (const auto& entry : fs::directory_iterator(input_dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".bin") {
            bin_files.emplace_back(chunk_index_from_name(entry.path()), entry.path());
        }
    }
    if (bin_files.empty()) {
        throw std::runtime_error("No chunk files found in '" + input_dir.string() + "'");
    }

    std::sort(bin_files.begin(), bin_files.end());
    for (size_t i = 1; i < bin_files.size(); ++i) {
        if (bin_files[i].first == bin_files[i - 1].first) {
            throw MissingOrInvalidMetadataError("Duplicate chunk index " + std::to_string(bin_files[i].first) +
                                                ": " + bin_files[i - 1].second.filename().string() + " and " +
                                                bin_files[i].second.filename().string());
        }
    }

    std::vector<FlbChunk> chunks;
    chunks.reserve(bin_files.size());
    for (const auto& bin_file : bin_files) {
        chunks.push_back(load_chunk(bin_file.second, reporter));
    }

    reporter.info("Loaded " + std::to_string(chunks.size()) + " chunks");
    return FlbContainer::from_chunks(std::move(chunks));
}

void FlbBuilder::build(const fs::path& output_path, Reporter& reporter) const {
    FlbContainer container = load(reporter);

    reporter.debug("Serializing " + std::to_string(container.chunks.size()) + " chunks (" +
                   std::to_string(container.serialized_size()) + " bytes)");
    std::vector<char> output;
    container.serialize(output, reporter);

    write_filepath(output_path, output);
    reporter.info("FLB file '" + output_path.string() + "' created successfully (" +
                  std::to_string(output.size()) + " bytes)");
    reporter.info("Done!");
}
