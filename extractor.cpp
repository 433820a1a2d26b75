#include "extractor.hpp"
#include "metadata_generator.hpp"
#include "utils.hpp"
#include <cstdio>

namespace fs = std::filesystem;

std::string chunk_file_stem(size_t index) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "chunk_%03zu", index);
    return buf;
}

void extract_chunks(const FlbContainer& container, const fs::path& out_path, Reporter& reporter) {
    if (fs::exists(out_path)) {
        reporter.warning("Output directory exists, writing anyway");
    }
    fs::create_directories(out_path);

    reporter.debug("Parsing done, writing " + std::to_string(container.chunks.size()) + " chunks to disk");

    for (const auto& chunk : container.chunks) {
        std::string stem = chunk_file_stem(chunk.index);
        fs::path bin_path = out_path / (stem + ".bin");
        fs::path json_path = out_path / (stem + ".json");

        reporter.info("  extracting chunk " + std::to_string(chunk.index) + " (" +
                      std::to_string(chunk.firmware.size()) + " bytes) to " + bin_path.filename().string());
        write_filepath(bin_path, chunk.firmware);
        generate_metadata(json_path, chunk);
    }

    reporter.info("Done!");
}
