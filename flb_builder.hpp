#ifndef FLB_BUILDER_HPP
#define FLB_BUILDER_HPP

#include <filesystem>
#include <utility>
#include <vector>
#include "flb_container.hpp"
#include "reporter.hpp"

// Reassembles an FLB3 file from a directory written by extract_chunks().
class FlbBuilder {
private:
    std::filesystem::path input_dir;

    // Parses NNN out of chunk_NNN.bin.
    static size_t chunk_index_from_name(const std::filesystem::path& bin_path);

public:
    explicit FlbBuilder(std::filesystem::path input_dir) : input_dir(std::move(input_dir)) {}

    // Loads one chunk from its payload file and the sibling .json.
    FlbChunk load_chunk(const std::filesystem::path& bin_path, Reporter& reporter) const;

    // Loads every chunk_NNN.bin in the directory, ordered by NNN.
    FlbContainer load(Reporter& reporter) const;

    // Loads all chunks and serializes the container. Nothing is written until every
    // chunk has been loaded and encoded.
    void build(const std::filesystem::path& output_path, Reporter& reporter) const;
};

#endif // FLB_BUILDER_HPP
