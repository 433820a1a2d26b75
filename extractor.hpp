#ifndef EXTRACTOR_HPP
#define EXTRACTOR_HPP

#include "flb_container.hpp"
#include "reporter.hpp"
#include <filesystem>
#include <string>

// "chunk_007" for index 7.
std::string chunk_file_stem(size_t index);

// Writes chunk_NNN.bin (firmware) and chunk_NNN.json (metadata) for every chunk.
void extract_chunks(const FlbContainer& container, const std::filesystem::path& out_path, Reporter& reporter);

#endif // EXTRACTOR_HPP
