#ifndef FLB_CONTAINER_HPP
#define FLB_CONTAINER_HPP

#include <vector>
#include "flb_chunk.hpp"
#include "reporter.hpp"

// A whole FLB3 file: chunks laid back to back, with no count or length of its own.
class FlbContainer {
public:
    std::vector<FlbChunk> chunks;

    // Parses chunks from offset 0 until the buffer is exhausted. A chunk that runs past
    // the end of the buffer raises TrailingDataError.
    static FlbContainer parse(const std::vector<char>& data, Reporter& reporter);

    // Keeps the chunks in the order given.
    static FlbContainer from_chunks(std::vector<FlbChunk> ordered_chunks);

    // Recomputes every chunk's length fields, then writes the chunks in order.
    void serialize(std::vector<char>& out);
    void serialize(std::vector<char>& out, Reporter& reporter);

    // Total output size of serialize(), after recomputation.
    size_t serialized_size() const;
};

#endif // FLB_CONTAINER_HPP
