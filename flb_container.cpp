#include "flb_container.hpp"
#include "utils.hpp"
#include <utility>

FlbContainer FlbContainer::parse(const std::vector<char>& data, Reporter& reporter) {
    reporter.debug("Reading " + std::to_string(data.size()) + " bytes...");

    FlbContainer container;
    size_t pos = 0;
    while (pos < data.size()) {
        size_t index = container.chunks.size();
        try {
            auto parsed = FlbChunk::parse(data.data() + pos, data.size() - pos, index, reporter);
            pos += parsed.consumed;
            container.chunks.push_back(std::move(parsed.chunk));
        } catch (const TruncatedInputError& e) {
            throw TrailingDataError("Chunk " + std::to_string(index) + " at offset " + std::to_string(pos) +
                                    " is incomplete (" + std::to_string(data.size() - pos) +
                                    " bytes left): " + e.what());
        }
    }
    return container;
}

FlbContainer FlbContainer::from_chunks(std::vector<FlbChunk> ordered_chunks) {
    FlbContainer container;
    container.chunks = std::move(ordered_chunks);
    return container;
}

void FlbContainer::serialize(std::vector<char>& out) {
    NullReporter quiet;
    serialize(out, quiet);
}

void FlbContainer::serialize(std::vector<char>& out, Reporter& reporter) {
    out.reserve(out.size() + serialized_size());
    for (auto& chunk : chunks) {
        reporter.debug("Writing chunk " + std::to_string(chunk.index));
        chunk.recalculate_lengths();
        chunk.write(out);
    }
}

size_t FlbContainer::serialized_size() const {
    size_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.serialized_size();
    }
    return total;
}
