#pragma once

#include "lo/LargeObject.hpp"

#include <vector>

namespace pglo::lo {

// Random access to an object in bufferSize() units. Every indexed read seeks to
// index * bufferSize first, so a previously moved cursor does not shift chunk 0.
class ChunkView {
public:
    explicit ChunkView(LargeObject& lob) : lob_(lob) {}

    // ceil(size / bufferSize)
    [[nodiscard]] size_t count() const;

    [[nodiscard]] Bytes at(size_t index);

    // length chunks at index start, start + step, start + 2 * step, ...
    [[nodiscard]] std::vector<Bytes> slice(size_t start, size_t length, size_t step = 1);

private:
    LargeObject& lob_;

    Bytes readChunk(size_t index);
};

}
