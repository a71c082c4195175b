#include "lo/ChunkView.hpp"

#include <stdexcept>
#include <string>

namespace pglo::lo {

size_t ChunkView::count() const {
    const auto size = lob_.size();
    const auto bufsize = static_cast<uint64_t>(lob_.bufferSize());
    return static_cast<size_t>((size + bufsize - 1) / bufsize);
}

Bytes ChunkView::at(const size_t index) {
    if (index >= count())
        throw std::out_of_range("ChunkView index " + std::to_string(index) + " out of range for object "
                                + std::to_string(lob_.oid()));
    return readChunk(index);
}

std::vector<Bytes> ChunkView::slice(const size_t start, const size_t length, const size_t step) {
    if (step == 0) throw std::invalid_argument("ChunkView slice step must be positive");
    if (length == 0) return {};

    const auto last = start + (length - 1) * step;
    if (last >= count())
        throw std::out_of_range("ChunkView slice [" + std::to_string(start) + ", " + std::to_string(last)
                                + "] out of range for object " + std::to_string(lob_.oid()));

    std::vector<Bytes> chunks;
    chunks.reserve(length);
    for (size_t i = 0; i < length; ++i) chunks.push_back(readChunk(start + i * step));
    return chunks;
}

Bytes ChunkView::readChunk(const size_t index) {
    lob_.seek(static_cast<int64_t>(index * lob_.bufferSize()), Whence::Start);
    return lob_.read();
}

}
