#include "lo/ChunkSource.hpp"
#include "lo/ChunkSink.hpp"

#include <algorithm>
#include <stdexcept>

namespace pglo::lo {

BufferSource::BufferSource(const std::span<const uint8_t> buffer, const size_t chunkSize)
    : buffer_(buffer), chunkSize_(chunkSize) {
    if (chunkSize_ == 0) throw std::invalid_argument("BufferSource chunk size must be positive");
}

std::optional<Bytes> BufferSource::next() {
    if (offset_ >= buffer_.size()) return std::nullopt;
    const auto n = std::min(chunkSize_, buffer_.size() - offset_);
    const auto piece = buffer_.subspan(offset_, n);
    offset_ += n;
    return Bytes(piece.begin(), piece.end());
}

StreamSource::StreamSource(std::istream& in, const size_t chunkSize) : in_(in), chunkSize_(chunkSize) {
    if (chunkSize_ == 0) throw std::invalid_argument("StreamSource chunk size must be positive");
}

std::optional<Bytes> StreamSource::next() {
    if (!in_.good()) {
        if (in_.bad()) throw std::runtime_error("StreamSource read error");
        return std::nullopt;
    }

    Bytes chunk(chunkSize_);
    in_.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
    if (in_.bad()) throw std::runtime_error("StreamSource read error");

    chunk.resize(static_cast<size_t>(in_.gcount()));
    if (chunk.empty()) return std::nullopt;
    return chunk;
}

void BufferSink::write(const std::span<const uint8_t> chunk) { data_.insert(data_.end(), chunk.begin(), chunk.end()); }

void StreamSink::write(const std::span<const uint8_t> chunk) {
    out_.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
    if (!out_) throw std::runtime_error("StreamSink write error");
}

void StreamSink::finish() {
    out_.flush();
    if (!out_) throw std::runtime_error("StreamSink flush error");
}

}
