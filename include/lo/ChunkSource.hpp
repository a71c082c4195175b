#pragma once

#include "lo/Types.hpp"

#include <cstddef>
#include <istream>
#include <iterator>
#include <optional>
#include <span>

namespace pglo::lo {

// Pull side of a byte stream: a lazy, single-pass sequence of chunks.
// next() returns std::nullopt once the sequence is exhausted.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    [[nodiscard]] virtual std::optional<Bytes> next() = 0;

    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Bytes;
        using difference_type = std::ptrdiff_t;
        using pointer = const Bytes*;
        using reference = const Bytes&;

        Iterator() = default;
        explicit Iterator(ChunkSource* source) : source_(source) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        Iterator& operator++() {
            advance();
            return *this;
        }

        void operator++(int) { advance(); }

        friend bool operator==(const Iterator& a, const Iterator& b) { return a.source_ == b.source_; }

    private:
        ChunkSource* source_ = nullptr;
        std::optional<Bytes> current_;

        void advance() {
            current_ = source_->next();
            if (!current_) source_ = nullptr;
        }
    };

    Iterator begin() { return Iterator(this); }
    Iterator end() { return {}; }
};

// Re-chunks one in-memory buffer into pieces of at most chunkSize bytes.
// The buffer is viewed, not copied, and must outlive the source.
class BufferSource : public ChunkSource {
public:
    BufferSource(std::span<const uint8_t> buffer, size_t chunkSize);

    [[nodiscard]] std::optional<Bytes> next() override;

private:
    std::span<const uint8_t> buffer_;
    size_t chunkSize_;
    size_t offset_ = 0;
};

class StreamSource : public ChunkSource {
public:
    StreamSource(std::istream& in, size_t chunkSize);

    [[nodiscard]] std::optional<Bytes> next() override;

private:
    std::istream& in_;
    size_t chunkSize_;
};

}
