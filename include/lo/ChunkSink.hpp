#pragma once

#include "lo/Types.hpp"

#include <functional>
#include <ostream>
#include <span>
#include <utility>

namespace pglo::lo {

// Push side of a byte stream. finish() marks normal completion; abort() is the
// abrupt-termination path and must not throw.
class ChunkSink {
public:
    virtual ~ChunkSink() = default;

    virtual void write(std::span<const uint8_t> chunk) = 0;
    virtual void finish() {}
    virtual void abort() {}
};

class BufferSink : public ChunkSink {
public:
    void write(std::span<const uint8_t> chunk) override;

    [[nodiscard]] const Bytes& data() const { return data_; }
    [[nodiscard]] Bytes take() { return std::move(data_); }

private:
    Bytes data_;
};

class StreamSink : public ChunkSink {
public:
    explicit StreamSink(std::ostream& out) : out_(out) {}

    void write(std::span<const uint8_t> chunk) override;
    void finish() override;

private:
    std::ostream& out_;
};

class CallbackSink : public ChunkSink {
public:
    using Callback = std::function<void(std::span<const uint8_t>)>;

    explicit CallbackSink(Callback cb) : cb_(std::move(cb)) {}

    void write(const std::span<const uint8_t> chunk) override { cb_(chunk); }

private:
    Callback cb_;
};

}
