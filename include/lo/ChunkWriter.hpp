#pragma once

#include "lo/ChunkSink.hpp"
#include "lo/LargeObject.hpp"

namespace pglo::lo {

// Consumer adapter. Each pushed chunk becomes exactly one write(chunk), whatever its
// size. finish() closes the object and propagates close failures; abort(), or
// destruction without finish(), attempts a close and only logs a failure.
class ChunkWriter : public ChunkSink {
public:
    explicit ChunkWriter(LargeObject lob);
    ~ChunkWriter() override;

    ChunkWriter(const ChunkWriter&) = delete;
    ChunkWriter& operator=(const ChunkWriter&) = delete;

    void write(std::span<const uint8_t> chunk) override;
    void finish() override;
    void abort() override;

    [[nodiscard]] Oid oid() const { return lob_.oid(); }
    [[nodiscard]] uint64_t bytesWritten() const { return bytesWritten_; }
    [[nodiscard]] size_t chunkCount() const { return chunkCount_; }
    [[nodiscard]] bool finished() const { return finished_; }

private:
    LargeObject lob_;
    uint64_t bytesWritten_ = 0;
    size_t chunkCount_ = 0;
    bool finished_ = false;
};

}
