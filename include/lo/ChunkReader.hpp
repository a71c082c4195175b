#pragma once

#include "lo/ChunkSource.hpp"
#include "lo/LargeObject.hpp"

namespace pglo::lo {

// Producer adapter. Each pull issues one read(bufferSize); the first empty read ends
// the sequence and closes the object. Stopping early (cancel() or destruction)
// closes without further reads. Not restartable.
class ChunkReader : public ChunkSource {
public:
    explicit ChunkReader(LargeObject lob);
    ~ChunkReader() override;

    ChunkReader(const ChunkReader&) = delete;
    ChunkReader& operator=(const ChunkReader&) = delete;

    [[nodiscard]] std::optional<Bytes> next() override;

    // Close failures propagate
    void cancel();

    [[nodiscard]] bool done() const { return done_; }
    [[nodiscard]] const LargeObject& object() const { return lob_; }

private:
    LargeObject lob_;
    bool done_ = false;

    void closeQuietly() noexcept;
};

}
