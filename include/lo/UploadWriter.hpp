#pragma once

#include "lo/Types.hpp"

#include <chrono>
#include <optional>
#include <span>
#include <string_view>

namespace pglo::lo {

class Store;

enum class CloseReason { Done, Cancel, Error };

[[nodiscard]] std::string_view closeReasonName(CloseReason reason);

struct UploadOptions {
    std::chrono::milliseconds timeout = std::chrono::seconds(60);
    bool removeOnFailure = false;   // unlink the partial object on Cancel / Error
};

struct UploadState {
    Oid objectId = 0;
    uint64_t bytesWritten = 0;
    size_t chunkCount = 0;
    std::optional<CloseReason> closeReason;
};

// Streams upload chunks into a large object without a long-lived scope: init() creates
// the object in one scope, every writeChunk() appends in a fresh scope of its own.
class UploadWriter {
public:
    static UploadWriter init(Store& store, const UploadOptions& opts = {});

    // A failed chunk rolls back only its own scope; earlier chunks stay committed.
    void writeChunk(std::span<const uint8_t> data);

    void close(CloseReason reason);

    [[nodiscard]] const UploadState& meta() const { return state_; }

private:
    UploadWriter(Store& store, UploadOptions opts, Oid oid);

    Store* store_;
    UploadOptions opts_;
    UploadState state_;
};

}
