#pragma once

#include "lo/Types.hpp"

#include <chrono>
#include <span>

namespace pglo::lo {

class Store;
class ChunkSource;
class ChunkSink;

struct TransferOptions {
    size_t bufferSize = DEFAULT_TRANSFER_BUFFER_SIZE;
    std::chrono::milliseconds timeout = std::chrono::seconds(60);
};

// Import/export in one Store scope each. Memory use is bounded by bufferSize; any
// failure (including timeout) aborts the scope, so no partial object becomes visible.
struct Transfer {
    static Oid importObject(Store& store, ChunkSource& source, const TransferOptions& opts = {});

    // Re-chunks buffer into opts.bufferSize pieces
    static Oid importObject(Store& store, std::span<const uint8_t> buffer, const TransferOptions& opts = {});

    // NotFound for a missing oid; an existing empty object yields an empty buffer
    [[nodiscard]] static Bytes exportObject(Store& store, Oid oid, const TransferOptions& opts = {});

    // finish() on success, abort() on failure
    static void exportObject(Store& store, Oid oid, ChunkSink& sink, const TransferOptions& opts = {});
};

}
