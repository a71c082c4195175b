#include "lo/Transfer.hpp"
#include "lo/Store.hpp"
#include "lo/LargeObject.hpp"
#include "lo/ChunkReader.hpp"
#include "lo/ChunkWriter.hpp"
#include "lo/ChunkSink.hpp"
#include "lo/ChunkSource.hpp"
#include "lo/Deadline.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace pglo::logging;

namespace pglo::lo {

Oid Transfer::importObject(Store& store, ChunkSource& source, const TransferOptions& opts) {
    if (opts.bufferSize == 0) throw std::invalid_argument("Transfer buffer size must be positive");

    const Deadline deadline(opts.timeout);

    return store.exec("Transfer::importObject", opts.timeout, [&](Backend& backend) {
        ChunkWriter writer(LargeObject::create(backend, Mode::Write, opts.bufferSize));

        for (const auto& chunk : source) {
            deadline.check("Transfer::importObject");
            writer.write(chunk);
        }
        deadline.check("Transfer::importObject");
        writer.finish();

        LogRegistry::transfer()->info("[Transfer::importObject] Imported {} bytes in {} chunks into object {}",
                                      writer.bytesWritten(), writer.chunkCount(), writer.oid());
        return writer.oid();
    });
}

Oid Transfer::importObject(Store& store, const std::span<const uint8_t> buffer, const TransferOptions& opts) {
    if (opts.bufferSize == 0) throw std::invalid_argument("Transfer buffer size must be positive");
    BufferSource source(buffer, opts.bufferSize);
    return importObject(store, source, opts);
}

Bytes Transfer::exportObject(Store& store, const Oid oid, const TransferOptions& opts) {
    BufferSink sink;
    exportObject(store, oid, sink, opts);
    return sink.take();
}

void Transfer::exportObject(Store& store, const Oid oid, ChunkSink& sink, const TransferOptions& opts) {
    if (opts.bufferSize == 0) throw std::invalid_argument("Transfer buffer size must be positive");

    const Deadline deadline(opts.timeout);
    uint64_t total = 0;

    try {
        store.exec("Transfer::exportObject", opts.timeout, [&](Backend& backend) {
            ChunkReader reader(LargeObject::open(backend, oid, Mode::Read, opts.bufferSize));

            for (const auto& chunk : reader) {
                deadline.check("Transfer::exportObject");
                sink.write(chunk);
                total += chunk.size();
            }
        });
    } catch (...) {
        sink.abort();
        throw;
    }

    sink.finish();
    LogRegistry::transfer()->info("[Transfer::exportObject] Exported {} bytes from object {}", total, oid);
}

}
