#include "lo/UploadWriter.hpp"
#include "lo/Store.hpp"
#include "lo/LargeObject.hpp"
#include "lo/Scoped.hpp"
#include "lo/Error.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>
#include <string>

using namespace pglo::logging;

namespace pglo::lo {

std::string_view closeReasonName(const CloseReason reason) {
    switch (reason) {
        case CloseReason::Done: return "done";
        case CloseReason::Cancel: return "cancel";
        case CloseReason::Error: return "error";
    }
    return "unknown";
}

UploadWriter::UploadWriter(Store& store, UploadOptions opts, const Oid oid) : store_(&store), opts_(opts) {
    state_.objectId = oid;
}

UploadWriter UploadWriter::init(Store& store, const UploadOptions& opts) {
    const auto oid = store.exec("UploadWriter::init", opts.timeout, [](Backend& backend) {
        auto lob = LargeObject::create(backend, Mode::Write);
        lob.close();
        return lob.oid();
    });

    LogRegistry::upload()->debug("[UploadWriter::init] Created object {} for upload", oid);
    return {store, opts, oid};
}

void UploadWriter::writeChunk(const std::span<const uint8_t> data) {
    if (state_.closeReason)
        throw std::logic_error("UploadWriter: write to upload of object " + std::to_string(state_.objectId)
                               + " after close");

    try {
        store_->exec("UploadWriter::writeChunk", opts_.timeout, [&](Backend& backend) {
            withLargeObject(backend, state_.objectId, Mode::Append, [&](LargeObject& lob) { lob.write(data); });
        });
    } catch (const Error& e) {
        LogRegistry::upload()->error("[UploadWriter::writeChunk] Chunk {} of object {} failed: {}",
                                     state_.chunkCount, state_.objectId, e.what());
        throw;
    }

    state_.bytesWritten += data.size();
    ++state_.chunkCount;
}

void UploadWriter::close(const CloseReason reason) {
    if (state_.closeReason) return;
    state_.closeReason = reason;

    LogRegistry::upload()->info("[UploadWriter::close] Upload of object {} closed ({}): {} bytes in {} chunks",
                                state_.objectId, closeReasonName(reason), state_.bytesWritten, state_.chunkCount);

    if (reason != CloseReason::Done && opts_.removeOnFailure) {
        store_->exec("UploadWriter::close", opts_.timeout,
                     [&](Backend& backend) { LargeObject::remove(backend, state_.objectId); });
        LogRegistry::upload()->debug("[UploadWriter::close] Removed partial object {}", state_.objectId);
    }
}

}
