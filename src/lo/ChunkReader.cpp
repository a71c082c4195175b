#include "lo/ChunkReader.hpp"
#include "logging/LogRegistry.hpp"

#include <exception>
#include <utility>

using namespace pglo::logging;

namespace pglo::lo {

ChunkReader::ChunkReader(LargeObject lob) : lob_(std::move(lob)) {}

ChunkReader::~ChunkReader() {
    if (!done_) closeQuietly();
}

std::optional<Bytes> ChunkReader::next() {
    if (done_) return std::nullopt;

    Bytes data;
    try {
        data = lob_.read();
    } catch (...) {
        done_ = true;
        closeQuietly();
        throw;
    }

    if (data.empty()) {
        done_ = true;
        if (!lob_.closed()) lob_.close();
        return std::nullopt;
    }

    return data;
}

void ChunkReader::cancel() {
    if (done_) return;
    done_ = true;
    if (!lob_.closed()) lob_.close();
}

void ChunkReader::closeQuietly() noexcept {
    done_ = true;
    if (lob_.closed()) return;
    try {
        lob_.close();
    } catch (const std::exception& e) {
        // the scope may already be aborted; the server drops the descriptor with it
        if (LogRegistry::isInitialized())
            LogRegistry::lo()->warn("[ChunkReader] Failed to close fd {} of object {}: {}", lob_.fd(), lob_.oid(), e.what());
    }
}

}
