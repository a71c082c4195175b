#include "lo/ChunkWriter.hpp"
#include "logging/LogRegistry.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

using namespace pglo::logging;

namespace pglo::lo {

ChunkWriter::ChunkWriter(LargeObject lob) : lob_(std::move(lob)) {}

ChunkWriter::~ChunkWriter() {
    if (!finished_) abort();
}

void ChunkWriter::write(const std::span<const uint8_t> chunk) {
    if (finished_) throw std::logic_error("ChunkWriter: write after finish");
    lob_.write(chunk);
    bytesWritten_ += chunk.size();
    ++chunkCount_;
}

void ChunkWriter::finish() {
    if (finished_) return;
    finished_ = true;
    if (!lob_.closed()) lob_.close();
}

void ChunkWriter::abort() {
    finished_ = true;
    if (lob_.closed()) return;
    try {
        lob_.close();
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized())
            LogRegistry::lo()->warn("[ChunkWriter] Failed to close fd {} of object {} after abort: {}",
                                    lob_.fd(), lob_.oid(), e.what());
    }
}

}
