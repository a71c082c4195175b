#pragma once

#include "lo/Types.hpp"

#include <span>
#include <string_view>

namespace pglo::lo {

class Backend;

// An object opened for I/O inside one Store scope. The cursor lives on the server;
// tell() and size() always round-trip. Move-only; does not close on destruction
// (the scope does), use withLargeObject() for guaranteed release.
class LargeObject {
public:
    static LargeObject create(Backend& backend, Mode mode = Mode::ReadWrite,
                              size_t bufferSize = DEFAULT_BUFFER_SIZE);

    static LargeObject open(Backend& backend, Oid oid, Mode mode = Mode::Read,
                            size_t bufferSize = DEFAULT_BUFFER_SIZE);

    static void remove(Backend& backend, Oid oid);

    LargeObject(const LargeObject&) = delete;
    LargeObject& operator=(const LargeObject&) = delete;
    LargeObject(LargeObject&& other) noexcept;
    LargeObject& operator=(LargeObject&& other) noexcept;
    ~LargeObject() = default;

    void close();

    // Reads bufferSize() bytes
    [[nodiscard]] Bytes read();
    [[nodiscard]] Bytes read(size_t length);

    void write(std::span<const uint8_t> data);
    void write(std::string_view data);

    uint64_t seek(int64_t offset, Whence whence = Whence::Start);
    [[nodiscard]] uint64_t tell() const;

    /// Byte length of the object. Saves the cursor, seeks to the end and seeks back;
    /// throws rather than report a size if the cursor could not be restored.
    [[nodiscard]] uint64_t size() const;

    /// Truncates or zero-extends to exactly newSize bytes. The cursor does not move.
    void resize(uint64_t newSize);

    [[nodiscard]] Oid oid() const { return oid_; }
    [[nodiscard]] Descriptor fd() const { return fd_; }
    [[nodiscard]] size_t bufferSize() const { return bufferSize_; }
    [[nodiscard]] Mode mode() const { return mode_; }
    [[nodiscard]] bool closed() const { return closed_; }
    [[nodiscard]] Backend& backend() const { return *backend_; }

private:
    LargeObject(Backend& backend, Oid oid, Descriptor fd, Mode mode, size_t bufferSize);

    Backend* backend_;
    Oid oid_;
    Descriptor fd_;
    Mode mode_;
    size_t bufferSize_;
    bool closed_ = false;

    // A closed handle's fd may already belong to another handle
    void ensureOpen(const char* op) const;
};

}
