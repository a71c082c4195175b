#include "lo/LargeObject.hpp"
#include "lo/Backend.hpp"
#include "lo/Error.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>
#include <string>
#include <utility>

using namespace pglo::logging;

namespace pglo::lo {

LargeObject::LargeObject(Backend& backend, const Oid oid, const Descriptor fd, const Mode mode, const size_t bufferSize)
    : backend_(&backend), oid_(oid), fd_(fd), mode_(mode), bufferSize_(bufferSize) {}

LargeObject::LargeObject(LargeObject&& other) noexcept
    : backend_(other.backend_),
      oid_(other.oid_),
      fd_(other.fd_),
      mode_(other.mode_),
      bufferSize_(other.bufferSize_),
      closed_(std::exchange(other.closed_, true)) {}

LargeObject& LargeObject::operator=(LargeObject&& other) noexcept {
    if (this != &other) {
        backend_ = other.backend_;
        oid_ = other.oid_;
        fd_ = other.fd_;
        mode_ = other.mode_;
        bufferSize_ = other.bufferSize_;
        closed_ = std::exchange(other.closed_, true);
    }
    return *this;
}

LargeObject LargeObject::create(Backend& backend, const Mode mode, const size_t bufferSize) {
    if (bufferSize == 0) throw std::invalid_argument("LargeObject buffer size must be positive");
    const auto flags = flagsFor(mode);

    const auto oid = backend.create(0);
    LogRegistry::lo()->debug("[LargeObject::create] Created object {}", oid);

    const auto fd = backend.open(oid, flags);
    LargeObject lob(backend, oid, fd, mode, bufferSize);
    if (mode == Mode::Append) lob.seek(0, Whence::End);
    return lob;
}

LargeObject LargeObject::open(Backend& backend, const Oid oid, const Mode mode, const size_t bufferSize) {
    if (oid == 0) throw std::invalid_argument("LargeObject oid must be positive");
    if (bufferSize == 0) throw std::invalid_argument("LargeObject buffer size must be positive");
    const auto flags = flagsFor(mode);

    const auto fd = backend.open(oid, flags);
    LogRegistry::lo()->trace("[LargeObject::open] Opened object {} as fd {} (mode: {}, bufsize: {})",
                             oid, fd, modeName(mode), bufferSize);

    LargeObject lob(backend, oid, fd, mode, bufferSize);
    if (mode == Mode::Append) lob.seek(0, Whence::End);
    return lob;
}

void LargeObject::remove(Backend& backend, const Oid oid) {
    if (oid == 0) throw std::invalid_argument("LargeObject oid must be positive");
    backend.unlink(oid);
    LogRegistry::lo()->debug("[LargeObject::remove] Removed object {}", oid);
}

void LargeObject::ensureOpen(const char* op) const {
    if (closed_)
        throw Error(ErrorKind::NotFound, op,
                    "descriptor " + std::to_string(fd_) + " of object " + std::to_string(oid_) + " is closed");
}

void LargeObject::close() {
    ensureOpen("LargeObject::close");
    backend_->close(fd_);
    closed_ = true;
    LogRegistry::lo()->trace("[LargeObject::close] Closed fd {} (object {})", fd_, oid_);
}

Bytes LargeObject::read() { return read(bufferSize_); }

Bytes LargeObject::read(const size_t length) {
    ensureOpen("LargeObject::read");
    auto data = backend_->read(fd_, length);
    LogRegistry::lo()->trace("[LargeObject::read] fd {} requested {} got {} bytes", fd_, length, data.size());
    return data;
}

void LargeObject::write(const std::span<const uint8_t> data) {
    ensureOpen("LargeObject::write");
    backend_->write(fd_, data);
    LogRegistry::lo()->trace("[LargeObject::write] fd {} wrote {} bytes", fd_, data.size());
}

void LargeObject::write(const std::string_view data) {
    write(std::span{reinterpret_cast<const uint8_t*>(data.data()), data.size()});
}

uint64_t LargeObject::seek(const int64_t offset, const Whence whence) {
    ensureOpen("LargeObject::seek");
    if (whence == Whence::Start && offset < 0)
        throw Error(ErrorKind::InvalidOffset, "LargeObject::seek",
                    "negative offset " + std::to_string(offset) + " from start of object " + std::to_string(oid_));
    if (whence == Whence::End && offset > 0)
        throw Error(ErrorKind::InvalidOffset, "LargeObject::seek",
                    "positive offset " + std::to_string(offset) + " from end of object " + std::to_string(oid_));

    const auto pos = backend_->seek(fd_, offset, whence);
    LogRegistry::lo()->trace("[LargeObject::seek] fd {} offset {} from {} -> {}", fd_, offset, whenceName(whence), pos);
    return pos;
}

uint64_t LargeObject::tell() const {
    ensureOpen("LargeObject::tell");
    return backend_->tell(fd_);
}

uint64_t LargeObject::size() const {
    ensureOpen("LargeObject::size");
    const auto pos = backend_->tell(fd_);
    const auto size = backend_->seek(fd_, 0, Whence::End);
    const auto restored = backend_->seek(fd_, static_cast<int64_t>(pos), Whence::Start);
    if (restored != pos)
        throw Error(ErrorKind::Backend, "LargeObject::size",
                    "cursor of fd " + std::to_string(fd_) + " restored to " + std::to_string(restored)
                    + " instead of " + std::to_string(pos));
    return size;
}

void LargeObject::resize(const uint64_t newSize) {
    ensureOpen("LargeObject::resize");
    backend_->resize(fd_, newSize);
    LogRegistry::lo()->trace("[LargeObject::resize] fd {} resized to {} bytes", fd_, newSize);
}

}
