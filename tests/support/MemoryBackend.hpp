#pragma once

#include "lo/Backend.hpp"
#include "lo/Error.hpp"
#include "lo/Store.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pglo::test {

using lo::Bytes;
using lo::Descriptor;
using lo::Oid;

// In-memory stand-in for the server-side large-object functions. Mirrors the
// PostgreSQL behaviour the library depends on: INV_WRITE implies read access,
// lo_unlink closes descriptors on the object, seeks before 0 fail, holes read as zeros.
class MemoryBackend : public lo::Backend {
public:
    struct Call {
        std::string op;
        int64_t target = 0;   // oid or fd
        uint64_t size = 0;    // requested length / written bytes / offset
    };

    [[nodiscard]] Oid create(Oid desired) override;
    void unlink(Oid oid) override;

    [[nodiscard]] Descriptor open(Oid oid, uint32_t flags) override;
    void close(Descriptor fd) override;

    void write(Descriptor fd, std::span<const uint8_t> data) override;
    [[nodiscard]] Bytes read(Descriptor fd, size_t length) override;

    uint64_t seek(Descriptor fd, int64_t offset, lo::Whence whence) override;
    [[nodiscard]] uint64_t tell(Descriptor fd) override;

    void resize(Descriptor fd, uint64_t size) override;

    // Fixture helpers, bypass the call log
    Oid put(const Bytes& data);
    Oid put(const std::string& data);
    [[nodiscard]] std::optional<Bytes> contents(Oid oid) const;
    [[nodiscard]] std::string text(Oid oid) const;
    [[nodiscard]] bool exists(Oid oid) const { return objects_.contains(oid); }
    [[nodiscard]] size_t objectCount() const { return objects_.size(); }
    [[nodiscard]] size_t openDescriptors() const { return descriptors_.size(); }

    [[nodiscard]] const std::vector<Call>& calls() const { return calls_; }
    [[nodiscard]] size_t callCount(const std::string& op) const;
    void clearCalls() { calls_.clear(); }
    void setRecording(const bool on) { recording_ = on; }

    // The nth (1-based) future call of op throws kind
    void failOn(const std::string& op, size_t nth, lo::ErrorKind kind);
    void clearFailures() { failures_.clear(); }

    void setCallDelay(std::chrono::milliseconds delay) { delay_ = delay; }

    // Scope-end semantics: every descriptor dies with the transaction
    void dropDescriptors() { descriptors_.clear(); }

    struct Snapshot {
        std::map<Oid, Bytes> objects;
        Oid nextOid;
    };

    [[nodiscard]] Snapshot snapshot() const { return {objects_, nextOid_}; }
    void restore(const Snapshot& s);

private:
    struct Fd {
        Oid oid;
        uint32_t flags;
        uint64_t pos;
    };

    struct Failure {
        std::string op;
        size_t remaining;
        lo::ErrorKind kind;
    };

    std::map<Oid, Bytes> objects_;
    std::map<Descriptor, Fd> descriptors_;
    Oid nextOid_ = 16384;
    std::vector<Call> calls_;
    bool recording_ = true;
    std::vector<Failure> failures_;
    std::chrono::milliseconds delay_{0};

    void record(const std::string& op, int64_t target, uint64_t size = 0);
    Fd& descriptor(Descriptor fd, const std::string& op);
};

// Store whose scopes snapshot the backend and roll back on exceptions.
class MemoryStore : public lo::Store {
public:
    void transact(const std::string& ctx, std::chrono::milliseconds timeout,
                  const std::function<void(lo::Backend&)>& body) override;

    [[nodiscard]] MemoryBackend& backend() { return backend_; }

    [[nodiscard]] size_t commits() const { return commits_; }
    [[nodiscard]] size_t rollbacks() const { return rollbacks_; }
    [[nodiscard]] std::chrono::milliseconds lastTimeout() const { return lastTimeout_; }
    [[nodiscard]] const std::vector<std::string>& contexts() const { return contexts_; }

private:
    MemoryBackend backend_;
    size_t commits_ = 0;
    size_t rollbacks_ = 0;
    std::chrono::milliseconds lastTimeout_{0};
    std::vector<std::string> contexts_;
};

}
