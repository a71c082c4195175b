#pragma once

#include "lo/Types.hpp"

#include <span>

namespace pglo::lo {

// Primitive large-object operations, one per server function (lo_create, lo_unlink, ...).
// Implementations report failures as lo::Error. A Backend is only valid inside the
// scope that handed it out; descriptors die with that scope.
class Backend {
public:
    virtual ~Backend() = default;

    // desired == 0 lets the server pick the oid
    [[nodiscard]] virtual Oid create(Oid desired) = 0;
    virtual void unlink(Oid oid) = 0;

    [[nodiscard]] virtual Descriptor open(Oid oid, uint32_t flags) = 0;
    virtual void close(Descriptor fd) = 0;

    virtual void write(Descriptor fd, std::span<const uint8_t> data) = 0;
    [[nodiscard]] virtual Bytes read(Descriptor fd, size_t length) = 0;

    virtual uint64_t seek(Descriptor fd, int64_t offset, Whence whence) = 0;
    [[nodiscard]] virtual uint64_t tell(Descriptor fd) = 0;

    virtual void resize(Descriptor fd, uint64_t size) = 0;
};

}
