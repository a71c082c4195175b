#pragma once

#include "lo/LargeObject.hpp"
#include "logging/LogRegistry.hpp"

#include <exception>
#include <string>
#include <type_traits>
#include <utility>

namespace pglo::lo {

namespace detail {

inline void closeAfterFailure(LargeObject& lob, const std::string& ctx) {
    if (lob.closed()) return;
    try {
        lob.close();
    } catch (const std::exception& e) {
        logging::LogRegistry::lo()->warn("[{}] Failed to close fd {} after error: {}", ctx, lob.fd(), e.what());
    }
}

template <typename Func>
auto runAndClose(LargeObject& lob, const std::string& ctx, Func&& func) -> decltype(func(lob)) {
    using Result = decltype(func(lob));
    if constexpr (std::is_void_v<Result>) {
        try {
            func(lob);
        } catch (...) {
            closeAfterFailure(lob, ctx);
            throw;
        }
        if (!lob.closed()) lob.close();
    } else {
        auto result = [&]() -> Result {
            try {
                return func(lob);
            } catch (...) {
                closeAfterFailure(lob, ctx);
                throw;
            }
        }();
        if (!lob.closed()) lob.close();
        return result;
    }
}

}

// Opens oid, runs func(LargeObject&) and closes on every exit path. A close failure
// after func threw is logged; the original exception propagates.
template <typename Func>
auto withLargeObject(Backend& backend, const Oid oid, const Mode mode, Func&& func) -> decltype(func(std::declval<LargeObject&>())) {
    auto lob = LargeObject::open(backend, oid, mode);
    return detail::runAndClose(lob, "withLargeObject", std::forward<Func>(func));
}

template <typename Func>
auto withNewLargeObject(Backend& backend, const Mode mode, Func&& func) -> decltype(func(std::declval<LargeObject&>())) {
    auto lob = LargeObject::create(backend, mode);
    return detail::runAndClose(lob, "withNewLargeObject", std::forward<Func>(func));
}

}
