#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace pglo::lo {

class Backend;

// Opens a transactional scope around body. Commits when body returns, aborts and
// rethrows when it throws. The Backend& must not escape body.
class Store {
public:
    virtual ~Store() = default;

    virtual void transact(const std::string& ctx, std::chrono::milliseconds timeout,
                          const std::function<void(Backend&)>& body) = 0;

    template <typename Func>
    auto exec(const std::string& ctx, const std::chrono::milliseconds timeout, Func&& func)
        -> decltype(func(std::declval<Backend&>())) {
        using Result = decltype(func(std::declval<Backend&>()));
        if constexpr (std::is_void_v<Result>) {
            transact(ctx, timeout, [&](Backend& backend) { func(backend); });
        } else {
            std::optional<Result> result;
            transact(ctx, timeout, [&](Backend& backend) { result.emplace(func(backend)); });
            return std::move(*result);
        }
    }
};

}
