#pragma once
// Minimal synchronous observer list. Listeners run on the emitting thread,
// in registration order.
#include <functional>
#include <utility>
#include <vector>

namespace plantop {

template <typename... Args>
class Signal {
public:
    using Listener = std::function<void(Args...)>;

    void connect(Listener fn) { listeners_.push_back(std::move(fn)); }

    void emit(Args... args) const {
        for (const auto& fn : listeners_) {
            fn(args...);
        }
    }

private:
    std::vector<Listener> listeners_;
};

} // namespace plantop
