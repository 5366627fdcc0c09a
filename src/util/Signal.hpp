/**
 * @file Signal.hpp
 * @brief Minimal synchronous signal/slot helper.
 *
 * Slots run on the emitting thread, in connection order.
 */

#pragma once
#include <functional>
#include <vector>

namespace mw {

template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;

    void connect(Slot slot) {
        slots_.push_back(std::move(slot));
    }

    void emitSignal(Args... args) const {
        for (const auto& slot : slots_)
            slot(args...);
    }

private:
    std::vector<Slot> slots_;
};

} // namespace mw
