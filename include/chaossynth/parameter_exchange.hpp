// parameter_exchange.hpp
// single-writer/single-reader "publish latest" slot
//
// Triple buffer: the writer fills its private slot and swaps it into the
// shared middle slot with one atomic exchange; the reader swaps the middle
// slot into its private slot when a fresh value is flagged. Neither side
// ever waits on the other, and no allocation happens after construction.
#pragma once

#include <array>
#include <atomic>
#include <cstdint>

namespace chaossynth {

template <typename T>
class ParameterExchange {
public:
    ParameterExchange() = default;
    ParameterExchange(const ParameterExchange&) = delete;
    ParameterExchange& operator=(const ParameterExchange&) = delete;

    // Writer side.
    void publish(const T& value) {
        slots_[back_] = value;
        std::uint8_t prev = middle_.exchange(back_ | FRESH, std::memory_order_acq_rel);
        back_ = prev & INDEX;
    }

    // Reader side. False until the first publish.
    bool read(T& out) {
        if (middle_.load(std::memory_order_acquire) & FRESH) {
            std::uint8_t prev = middle_.exchange(front_, std::memory_order_acq_rel);
            front_ = prev & INDEX;
            hasValue_ = true;
        }
        if (!hasValue_) return false;
        out = slots_[front_];
        return true;
    }

private:
    static constexpr std::uint8_t INDEX = 0x3;
    static constexpr std::uint8_t FRESH = 0x4;

    std::array<T, 3> slots_{};
    std::atomic<std::uint8_t> middle_{1};
    std::uint8_t back_ = 0;   // writer-owned
    std::uint8_t front_ = 2;  // reader-owned
    bool hasValue_ = false;   // reader-owned
};

}  // namespace chaossynth
