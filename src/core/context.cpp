#include "core/context.hpp"

#include <algorithm>
#include <thread>

namespace ledgerstore {

bool Context::sleep_for(std::chrono::milliseconds duration) const {
    static constexpr std::chrono::milliseconds kSlice{20};

    const auto until = Clock::now() + duration;
    while (Clock::now() < until) {
        if (done()) return false;
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - Clock::now());
        std::this_thread::sleep_for(std::min(kSlice, std::max(left, std::chrono::milliseconds{1})));
    }
    return !done();
}

} // namespace ledgerstore
