// tests/test_support.hpp
// Small helpers shared by the fixturelink tests.
#ifndef FIXTURELINK_TEST_SUPPORT_HPP
#define FIXTURELINK_TEST_SUPPORT_HPP

#include <chrono>
#include <functional>
#include <thread>

namespace fixturelink_test {

/// Poll @p pred every few ms until it holds or @p timeout_ms passes.
inline bool eventually(const std::function<bool()>& pred, int timeout_ms = 2000) {
    const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < until) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

inline long elapsed_ms(std::chrono::steady_clock::time_point since) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count());
}

} // namespace fixturelink_test

#endif // FIXTURELINK_TEST_SUPPORT_HPP
