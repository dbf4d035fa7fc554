/**
 * Cadence Engine - Async Helpers
 *
 * Fan-out/gather for I/O-bound collaborator calls. Each branch runs on its
 * own detached thread so a hung collaborator cannot block the caller past
 * the timeout; results that arrive late are dropped with the future.
 *
 * A timed-out branch keeps running after the caller returns and may outlive
 * the engine that launched it. Branch functions must therefore own what they
 * touch: capture providers and catalogs by shared_ptr and arguments by value,
 * never `this` or references into caller state.
 */

#ifndef CADENCE_ASYNC_H
#define CADENCE_ASYNC_H

#include "utils.h"
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <vector>

namespace cadence {

template<typename Fn>
auto launch_detached(Fn fn) -> std::future<std::invoke_result_t<Fn>> {
    using R = std::invoke_result_t<Fn>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    auto future = task->get_future();
    std::thread([task]() { (*task)(); }).detach();
    return future;
}

/**
 * Wait for a branch result. A timeout or anything thrown by the branch
 * yields an empty result; both are logged under the given tag.
 */
template<typename T>
std::vector<T> await_branch(std::future<std::vector<T>>& future,
                            std::chrono::steady_clock::time_point deadline,
                            const char* tag, const char* branch) {
    if (!future.valid()) return {};

    if (future.wait_until(deadline) != std::future_status::ready) {
        utils::log(utils::LogLevel::Warn, tag, "%s timed out", branch);
        return {};
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        utils::log(utils::LogLevel::Warn, tag, "%s failed: %s", branch, e.what());
        return {};
    } catch (...) {
        utils::log(utils::LogLevel::Warn, tag, "%s failed: unknown error", branch);
        return {};
    }
}

} // namespace cadence

#endif // CADENCE_ASYNC_H
