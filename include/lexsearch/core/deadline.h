#pragma once

#include <lexsearch/core/types.h>

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <utility>

#include <boost/asio/post.hpp>

namespace lexsearch {

/**
 * @brief Run a fallible call on an executor and wait for it with a deadline
 *
 * The callable runs on @p executor (a thread pool or any Asio executor). If it
 * does not complete within @p timeout the caller receives ErrorCode::Timeout and
 * the task is left to finish in the background, so the callable must own (copy
 * or share) everything it touches. A non-positive timeout waits indefinitely.
 * Exceptions escaping the callable are converted to ErrorCode::InternalError.
 *
 * @param executor Execution context or executor accepted by boost::asio::post
 * @param timeout Deadline for the call
 * @param name Short name of the call, used in error messages
 * @param fn Callable returning Result<T>
 */
template <typename T, typename Executor, typename Fn>
Result<T> runWithDeadline(Executor& executor, std::chrono::milliseconds timeout,
                          const std::string& name, Fn&& fn) {
    auto task = std::make_shared<std::packaged_task<Result<T>()>>(std::forward<Fn>(fn));
    auto future = task->get_future();
    boost::asio::post(executor, [task]() { (*task)(); });

    if (timeout.count() > 0 && future.wait_for(timeout) != std::future_status::ready) {
        return Error{ErrorCode::Timeout,
                     name + " timed out after " + std::to_string(timeout.count()) + " ms"};
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, name + " failed: " + e.what()};
    }
}

} // namespace lexsearch
