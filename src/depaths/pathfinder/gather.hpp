/**
 * @file gather.hpp
 * @brief Bounded fan-out / fan-in of independent tasks
 */

#pragma once

#include "paths.hpp"
#include <algorithm>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <thread>
#include <vector>

namespace depaths {
namespace pathfinder {


/**
 * @brief resolve the actual number of concurrent tasks to use.
 *        0 means "as many as the hardware threads"
 */
inline unsigned effective_jobs(unsigned jobs)
{
    if (jobs != 0) return jobs;
    return std::max(1U, std::thread::hardware_concurrency());
}


/**
 * @brief run @p tasks concurrently, at most @p jobs at a time, and collect
 *        their results in input order.
 *
 * Tasks are started through std::async as soon as a slot is free, and
 * joined in input order.
 *
 * The first task that throws wins: @p cancel gets raised so that running
 * tasks can bail out early, no further task is started, the tasks still
 * in flight are waited for, and the first exception is rethrown.
 * OperationCancelled raised by tasks that merely noticed the flag never
 * shadows the failure that caused it.
 */
template<typename Result>
std::vector<Result> gather(const std::vector<std::function<Result()>> &tasks
                           , unsigned jobs
                           , const CancellationFlag &cancel)
{
    jobs = effective_jobs(jobs);

    std::vector<Result> results;
    results.reserve(tasks.size());
    std::deque<std::future<Result>> running;
    std::exception_ptr first_error;
    bool first_error_is_cancellation = false;
    std::size_t next_task = 0;

    auto join_oldest = [&]()
    {
        auto f = std::move(running.front());
        running.pop_front();
        try {
            results.emplace_back(f.get());
        } catch (const OperationCancelled &) {
            // most likely a side effect of a failure elsewhere.
            // Only reported when nothing better shows up
            if (!first_error)
            {
                first_error = std::current_exception();
                first_error_is_cancellation = true;
            }
        } catch (...) {
            // kept, and rethrown once everything in flight is joined
            if (!first_error || first_error_is_cancellation)
            {
                first_error = std::current_exception();
                first_error_is_cancellation = false;
            }
            cancel.cancel();
        }
    };

    while (next_task < tasks.size() && !first_error)
    {
        if (running.size() >= jobs)
        {
            join_oldest();
            continue;
        }
        running.emplace_back(std::async(std::launch::async, tasks[next_task]));
        ++next_task;
    }
    while (!running.empty())
    {
        join_oldest();
    }

    if (first_error)
    {
        std::rethrow_exception(first_error);
    }
    return results;
}


} // namespace pathfinder
} // namespace depaths
