/**
 * @file progress.hpp
 * @brief Progress notifications of long running searches
 *
 * Notifications are advisory only. Nothing in the search depends on them:
 * a sink that fails is contained by notify_progress() and the search carries
 * on as if nothing happened.
 */

#pragma once

#include <string>

namespace depaths {
namespace pathfinder {


struct ProgressSink
{
    virtual ~ProgressSink() {}

    /**
     * @brief receive a status line.
     *
     * May be invoked concurrently by several search tasks.
     */
    virtual void notify(const std::string &msg) = 0;
};


/**
 * @brief forwards notifications to the logging facility, at info level
 */
struct LogProgressSink: ProgressSink
{
    void notify(const std::string &msg) override;
};


/**
 * @brief deliver @p msg to @p sink, if any, and contain sink failures
 */
void notify_progress(ProgressSink *sink, const std::string &msg) noexcept;


} // namespace pathfinder
} // namespace depaths
