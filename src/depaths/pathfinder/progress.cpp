#include "progress.hpp"
#include "../commons/depaths_log.hpp"

namespace depaths {
namespace pathfinder {


void LogProgressSink::notify(const std::string &msg)
{
    log_info("%1%", msg);
}


void notify_progress(ProgressSink *sink, const std::string &msg) noexcept
{
    if (sink == nullptr) return;
    try {
        sink->notify(msg);
    } catch (const std::exception &e) {
        log_debug("progress sink failed: %1%", e.what());
    } catch (...) {
        log_debug("progress sink failed with a non standard exception");
    }
}


} // namespace pathfinder
} // namespace depaths
