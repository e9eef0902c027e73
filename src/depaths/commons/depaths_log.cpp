#include "depaths_log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

struct status_holder {
    // this is allocated on heap at first registration.
    // it avoids building a std::function statically, which would
    // be torn down before late log statements issued at program exit

    log_sink_t functor;
    std::mutex mutex;
};

static status_holder *m_status = nullptr;
static std::mutex m_register_mutex;
static std::atomic<int> m_current_level(log_level_info);


static void m_stderr_sink(log_level lvl, const std::string &msg)
{
    std::cerr << "[" << log_level_name(lvl) << "] " << msg << std::endl;
}


bool log_trigger(log_level lvl)
{
    return lvl >= m_current_level.load(std::memory_order_relaxed);
}

log_level log_get_level()
{
    return static_cast<log_level>(m_current_level.load());
}

void log_set_level(log_level lvl)
{
    switch (lvl) {
    case log_level_trace:
    case log_level_debug:
    case log_level_info:
    case log_level_warning:
    case log_level_error:
        m_current_level = lvl;
        break;
    default:
        break;
    }
}

bool log_parse_level(const std::string &name, log_level &out)
{
    static const log_level all[] = {
        log_level_trace,
        log_level_debug,
        log_level_info,
        log_level_warning,
        log_level_error,
    };
    for (auto lvl: all)
    {
        if (name == log_level_name(lvl))
        {
            out = lvl;
            return true;
        }
    }
    return false;
}

const char *log_level_name(log_level lvl)
{
    switch (lvl) {
    case log_level_trace:   return "trace";
    case log_level_debug:   return "debug";
    case log_level_info:    return "info";
    case log_level_warning: return "warning";
    case log_level_error:   return "error";
    default:
        break;
    }
    return "unknown";
}


static status_holder *m_get_status()
{
    std::lock_guard<std::mutex> lock(m_register_mutex);
    if (m_status == nullptr)
    {
        m_status = new status_holder;
        m_status->functor = m_stderr_sink;
    }
    return m_status;
}


void log_register_sink(log_sink_t sink)
{
    auto status = m_get_status();
    std::lock_guard<std::mutex> lock(status->mutex);
    status->functor = sink ? sink : log_sink_t(m_stderr_sink);
}


void log_emit_ll(log_level lvl, const std::string &msg)
{
    if (!log_trigger(lvl)) return;
    auto status = m_get_status();
    std::lock_guard<std::mutex> lock(status->mutex);
    try {
        status->functor(lvl, msg);
    } catch (const std::exception &e) {
        // a broken sink must not take down the caller. Report on the
        // stream that is always there
        std::cerr << "[log sink failure] " << e.what() << ": " << msg << std::endl;
    } catch (...) {
        std::cerr << "[log sink failure] " << msg << std::endl;
    }
}
