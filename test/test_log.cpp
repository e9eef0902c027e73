#include "test_utils.hpp"
#include <depaths/commons/depaths_log.hpp>
#include <depaths/pathfinder/progress.hpp>
#include <thread>
#include <utility>
#include <vector>

using namespace depaths;
using namespace depaths::test;


int main()
{
    std::vector<std::pair<log_level, std::string>> lines;
    log_register_sink([&](log_level lvl, const std::string &msg) {
        lines.emplace_back(lvl, msg);
    });

    // threshold
    log_set_level(log_level_info);
    log_debug("not shown %1%", 1);
    log_info("shown %1% of %2%", 1, 2);
    log_error("shown too");
    expect(lines.size() == 2, "debug is below threshold");
    expect(lines[0].first == log_level_info && lines[0].second == "shown 1 of 2", "formatting");
    expect(lines[1].first == log_level_error, "error level");

    // parameters are not even evaluated below threshold
    int evaluated = 0;
    log_trace("%1%", ++evaluated);
    expect(evaluated == 0, "lazy parameters");

    // level names
    log_level lvl = log_level_error;
    expect(log_parse_level("warning", lvl) && lvl == log_level_warning, "parse warning");
    expect(!log_parse_level("chatty", lvl) && lvl == log_level_warning, "bad level untouched");

    // the progress sink of the fan-out lands here
    lines.clear();
    pathfinder::LogProgressSink progress;
    pathfinder::notify_progress(&progress, "found 100 paths so far");
    expect(lines.size() == 1 && lines[0].second == "found 100 paths so far", "progress through log");

    // concurrent emitters don't trample each other
    lines.clear();
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back([t]() {
            for (int i = 0; i < 100; ++i) log_info("thread %1% line %2%", t, i);
        });
    }
    for (auto &th: threads) th.join();
    expect(lines.size() == 400, "every line made it");

    expect(strfmt("%1%-%2%", "a", 3) == "a-3", "strfmt");

    // conditional expressions as arguments
    lines.clear();
    bool cancelled = true;
    log_info("search over%1%", cancelled ? " (cancelled)" : "");
    log_info("%1% paths%2%", 3, cancelled ? " (cancelled)" : "");
    expect(lines.size() == 2 && lines[0].second == "search over (cancelled)"
           && lines[1].second == "3 paths (cancelled)", "conditional arguments");

    // a sink throwing anything at all does not reach the caller
    log_register_sink([](log_level, const std::string &) { throw 42; });
    log_info("dropped %1%", 1);
    pathfinder::notify_progress(&progress, "dropped too");

    log_register_sink(log_sink_t());
    return 0;
}
