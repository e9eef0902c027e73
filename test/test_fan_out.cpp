#include "test_utils.hpp"
#include <depaths/pathfinder/fan_out.hpp>
#include <depaths/pathfinder/gather.hpp>

using namespace depaths;
using namespace depaths::model;
using namespace depaths::pathfinder;
using namespace depaths::test;


static void test_adjacency_reuse()
{
    auto graph = make_random_graph(80, 400, 5);
    CountingProvider provider(graph.get());

    NodeList destinations;
    for (int i = 1; i < 30; ++i) destinations.emplace_back("node_" + std::to_string(i));

    PairFanOut pair_fan_out(&provider);
    auto res = pair_fan_out("node_0", destinations);
    expect(res.size() == destinations.size(), "one entry per destination");
    expect(provider.closure_calls == 1, "closure resolved once");
    expect(provider.successors_calls == 1, "successors resolved once");

    for (std::size_t i = 0; i < res.size(); ++i)
    {
        expect(res[i].root == "node_0", "root");
        expect(res[i].destination == destinations[i], "destination input order");
    }

    CountingProvider per_root(graph.get());
    RootFanOut root_fan_out(&per_root);
    root_fan_out(NodeList{"node_0", "node_1", "node_2"}, destinations);
    expect(per_root.closure_calls == 3, "one closure per root");
    expect(per_root.successors_calls == 3, "one successors call per root");
}


static void test_flattening()
{
    auto graph = make_graph(
                "A1 D1 X D2\n"
                "X D1\n"
                "A2 D2 D1\n");

    SearchSettings settings;
    settings.jobs = 2;
    RootFanOut fan_out(graph.get(), nullptr, settings);
    auto paths = fan_out(NodeList{"A1", "A2"}, NodeList{"D1", "D2"});

    PathList expected{
        {"A1", "D1"}, {"A1", "X", "D1"},  // A1 -> D1
        {"A1", "D2"},                     // A1 -> D2
        {"A2", "D1"},                     // A2 -> D1
        {"A2", "D2"},                     // A2 -> D2
    };
    expect(paths == expected, "grouped by root, then destination. Got " + print_paths(paths));

    auto grouped = fan_out.grouped(NodeList{"A1", "A2"}, NodeList{"D1", "D2"});
    expect(grouped.size() == 2 && grouped[0].size() == 2 && grouped[1].size() == 2, "grouped shape");
    expect(grouped[1][0].root == "A2" && grouped[1][0].destination == "D1", "grouped keys");

    // repeated nodes collapse
    auto again = fan_out(NodeList{"A1", "A2", "A1"}, NodeList{"D1", "D2", "D1"});
    expect(again == expected, "inputs are sets");

    // a single job at a time gives the very same answer
    settings.jobs = 1;
    RootFanOut serial(graph.get(), nullptr, settings);
    expect(serial(NodeList{"A1", "A2"}, NodeList{"D1", "D2"}) == expected, "serial");
}


static void test_empty_selections()
{
    auto graph = make_graph("A B\n");
    CountingProvider provider(graph.get());
    RootFanOut fan_out(&provider);

    expect(fan_out(NodeList(), NodeList{"B"}).empty(), "no roots");
    expect(fan_out(NodeList{"A"}, NodeList()).empty(), "no destinations");
    expect(provider.closure_calls == 0, "nothing resolved for nothing");

    expect(fan_out(NodeList{"B"}, NodeList{"A"}).empty(), "no path is not an error");
    expect((fan_out(NodeList{"A"}, NodeList{"A"}) == PathList{{"A"}}), "self path through fan-out");
}


static void test_max_paths()
{
    auto graph = make_graph(
                "A B C D\n"
                "B D\n"
                "C D\n");
    SearchSettings settings;
    settings.max_paths = 2;
    RootFanOut fan_out(graph.get(), nullptr, settings);
    auto paths = fan_out(NodeList{"A"}, NodeList{"D"});
    expect(paths == (PathList{{"A", "D"}, {"A", "B", "D"}}), "limited to 2, got " + print_paths(paths));
}


static void test_failure_propagation()
{
    auto graph = make_random_graph(40, 160, 9);
    FailingProvider provider(graph.get(), "node_3");

    NodeList roots;
    for (int i = 0; i < 8; ++i) roots.emplace_back("node_" + std::to_string(i));

    CancellationFlag cancel;
    SearchSettings settings;
    settings.jobs = 3;
    RootFanOut fan_out(&provider, nullptr, settings, cancel);

    std::string error;
    try {
        fan_out(roots, NodeList{"node_10", "node_20"});
    } catch (const OperationCancelled &e) {
        error = std::string("cancelled: ") + e.what();
    } catch (const std::runtime_error &e) {
        error = e.what();
    }
    expect(error == "provider down", "provider failure comes through unchanged, got: " + error);
    expect(cancel.cancelled(), "the rest of the operation got cancelled");

    // unknown roots are the provider's business
    RootFanOut strict(graph.get());
    bool thrown = false;
    try {
        strict(NodeList{"nope"}, NodeList{"node_1"});
    } catch (const UnknownNodeError &) {
        thrown = true;
    }
    expect(thrown, "unknown root");
}


static void test_cancellation()
{
    auto graph = make_random_graph(40, 160, 9);
    CancellationFlag cancel;
    cancel.cancel();

    RootFanOut fan_out(graph.get(), nullptr, SearchSettings(), cancel);
    bool thrown = false;
    try {
        fan_out(NodeList{"node_0", "node_1"}, NodeList{"node_5"});
    } catch (const OperationCancelled &) {
        thrown = true;
    }
    expect(thrown, "cancelled operations don't return partial results");
}


static void test_gather()
{
    CancellationFlag cancel;
    std::vector<std::function<int()>> tasks;
    for (int i = 0; i < 10; ++i)
    {
        tasks.emplace_back([i]() { return i * i; });
    }
    auto res = gather(tasks, 3, cancel);
    expect(res.size() == 10, "all results");
    for (int i = 0; i < 10; ++i)
    {
        expect(res[i] == i * i, "input order");
    }
    expect(!cancel.cancelled(), "no failure, no cancellation");

    // a cancellation noticed by an early task doesn't hide the real failure
    tasks.clear();
    tasks.emplace_back([]() -> int { throw OperationCancelled("side effect"); });
    tasks.emplace_back([]() -> int { throw std::logic_error("root cause"); });
    std::string error;
    try {
        gather(tasks, 2, cancel);
    } catch (const OperationCancelled &) {
        error = "cancelled";
    } catch (const std::logic_error &e) {
        error = e.what();
    }
    expect(error == "root cause", "first real failure wins, got: " + error);
    expect(cancel.cancelled(), "failure raises the flag");
}


static void test_progress()
{
    auto graph = make_graph("A B\nB C\n");
    RecordingProgressSink sink;
    RootFanOut fan_out(graph.get(), &sink);
    fan_out(NodeList{"A"}, NodeList{"C"});

    auto messages = sink.messages();
    expect(messages.size() == 4, "four notifications");
    expect(messages[0] == "loading dependencies for A...", messages[0]);
    expect(messages[1] == "resolving 3 nodes...", messages[1]);
    expect(messages[2] == "finding paths from A to 1 destinations...", messages[2]);
    expect(messages[3] == "finding paths from A to C...", messages[3]);
}


int main()
{
    test_adjacency_reuse();
    test_flattening();
    test_empty_selections();
    test_max_paths();
    test_failure_propagation();
    test_cancellation();
    test_gather();
    test_progress();
    return 0;
}
