#include "fan_out.hpp"
#include "gather.hpp"
#include "../commons/depaths_log.hpp"
#include <assert.h>

namespace depaths {
namespace pathfinder {


PairPathsList PairFanOut::operator()(const Node &root
                                     , const NodeList &destinations) const
{
    assert(m_provider != nullptr);

    auto targets = unique_nodes(destinations);
    if (targets.empty())
    {
        log_debug("no destinations for %1%, nothing to resolve", root);
        return PairPathsList();
    }

    notify_progress(m_progress, strfmt("loading dependencies for %1%...", root));
    auto adjacency = model::AdjacencyMap::resolve(*m_provider, root);

    notify_progress(m_progress, strfmt("resolving %1% nodes...", adjacency->nodes_count()));
    notify_progress(m_progress, strfmt("finding paths from %1% to %2% destinations..."
                                       , root, targets.size()));

    std::vector<std::function<PairPaths()>> tasks;
    tasks.reserve(targets.size());
    for (auto &destination: targets)
    {
        tasks.emplace_back([this, adjacency, root, destination]()
        {
            notify_progress(m_progress, strfmt("finding paths from %1% to %2%...", root, destination));
            PathFinder finder(adjacency, root, destination, m_progress, m_cancel);
            PairPaths res;
            res.root = root;
            res.destination = destination;
            res.paths = collect_paths(finder, m_settings.max_paths);
            log_debug("%1% -> %2%: %3% paths, %4% edges visited"
                      , root, destination
                      , finder.paths_found(), finder.edges_visited());
            return res;
        });
    }

    auto res = gather(tasks, m_settings.jobs, m_cancel);
    if (m_cancel.cancelled())
    {
        throw OperationCancelled(strfmt("search from %1% cancelled", root));
    }
    return res;
}


std::vector<PairPathsList> RootFanOut::grouped(const NodeList &roots
                                               , const NodeList &destinations) const
{
    auto sources = unique_nodes(roots);
    auto targets = unique_nodes(destinations);

    log_debug("searching paths between %1% roots and %2% destinations"
              , sources.size(), targets.size());

    PairFanOut pair_fan_out(m_provider, m_progress, m_settings, m_cancel);

    std::vector<std::function<PairPathsList()>> tasks;
    tasks.reserve(sources.size());
    for (auto &root: sources)
    {
        tasks.emplace_back([pair_fan_out, root, targets]()
        {
            return pair_fan_out(root, targets);
        });
    }

    auto res = gather(tasks, m_settings.jobs, m_cancel);
    if (m_cancel.cancelled())
    {
        throw OperationCancelled("path search cancelled");
    }
    return res;
}


PathList RootFanOut::operator()(const NodeList &roots
                                , const NodeList &destinations) const
{
    PathList res;
    for (auto &per_root: grouped(roots, destinations))
    {
        for (auto &pair: per_root)
        {
            for (auto &p: pair.paths)
            {
                res.emplace_back(std::move(p));
            }
        }
    }
    return res;
}


} // namespace pathfinder
} // namespace depaths
