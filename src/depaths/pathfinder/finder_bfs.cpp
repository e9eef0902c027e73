#include "finder_bfs.hpp"
#include "../commons/depaths_log.hpp"
#include <assert.h>
#include <algorithm>

namespace depaths {
namespace pathfinder {

using model::node_id;
using model::no_node;

PathFinder::PathFinder(model::AdjacencyMap::ref adjacency
                       , const Node &root
                       , const Node &destination
                       , ProgressSink *progress
                       , CancellationFlag cancel)
    : m_adjacency(std::move(adjacency))
    , m_root(root)
    , m_destination(destination)
    , m_progress(progress)
    , m_cancel(cancel)
{
    assert(m_adjacency != nullptr);

    if (m_root == m_destination)
    {
        // trivial path. No need to look at the graph at all
        m_self_path = true;
        return;
    }

    m_destination_id = m_adjacency->lookup(m_destination);
    auto root_id = m_adjacency->lookup(m_root);
    if (m_destination_id == no_node || root_id == no_node)
    {
        // can't possibly get there
        log_trace("%1% and %2% are not connected", m_root, m_destination);
        m_done = true;
        return;
    }

    m_steps.push_back(step_t{root_id, no_parent});
    m_queue.push_back(0);
}


bool PathFinder::next(Path &out)
{
    if (m_done) return false;

    if (m_self_path)
    {
        m_done = true;
        out = Path{m_root};
        m_count_path();
        return true;
    }

    for (;;)
    {
        if (m_expanding != no_parent)
        {
            // resume expansion of the current step where it was left
            auto &successors = m_adjacency->successors(m_steps[m_expanding].node);
            while (m_successor_pos < successors.size())
            {
                auto successor = successors[m_successor_pos++];
                if (successor == m_destination_id)
                {
                    // found it. This one is not walked any further
                    out = m_materialize(m_expanding, successor);
                    m_count_path();
                    return true;
                }
                m_steps.push_back(step_t{successor, m_expanding});
                m_queue.push_back(m_steps.size()-1);
            }
            m_expanding = no_parent;
        }

        if (m_queue.empty() || m_cancel.cancelled())
        {
            log_trace("search %1% -> %2% over: %3% paths, %4% edges%5%"
                      , m_root, m_destination
                      , m_paths_found, m_edges_visited
                      , (m_cancel.cancelled() ? " (cancelled)" : ""));
            m_done = true;
            return false;
        }

        auto current = m_queue.front();
        m_queue.pop_front();

        auto &step = m_steps[current];
        auto predecessor = step.parent == no_parent
                ? no_node
                : m_steps[step.parent].node;
        model::edge_t edge(predecessor, step.node);

        if (!m_visited.emplace(edge).second)
        {
            // this edge was already expanded on behalf of a shorter path
            continue;
        }

        m_count_edge();
        m_expanding = current;
        m_successor_pos = 0;
    }
}


std::size_t PathFinder::operator()(listener_t callback)
{
    assert(callback);
    std::size_t count = 0;
    Path p;
    while (next(p))
    {
        ++count;
        if (!callback(p))
        {
            stop();
            break;
        }
    }
    return count;
}


Path PathFinder::m_materialize(std::size_t step, node_id last) const
{
    Path res;
    res.emplace_back(m_adjacency->name(last));
    for (auto i = step; i != no_parent; i = m_steps[i].parent)
    {
        res.emplace_back(m_adjacency->name(m_steps[i].node));
    }
    std::reverse(res.begin(), res.end());
    return res;
}


void PathFinder::m_count_edge()
{
    ++m_edges_visited;
    if (m_progress != nullptr &&
            m_edges_visited - m_last_edges_notification >= edges_notification_step)
    {
        m_last_edges_notification = m_edges_visited;
        notify_progress(m_progress, strfmt("found %1% paths, visited %2% edges"
                                           , m_paths_found, m_edges_visited));
    }
}


void PathFinder::m_count_path()
{
    ++m_paths_found;
    if (m_progress != nullptr && m_paths_found % paths_notification_step == 0)
    {
        notify_progress(m_progress, strfmt("found %1% paths so far", m_paths_found));
    }
}


PathList collect_paths(PathFinder &finder, std::size_t max_paths)
{
    PathList res;
    Path p;
    while ((max_paths == 0 || res.size() < max_paths) && finder.next(p))
    {
        res.emplace_back(std::move(p));
    }
    if (!finder.done())
    {
        log_debug("stopping search %1% -> %2% after %3% paths"
                  , finder.root(), finder.destination(), res.size());
        finder.stop();
    }
    return res;
}


} // namespace pathfinder
} // namespace depaths
