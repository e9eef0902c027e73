#pragma once

#include "paths.hpp"
#include "progress.hpp"
#include <depaths/model/depaths_adjacency.hpp>
#include <boost/functional/hash.hpp>
#include <boost/noncopyable.hpp>
#include <deque>
#include <iterator>
#include <unordered_set>

namespace depaths {
namespace pathfinder {


/**
 * @brief Lazy enumeration of all paths from one root to one destination
 *
 * Breadth first walk of the adjacency map. Partial paths wait in a FIFO
 * queue, therefore paths come out shortest first. Paths of the same length
 * come out in successor order of the adjacency map.
 *
 * Cycles are dealt with by never expanding the same (predecessor, node)
 * edge twice. The same node may still be reached again through a different
 * incoming edge, so paths are not necessarily simple, but the walk always
 * ends because the edge set is finite.
 *
 * Nothing is computed upfront: each call to next() does just enough work
 * to produce the next path. Dropping the finder, or simply not asking for
 * more, is how a consumer stops the search. A raised CancellationFlag
 * ends it at the next dequeue.
 *
 * The adjacency map is shared (read-only) with other finders. Everything
 * else is private to this instance. Not thread safe: one consumer at a time.
 */
struct PathFinder: boost::noncopyable
{
    static constexpr std::size_t edges_notification_step = 1000;
    static constexpr std::size_t paths_notification_step = 100;

    PathFinder(model::AdjacencyMap::ref adjacency
               , const Node &root
               , const Node &destination
               , ProgressSink *progress = nullptr
               , CancellationFlag cancel = CancellationFlag());

    /**
     * @brief produce the next path
     * @return false when the search is over (nothing written to @p out)
     */
    bool next(Path &out);

    /**
     * @brief walk all remaining paths, until @p callback returns false
     * @return number of paths handed to @p callback
     */
    std::size_t operator()(listener_t callback);

    /**
     * @brief stop the search. Further next() calls return false
     */
    void stop() noexcept { m_done = true; }

    bool done() const noexcept { return m_done; }

    std::size_t paths_found() const noexcept { return m_paths_found; }
    std::size_t edges_visited() const noexcept { return m_edges_visited; }

    const Node &root() const noexcept { return m_root; }
    const Node &destination() const noexcept { return m_destination; }


    /**
     * @brief single pass input iterator over the remaining paths
     */
    struct iterator
    {
        typedef std::input_iterator_tag iterator_category;
        typedef Path value_type;
        typedef std::ptrdiff_t difference_type;
        typedef const Path *pointer;
        typedef const Path &reference;

        iterator(): m_finder(nullptr) {}
        explicit iterator(PathFinder *finder): m_finder(finder) { advance(); }

        reference operator*() const { return m_current; }
        pointer operator->() const { return &m_current; }
        iterator &operator++() { advance(); return *this; }

        bool operator==(const iterator &o) const noexcept { return m_finder == o.m_finder; }
        bool operator!=(const iterator &o) const noexcept { return m_finder != o.m_finder; }

    private:
        void advance()
        {
            if (m_finder != nullptr && !m_finder->next(m_current))
            {
                m_finder = nullptr;
            }
        }

        PathFinder *m_finder;
        Path m_current;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    /**
     * @brief partial paths are stored as a tree of steps. Each step
     *        knows its node and the step it was reached from
     */
    struct step_t {
        model::node_id node;
        std::size_t parent;
    };
    static constexpr std::size_t no_parent = static_cast<std::size_t>(-1);

    Path m_materialize(std::size_t step, model::node_id last) const;
    void m_count_edge();
    void m_count_path();

    model::AdjacencyMap::ref m_adjacency;
    const Node m_root;
    const Node m_destination;
    ProgressSink *m_progress;
    CancellationFlag m_cancel;

    model::node_id m_destination_id = model::no_node;
    bool m_done = false;
    bool m_self_path = false;

    std::vector<step_t> m_steps;
    std::deque<std::size_t> m_queue;
    std::unordered_set<model::edge_t, boost::hash<model::edge_t>> m_visited;

    // step being expanded, and position in its successor list
    std::size_t m_expanding = no_parent;
    std::size_t m_successor_pos = 0;

    std::size_t m_paths_found = 0;
    std::size_t m_edges_visited = 0;
    std::size_t m_last_edges_notification = 0;
};


/**
 * @brief drain a finder into a list
 * @param max_paths stop after this many paths. 0 means no limit
 */
PathList collect_paths(PathFinder &finder, std::size_t max_paths = 0);


} // namespace pathfinder
} // namespace depaths
