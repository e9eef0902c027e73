/**
 * @file depaths_adjacency.hpp
 * @brief Adjacency oracle and its precomputed, immutable snapshot.
 */

#pragma once

#include "depaths_node_idx.hpp"
#include "depaths_types.hpp"
#include <boost/noncopyable.hpp>
#include <memory>
#include <vector>


namespace depaths {
namespace model {


/**
 * @brief Source of dependency edges.
 *
 * This is where the graph actually lives: the path finder never walks the
 * graph on its own, it asks the provider for the reachable neighbourhood of
 * one root and works on that.
 *
 * Implementations are expected to be pure. Both calls may be issued
 * concurrently by several root tasks, and are issued exactly once per root.
 * Failures are reported by throwing, and travel unchanged up to whoever
 * started the search.
 */
struct AdjacencyProvider
{
    virtual ~AdjacencyProvider() {}

    /**
     * @brief transitive closure of @p root (all nodes reachable from it,
     *        @p root itself included)
     */
    virtual NodeList closure(const Node &root) const = 0;

    /**
     * @brief immediate successors of every node in @p nodes.
     *
     * Edges are always traversed, whatever their kind.
     * Nodes without successors may be omitted from the result.
     */
    virtual SuccessorLists successors(const NodeList &nodes) const = 0;
};


/**
 * @brief Precomputed successor table for one root.
 *
 * Built once per root out of an AdjacencyProvider, then handed out to all
 * the searches departing from that root via shared_ptr<const AdjacencyMap>.
 * Nothing mutates it after construction, which is why concurrent searches
 * can read it without locks.
 *
 * Successor order is the order handed out by the provider, and it is what
 * breaks ties among paths of equal length.
 */
struct AdjacencyMap: boost::noncopyable
{
    typedef std::shared_ptr<const AdjacencyMap> ref;
    typedef std::vector<node_id> successor_list;

    /**
     * @brief resolve the neighbourhood of @p root through @p provider.
     *
     * Calls AdjacencyProvider::closure() and AdjacencyProvider::successors()
     * exactly once each.
     */
    static ref resolve(const AdjacencyProvider &provider, const Node &root);

    /**
     * @brief assemble a map out of already resolved data
     *
     * Nodes are interned in @p closure order first, then in order of first
     * appearance among the successor lists.
     */
    AdjacencyMap(const NodeList &closure, const SuccessorLists &successors);

    /**
     * @brief successors of @p id. Empty if @p id has none, or isn't a key
     */
    const successor_list &successors(node_id id) const noexcept
    {
        if (id < m_successors.size()) return m_successors[id];
        return m_empty;
    }

    /**
     * @brief id of @p name, or no_node if the map never heard of it
     */
    node_id lookup(const Node &name) const noexcept { return m_nodes.lookup(name); }

    const Node &name(node_id id) const { return m_nodes.name(id); }

    std::size_t nodes_count() const noexcept { return m_nodes.size(); }
    std::size_t edges_count() const noexcept { return m_edges_count; }

private:
    NodeIndex m_nodes;
    std::vector<successor_list> m_successors;
    std::size_t m_edges_count = 0;
    const successor_list m_empty;
};


} // namespace model
} // namespace depaths
