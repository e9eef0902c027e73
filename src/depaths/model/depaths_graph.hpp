/**
 * @file depaths_graph.hpp
 * @brief In-memory dependency graph
 *
 * The simplest AdjacencyProvider there is: every node and edge is known
 * upfront, typically loaded from an edge list file.
 *
 * Edge list format, one node per line:
 *
 *     # comment
 *     src/app:main   src/lib:core src/lib:util
 *     src/lib:core:  src/lib:util
 *
 * The first token is the node, the rest are its direct dependencies, in
 * order. A trailing ':' on the first token is accepted and ignored.
 * A node may be listed on several lines: its lists are concatenated.
 * Repeated edges are dropped (first occurrence wins).
 */

#pragma once

#include "depaths_adjacency.hpp"
#include "depaths_node_idx.hpp"
#include <boost/functional/hash.hpp>
#include <boost/noncopyable.hpp>
#include <istream>
#include <memory>
#include <unordered_set>


namespace depaths {
namespace model {


struct DependencyGraph: AdjacencyProvider, boost::noncopyable
{
    typedef std::unique_ptr<DependencyGraph> ptr;

    DependencyGraph() {}

    /**
     * @brief load a graph from the edge list file at @p path
     * @throw GraphFormatError if the file can't be read or is malformed
     */
    static ptr load_file(const std::string &path);

    /**
     * @brief add edge lists read from @p in to this graph
     * @param origin used in error messages only
     * @throw GraphFormatError
     */
    void load(std::istream &in, const std::string &origin);

    /**
     * @brief Introduce a new node into the graph, if not existing.
     * @return true if the node was not known before
     */
    bool add_node(const Node &n);

    /**
     * @brief Introduce a new dependency edge, if not existing.
     *
     * Both ends are added as nodes as needed.
     *
     * @return true if the edge was not known before
     */
    bool add_edge(const Node &from, const Node &to);

    bool has_node(const Node &n) const noexcept;

    /**
     * @brief all nodes, in declaration order
     */
    NodeList nodes() const;

    std::size_t nodes_count() const noexcept { return m_nodes.size(); }
    std::size_t edges_count() const noexcept { return m_edges.size(); }

    /**
     * @throw UnknownNodeError if @p root is not a node of this graph
     */
    NodeList closure(const Node &root) const override;
    SuccessorLists successors(const NodeList &nodes) const override;

private:
    NodeIndex m_nodes;
    std::vector<std::vector<node_id>> m_successors;
    std::unordered_set<edge_t, boost::hash<edge_t>> m_edges;
};


} // namespace model
} // namespace depaths
