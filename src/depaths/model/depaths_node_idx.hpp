/**
 * @file depaths_node_idx.hpp
 * @brief Interning index of graph nodes
 *
 * The machinery implemented here is based around boost::multi_index.
 * multi_index is great but ostensibly tortuous to use and read,
 * which is the reason I've partitioned this code here.
 *
 * Nodes are strings, and strings are expensive to copy, hash and compare
 * in the hot loop of a path search. Every node that takes part in a search
 * is interned once here and gets a dense node_id, which is its position
 * in the index. The path finder only ever moves node_ids around.
 */

#pragma once

#include "depaths_types.hpp"
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/random_access_index.hpp>


namespace depaths {
namespace model {
namespace idx {

using namespace boost::multi_index;


/**
 * @defgroup indexes Available indexing (and lookup) strategies
 * @{
 */
struct by_id {};
struct by_name {};

/** @} */


struct NodeEntry {
    const Node name;
};


/**
 * @brief Base multi_index implementation
 *
 * Items can be looked up:
 *
 *  - by_id in O(1): the position of insertion is the node_id
 *  - by_name in O(1)
 */
typedef multi_index_container<
  NodeEntry,
  indexed_by<
        // 1. insertion order. Position is the node id
          random_access<      tag<by_id>    >
        // 2. lookup by node name. Names are unique
        , hashed_unique<      tag<by_name>  ,  member<NodeEntry, const Node, &NodeEntry::name> >
  >
> NodeIndex_base;

} // namespace idx


/**
 * @brief Public NodeIndex type
 *
 * @note Promoted as struct in order to attach the interning API
 */
struct NodeIndex: idx::NodeIndex_base {
    using idx::NodeIndex_base::NodeIndex_base;

    /**
     * @brief intern @p name, if not already known
     * @return id of the (new or existing) entry
     */
    node_id intern(const Node &name)
    {
        auto &ids = get<idx::by_id>();
        auto res = ids.push_back(idx::NodeEntry{name});
        return static_cast<node_id>(res.first - ids.begin());
    }

    /**
     * @brief lookup node by name
     * @return matching id or no_node
     */
    node_id lookup(const Node &name) const noexcept
    {
        auto &names = get<idx::by_name>();
        auto i = names.find(name);
        if (i == names.end())
        {
            return no_node;
        }
        auto &ids = get<idx::by_id>();
        return static_cast<node_id>(project<idx::by_id>(i) - ids.begin());
    }

    /**
     * @brief name of an interned node
     */
    const Node &name(node_id id) const
    {
        return get<idx::by_id>()[id].name;
    }
};


} // namespace model
} // namespace depaths
