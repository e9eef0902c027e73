#pragma once

#include "depaths_common.hpp"
#include "depaths_model_fwd.hpp"
#include <cstdint>
#include <limits>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>


namespace depaths {
namespace model {

/**
 * @brief Graph vertex identifier.
 *
 * Opaque to the path finder: only equality and hashing are ever used.
 * In practice this is a build target address such as "src/app:main".
 */
typedef std::string Node;

typedef std::vector<Node> NodeList;

/**
 * @brief immediate successors of a bunch of nodes, as handed out by an
 *        AdjacencyProvider. Successor order is significant.
 */
typedef std::unordered_map<Node, NodeList> SuccessorLists;

/**
 * @brief dense identifier of a node interned in a NodeIndex
 */
typedef std::uint32_t node_id;

/**
 * @brief reserved id. Stands for "no node" (ie. the missing predecessor
 *        of a BFS root)
 */
constexpr node_id no_node = std::numeric_limits<node_id>::max();

/**
 * @brief (predecessor, successor) pair of interned nodes.
 *
 * The synthetic edge that enters the root of a search has
 * predecessor == no_node.
 */
typedef std::pair<node_id, node_id> edge_t;


} // namespace model
} // namespace depaths
