#pragma once

#include <depaths/model/depaths_types.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace depaths {
namespace pathfinder {

using Node = model::Node;
using NodeList = model::NodeList;


/**
 * @brief A path in the dependency graph
 *
 * Root first, destination last. Never empty: when root and destination
 * are the same node, the path is just [root].
 */
typedef model::NodeList Path;

typedef std::vector<Path> PathList;

/**
 * @brief callback type
 *
 * Search algos may hand over discovered paths to a listener functor,
 * rather than collecting them in lists.
 * Returning false from the listener stops the search right away.
 */
typedef std::function<bool(const Path &)> listener_t;

/**
 * @brief all paths found from one root to one destination
 */
struct PairPaths
{
    Node root;
    Node destination;
    PathList paths;
};

/**
 * @brief per-destination results of a root, in destination input order
 */
typedef std::vector<PairPaths> PairPathsList;


/**
 * @brief cooperative stop signal shared by a whole search operation.
 *
 * Copies share the same flag. Searches poll it, nobody waits on it.
 */
struct CancellationFlag
{
    CancellationFlag(): m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const noexcept { m_flag->store(true); }
    bool cancelled() const noexcept { return m_flag->load(std::memory_order_relaxed); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};


/**
 * @brief one-line rendering, such as "a -> b -> c"
 */
std::string print_path(const Path &p);

/**
 * @brief collapse repeated nodes, keeping first occurrences in order
 */
NodeList unique_nodes(const NodeList &nodes);


} // namespace pathfinder
} // namespace depaths
