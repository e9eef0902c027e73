#include "depaths_adjacency.hpp"
#include "../commons/depaths_log.hpp"


namespace depaths {
namespace model {


AdjacencyMap::ref AdjacencyMap::resolve(const AdjacencyProvider &provider
                                        , const Node &root)
{
    auto closure = provider.closure(root);
    log_debug("closure of %1% has %2% nodes", root, closure.size());
    auto successors = provider.successors(closure);
    return std::make_shared<const AdjacencyMap>(closure, successors);
}


AdjacencyMap::AdjacencyMap(const NodeList &closure
                           , const SuccessorLists &successors)
{
    for (auto &n: closure)
    {
        m_nodes.intern(n);
    }

    // the closure is only the key set. Successor lists of nodes
    // outside of it are not part of this root's neighbourhood.
    std::vector<std::pair<node_id, const NodeList *>> keyed;
    keyed.reserve(closure.size());
    for (auto &n: closure)
    {
        auto i = successors.find(n);
        if (i == successors.end()) continue;
        keyed.emplace_back(m_nodes.lookup(n), &i->second);
    }

    m_successors.resize(m_nodes.size());
    for (auto &k: keyed)
    {
        auto &out = m_successors[k.first];
        if (!out.empty()) continue; // listed twice in the closure
        out.reserve(k.second->size());
        for (auto &s: *k.second)
        {
            out.emplace_back(m_nodes.intern(s));
        }
        m_edges_count += out.size();
    }
    // interning may have brought in nodes with no successor list
    m_successors.resize(m_nodes.size());
}


} // namespace model
} // namespace depaths
