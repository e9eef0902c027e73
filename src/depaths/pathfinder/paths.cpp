#include "paths.hpp"
#include <boost/algorithm/string/join.hpp>
#include <unordered_set>

namespace depaths {
namespace pathfinder {


std::string print_path(const Path &p)
{
    return boost::algorithm::join(p, " -> ");
}


NodeList unique_nodes(const NodeList &nodes)
{
    NodeList res;
    std::unordered_set<Node> seen;
    for (auto &n: nodes)
    {
        if (seen.emplace(n).second)
        {
            res.emplace_back(n);
        }
    }
    return res;
}


} // namespace pathfinder
} // namespace depaths
