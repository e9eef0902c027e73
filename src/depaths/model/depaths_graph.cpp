#include "depaths_graph.hpp"
#include "../commons/depaths_log.hpp"
#include <boost/algorithm/string.hpp>
#include <deque>
#include <fstream>


namespace depaths {
namespace model {


DependencyGraph::ptr DependencyGraph::load_file(const std::string &path)
{
    std::ifstream fin(path);
    if (!fin)
    {
        throw GraphFormatError(strfmt("unable to open graph file %1%", path));
    }
    ptr graph(new DependencyGraph);
    graph->load(fin, path);
    log_info("loaded %1% nodes and %2% edges from %3%"
             , graph->nodes_count()
             , graph->edges_count()
             , path);
    return graph;
}


void DependencyGraph::load(std::istream &in, const std::string &origin)
{
    std::string line;
    std::vector<std::string> tokens;
    unsigned lineno = 0;

    while (std::getline(in, line))
    {
        ++lineno;
        auto comment = line.find('#');
        if (comment != std::string::npos)
        {
            line.erase(comment);
        }
        boost::algorithm::trim(line);
        if (line.empty()) continue;

        boost::algorithm::split(tokens, line
                                , boost::algorithm::is_space()
                                , boost::algorithm::token_compress_on);

        auto &node = tokens[0];
        if (boost::algorithm::ends_with(node, ":"))
        {
            node.pop_back();
        }
        if (node.empty())
        {
            throw GraphFormatError(strfmt("%1%:%2%: missing node name", origin, lineno));
        }

        add_node(node);
        for (std::size_t i = 1; i < tokens.size(); ++i)
        {
            add_edge(node, tokens[i]);
        }
    }

    if (in.bad())
    {
        throw GraphFormatError(strfmt("%1%: read error after line %2%", origin, lineno));
    }
}


bool DependencyGraph::add_node(const Node &n)
{
    auto before = m_nodes.size();
    m_nodes.intern(n);
    if (m_nodes.size() == before)
    {
        return false;
    }
    m_successors.resize(m_nodes.size());
    return true;
}


bool DependencyGraph::add_edge(const Node &from, const Node &to)
{
    add_node(from);
    add_node(to);
    edge_t e(m_nodes.lookup(from), m_nodes.lookup(to));
    if (!m_edges.emplace(e).second)
    {
        log_trace("dropping repeated edge %1% -> %2%", from, to);
        return false;
    }
    m_successors[e.first].emplace_back(e.second);
    return true;
}


bool DependencyGraph::has_node(const Node &n) const noexcept
{
    return m_nodes.lookup(n) != no_node;
}


NodeList DependencyGraph::nodes() const
{
    NodeList res;
    res.reserve(m_nodes.size());
    for (auto &entry: m_nodes)
    {
        res.emplace_back(entry.name);
    }
    return res;
}


NodeList DependencyGraph::closure(const Node &root) const
{
    auto root_id = m_nodes.lookup(root);
    if (root_id == no_node)
    {
        throw UnknownNodeError(strfmt("unknown node: %1%", root));
    }

    // plain BFS, marking nodes as they are first seen. Declaration order
    // of the successors is kept, which makes the closure order repeatable.
    std::vector<bool> seen(m_nodes.size(), false);
    std::deque<node_id> to_visit;
    NodeList res;

    seen[root_id] = true;
    to_visit.push_back(root_id);
    while (!to_visit.empty())
    {
        auto current = to_visit.front();
        to_visit.pop_front();
        res.emplace_back(m_nodes.name(current));
        for (auto next: m_successors[current])
        {
            if (seen[next]) continue;
            seen[next] = true;
            to_visit.push_back(next);
        }
    }
    return res;
}


SuccessorLists DependencyGraph::successors(const NodeList &nodes) const
{
    SuccessorLists res;
    res.reserve(nodes.size());
    for (auto &n: nodes)
    {
        auto id = m_nodes.lookup(n);
        if (id == no_node)
        {
            throw UnknownNodeError(strfmt("unknown node: %1%", n));
        }
        auto &out = res[n];
        out.clear();
        for (auto s: m_successors[id])
        {
            out.emplace_back(m_nodes.name(s));
        }
    }
    return res;
}


} // namespace model
} // namespace depaths
