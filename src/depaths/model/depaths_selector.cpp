#include "depaths_selector.hpp"
#include "../commons/depaths_log.hpp"
#include <boost/algorithm/string.hpp>
#include <assert.h>


namespace depaths {
namespace model {


std::string AddressSelector::directory_of(const Node &address)
{
    auto colon = address.find(':');
    if (colon != std::string::npos)
    {
        return address.substr(0, colon);
    }
    auto slash = address.rfind('/');
    if (slash == std::string::npos)
    {
        return std::string();
    }
    return address.substr(0, slash);
}


NodeList AddressSelector::operator()(const std::string &selector) const
{
    using boost::algorithm::ends_with;
    using boost::algorithm::starts_with;

    assert(m_graph != nullptr);

    NodeList res;

    if (ends_with(selector, "::"))
    {
        auto dir = selector.substr(0, selector.size()-2);
        for (auto &n: m_graph->nodes())
        {
            auto d = directory_of(n);
            if (dir.empty() || d == dir || starts_with(d, dir + "/"))
            {
                res.emplace_back(n);
            }
        }
    }
    else if (ends_with(selector, ":"))
    {
        auto dir = selector.substr(0, selector.size()-1);
        for (auto &n: m_graph->nodes())
        {
            if (directory_of(n) == dir)
            {
                res.emplace_back(n);
            }
        }
    }
    else if (m_graph->has_node(selector))
    {
        res.emplace_back(selector);
    }

    log_debug("selector %1% matches %2% nodes", selector, res.size());
    return res;
}


} // namespace model
} // namespace depaths
