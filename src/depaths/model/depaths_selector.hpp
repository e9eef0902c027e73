/**
 * @file depaths_selector.hpp
 * @brief Resolution of address selectors into sets of graph nodes
 *
 * Supported forms:
 *
 *  - "dir:"    all nodes whose directory is exactly dir
 *  - "dir::"   all nodes whose directory is dir, or lies below dir/
 *  - "::"      everything
 *  - anything else is matched verbatim against node names
 *
 * The directory of an address is what comes before its first ':', if any
 * ("src/app:main" -> "src/app"), otherwise its parent path
 * ("src/app/main.py" -> "src/app").
 */

#pragma once

#include "depaths_graph.hpp"


namespace depaths {
namespace model {


struct AddressSelector
{
    AddressSelector(const DependencyGraph *graph): m_graph(graph) {}

    /**
     * @brief nodes selected by @p selector, in graph declaration order.
     *
     * An empty selection is not an error.
     */
    NodeList operator()(const std::string &selector) const;

    /**
     * @brief directory part of @p address
     */
    static std::string directory_of(const Node &address);

    const DependencyGraph *m_graph;
};


} // namespace model
} // namespace depaths
