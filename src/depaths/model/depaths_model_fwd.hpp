#pragma once

#include <string>

namespace depaths {
namespace model {

struct NodeIndex;
struct AdjacencyMap;
struct AdjacencyProvider;
struct DependencyGraph;
struct AddressSelector;

} // namespace model
} // namespace depaths
