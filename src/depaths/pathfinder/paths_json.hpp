#pragma once

#include "paths.hpp"
#include <ostream>

namespace depaths {
namespace pathfinder {

/**
 * @brief write @p paths as a pretty printed JSON array of arrays of node
 *        names (2 spaces indent, non-ASCII escaped), newline terminated
 */
void write_paths_json(std::ostream &out, const PathList &paths);

} // namespace pathfinder
} // namespace depaths
