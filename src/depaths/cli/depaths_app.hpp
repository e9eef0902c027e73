#pragma once

#include "depaths_options.hpp"
#include <ostream>

namespace depaths {
namespace cli {

/**
 * @brief the whole paths goal: load the graph, resolve both selectors,
 *        find all the paths and write them out as JSON
 *
 * Output goes to Options::output_file if set, else to @p out.
 * Diagnostics go through the logging facility.
 *
 * @throw GraphFormatError, UnknownNodeError, std::runtime_error
 */
void run(const Options &opts, std::ostream &out);

} // namespace cli
} // namespace depaths
