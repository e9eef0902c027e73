/**
 * @file depaths_options.hpp
 * @brief Command line and config file options of the depaths tool
 */

#pragma once

#include <depaths/commons/depaths_log.hpp>
#include <depaths/pathfinder/fan_out.hpp>
#include <ostream>
#include <string>

namespace depaths {
namespace cli {


struct Options {
    /**
     * @brief selector of the nodes paths start from (--from). Required
     */
    std::string from;

    /**
     * @brief selector of the nodes paths end at (--to). Required
     */
    std::string to;

    /**
     * @brief edge list file of the dependency graph (--graph). Required
     */
    std::string graph_file;

    /**
     * @brief where the JSON result goes (--output-file).
     *
     * @default empty (stdout)
     */
    std::string output_file;

    /**
     * @brief diagnostics threshold (--log-level)
     *
     * @default info
     */
    log_level level = log_level_info;

    pathfinder::SearchSettings search;

    /**
     * @brief --help was given. Nothing else is validated in that case
     */
    bool help = false;
};


/**
 * @brief parse command line (and the --config file it may name)
 *
 * Options given on the command line win over the config file.
 *
 * @throw ConfigurationError on unknown options, bad values, or when
 *        --from, --to or --graph are missing
 */
Options parse_options(int argc, const char * const argv[]);

/**
 * @brief print usage
 */
void print_usage(std::ostream &out);


} // namespace cli
} // namespace depaths
