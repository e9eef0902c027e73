#include "depaths_app.hpp"
#include "depaths_options.hpp"
#include <depaths/commons/depaths_log.hpp>
#include <depaths/model/depaths_common.hpp>
#include <iostream>

using namespace depaths;


int main(int argc, char *argv[])
{
    cli::Options opts;
    try {
        opts = cli::parse_options(argc, argv);
    } catch (const ConfigurationError &e) {
        log_error("%1%", e.what());
        std::cerr << "try 'depaths --help'" << std::endl;
        return 2;
    }

    if (opts.help)
    {
        cli::print_usage(std::cout);
        return 0;
    }

    log_set_level(opts.level);

    try {
        cli::run(opts, std::cout);
    } catch (const std::exception &e) {
        log_error("%1%", e.what());
        return 1;
    }
    return 0;
}
