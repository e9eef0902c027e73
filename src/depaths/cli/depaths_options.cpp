#include "depaths_options.hpp"
#include <depaths/model/depaths_common.hpp>
#include <boost/program_options.hpp>
#include <fstream>

namespace depaths {
namespace cli {

namespace po = boost::program_options;


static po::options_description m_options_description()
{
    po::options_description desc(
                "List the paths between two sets of nodes of a dependency graph.\n"
                "Either side may select a group of nodes, "
                "e.g. --from=src/app/main.py --to=src/library::\n\n"
                "Options");
    desc.add_options()
            ("help,h", "print this help")
            ("from", po::value<std::string>(), "the path starting address")
            ("to", po::value<std::string>(), "the path end address")
            ("graph", po::value<std::string>(), "dependency graph edge list file")
            ("output-file", po::value<std::string>(), "write the output here instead of stdout")
            ("log-level", po::value<std::string>()->default_value("info"),
                          "trace, debug, info, warning or error")
            ("jobs,j", po::value<int>()->default_value(0),
                       "max concurrent searches per fan-out level (0: hardware concurrency)")
            ("max-paths", po::value<long long>()->default_value(0),
                          "stop after this many paths per source/destination pair (0: no limit)")
            ("config", po::value<std::string>(), "read further options from this INI file")
            ;
    return desc;
}


void print_usage(std::ostream &out)
{
    out << "usage: depaths --from=<address> --to=<address> --graph=<file> [options]\n\n"
        << m_options_description() << std::endl;
}


Options parse_options(int argc, const char * const argv[])
{
    auto desc = m_options_description();
    po::variables_map vm;
    Options res;

    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("config"))
        {
            auto path = vm["config"].as<std::string>();
            std::ifstream fin(path);
            if (!fin)
            {
                throw ConfigurationError(strfmt("unable to open config file %1%", path));
            }
            // values already stored from the command line are not overwritten
            po::store(po::parse_config_file(fin, desc), vm);
        }
        po::notify(vm);
    } catch (const po::error &e) {
        throw ConfigurationError(e.what());
    }

    if (vm.count("help"))
    {
        res.help = true;
        return res;
    }

    if (!vm.count("from"))
    {
        throw ConfigurationError("Must set --from");
    }
    if (!vm.count("to"))
    {
        throw ConfigurationError("Must set --to");
    }
    if (!vm.count("graph"))
    {
        throw ConfigurationError("Must set --graph");
    }

    res.from = vm["from"].as<std::string>();
    res.to = vm["to"].as<std::string>();
    res.graph_file = vm["graph"].as<std::string>();
    if (vm.count("output-file"))
    {
        res.output_file = vm["output-file"].as<std::string>();
    }

    auto level = vm["log-level"].as<std::string>();
    if (!log_parse_level(level, res.level))
    {
        throw ConfigurationError(strfmt("bad --log-level: %1%", level));
    }

    // parsed signed, so that negative values are rejected rather than wrapped
    auto jobs = vm["jobs"].as<int>();
    if (jobs < 0)
    {
        throw ConfigurationError(strfmt("bad --jobs: %1%", jobs));
    }
    auto max_paths = vm["max-paths"].as<long long>();
    if (max_paths < 0)
    {
        throw ConfigurationError(strfmt("bad --max-paths: %1%", max_paths));
    }
    res.search.jobs = static_cast<unsigned>(jobs);
    res.search.max_paths = static_cast<std::size_t>(max_paths);
    return res;
}


} // namespace cli
} // namespace depaths
