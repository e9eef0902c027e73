#include "depaths_app.hpp"
#include <depaths/commons/depaths_log.hpp>
#include <depaths/model/depaths_graph.hpp>
#include <depaths/model/depaths_selector.hpp>
#include <depaths/pathfinder/fan_out.hpp>
#include <depaths/pathfinder/paths_json.hpp>
#include <depaths/pathfinder/progress.hpp>
#include <fstream>

namespace depaths {
namespace cli {

using namespace model;
using namespace pathfinder;


void run(const Options &opts, std::ostream &out)
{
    auto graph = DependencyGraph::load_file(opts.graph_file);
    AddressSelector select(graph.get());

    log_info("resolving source nodes from %1%...", opts.from);
    auto roots = select(opts.from);
    log_info("resolving destination nodes from %1%...", opts.to);
    auto destinations = select(opts.to);
    log_info("found %1% source nodes and %2% destination nodes"
             , roots.size(), destinations.size());

    LogProgressSink progress;
    RootFanOut fan_out(graph.get(), &progress, opts.search);
    auto paths = fan_out(roots, destinations);
    log_info("found %1% paths", paths.size());

    if (opts.output_file.empty())
    {
        write_paths_json(out, paths);
        out.flush();
        return;
    }

    std::ofstream fout(opts.output_file);
    if (!fout)
    {
        throw std::runtime_error(strfmt("unable to write %1%", opts.output_file));
    }
    write_paths_json(fout, paths);
    fout.close();
    if (!fout)
    {
        throw std::runtime_error(strfmt("error writing %1%", opts.output_file));
    }
}


} // namespace cli
} // namespace depaths
