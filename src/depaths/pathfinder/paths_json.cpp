#include "paths_json.hpp"
#include <nlohmann/json.hpp>

namespace depaths {
namespace pathfinder {


void write_paths_json(std::ostream &out, const PathList &paths)
{
    auto doc = nlohmann::json::array();
    for (auto &p: paths)
    {
        doc.push_back(p);
    }
    out << doc.dump(2, ' ', true, nlohmann::json::error_handler_t::replace) << "\n";
}


} // namespace pathfinder
} // namespace depaths
