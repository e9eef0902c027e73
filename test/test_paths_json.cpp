#include "test_utils.hpp"
#include <depaths/pathfinder/paths_json.hpp>
#include <sstream>

using namespace depaths;
using namespace depaths::pathfinder;
using namespace depaths::test;


static std::string render(const PathList &paths)
{
    std::ostringstream out;
    write_paths_json(out, paths);
    return out.str();
}


int main()
{
    expect(render(PathList()) == "[]\n", "no paths");

    expect(render(PathList{{"src/app:main", "src/lib:core"}, {"x"}}) ==
           "[\n"
           "  [\n"
           "    \"src/app:main\",\n"
           "    \"src/lib:core\"\n"
           "  ],\n"
           "  [\n"
           "    \"x\"\n"
           "  ]\n"
           "]\n", "pretty printed, 2 spaces");

    expect(render(PathList{{"caf\xc3\xa9", "q\"uote"}}) ==
           "[\n"
           "  [\n"
           "    \"caf\\u00e9\",\n"
           "    \"q\\\"uote\"\n"
           "  ]\n"
           "]\n", "escaping");
    return 0;
}
