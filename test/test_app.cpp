#include "test_utils.hpp"
#include <depaths/cli/depaths_app.hpp>
#include <depaths/model/depaths_common.hpp>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>

using namespace depaths;
using namespace depaths::cli;
using namespace depaths::test;


static std::string write_graph()
{
    auto path = temp_file_path(".deps");
    std::ofstream fout(path);
    fout << "src/app:main     src/app/cli.py src/lib:core\n"
         << "src/app/cli.py   src/lib:core src/lib:util\n"
         << "src/lib:core     src/lib:util\n"
         << "src/lib:util\n";
    return path;
}

static std::string read_file(const std::string &path)
{
    std::ifstream fin(path);
    return std::string(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
}


static void test_stdout()
{
    auto graph = write_graph();
    Options opts;
    opts.from = "src/app:main";
    opts.to = "src/lib:util";
    opts.graph_file = graph;

    std::ostringstream out;
    run(opts, out);

    expect(out.str() ==
           "[\n"
           "  [\n"
           "    \"src/app:main\",\n"
           "    \"src/app/cli.py\",\n"
           "    \"src/lib:util\"\n"
           "  ],\n"
           "  [\n"
           "    \"src/app:main\",\n"
           "    \"src/lib:core\",\n"
           "    \"src/lib:util\"\n"
           "  ],\n"
           "  [\n"
           "    \"src/app:main\",\n"
           "    \"src/app/cli.py\",\n"
           "    \"src/lib:core\",\n"
           "    \"src/lib:util\"\n"
           "  ]\n"
           "]\n", "paths on stdout, got:\n" + out.str());

    // nothing selected, nothing found, still a success
    opts.to = "src/nowhere::";
    std::ostringstream empty;
    run(opts, empty);
    expect(empty.str() == "[]\n", "empty selection");

    std::remove(graph.c_str());
}


static void test_output_file()
{
    auto graph = write_graph();
    auto output = temp_file_path(".json");
    Options opts;
    opts.from = "src/app:";
    opts.to = "src/lib:core";
    opts.graph_file = graph;
    opts.output_file = output;

    std::ostringstream out;
    run(opts, out);
    expect(out.str().empty(), "nothing on stdout");

    auto written = read_file(output);
    expect(written.find("\"src/app/cli.py\",\n    \"src/lib:core\"") != std::string::npos
           , "file has the paths, got:\n" + written);
    expect(written.back() == '\n', "newline terminated");

    std::remove(graph.c_str());
    std::remove(output.c_str());
}


static void test_failures()
{
    Options opts;
    opts.from = "a";
    opts.to = "b";
    opts.graph_file = "/nonexistent/graph.deps";

    bool thrown = false;
    std::ostringstream out;
    try {
        run(opts, out);
    } catch (const GraphFormatError &) {
        thrown = true;
    }
    expect(thrown, "unreadable graph");
    expect(out.str().empty(), "no output on failure");
}


int main()
{
    log_set_level(log_level_warning);
    test_stdout();
    test_output_file();
    test_failures();
    return 0;
}
