#include "test/environment.hpp"
#include <glog/logging.h>
#include <cstdlib>
#include "common/io_utils.hpp"
#include "config.hpp"

namespace oj {
using namespace std;

static filesystem::path test_root("/tmp/oj-judger-test");

void setup_test_environment() {
    if (getenv("DEBUG")) oj::DEBUG = true;

    oj::RUN_DIR = test_root / "run";
    filesystem::create_directories(oj::RUN_DIR);
    CHECK(filesystem::is_directory(oj::RUN_DIR))
        << "Run directory " << oj::RUN_DIR << " does not exist";
    filesystem::create_directories(test_root / "data");
}

filesystem::path write_test_file(const string &name, const string &content) {
    filesystem::path path = test_root / "data" / name;
    filesystem::create_directories(path.parent_path());
    write_file_content(path, content);
    return path;
}

language shell_language() {
    language lang;
    lang.name = "sh";
    lang.file_name = "main.sh";
    lang.command = {"/bin/sh", "-c", "sh -n \"$0\" && cp \"$0\" \"$1\" && chmod +x \"$1\"", "%INPUT%", "%OUTPUT%"};
    return lang;
}

test_case make_test_case(const string &name, double score, const string &input, const string &answer, uint64_t time_limit) {
    test_case tc;
    tc.score = score;
    tc.input_file = write_test_file(name + ".in", input);
    tc.answer_file = write_test_file(name + ".ans", answer);
    tc.time_limit = time_limit;
    tc.memory_limit = 1 << 20;
    return tc;
}

problem make_problem(uint32_t id, problem_type type, vector<test_case> cases) {
    problem prob;
    prob.id = id;
    prob.name = "problem-" + to_string(id);
    prob.type = type;
    prob.cases = move(cases);
    return prob;
}

}  // namespace oj
