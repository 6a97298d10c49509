#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace oj {
using namespace std;

// clang-format off
static const unordered_map<oj_result, const char *> result_string = boost::assign::map_list_of
    (oj_result::WAITING, "Waiting")
    (oj_result::RUNNING, "Running")
    (oj_result::ACCEPTED, "Accepted")
    (oj_result::COMPILATION_ERROR, "Compilation Error")
    (oj_result::COMPILATION_SUCCESS, "Compilation Success")
    (oj_result::WRONG_ANSWER, "Wrong Answer")
    (oj_result::RUNTIME_ERROR, "Runtime Error")
    (oj_result::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (oj_result::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (oj_result::SYSTEM_ERROR, "System Error")
    (oj_result::SPJ_ERROR, "SPJ Error")
    (oj_result::SKIPPED, "Skipped");

static const unordered_map<job_state, const char *> state_string = boost::assign::map_list_of
    (job_state::QUEUEING, "Queueing")
    (job_state::RUNNING, "Running")
    (job_state::FINISHED, "Finished")
    (job_state::CANCELED, "Canceled");
// clang-format on

const char *get_display_message(oj_result result) {
    return result_string.at(result);
}

optional<oj_result> parse_oj_result(const string &message) {
    for (auto &[result, name] : result_string)
        if (message == name) return result;
    return nullopt;
}

const char *get_display_message(job_state state) {
    return state_string.at(state);
}

optional<job_state> parse_job_state(const string &message) {
    for (auto &[state, name] : state_string)
        if (message == name) return state;
    return nullopt;
}

}  // namespace oj
