#include "store/job_filter.hpp"
#include "common/utils.hpp"

namespace oj {
using namespace std;
using namespace nlohmann;

bool job_filter::matches(const job &record) const {
    if (user_id && record.submit.user_id != *user_id) return false;
    if (contest_id && record.submit.contest_id != *contest_id) return false;
    if (problem_id && record.submit.problem_id != *problem_id) return false;
    if (language && record.submit.language != *language) return false;
    if (from && record.created_time < *from) return false;
    if (to && record.created_time > *to) return false;
    if (state && record.state != *state) return false;
    if (result && record.result != *result) return false;
    return true;
}

void from_json(const json &j, job_filter &filter) {
    if (j.count("user_id")) filter.user_id = j.at("user_id").get<uint32_t>();
    if (j.count("user_name")) filter.user_name = j.at("user_name").get<string>();
    if (j.count("contest_id")) filter.contest_id = j.at("contest_id").get<uint32_t>();
    if (j.count("problem_id")) filter.problem_id = j.at("problem_id").get<uint32_t>();
    if (j.count("language")) filter.language = j.at("language").get<string>();
    if (j.count("from")) filter.from = parse_time(j.at("from").get<string>());
    if (j.count("to")) filter.to = parse_time(j.at("to").get<string>());
    if (j.count("state")) filter.state = j.at("state").get<job_state>();
    if (j.count("result")) filter.result = j.at("result").get<oj_result>();
}

}  // namespace oj
