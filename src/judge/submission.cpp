#include "judge/submission.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace oj {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, oj_result &result) {
    auto parsed = parse_oj_result(j.get<string>());
    if (!parsed) throw validation_error(error_reason::INVALID_ARGUMENT, "Unrecognized result " + j.get<string>());
    result = *parsed;
}

void to_json(json &j, const oj_result &result) {
    j = get_display_message(result);
}

void from_json(const json &j, job_state &state) {
    auto parsed = parse_job_state(j.get<string>());
    if (!parsed) throw validation_error(error_reason::INVALID_ARGUMENT, "Unrecognized state " + j.get<string>());
    state = *parsed;
}

void to_json(json &j, const job_state &state) {
    j = get_display_message(state);
}

void from_json(const json &j, submission &submit) {
    j.at("source_code").get_to(submit.source_code);
    j.at("language").get_to(submit.language);
    j.at("user_id").get_to(submit.user_id);
    if (j.count("contest_id"))
        j.at("contest_id").get_to(submit.contest_id);
    else
        submit.contest_id = 0;
    j.at("problem_id").get_to(submit.problem_id);
}

void to_json(json &j, const submission &submit) {
    j = {{"source_code", submit.source_code},
         {"language", submit.language},
         {"user_id", submit.user_id},
         {"contest_id", submit.contest_id},
         {"problem_id", submit.problem_id}};
}

void from_json(const json &j, case_result &result) {
    j.at("id").get_to(result.id);
    j.at("result").get_to(result.result);
    j.at("time").get_to(result.time);
    j.at("memory").get_to(result.memory);
    j.at("info").get_to(result.info);
}

void to_json(json &j, const case_result &result) {
    j = {{"id", result.id},
         {"result", result.result},
         {"time", result.time},
         {"memory", result.memory},
         {"info", result.info}};
}

void from_json(const json &j, job &record) {
    j.at("id").get_to(record.id);
    record.created_time = parse_time(j.at("created_time").get<string>());
    record.updated_time = parse_time(j.at("updated_time").get<string>());
    j.at("submission").get_to(record.submit);
    j.at("state").get_to(record.state);
    j.at("result").get_to(record.result);
    j.at("score").get_to(record.score);
    j.at("cases").get_to(record.cases);
}

void to_json(json &j, const job &record) {
    j = {{"id", record.id},
         {"created_time", format_time(record.created_time)},
         {"updated_time", format_time(record.updated_time)},
         {"submission", record.submit},
         {"state", record.state},
         {"result", record.result},
         {"score", record.score},
         {"cases", record.cases}};
}

void from_json(const json &j, user &u) {
    if (j.count("id"))
        j.at("id").get_to(u.id);
    else
        u.id = 0;
    j.at("name").get_to(u.name);
}

void to_json(json &j, const user &u) {
    j = {{"id", u.id}, {"name", u.name}};
}

void from_json(const json &j, contest &c) {
    if (j.count("id"))
        j.at("id").get_to(c.id);
    else
        c.id = 0;
    j.at("name").get_to(c.name);
    c.from = parse_time(j.at("from").get<string>());
    c.to = parse_time(j.at("to").get<string>());
    j.at("problem_ids").get_to(c.problem_ids);
    j.at("user_ids").get_to(c.user_ids);
    j.at("submission_limit").get_to(c.submission_limit);
}

void to_json(json &j, const contest &c) {
    j = {{"id", c.id},
         {"name", c.name},
         {"from", format_time(c.from)},
         {"to", format_time(c.to)},
         {"problem_ids", c.problem_ids},
         {"user_ids", c.user_ids},
         {"submission_limit", c.submission_limit}};
}

}  // namespace oj
