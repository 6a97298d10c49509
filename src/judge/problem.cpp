#include "judge/problem.hpp"
#include <fmt/core.h>
#include <set>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace oj {
using namespace std;
using namespace nlohmann;

const problem *configuration::find_problem(uint32_t id) const {
    for (auto &prob : problems)
        if (prob.id == id) return &prob;
    return nullptr;
}

const language *configuration::find_language(const string &name) const {
    for (auto &lang : languages)
        if (lang.name == name) return &lang;
    return nullptr;
}

const char *get_display_message(problem_type type) {
    switch (type) {
        case problem_type::STANDARD: return "standard";
        case problem_type::STRICT: return "strict";
        case problem_type::SPJ: return "spj";
        case problem_type::DYNAMIC_RANKING: return "dynamic_ranking";
    }
    return "standard";
}

void from_json(const json &j, problem_type &type) {
    string name = j.get<string>();
    for (auto candidate : {problem_type::STANDARD, problem_type::STRICT, problem_type::SPJ, problem_type::DYNAMIC_RANKING}) {
        if (name == get_display_message(candidate)) {
            type = candidate;
            return;
        }
    }
    throw validation_error(error_reason::INVALID_ARGUMENT, "Unrecognized problem type " + name);
}

void to_json(json &j, const problem_type &type) {
    j = get_display_message(type);
}

void from_json(const json &j, test_case &tc) {
    j.at("score").get_to(tc.score);
    tc.input_file = j.at("input_file").get<string>();
    tc.answer_file = j.at("answer_file").get<string>();
    j.at("time_limit").get_to(tc.time_limit);
    if (j.count("memory_limit"))
        j.at("memory_limit").get_to(tc.memory_limit);
    else
        tc.memory_limit = 0;
}

void to_json(json &j, const test_case &tc) {
    j = {{"score", tc.score},
         {"input_file", tc.input_file.string()},
         {"answer_file", tc.answer_file.string()},
         {"time_limit", tc.time_limit},
         {"memory_limit", tc.memory_limit}};
}

void from_json(const json &j, problem_misc &misc) {
    if (j.count("special_judge") && !j.at("special_judge").is_null())
        misc.special_judge = j.at("special_judge").get<vector<string>>();
    if (j.count("dynamic_ranking_ratio") && !j.at("dynamic_ranking_ratio").is_null())
        misc.dynamic_ranking_ratio = j.at("dynamic_ranking_ratio").get<double>();
}

void to_json(json &j, const problem_misc &misc) {
    j = json::object();
    if (misc.special_judge) j["special_judge"] = *misc.special_judge;
    if (misc.dynamic_ranking_ratio) j["dynamic_ranking_ratio"] = *misc.dynamic_ranking_ratio;
}

void from_json(const json &j, problem &prob) {
    j.at("id").get_to(prob.id);
    j.at("name").get_to(prob.name);
    j.at("type").get_to(prob.type);
    if (j.count("misc"))
        j.at("misc").get_to(prob.misc);
    else
        prob.misc = problem_misc();
    j.at("cases").get_to(prob.cases);
}

void to_json(json &j, const problem &prob) {
    j = {{"id", prob.id},
         {"name", prob.name},
         {"type", prob.type},
         {"misc", prob.misc},
         {"cases", prob.cases}};
}

void from_json(const json &j, language &lang) {
    j.at("name").get_to(lang.name);
    j.at("file_name").get_to(lang.file_name);
    j.at("command").get_to(lang.command);
}

void to_json(json &j, const language &lang) {
    j = {{"name", lang.name},
         {"file_name", lang.file_name},
         {"command", lang.command}};
}

configuration parse_configuration(const json &j) {
    configuration config;
    try {
        j.at("problems").get_to(config.problems);
        j.at("languages").get_to(config.languages);
    } catch (json::exception &ex) {
        throw validation_error(error_reason::INVALID_ARGUMENT, string("Malformed configuration: ") + ex.what());
    }

    set<uint32_t> problem_ids;
    for (auto &prob : config.problems) {
        if (!problem_ids.insert(prob.id).second)
            throw validation_error(error_reason::INVALID_ARGUMENT, fmt::format("Duplicate problem id {}", prob.id));
        auto ratio = prob.misc.dynamic_ranking_ratio;
        if (ratio && (*ratio < 0 || *ratio > 1))
            throw validation_error(error_reason::INVALID_ARGUMENT, fmt::format("Dynamic ranking ratio of problem {} is out of range", prob.id));
    }

    set<string> language_names;
    for (auto &lang : config.languages) {
        if (!language_names.insert(lang.name).second)
            throw validation_error(error_reason::INVALID_ARGUMENT, "Duplicate language " + lang.name);
        if (lang.command.empty())
            throw validation_error(error_reason::INVALID_ARGUMENT, "Compile command of language " + lang.name + " is empty");
    }
    return config;
}

configuration load_configuration(const filesystem::path &path) {
    json j;
    try {
        j = json::parse(read_file_content(path));
    } catch (json::parse_error &ex) {
        throw validation_error(error_reason::INVALID_ARGUMENT, "Configuration file " + path.string() + " is malformed: " + ex.what());
    }
    return parse_configuration(j);
}

}  // namespace oj
