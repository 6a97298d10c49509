#include "judge/classifier.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace oj {
using namespace std;

static vector<string> split_lines(const string &text) {
    vector<string> lines;
    boost::split(lines, text, boost::is_any_of("\n"));
    for (auto &line : lines) boost::trim(line);
    return lines;
}

bool compare_standard(const string &expected, const string &actual) {
    vector<string> expected_lines = split_lines(expected);
    vector<string> actual_lines = split_lines(actual);
    // 文末空行不参与比较
    while (!expected_lines.empty() && expected_lines.back().empty()) expected_lines.pop_back();
    while (!actual_lines.empty() && actual_lines.back().empty()) actual_lines.pop_back();
    return expected_lines == actual_lines;
}

bool compare_strict(const string &expected, const string &actual) {
    return expected == actual;
}

verdict parse_verifier_output(const string &output) {
    vector<string> lines = split_lines(output);
    lines.erase(remove_if(lines.begin(), lines.end(), [](const string &line) { return line.empty(); }), lines.end());
    if (lines.size() != 2)
        return {oj_result::SPJ_ERROR, "Invalid special judge output."};
    auto result = parse_oj_result(lines[0]);
    if (!result)
        return {oj_result::SPJ_ERROR, "Invalid special judge output."};
    return {*result, lines[1]};
}

verdict run_verifier(const vector<string> *command,
                     const filesystem::path &answer_file,
                     const filesystem::path &output_file,
                     const cancellation_token *token) {
    if (!command || command->empty())
        return {oj_result::SPJ_ERROR, "Special judge command not found"};

    process_options options;
    options.argv = substitute_arguments(*command, {{"%ANSWER%", answer_file.string()},
                                                   {"%OUTPUT%", output_file.string()}});
    options.token = token;

    process_result proc;
    try {
        proc = run_process(options);
    } catch (execution_error &ex) {
        LOG(WARNING) << "Unable to run special judge " << options.argv[0] << ": " << ex.what();
        return {oj_result::SPJ_ERROR, "Error occurred while calling the special judger"};
    }

    if (proc.canceled) throw judge_canceled("Judging is canceled while running special judge");
    if (!proc.success()) {
        DLOG(INFO) << "Special judge exited with " << proc.exit_code << ": " << proc.captured_stderr;
        return {oj_result::SPJ_ERROR, "Error occurred while calling the special judger"};
    }
    return parse_verifier_output(proc.captured_stdout);
}

// 选手输出作为测试点信息保存，超过 MAX_CAPTURE_SIZE 的部分丢弃
static string truncate_output(string output) {
    if (output.size() > MAX_CAPTURE_SIZE) output.resize(MAX_CAPTURE_SIZE);
    return output;
}

verdict classify(const problem &prob, const test_case &tc,
                 const filesystem::path &output_file,
                 const cancellation_token *token) {
    switch (prob.type) {
        case problem_type::STANDARD:
        case problem_type::DYNAMIC_RANKING: {
            string output = read_file_content(output_file);
            bool same = compare_standard(read_file_content(tc.answer_file), output);
            return {same ? oj_result::ACCEPTED : oj_result::WRONG_ANSWER, truncate_output(move(output))};
        }
        case problem_type::STRICT: {
            string output = read_file_content(output_file);
            bool same = compare_strict(read_file_content(tc.answer_file), output);
            return {same ? oj_result::ACCEPTED : oj_result::WRONG_ANSWER, truncate_output(move(output))};
        }
        case problem_type::SPJ:
            return run_verifier(prob.misc.special_judge ? &*prob.misc.special_judge : nullptr,
                                tc.answer_file, output_file, token);
    }
    throw internal_error("Unrecognized problem type");
}

}  // namespace oj
