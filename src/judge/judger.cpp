#include "judge/judger.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/classifier.hpp"

namespace oj {
using namespace std;

judger::~judger() {}

vector<case_result> make_waiting_cases(const problem &prob) {
    vector<case_result> cases(prob.cases.size() + 1);
    for (size_t i = 0; i < cases.size(); ++i) {
        cases[i].id = i;
        cases[i].result = oj_result::WAITING;
    }
    return cases;
}

static filesystem::path create_workspace(uint32_t job_id) {
    // boost::uuids::random_generator 不是线程安全的，每次评测单独构造
    boost::uuids::random_generator generator;
    filesystem::path workdir = filesystem::absolute(RUN_DIR) / fmt::format("{}-{}", job_id, boost::uuids::to_string(generator()));
    error_code ec;
    filesystem::create_directories(workdir, ec);
    if (ec) throw execution_error(fmt::format("Unable to create directory {}: {}", workdir, ec.message()));
    return workdir;
}

static void check_canceled(const cancellation_token *token, uint32_t job_id) {
    if (token && token->canceled())
        throw judge_canceled(fmt::format("Job {} is canceled", job_id));
}

job programming_judger::judge(uint32_t job_id, const submission &submit, const problem &prob, const language &lang,
                              timestamp created_time, timestamp updated_time, const cancellation_token *token) const {
    LOG(INFO) << "Judging job [" << job_id << "] problem " << prob.id << " language " << lang.name;

    job record;
    record.id = job_id;
    record.created_time = created_time;
    record.updated_time = updated_time;
    record.submit = submit;
    record.state = job_state::RUNNING;
    record.result = oj_result::ACCEPTED;
    record.score = 0;
    record.cases = make_waiting_cases(prob);

    filesystem::path workdir = create_workspace(job_id);
    defer {
        try {
            if (!DEBUG) filesystem::remove_all(workdir);
        } catch (exception &e) {
            LOG(ERROR) << "Unable to delete directory " << workdir << ": " << e.what();
        }
    };

    filesystem::path source = workdir / assert_safe_path(lang.file_name);
    filesystem::path executable = workdir / "target";
    write_file_content(source, submit.source_code);

    process_options compile;
    compile.argv = substitute_arguments(lang.command, {{"%INPUT%", source.string()},
                                                       {"%OUTPUT%", executable.string()}});
    compile.working_dir = workdir;
    compile.token = token;
    process_result compiled = run_process(compile);
    if (compiled.canceled) check_canceled(token, job_id);

    record.cases[0].time = compiled.elapsed.count();
    if (!compiled.success()) {
        record.cases[0].result = oj_result::COMPILATION_ERROR;
        record.cases[0].info = compiled.captured_stderr;
        record.result = oj_result::COMPILATION_ERROR;
        record.state = job_state::FINISHED;
        DLOG(INFO) << "Job [" << job_id << "] compilation error";
        return record;
    }
    record.cases[0].result = oj_result::COMPILATION_SUCCESS;

    for (size_t i = 0; i < prob.cases.size(); ++i) {
        check_canceled(token, job_id);

        const test_case &tc = prob.cases[i];
        case_result &current = record.cases[i + 1];
        filesystem::path output = workdir / fmt::format("{}.out", i + 1);

        process_options run;
        run.argv = {executable.string()};
        run.stdin_path = tc.input_file;
        run.stdout_path = output;
        run.working_dir = workdir;
        run.deadline = chrono::microseconds(tc.time_limit);
        run.token = token;
        process_result proc = run_process(run);
        if (proc.canceled) check_canceled(token, job_id);

        verdict v;
        if (proc.deadline_exceeded) {
            v = {oj_result::TIME_LIMIT_EXCEEDED, fmt::format("Time limit: {}", tc.time_limit)};
        } else if (!proc.success()) {
            v = {oj_result::RUNTIME_ERROR, proc.captured_stderr};
        } else {
            v = classify(prob, tc, output, token);
        }

        current.result = v.result;
        current.time = proc.elapsed.count();
        current.info = v.info;
        DLOG(INFO) << "Job [" << job_id << "-" << current.id << "]: " << get_display_message(v.result) << ", " << current.time << "us";

        if (v.result == oj_result::ACCEPTED)
            record.score += tc.score;
        else if (record.result == oj_result::ACCEPTED)
            record.result = v.result;
    }

    record.state = job_state::FINISHED;
    return record;
}

}  // namespace oj
