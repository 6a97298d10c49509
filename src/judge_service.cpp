#include "judge_service.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace oj {
using namespace std;

static bool contains(const vector<uint32_t> &ids, uint32_t id) {
    return find(ids.begin(), ids.end(), id) != ids.end();
}

judge_service::judge_service(const configuration &config, record_store &store, const judger &j, size_t worker_count)
    : config(config), store(store), j(j) {
    for (size_t i = 0; i < max<size_t>(worker_count, 1); ++i)
        workers.push_back(start_worker(i, task_queue, [this](const judge_task &task) { process(task); }));
}

judge_service::~judge_service() {
    stop();
}

void judge_service::validate(const submission &submit, timestamp now) const {
    if (!config.find_language(submit.language))
        throw validation_error(error_reason::NOT_FOUND, fmt::format("Language {} not found.", submit.language));
    if (!config.find_problem(submit.problem_id))
        throw validation_error(error_reason::NOT_FOUND, fmt::format("Problem {} not found.", submit.problem_id));

    if (submit.contest_id != 0) {
        auto c = store.contests().select_by_id(submit.contest_id);
        if (!c)
            throw validation_error(error_reason::NOT_FOUND, fmt::format("Contest {} not found.", submit.contest_id));
        if (!contains(c->problem_ids, submit.problem_id))
            throw validation_error(error_reason::INVALID_ARGUMENT, fmt::format("Contest {} does not contain problem {}.", c->id, submit.problem_id));
        if (!contains(c->user_ids, submit.user_id))
            throw validation_error(error_reason::INVALID_ARGUMENT, fmt::format("Contest {} does not contain user {}.", c->id, submit.user_id));
        if (now < c->from || now >= c->to)
            throw validation_error(error_reason::INVALID_ARGUMENT, fmt::format("Contest {} is not open now.", c->id));

        job_filter filter;
        filter.user_id = submit.user_id;
        filter.contest_id = submit.contest_id;
        filter.problem_id = submit.problem_id;
        if (store.select_jobs(filter).size() >= c->submission_limit)
            throw validation_error(error_reason::RATE_LIMIT, "Submission limit reached.");
    }

    if (!store.users().select_by_id(submit.user_id))
        throw validation_error(error_reason::NOT_FOUND, fmt::format("User {} not found.", submit.user_id));
}

void judge_service::enqueue(uint32_t job_id) {
    auto token = make_shared<cancellation_token>();
    active[job_id] = token;
    task_queue.push({job_id, token});
}

job judge_service::submit(const submission &submit) {
    scoped_lock guard(mut);
    timestamp now = chrono::system_clock::now();
    validate(submit, now);

    job record;
    record.created_time = now;
    record.updated_time = now;
    record.submit = submit;
    record.state = job_state::QUEUEING;
    record.result = oj_result::WAITING;
    record.score = 0;
    record.cases = make_waiting_cases(*config.find_problem(submit.problem_id));
    record.id = store.jobs().insert(record);

    LOG(INFO) << "Accepted job [" << record.id << "] from user " << submit.user_id << " for problem " << submit.problem_id;
    enqueue(record.id);
    return record;
}

job judge_service::rejudge(uint32_t job_id) {
    scoped_lock guard(mut);
    auto record = store.jobs().select_by_id(job_id);
    if (!record)
        throw validation_error(error_reason::NOT_FOUND, fmt::format("Job {} not found.", job_id));
    if (active.count(job_id))
        throw validation_error(error_reason::INVALID_STATE, fmt::format("Job {} is being judged.", job_id));
    const problem *prob = config.find_problem(record->submit.problem_id);
    if (!prob)
        throw validation_error(error_reason::NOT_FOUND, fmt::format("Problem {} not found.", record->submit.problem_id));

    record->updated_time = chrono::system_clock::now();
    record->state = job_state::QUEUEING;
    record->result = oj_result::WAITING;
    record->score = 0;
    record->cases = make_waiting_cases(*prob);
    store.jobs().update(*record);

    LOG(INFO) << "Rejudging job [" << job_id << "]";
    enqueue(job_id);
    return *record;
}

job judge_service::canceled_job(job record) const {
    record.state = job_state::CANCELED;
    record.result = oj_result::SKIPPED;
    record.score = 0;
    for (auto &c : record.cases) {
        c.result = oj_result::SKIPPED;
        c.time = 0;
        c.info.clear();
    }
    return record;
}

job judge_service::cancel(uint32_t job_id) {
    unique_lock lock(mut);
    auto record = store.jobs().select_by_id(job_id);
    if (!record)
        throw validation_error(error_reason::NOT_FOUND, fmt::format("Job {} not found.", job_id));
    auto it = active.find(job_id);
    if (it == active.end() || record->state == job_state::CANCELED)
        throw validation_error(error_reason::INVALID_STATE, fmt::format("Job {} is already {}.", job_id, get_display_message(record->state)));

    LOG(INFO) << "Canceling job [" << job_id << "] in state " << get_display_message(record->state);
    auto token = it->second;
    token->cancel();

    if (record->state == job_state::QUEUEING) {
        // 排队中的任务仍然留在队列里，worker 取出时发现已取消就直接丢弃，
        // 因此这里立刻释放 active，已取消的评测可以马上重新评测
        job canceled = canceled_job(*record);
        store.jobs().update(canceled);
        finish(job_id);
        return canceled;
    }

    // 等待 worker 杀死正在运行的程序、删除工作目录并记录结果
    active_changed.wait(lock, [&] {
        auto current = active.find(job_id);
        return current == active.end() || current->second != token;
    });
    return *store.jobs().select_by_id(job_id);
}

void judge_service::finish(uint32_t job_id) {
    active.erase(job_id);
    active_changed.notify_all();
}

void judge_service::process(const judge_task &task) {
    job record;
    {
        scoped_lock guard(mut);
        if (task.token->canceled()) {
            // 排队时已经被取消，cancel 已经记录了结果并释放了 active，
            // active 中如果有这个评测，那么属于之后的重新评测
            auto current = active.find(task.job_id);
            if (current != active.end() && current->second == task.token) finish(task.job_id);
            return;
        }
        auto stored = store.jobs().select_by_id(task.job_id);
        if (!stored) {
            finish(task.job_id);
            throw database_error(fmt::format("Job {} disappeared before judging", task.job_id));
        }
        record = *stored;
        record.state = job_state::RUNNING;
        record.result = oj_result::RUNNING;
        try {
            store.jobs().update(record);
        } catch (database_error &) {
            finish(task.job_id);
            throw;
        }
    }

    const problem *prob = config.find_problem(record.submit.problem_id);
    const language *lang = config.find_language(record.submit.language);

    job judged;
    bool failed = false;
    try {
        if (!prob || !lang)
            throw execution_error(fmt::format("Problem {} or language {} of job {} is not configured", record.submit.problem_id, record.submit.language, record.id));
        judged = j.judge(record.id, record.submit, *prob, *lang, record.created_time, record.updated_time, task.token.get());
    } catch (judge_canceled &ex) {
        DLOG(INFO) << ex.what();
    } catch (execution_error &ex) {
        LOG(ERROR) << "Job [" << record.id << "] failed with system error: " << ex;
        failed = true;
    } catch (exception &ex) {
        LOG(ERROR) << "Job [" << record.id << "] failed with unexpected error: " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        failed = true;
    }

    scoped_lock guard(mut);
    defer { finish(task.job_id); };
    if (task.token->canceled()) {
        store.jobs().update(canceled_job(record));
    } else if (failed) {
        // 没有评测完成的数据点保持 Waiting
        record.state = job_state::FINISHED;
        record.result = oj_result::SYSTEM_ERROR;
        record.score = 0;
        store.jobs().update(record);
    } else {
        store.jobs().update(judged);
    }
}

optional<job> judge_service::find_job(uint32_t job_id) const {
    return store.jobs().select_by_id(job_id);
}

vector<job> judge_service::list_jobs(const job_filter &filter) const {
    return store.select_jobs(filter);
}

vector<user_ranking> judge_service::ranklist(uint32_t contest_id, const ranking_rule &rule) const {
    vector<user> users = store.users().select_all();
    ranking_scope scope;
    if (contest_id == 0) {
        scope = make_global_scope(users, config);
    } else {
        auto c = store.contests().select_by_id(contest_id);
        if (!c)
            throw validation_error(error_reason::NOT_FOUND, fmt::format("Contest {} not found.", contest_id));
        scope = make_contest_scope(*c, users);
    }
    return rank(scope, rule, store.jobs().select_all(), config);
}

void judge_service::wait_idle() {
    unique_lock lock(mut);
    active_changed.wait(lock, [this] { return active.empty(); });
}

void judge_service::stop() {
    task_queue.close();
    for (auto &worker : workers)
        if (worker.joinable()) worker.join();
    workers.clear();
}

}  // namespace oj
