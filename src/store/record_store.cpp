#include "store/record_store.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace oj {
using namespace std;
using namespace nlohmann;

record_store::record_store() : job_table(0), user_table(0), contest_table(1) {
    clear();
}

table<job> &record_store::jobs() { return job_table; }
const table<job> &record_store::jobs() const { return job_table; }
table<user> &record_store::users() { return user_table; }
const table<user> &record_store::users() const { return user_table; }
table<contest> &record_store::contests() { return contest_table; }
const table<contest> &record_store::contests() const { return contest_table; }

user record_store::create_user(const string &name) {
    scoped_lock guard(user_mutex);
    if (find_user_by_name(name))
        throw validation_error(error_reason::INVALID_ARGUMENT, fmt::format("User name '{}' already exists.", name));
    user u;
    u.name = name;
    u.id = user_table.insert(u);
    LOG(INFO) << "Created user " << u.id << " " << name;
    return u;
}

user record_store::rename_user(uint32_t id, const string &name) {
    scoped_lock guard(user_mutex);
    auto existing = user_table.select_by_id(id);
    if (!existing)
        throw validation_error(error_reason::NOT_FOUND, fmt::format("User {} not found.", id));
    auto other = find_user_by_name(name);
    if (other && other->id != id)
        throw validation_error(error_reason::INVALID_ARGUMENT, fmt::format("User name '{}' already exists.", name));
    existing->name = name;
    user_table.update(*existing);
    return *existing;
}

optional<user> record_store::find_user_by_name(const string &name) const {
    for (auto &u : user_table.select_all())
        if (u.name == name) return u;
    return nullopt;
}

contest record_store::save_contest(contest c, const configuration &config) {
    for (uint32_t problem_id : c.problem_ids)
        if (!config.find_problem(problem_id))
            throw validation_error(error_reason::NOT_FOUND, fmt::format("Problem {} not found.", problem_id));
    for (uint32_t user_id : c.user_ids)
        if (!user_table.select_by_id(user_id))
            throw validation_error(error_reason::NOT_FOUND, fmt::format("User {} not found.", user_id));

    if (c.id == 0) {
        c.id = contest_table.insert(c);
        LOG(INFO) << "Created contest " << c.id << " " << c.name;
    } else {
        if (!contest_table.select_by_id(c.id))
            throw validation_error(error_reason::NOT_FOUND, fmt::format("Contest {} not found.", c.id));
        contest_table.update(c);
    }
    return c;
}

vector<job> record_store::select_jobs(const job_filter &filter) const {
    job_filter resolved = filter;
    if (filter.user_name) {
        auto u = find_user_by_name(*filter.user_name);
        if (!u) return {};
        if (filter.user_id && *filter.user_id != u->id) return {};
        resolved.user_id = u->id;
    }

    vector<job> result;
    for (auto &record : job_table.select_all())
        if (resolved.matches(record)) result.push_back(record);
    return result;
}

void record_store::clear() {
    job_table.reset({});
    contest_table.reset({});
    user root;
    root.id = 0;
    root.name = "root";
    user_table.reset({root});
}

void record_store::save(const filesystem::path &path) const {
    json j = {{"jobs", job_table.select_all()},
              {"users", user_table.select_all()},
              {"contests", contest_table.select_all()}};
    write_file_content(path, j.dump(2));
}

void record_store::load(const filesystem::path &path) {
    vector<job> jobs;
    vector<user> users;
    vector<contest> contests;
    try {
        json j = json::parse(read_file_content(path));
        j.at("jobs").get_to(jobs);
        j.at("users").get_to(users);
        j.at("contests").get_to(contests);
    } catch (json::exception &ex) {
        throw database_error("Malformed data file " + path.string() + ": " + ex.what());
    } catch (validation_error &ex) {
        throw database_error("Malformed data file " + path.string() + ": " + ex.what());
    }

    if (none_of(users.begin(), users.end(), [](const user &u) { return u.id == 0; })) {
        user root;
        root.id = 0;
        root.name = "root";
        users.insert(users.begin(), root);
    }
    job_table.reset(jobs);
    user_table.reset(users);
    contest_table.reset(contests);
    LOG(INFO) << "Loaded " << jobs.size() << " jobs, " << users.size() << " users, " << contests.size() << " contests from " << path;
}

}  // namespace oj
