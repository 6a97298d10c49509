#include "rank/ranking.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <map>
#include "common/exceptions.hpp"

namespace oj {
using namespace std;
using namespace nlohmann;

const char *get_display_message(scoring_rule rule) {
    switch (rule) {
        case scoring_rule::LATEST: return "latest";
        case scoring_rule::HIGHEST: return "highest";
    }
    return "latest";
}

const char *get_display_message(tie_breaker tie) {
    switch (tie) {
        case tie_breaker::SUBMISSION_TIME: return "submission_time";
        case tie_breaker::SUBMISSION_COUNT: return "submission_count";
        case tie_breaker::USER_ID: return "user_id";
    }
    return "user_id";
}

optional<scoring_rule> parse_scoring_rule(const string &name) {
    for (auto rule : {scoring_rule::LATEST, scoring_rule::HIGHEST})
        if (name == get_display_message(rule)) return rule;
    return nullopt;
}

optional<tie_breaker> parse_tie_breaker(const string &name) {
    for (auto tie : {tie_breaker::SUBMISSION_TIME, tie_breaker::SUBMISSION_COUNT, tie_breaker::USER_ID})
        if (name == get_display_message(tie)) return tie;
    return nullopt;
}

ranking_scope make_global_scope(const vector<user> &users, const configuration &config) {
    ranking_scope scope;
    scope.contest_id = 0;
    scope.users = users;
    sort(scope.users.begin(), scope.users.end(), [](const user &a, const user &b) { return a.id < b.id; });
    for (auto &prob : config.problems)
        scope.problem_ids.push_back(prob.id);
    return scope;
}

ranking_scope make_contest_scope(const contest &c, const vector<user> &users) {
    ranking_scope scope;
    scope.contest_id = c.id;
    scope.problem_ids = c.problem_ids;
    for (uint32_t user_id : c.user_ids) {
        auto it = find_if(users.begin(), users.end(), [user_id](const user &u) { return u.id == user_id; });
        if (it == users.end())
            throw validation_error(error_reason::NOT_FOUND, fmt::format("User {} not found.", user_id));
        scope.users.push_back(*it);
    }
    return scope;
}

/**
 * @brief 按计分规则选取一次提交
 * 分数相同时选取较晚的提交，创建时间相同时选取编号较大的提交
 */
static const job *select_job(const vector<const job *> &candidates, scoring_rule rule) {
    const job *selected = nullptr;
    for (const job *j : candidates) {
        if (!selected) {
            selected = j;
            continue;
        }
        auto later = [](const job *a, const job *b) {
            return std::tie(a->created_time, a->id) > std::tie(b->created_time, b->id);
        };
        if (rule == scoring_rule::HIGHEST) {
            if (j->score > selected->score || (j->score == selected->score && later(j, selected)))
                selected = j;
        } else if (later(j, selected)) {
            selected = j;
        }
    }
    return selected;
}

static uint64_t case_time(const job &j, size_t case_index) {
    return case_index + 1 < j.cases.size() ? j.cases[case_index + 1].time : 0;
}

/**
 * @brief 动态计分题目的得分
 * @param gathered 该用户对该题目的所有提交
 * @param all_accepted 范围内所有用户对该题目通过的提交
 */
static double dynamic_score(const problem &prob, double ratio, scoring_rule rule,
                            const vector<const job *> &gathered,
                            const vector<const job *> &all_accepted) {
    vector<const job *> accepted;
    for (const job *j : gathered)
        if (j->result == oj_result::ACCEPTED) accepted.push_back(j);

    if (accepted.empty()) {
        const job *selected = select_job(gathered, rule);
        return selected ? selected->score * (1 - ratio) : 0;
    }

    const job *representative = select_job(accepted, scoring_rule::LATEST);
    double score = 0;
    for (size_t i = 0; i < prob.cases.size(); ++i) {
        uint64_t fastest = case_time(*representative, i);
        for (const job *j : all_accepted)
            fastest = min(fastest, case_time(*j, i));
        uint64_t own = case_time(*representative, i);
        // 运行时间为 0 时无法比较快慢，视为最快
        double share = own == 0 ? 1.0 : static_cast<double>(fastest) / own;
        score += prob.cases[i].score * (1 - ratio) + prob.cases[i].score * ratio * share;
    }
    return score;
}

vector<user_ranking> rank(const ranking_scope &scope, const ranking_rule &rule,
                          const vector<job> &jobs, const configuration &config) {
    // 按题目分组范围内评测完成的提交
    map<uint32_t, vector<const job *>> jobs_by_problem;
    for (auto &j : jobs) {
        if (j.state != job_state::FINISHED) continue;
        if (j.submit.contest_id != scope.contest_id) continue;
        jobs_by_problem[j.submit.problem_id].push_back(&j);
    }

    vector<const problem *> problems;
    for (uint32_t problem_id : scope.problem_ids) {
        const problem *prob = config.find_problem(problem_id);
        if (!prob)
            throw validation_error(error_reason::NOT_FOUND, fmt::format("Problem {} not found.", problem_id));
        if (prob->type == problem_type::DYNAMIC_RANKING && !prob->misc.dynamic_ranking_ratio)
            throw validation_error(error_reason::INVALID_ARGUMENT, fmt::format("Dynamic ranking ratio of problem {} not found.", problem_id));
        problems.push_back(prob);
    }

    vector<user_ranking> rows;
    for (auto &u : scope.users) {
        user_ranking row;
        row.u = u;
        row.max_time = timestamp::min();

        for (const problem *prob : problems) {
            vector<const job *> gathered, all_accepted;
            for (const job *j : jobs_by_problem[prob->id]) {
                if (j->submit.user_id == u.id) gathered.push_back(j);
                if (j->result == oj_result::ACCEPTED) all_accepted.push_back(j);
            }

            double score;
            if (prob->type == problem_type::DYNAMIC_RANKING) {
                score = dynamic_score(*prob, *prob->misc.dynamic_ranking_ratio, rule.scoring, gathered, all_accepted);
            } else {
                const job *selected = select_job(gathered, rule.scoring);
                score = selected ? selected->score : 0;
            }
            row.scores.push_back(score);
            row.total += score;

            for (const job *j : gathered)
                row.max_time = max(row.max_time, j->created_time);
            row.submission_count += gathered.size();
        }

        if (row.submission_count == 0)
            row.max_time = timestamp::max();
        rows.push_back(move(row));
    }

    tie_breaker order = rule.tie.value_or(tie_breaker::USER_ID);
    sort(rows.begin(), rows.end(), [order](const user_ranking &a, const user_ranking &b) {
        if (a.total != b.total) return a.total > b.total;
        switch (order) {
            case tie_breaker::SUBMISSION_TIME:
                if (a.max_time != b.max_time) return a.max_time < b.max_time;
                break;
            case tie_breaker::SUBMISSION_COUNT:
                if (a.submission_count != b.submission_count) return a.submission_count < b.submission_count;
                break;
            case tie_breaker::USER_ID:
                break;
        }
        return a.u.id < b.u.id;
    });

    // 总分和排序依据都相同的用户排名相同，每组的排名为组内第一个用户的位置
    auto same_group = [&rule](const user_ranking &a, const user_ranking &b) {
        if (a.total != b.total) return false;
        if (!rule.tie) return true;
        switch (*rule.tie) {
            case tie_breaker::SUBMISSION_TIME: return a.max_time == b.max_time;
            case tie_breaker::SUBMISSION_COUNT: return a.submission_count == b.submission_count;
            case tie_breaker::USER_ID: return a.u.id == b.u.id;
        }
        return false;
    };
    for (size_t i = 0; i < rows.size(); ++i) {
        if (i > 0 && same_group(rows[i - 1], rows[i]))
            rows[i].rank = rows[i - 1].rank;
        else
            rows[i].rank = i + 1;
    }
    return rows;
}

void to_json(json &j, const user_ranking &row) {
    j = {{"user", row.u},
         {"rank", row.rank},
         {"scores", row.scores}};
}

}  // namespace oj
