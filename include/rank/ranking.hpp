#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>
#include "judge/problem.hpp"
#include "judge/submission.hpp"

/**
 * 排行榜计算
 * 排行榜只读取已经评测完成的记录，不会修改记录。调用方传入的记录
 * 是某一时刻的快照，正在评测的提交不会出现在排行榜中。
 */
namespace oj {

/**
 * @brief 同一用户对同一题目有多次提交时，选取哪一次提交计分
 */
enum class scoring_rule {
    /**
     * @brief 最后一次提交
     */
    LATEST,

    /**
     * @brief 分数最高的提交
     */
    HIGHEST
};

/**
 * @brief 总分相同时的排序依据
 */
enum class tie_breaker {
    /**
     * @brief 最后一次提交时间早的用户排在前面
     */
    SUBMISSION_TIME,

    /**
     * @brief 提交次数少的用户排在前面
     */
    SUBMISSION_COUNT,

    /**
     * @brief 用户编号小的用户排在前面
     */
    USER_ID
};

struct ranking_rule {
    scoring_rule scoring = scoring_rule::LATEST;

    /**
     * @brief 为空时按用户编号排序，但总分相同的用户排名相同
     */
    std::optional<tie_breaker> tie;
};

/**
 * @brief 排行榜的范围
 */
struct ranking_scope {
    /**
     * @brief 比赛编号，为 0 表示全局排行榜，只包含不属于任何比赛的练习提交
     */
    uint32_t contest_id = 0;

    /**
     * @brief 参与排名的用户
     */
    std::vector<user> users;

    /**
     * @brief 参与排名的题目，按顺序输出每道题的分数
     */
    std::vector<uint32_t> problem_ids;
};

/**
 * @brief 排行榜中的一行
 */
struct user_ranking {
    user u;

    /**
     * @brief 排名，从 1 开始。总分和排序依据都相同的用户排名相同，
     * 下一名的排名等于其在排行榜中的位置，比如 1, 2, 2, 4
     */
    uint32_t rank = 0;

    /**
     * @brief 每道题的得分，顺序和 ranking_scope::problem_ids 一致
     */
    std::vector<double> scores;

    double total = 0;

    /**
     * @brief 范围内该用户最后一次提交的时间，没有提交时为最大时间
     */
    timestamp max_time;

    size_t submission_count = 0;
};

const char *get_display_message(scoring_rule rule);
const char *get_display_message(tie_breaker tie);
std::optional<scoring_rule> parse_scoring_rule(const std::string &name);
std::optional<tie_breaker> parse_tie_breaker(const std::string &name);

/**
 * @brief 构造全局排行榜的范围：所有用户、配置中的所有题目
 */
ranking_scope make_global_scope(const std::vector<user> &users, const configuration &config);

/**
 * @brief 构造比赛排行榜的范围：比赛中的用户和题目
 * @throw validation_error 如果比赛中的用户不存在
 */
ranking_scope make_contest_scope(const contest &c, const std::vector<user> &users);

/**
 * @brief 计算排行榜
 * 
 * 对于每个用户的每道题：
 * 1. 普通题目按 scoring_rule 选取一次提交，得分为该提交的分数，没有提交为 0
 * 2. 动态计分题目若没有通过的提交，按 scoring_rule 选取一次提交，得分为该提交分数的 (1 - ratio)；
 *    否则选取最后一次通过的提交，每个测试点的得分为
 *    score * (1 - ratio) + score * ratio * 范围内所有通过的提交中该测试点的最短时间 / 该提交该测试点的时间
 * 
 * @param scope 排行榜范围
 * @param rule 计分和排序规则
 * @param jobs 评测记录快照，只有状态为 Finished 的记录会被计入
 * @param config 题目配置
 * @return 按排名排序的排行榜
 * @throw validation_error 如果动态计分题目没有配置 dynamic_ranking_ratio，或者题目不存在
 */
std::vector<user_ranking> rank(const ranking_scope &scope, const ranking_rule &rule,
                               const std::vector<job> &jobs, const configuration &config);

void to_json(nlohmann::json &j, const user_ranking &row);

}  // namespace oj
