#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "common/status.hpp"

/**
 * 这个头文件包含评测记录
 * 包含：
 * 1. submission 类（表示一次代码提交）
 * 2. case_result 类（表示一个数据点的评测结果）
 * 3. job 类（表示一个提交的评测记录）
 * 4. user、contest 类（表示用户和比赛）
 */
namespace oj {

using timestamp = std::chrono::system_clock::time_point;

/**
 * @brief 表示一次代码提交
 */
struct submission {
    std::string source_code;

    /**
     * @brief 语言名称，对应 language::name
     */
    std::string language;

    uint32_t user_id = 0;

    /**
     * @brief 比赛编号，为 0 表示不属于任何比赛
     */
    uint32_t contest_id = 0;

    uint32_t problem_id = 0;
};

/**
 * @brief 表示一个数据点的评测结果
 * 编号为 0 的数据点表示编译，编号 1..N 依次对应题目的测试点
 */
struct case_result {
    uint32_t id = 0;
    oj_result result = oj_result::WAITING;

    /**
     * @brief 运行时间，单位为微秒
     */
    uint64_t time = 0;

    /**
     * @brief 内存使用，评测系统不统计，总是为 0
     */
    uint64_t memory = 0;

    /**
     * @brief 附加信息，比如编译器的错误输出、选手程序的 stderr、SPJ 的信息
     */
    std::string info;
};

/**
 * @brief 表示一个提交的评测记录
 * 除了重测以外，评测完成后记录不会再被修改。
 * 重测时保留 id 和 created_time，只更新 updated_time 和评测结果。
 */
struct job {
    uint32_t id = 0;
    timestamp created_time;
    timestamp updated_time;
    submission submit;
    job_state state = job_state::QUEUEING;

    /**
     * @brief 整个提交的评测结果，等于第一个没有通过的数据点的结果
     */
    oj_result result = oj_result::WAITING;

    /**
     * @brief 通过的测试点的分数之和
     */
    double score = 0;

    /**
     * @brief 数量总是等于题目测试点数量 + 1
     */
    std::vector<case_result> cases;
};

struct user {
    uint32_t id = 0;
    std::string name;
};

/**
 * @brief 表示一场比赛
 * 只有 user_ids 中的用户可以在 [from, to) 时间段内提交 problem_ids 中的题目，
 * 每个用户每道题最多提交 submission_limit 次。
 */
struct contest {
    uint32_t id = 0;
    std::string name;
    timestamp from;
    timestamp to;
    std::vector<uint32_t> problem_ids;
    std::vector<uint32_t> user_ids;
    uint32_t submission_limit = 0;
};

void from_json(const nlohmann::json &j, oj_result &result);
void to_json(nlohmann::json &j, const oj_result &result);
void from_json(const nlohmann::json &j, job_state &state);
void to_json(nlohmann::json &j, const job_state &state);
void from_json(const nlohmann::json &j, submission &submit);
void to_json(nlohmann::json &j, const submission &submit);
void from_json(const nlohmann::json &j, case_result &result);
void to_json(nlohmann::json &j, const case_result &result);
void from_json(const nlohmann::json &j, job &record);
void to_json(nlohmann::json &j, const job &record);
void from_json(const nlohmann::json &j, user &u);
void to_json(nlohmann::json &j, const user &u);
void from_json(const nlohmann::json &j, contest &c);
void to_json(nlohmann::json &j, const contest &c);

}  // namespace oj
