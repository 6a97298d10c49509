#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "judge/submission.hpp"

namespace oj {

/**
 * @brief 评测记录的查询条件
 * 所有条件都是可选的，多个条件同时给出时取交集
 */
struct job_filter {
    std::optional<uint32_t> user_id;

    /**
     * @brief 用户名，由 record_store 转换为用户编号后再过滤
     */
    std::optional<std::string> user_name;

    /**
     * @brief 比赛编号，0 表示不属于任何比赛的提交
     */
    std::optional<uint32_t> contest_id;
    std::optional<uint32_t> problem_id;
    std::optional<std::string> language;

    /**
     * @brief 创建时间的下界（含）
     */
    std::optional<timestamp> from;

    /**
     * @brief 创建时间的上界（含）
     */
    std::optional<timestamp> to;
    std::optional<job_state> state;
    std::optional<oj_result> result;

    /**
     * @brief 判断评测记录是否满足除 user_name 以外的所有条件
     */
    bool matches(const job &record) const;
};

void from_json(const nlohmann::json &j, job_filter &filter);

}  // namespace oj
