#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "judge/problem.hpp"
#include "judge/submission.hpp"
#include "store/job_filter.hpp"
#include "store/table.hpp"

namespace oj {

/**
 * @brief 评测记录、用户、比赛的存储
 * 
 * 初始化时会创建编号为 0 的 root 用户。
 * 比赛编号从 1 开始，编号 0 表示不属于任何比赛（全局排行榜）。
 * 可以通过 save、load 将所有记录保存为 JSON 文件，以便重启后恢复。
 */
struct record_store {
    record_store();

    table<job> &jobs();
    const table<job> &jobs() const;
    table<user> &users();
    const table<user> &users() const;
    table<contest> &contests();
    const table<contest> &contests() const;

    /**
     * @brief 创建新用户
     * @throw validation_error 如果用户名已经存在
     */
    user create_user(const std::string &name);

    /**
     * @brief 修改用户名
     * @throw validation_error 如果用户不存在或者用户名已经被其他用户使用
     */
    user rename_user(uint32_t id, const std::string &name);

    std::optional<user> find_user_by_name(const std::string &name) const;

    /**
     * @brief 创建或者更新比赛
     * c.id 为 0 时创建新比赛，否则更新已有的比赛。
     * 比赛中的题目必须在配置中存在，比赛中的用户必须已经创建。
     * @throw validation_error 如果比赛、题目或者用户不存在
     */
    contest save_contest(contest c, const configuration &config);

    /**
     * @brief 查询满足条件的评测记录，按编号升序排列
     * 若按用户名查询而用户名不存在，返回空
     */
    std::vector<job> select_jobs(const job_filter &filter) const;

    /**
     * @brief 清空所有记录，重新创建 root 用户
     */
    void clear();

    /**
     * @brief 将所有记录保存为 JSON 文件
     * @throw execution_error 如果文件无法写入
     */
    void save(const std::filesystem::path &path) const;

    /**
     * @brief 从 save 产生的 JSON 文件恢复所有记录
     * @throw execution_error 如果文件无法读取
     * @throw database_error 如果文件格式不正确
     */
    void load(const std::filesystem::path &path);

private:
    memory_table<job> job_table;
    memory_table<user> user_table;
    memory_table<contest> contest_table;

    // 保证用户名检查和插入的原子性
    mutable std::mutex user_mutex;
};

}  // namespace oj
