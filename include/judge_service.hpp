#pragma once

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "judge/judger.hpp"
#include "judge/problem.hpp"
#include "judge/submission.hpp"
#include "rank/ranking.hpp"
#include "store/record_store.hpp"
#include "worker.hpp"

namespace oj {

/**
 * @brief 评测服务
 * 
 * 接受提交时只做检查并创建状态为 Queueing 的评测记录，立刻返回；
 * 评测由 worker 线程异步完成，完成后更新评测记录。
 * 
 * 每个评测记录同一时刻最多只有一个评测任务（排队或者正在评测），
 * 此时不允许重测。取消正在评测的提交会杀死正在运行的程序并删除
 * 工作目录，之后评测记录的状态为 Canceled。
 */
struct judge_service {
    /**
     * @param config 题目和语言配置，必须比评测服务活得久
     * @param store 记录存储，必须比评测服务活得久
     * @param j 评测逻辑，必须比评测服务活得久
     * @param worker_count worker 线程数量
     */
    judge_service(const configuration &config, record_store &store, const judger &j, size_t worker_count);

    ~judge_service();

    judge_service(const judge_service &) = delete;
    judge_service &operator=(const judge_service &) = delete;

    /**
     * @brief 接受一个提交
     * 检查顺序：语言、题目、比赛（题目和用户是否属于比赛、是否在比赛时间内、
     * 提交次数是否超过限制）、用户。
     * @return 状态为 Queueing 的评测记录
     * @throw validation_error 如果提交没有通过检查，此时不会创建评测记录
     */
    job submit(const submission &submit);

    /**
     * @brief 重新评测一个提交
     * 保留评测记录的编号和创建时间，更新时间为当前时间
     * @return 状态为 Queueing 的评测记录
     * @throw validation_error 如果评测记录不存在，或者提交正在排队或评测中
     */
    job rejudge(uint32_t job_id);

    /**
     * @brief 取消一个提交的评测
     * 排队中的提交直接标记为 Canceled；正在评测的提交会等待正在运行的程序被杀死、
     * 工作目录被删除后再返回。
     * @return 状态为 Canceled 的评测记录
     * @throw validation_error 如果评测记录不存在，或者提交已经评测完成或已经被取消
     */
    job cancel(uint32_t job_id);

    std::optional<job> find_job(uint32_t job_id) const;

    std::vector<job> list_jobs(const job_filter &filter) const;

    /**
     * @brief 计算排行榜
     * @param contest_id 比赛编号，为 0 表示全局排行榜
     * @throw validation_error 如果比赛不存在，或者动态计分题目没有配置计分比例
     */
    std::vector<user_ranking> ranklist(uint32_t contest_id, const ranking_rule &rule) const;

    /**
     * @brief 阻塞直到没有排队或者正在评测的提交
     */
    void wait_idle();

    /**
     * @brief 停止接受新的评测任务，等待 worker 完成已经排队的任务后退出
     */
    void stop();

private:
    void validate(const submission &submit, timestamp now) const;
    void enqueue(uint32_t job_id);
    void process(const judge_task &task);
    void finish(uint32_t job_id);
    job canceled_job(job record) const;

    const configuration &config;
    record_store &store;
    const judger &j;

    concurrent_queue<judge_task> task_queue;
    std::vector<std::thread> workers;

    // 保护 active 以及评测记录状态的读改写
    mutable std::mutex mut;
    std::condition_variable active_changed;

    /**
     * @brief 排队中或者正在评测的提交的取消标记
     */
    std::map<uint32_t, std::shared_ptr<cancellation_token>> active;
};

}  // namespace oj
