#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "process.hpp"

/**
 * 评测 worker 相关函数
 * 
 * 评测服务接受提交后，将评测任务放入 task_queue，worker 线程不断从
 * task_queue 中取出评测任务交给评测服务处理。每个 worker 同一时刻只
 * 评测一个提交，因此同时评测的提交数量等于 worker 数量。
 * task_queue 被关闭且为空时，worker 退出。
 */
namespace oj {

/**
 * @brief 一个评测任务
 */
struct judge_task {
    uint32_t job_id = 0;

    /**
     * @brief 取消标记，评测服务和 worker 共享
     */
    std::shared_ptr<cancellation_token> token;
};

/**
 * @brief 启动评测 worker 线程
 * @param worker_id worker 编号，只用于日志
 * @param task_queue 评测任务队列
 * @param handler 评测任务的处理函数，抛出的异常会被记录到日志，不会导致 worker 退出
 * @return 产生的线程
 */
std::thread start_worker(size_t worker_id, concurrent_queue<judge_task> &task_queue, std::function<void(const judge_task &)> handler);

}  // namespace oj
