#pragma once

#include <cstdint>
#include <vector>
#include "judge/problem.hpp"
#include "judge/submission.hpp"
#include "process.hpp"

namespace oj {

/**
 * @brief 表示一个提交的评测逻辑
 * 评测服务通过这个接口评测提交，测试中可以替换为假的实现
 */
struct judger {
    virtual ~judger();

    /**
     * @brief 评测一个提交，返回评测完成的记录
     * 这个函数可以并发调用，每次调用都使用独立的工作目录。
     * @param job_id 评测记录的编号，用于命名工作目录
     * @param submit 要被评测的提交
     * @param prob 提交的题目
     * @param lang 提交的语言
     * @param created_time 评测记录的创建时间，原样保存在返回的记录中
     * @param updated_time 评测记录的更新时间，原样保存在返回的记录中
     * @param token 评测取消标记，可以为空
     * @return state 为 Finished 的评测记录，数据点数量为题目测试点数量 + 1
     * @throw execution_error 如果工作目录、选手代码、测试数据读写失败或者程序无法运行
     * @throw judge_canceled 如果评测被取消
     */
    virtual job judge(uint32_t job_id, const submission &submit, const problem &prob, const language &lang,
                      timestamp created_time, timestamp updated_time, const cancellation_token *token) const = 0;
};

/**
 * @brief 编程题评测
 * 
 * 评测流程：
 * 1. 在 RUN_DIR 下创建工作目录，写入选手代码
 * 2. 根据语言的编译命令编译，编译不限制时间。编译失败时所有测试点保持 Waiting
 * 3. 依次运行每个测试点，超时为 TLE，返回非零值为 RE，否则根据题目评测方式判定
 * 4. 删除工作目录
 * 
 * 提交的评测结果为第一个没有通过的测试点的结果，后续测试点仍然会被评测，
 * 但不会改变提交的评测结果。只有通过的测试点的分数会计入总分。
 */
struct programming_judger : public judger {
    job judge(uint32_t job_id, const submission &submit, const problem &prob, const language &lang,
              timestamp created_time, timestamp updated_time, const cancellation_token *token) const override;
};

/**
 * @brief 产生编号 0..N 的数据点，结果均为 Waiting
 * 用于还没有开始评测的提交
 */
std::vector<case_result> make_waiting_cases(const problem &prob);

}  // namespace oj
