#pragma once

#include <optional>
#include <string>

namespace oj {

/**
 * @brief 表示数据点或整个提交的评测结果
 * 
 */
enum class oj_result {
    /**
     * @brief 数据点还没有被评测
     * 编译失败时，所有测试数据点都保持该状态
     */
    WAITING = 0,

    /**
     * @brief 提交正在评测
     */
    RUNNING = 1,

    /**
     * @brief 用户程序本测试点评测通过
     */
    ACCEPTED = 2,

    /**
     * @brief 用户程序编译错误
     * 编译器返回非零值，编译器的 stderr 会作为附加信息返回
     */
    COMPILATION_ERROR = 3,

    /**
     * @brief 用户程序编译通过
     * 只会出现在编号为 0 的编译数据点中
     */
    COMPILATION_SUCCESS = 4,

    /**
     * @brief 答案错误
     */
    WRONG_ANSWER = 5,

    /**
     * @brief 用户程序返回了非零值，或者因为信号崩溃
     */
    RUNTIME_ERROR = 6,

    /**
     * @brief 用户程序运行时间超出限制
     * 只比较时钟时间
     */
    TIME_LIMIT_EXCEEDED = 7,

    /**
     * @brief 用户程序运行内存超限
     * 本评测系统不会限制内存，只有 SPJ 可能返回该结果
     */
    MEMORY_LIMIT_EXCEEDED = 8,

    /**
     * @brief 内部错误，评测系统出错
     * 比如工作目录无法创建，测试数据无法读取
     */
    SYSTEM_ERROR = 9,

    /**
     * @brief SPJ 出错
     * SPJ 返回非零值、输出格式不正确、或者题目没有配置 SPJ
     */
    SPJ_ERROR = 10,

    /**
     * @brief 提交被取消，数据点没有被评测
     */
    SKIPPED = 11
};

const char *get_display_message(oj_result result);

/**
 * @brief 将评测结果的显示名称转换回评测结果
 * @param message 比如 "Wrong Answer"
 * @return 不能识别时返回空
 */
std::optional<oj_result> parse_oj_result(const std::string &message);

/**
 * @brief 表示一个提交的评测进度
 * Queueing -> Running -> Finished / Canceled
 */
enum class job_state {
    QUEUEING = 0,
    RUNNING = 1,
    FINISHED = 2,
    CANCELED = 3
};

const char *get_display_message(job_state state);

std::optional<job_state> parse_job_state(const std::string &message);

}  // namespace oj
