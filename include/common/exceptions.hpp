#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace oj {

struct oj_exception : std::exception {
    oj_exception();
    explicit oj_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const oj_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是序列化失败或者调用方违反了约定
 */
struct internal_error : public oj_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示执行外部程序失败或者评测工作目录的读写失败
 * 编译器、选手程序、SPJ 无法启动，或者测试数据无法读取时抛出。
 * 这个异常只会中止当前提交的评测，不影响其他正在评测的提交。
 */
struct execution_error : public oj_exception {
    execution_error();
    explicit execution_error(const std::string &message);
};

/**
 * @brief 表示数据库查询错误
 */
struct database_error : public oj_exception {
    database_error();
    explicit database_error(const std::string &message);
};

/**
 * @brief 表示正在评测的提交被取消
 * 评测过程中发现取消标记后抛出，调用方负责将提交标记为 Canceled
 */
struct judge_canceled : public oj_exception {
    judge_canceled();
    explicit judge_canceled(const std::string &message);
};

/**
 * @brief 请求被拒绝的原因
 * 数值和对外接口的错误码保持一致
 */
enum class error_reason {
    INVALID_ARGUMENT = 1,
    INVALID_STATE = 2,
    NOT_FOUND = 3,
    RATE_LIMIT = 4,
    EXTERNAL = 5,
    INTERNAL = 6
};

const char *get_display_message(error_reason reason);

/**
 * @brief 表示提交、评测请求或者排行榜请求没有通过检查
 * 抛出该异常时不会产生任何评测记录
 */
struct validation_error : public oj_exception {
    validation_error(error_reason reason, const std::string &message);

    error_reason reason() const;

    /**
     * @brief 错误码，等于 error_reason 的数值
     */
    int code() const;

private:
    error_reason why;
};

}  // namespace oj
