#pragma once

#include <fmt/core.h>
#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

namespace oj {

/**
 * @brief 替换命令模板中的占位符
 * 只有和占位符完全相同的参数才会被替换，其他参数原样保留
 * @code{.cpp}
 *     // {"g++", "-o", "/tmp/1/target", "/tmp/1/main.cpp"}
 *     substitute_arguments({"g++", "-o", "%OUTPUT%", "%INPUT%"},
 *                          {{"%INPUT%", "/tmp/1/main.cpp"}, {"%OUTPUT%", "/tmp/1/target"}});
 * @endcode
 * @param command 命令模板
 * @param variables 占位符到实际参数的映射
 */
std::vector<std::string> substitute_arguments(const std::vector<std::string> &command, const std::map<std::string, std::string> &variables);

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 将时间格式化为 UTC 时间字符串，精确到毫秒
 * 比如 2022-08-27T02:05:29.000Z
 */
std::string format_time(std::chrono::system_clock::time_point time);

/**
 * @brief 解析 format_time 产生的时间字符串
 * @throw validation_error 如果格式不正确
 */
std::chrono::system_clock::time_point parse_time(const std::string &text);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace oj
