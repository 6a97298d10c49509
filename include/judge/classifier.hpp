#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "judge/problem.hpp"
#include "process.hpp"

/**
 * 数据点结果判定
 * 选手程序正常退出后，根据题目的评测方式比较选手程序的输出和标准答案。
 */
namespace oj {

/**
 * @brief 一个数据点的判定结果
 */
struct verdict {
    oj_result result;
    std::string info;
};

/**
 * @brief 逐行比较，忽略每行首尾空白字符以及文末的空行
 * 行数不同时认为不相等，因此 "a\nb\n" 和 "a \nb" 相等，"a\nb" 和 "a\nb\nc" 不相等
 */
bool compare_standard(const std::string &expected, const std::string &actual);

/**
 * @brief 逐字节比较
 */
bool compare_strict(const std::string &expected, const std::string &actual);

/**
 * @brief 解析 SPJ 的标准输出
 * 去除空行后必须恰好有两行：第一行为评测结果名称，第二行为附加信息。
 * 格式不正确时返回 SPJ Error。
 */
verdict parse_verifier_output(const std::string &output);

/**
 * @brief 调用 SPJ 判定数据点结果
 * SPJ 不限制运行时间，但是会响应评测取消。
 * @param command SPJ 命令模板，为空指针表示题目没有配置 SPJ
 * @param answer_file 标准答案文件
 * @param output_file 选手程序输出文件
 * @return SPJ 给出的结果，SPJ 无法运行或者返回非零值时为 SPJ Error
 * @throw judge_canceled 如果 SPJ 运行期间评测被取消
 */
verdict run_verifier(const std::vector<std::string> *command,
                     const std::filesystem::path &answer_file,
                     const std::filesystem::path &output_file,
                     const cancellation_token *token = nullptr);

/**
 * @brief 根据题目评测方式判定选手程序正常退出时的数据点结果
 * @param prob 题目
 * @param tc 测试点
 * @param output_file 选手程序的 stdout 输出文件
 * @param token 评测取消标记
 * @throw execution_error 如果标准答案或者输出文件无法读取
 */
verdict classify(const problem &prob, const test_case &tc,
                 const std::filesystem::path &output_file,
                 const cancellation_token *token = nullptr);

}  // namespace oj
