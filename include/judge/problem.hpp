#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * 这个头文件包含评测系统启动时加载的配置
 * 包含：
 * 1. problem 类（表示一道题目及其测试数据）
 * 2. language 类（表示一种编程语言的编译方式）
 * 3. configuration 类（表示整个配置文件）
 * 配置加载完成后只读，可以在评测线程之间共享。
 */
namespace oj {

/**
 * @brief 题目的评测方式
 */
enum class problem_type {
    /**
     * @brief 逐行比较，忽略每行首尾的空白字符和文末空行
     */
    STANDARD,

    /**
     * @brief 逐字节比较
     */
    STRICT,

    /**
     * @brief 调用 SPJ 判断结果
     */
    SPJ,

    /**
     * @brief 按 STANDARD 评测，排行榜中按选手程序的运行时间计算部分分数
     */
    DYNAMIC_RANKING
};

/**
 * @brief 表示一个测试点
 */
struct test_case {
    /**
     * @brief 本测试点的分数，通过时计入提交的总分
     */
    double score = 0;

    /**
     * @brief 标准输入文件
     */
    std::filesystem::path input_file;

    /**
     * @brief 标准答案文件
     */
    std::filesystem::path answer_file;

    /**
     * @brief 时钟时间限制，单位为微秒，为 0 表示不限制
     */
    uint64_t time_limit = 0;

    /**
     * @brief 内存限制，单位为字节
     * 评测系统不限制内存，该字段只用于展示
     */
    uint64_t memory_limit = 0;
};

struct problem_misc {
    /**
     * @brief SPJ 的命令模板
     * %OUTPUT% 会被替换为选手程序输出文件，%ANSWER% 会被替换为标准答案文件。
     * SPJ 的标准输出第一行为评测结果（比如 Accepted），第二行为附加信息。
     */
    std::optional<std::vector<std::string>> special_judge;

    /**
     * @brief 动态计分题目中按运行时间计分的比例，在 [0, 1] 之间
     */
    std::optional<double> dynamic_ranking_ratio;
};

struct problem {
    uint32_t id = 0;
    std::string name;
    problem_type type = problem_type::STANDARD;
    problem_misc misc;
    std::vector<test_case> cases;
};

/**
 * @brief 表示一种编程语言
 */
struct language {
    std::string name;

    /**
     * @brief 选手代码保存的文件名，比如 main.rs
     */
    std::string file_name;

    /**
     * @brief 编译命令模板
     * %INPUT% 会被替换为选手代码路径，%OUTPUT% 会被替换为可执行文件路径。
     */
    std::vector<std::string> command;
};

struct configuration {
    std::vector<problem> problems;
    std::vector<language> languages;

    /**
     * @return 编号为 id 的题目，不存在时返回 nullptr
     */
    const problem *find_problem(uint32_t id) const;

    /**
     * @return 名为 name 的语言，不存在时返回 nullptr
     */
    const language *find_language(const std::string &name) const;
};

const char *get_display_message(problem_type type);

void from_json(const nlohmann::json &j, problem_type &type);
void to_json(nlohmann::json &j, const problem_type &type);
void from_json(const nlohmann::json &j, test_case &tc);
void to_json(nlohmann::json &j, const test_case &tc);
void from_json(const nlohmann::json &j, problem_misc &misc);
void to_json(nlohmann::json &j, const problem_misc &misc);
void from_json(const nlohmann::json &j, problem &prob);
void to_json(nlohmann::json &j, const problem &prob);
void from_json(const nlohmann::json &j, language &lang);
void to_json(nlohmann::json &j, const language &lang);

/**
 * @brief 解析配置并检查题目编号、语言名称不重复
 * 配置文件中的 server 段由外部的请求路由使用，这里忽略
 * @throw validation_error 如果配置不合法
 */
configuration parse_configuration(const nlohmann::json &j);

/**
 * @brief 从 JSON 文件加载配置
 * @throw execution_error 如果文件无法读取
 * @throw validation_error 如果配置不合法
 */
configuration load_configuration(const std::filesystem::path &path);

}  // namespace oj
