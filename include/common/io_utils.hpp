#pragma once

#include <filesystem>
#include <string>

namespace oj {

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @return 文件的内容(没有指定编码)
 * @throw execution_error 如果文件不存在或者无法读取
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，覆盖原有内容
 * @throw execution_error 如果文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，如果语言配置的
 * 源文件名包含 "../" 或者是绝对路径，那么选手代码有可能被写到
 * 工作目录以外，覆盖其他提交的文件。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

}  // namespace oj
