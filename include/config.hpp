#pragma once

#include <cstddef>
#include <filesystem>

namespace oj {

/**
 * @brief 选手程序编译及运行的根目录
 * 每个提交的每次评测都会在 RUN_DIR 下创建一个独立的工作目录，
 * 评测结束后工作目录会被删除。RUN_DIR 的文件结构如下：
 * 
 * RUN_DIR
 * ├── 12-4f1c...e2 // 提交编号-随机生成的 uuid
 * │   ├── main.rs // 选手程序的代码，文件名由语言配置决定
 * │   ├── target // 编译产生的可执行文件
 * │   ├── 1.out // 第 1 个测试点选手程序的 stdout 输出
 * │   └── ...
 * └── ...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测系统将不会删除产生的工作目录，
 * 以便手动检查测试产生的文件内容是否符合预期。
 */
extern bool DEBUG;

/**
 * @brief 保存在内存中的子进程 stdout、stderr 的最大字节数
 * 超出部分会被丢弃，避免选手程序疯狂输出导致评测系统内存耗尽
 */
extern std::size_t MAX_CAPTURE_SIZE;

}  // namespace oj
