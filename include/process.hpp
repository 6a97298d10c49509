#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

/**
 * 运行外部程序（编译器、选手程序、SPJ）的函数
 * 
 * 每次调用 run_process 都会 fork 出一个新的进程组，并在调用线程中
 * 通过 pidfd 等待子进程结束、时间限制到期或者评测被取消三者中最先
 * 发生的事件，等待期间不占用 CPU。因此不同提交的评测可以在不同的
 * 线程中并发调用 run_process，互不阻塞。
 */
namespace oj {

/**
 * @brief 评测取消标记
 * 由评测服务持有，评测线程在运行子进程时会同时等待这个标记，
 * 标记触发后子进程所在的进程组会被立刻杀死。
 */
struct cancellation_token {
    cancellation_token();
    ~cancellation_token();

    cancellation_token(const cancellation_token &) = delete;
    cancellation_token &operator=(const cancellation_token &) = delete;

    /**
     * @brief 触发取消标记，可以在任意线程调用，可以调用多次
     */
    void cancel();

    bool canceled() const;

    /**
     * @brief 可以被 poll 的 eventfd，取消后变为可读
     */
    int native_handle() const;

private:
    int fd;
    std::atomic<bool> flag;
};

struct process_options {
    /**
     * @brief 外部命令的路径 (argv[0]) 和 参数 (argv)
     * argv[0] 会通过 PATH 查找
     */
    std::vector<std::string> argv;

    /**
     * @brief 子进程的标准输入文件，为空时使用 /dev/null
     */
    std::filesystem::path stdin_path;

    /**
     * @brief 子进程的标准输出文件，为空时标准输出将被捕获到 process_result::captured_stdout
     */
    std::filesystem::path stdout_path;

    /**
     * @brief 子进程的工作目录，为空时继承当前进程的工作目录
     */
    std::filesystem::path working_dir;

    /**
     * @brief 时钟时间限制，为 0 表示不限制
     */
    std::chrono::microseconds deadline{0};

    /**
     * @brief 取消标记，可以为空
     */
    const cancellation_token *token = nullptr;
};

struct process_result {
    /**
     * @brief 子进程的返回值
     * 子进程因为信号退出、超时或者被取消时为 -1
     */
    int exit_code = -1;

    /**
     * @brief 导致子进程退出的信号，正常退出时为 0
     */
    int signal = 0;

    /**
     * @brief 子进程运行的时钟时间
     * 超时的情况下等于时间限制
     */
    std::chrono::microseconds elapsed{0};

    std::string captured_stdout;

    std::string captured_stderr;

    /**
     * @brief 子进程是否因为超出时间限制被杀死
     */
    bool deadline_exceeded = false;

    /**
     * @brief 子进程是否因为评测被取消而被杀死（或者根本没有启动）
     */
    bool canceled = false;

    /**
     * @brief 子进程是否正常运行结束并返回 0
     */
    bool success() const;
};

/**
 * @brief 运行外部程序并等待其结束
 * 子进程会被放进一个新的进程组，超时或取消时整个进程组都会被 SIGKILL 杀死，
 * 避免编译器或者 shell 脚本产生的孙子进程残留。
 * @param options 运行参数
 * @return 运行结果
 * @throw execution_error 若重定向文件无法打开、子进程无法创建或者 argv[0] 无法执行
 */
process_result run_process(const process_options &options);

}  // namespace oj
