#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "execute/outcome.hpp"

namespace grader {

struct process_options {
    /**
     * @brief 作为子进程标准输入的内容，为空时子进程的标准输入立即关闭
     */
    std::optional<std::string> input;

    /**
     * @brief 墙钟时间限制，0 表示不限制
     * 超时后整个进程组先收到 SIGTERM，0.1 秒后收到 SIGKILL
     */
    std::chrono::milliseconds time_limit{0};

    /**
     * @brief 子进程的工作目录，为空时继承当前工作目录
     */
    std::filesystem::path working_dir;

    /**
     * @brief 额外的环境变量
     */
    std::map<std::string, std::string> environment;
};

struct process_result {
    /**
     * @brief 子进程的返回值，被信号终止时为 128 + 信号值
     */
    int exit_code = 0;

    /**
     * @brief 终止子进程的信号，正常退出时为 0
     */
    int signal = 0;

    /**
     * @brief 子进程是否因为超时被终止
     */
    bool timed_out = false;

    std::string out;
    std::string err;

    std::chrono::milliseconds wall_time{0};
};

/**
 * @brief 在独立的进程组中运行外部命令，完整捕获标准输出和标准错误流
 * 外部命令以非零返回值退出是正常的结果，不会抛出异常。
 * @param command 外部命令的路径 (command[0]) 和参数，按 PATH 查找
 * @param options 运行参数
 * @throw spawn_error 外部命令无法启动（不存在、没有执行权限、工作目录不存在）
 */
process_result run_process(const std::vector<std::string> &command, const process_options &options = process_options());

/**
 * @brief 将外部命令的运行结果分类
 * 1. 超时为 TIMED_OUT；
 * 2. 返回值非零且标准错误流非空为 ERROR，诊断信息为标准错误流；
 * 3. 返回值非零且标准输出流非空为 ERROR，诊断信息为标准输出流；
 * 4. 被信号终止为 ERROR，诊断信息为信号名；
 * 5. 其他返回值非零的情况没有任何诊断信息，抛出 execution_error；
 * 6. 否则为 CHECKED，答案为去掉末尾换行的标准输出流。
 */
execution_outcome classify(const process_result &result);

/**
 * @brief 先编译（可选）再运行的程序
 * 编译只进行一次。编译没有正常结束时，编译的结果就是每个数据点的结果，
 * 运行命令不会被执行。
 */
class program_driver {
public:
    program_driver(std::vector<std::string> run_command, process_options options,
                   std::optional<std::vector<std::string>> compile_command = std::nullopt);

    /**
     * @brief 编译程序，重复调用时直接返回第一次编译的结果
     * @return 编译失败时的结果，编译成功或不需要编译时返回 std::nullopt
     */
    std::optional<execution_outcome> compile();

    /**
     * @brief 以 input 为标准输入运行程序一次
     */
    execution_outcome run(const std::string &input);

    std::vector<execution_outcome> run_all(const std::vector<std::string> &inputs);

private:
    std::vector<std::string> run_command;
    std::optional<std::vector<std::string>> compile_command;
    process_options options;

    bool compiled = false;
    std::optional<execution_outcome> compile_failure;
};

}  // namespace grader
