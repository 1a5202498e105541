#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "task/workspace.hpp"

namespace grader {

enum class task_type {
    /**
     * @brief 单元测试类题目：逐个数据点调用被测函数，与标准程序的结果比较
     */
    UNIT,

    /**
     * @brief 输入输出类题目：以数据点为标准输入运行程序，与期望输出比较
     */
    IO
};

task_type parse_task_type(const std::string &name);

struct command_options {
    explicit command_options(workspace work);

    workspace work;

    /**
     * @brief 测试配置文件
     */
    std::filesystem::path spec_file;

    /**
     * @brief 每次运行外部命令的墙钟时间限制
     */
    std::chrono::milliseconds time_limit{0};

    /**
     * @brief 随机数据的种子，没有指定时随机选择
     */
    std::optional<std::uint64_t> seed;

    /**
     * @brief io 类题目的编译命令，通过 /bin/sh -c 执行
     */
    std::optional<std::string> compile;

    /**
     * @brief unit 类题目中被测函数所在的 Python 模块名
     */
    std::string module = "program";

    /**
     * @brief 子命令的参数，比如 run 的 student/teacher，execute 的外部命令
     */
    std::vector<std::string> arguments;
};

/**
 * @brief 从 in 读取 {"tid": ..., "fields": ...}，重建工作目录并写入任务 id
 * 学生填写的内容写入 student/fields.json，供外部的模板填充工具使用。
 */
void preprocess(const command_options &options, std::istream &in);

/**
 * @brief 生成测试数据集并写入 input/data.csv
 */
void generate(const command_options &options);

/**
 * @brief 在当前进程中逐个数据点调用 student 或 teacher 目录中的 Python 函数
 * 结果写入 output/data.res 或 output/solution.res。
 */
void run_actor(const command_options &options);

/**
 * @brief 运行学生程序的 runner 命令，runner 没有正常结束时将诊断信息写入 output/out.err
 */
void execute_unit(const command_options &options);

/**
 * @brief 运行标准程序的 runner 命令（可选），按位置比较两方的结果并输出评测报告
 */
void feedback_unit(const command_options &options, std::ostream &out);

/**
 * @brief 编译（可选）并以每个预定义数据点的输入运行学生程序，结果写入 output/res.json
 */
void execute_io(const command_options &options);

/**
 * @brief 比较 output/res.json 与预定义数据点的期望输出并输出评测报告
 */
void feedback_io(const command_options &options, std::ostream &out);

/**
 * @brief 依次执行 execute_io 和 feedback_io
 */
void test_io(const command_options &options, std::ostream &out);

/**
 * @brief 根据子命令名和题目类型分发
 * @throw internal_error 未知的子命令，或子命令不适用于该题目类型
 */
void run_subcommand(const std::string &name, task_type type, const command_options &options);

}  // namespace grader
