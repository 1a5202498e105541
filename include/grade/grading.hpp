#pragma once

#include <optional>
#include <string>
#include <vector>
#include "execute/outcome.hpp"
#include "generator/record.hpp"
#include "grade/report.hpp"

namespace grader {

/**
 * @brief 带有期望输出的数据点，用于不运行标准程序的评测
 */
struct expected_case {
    std::string input;
    std::string expected;

    /**
     * @brief 学生答案错误时给出的提示
     */
    std::optional<std::string> message;
};

/**
 * @brief 按数据集顺序累计比较结果，生成评测报告
 * 只记录第一个没有通过的数据点作为反例，提示信息也只设置一次。
 */
class report_builder {
public:
    explicit report_builder(std::string tid);

    void match();

    /**
     * @brief 记录一个没有通过的数据点
     * @param input 数据点的输入
     * @param expected 标准答案
     * @param actual 学生程序的运行结果，不是 CHECKED 时设置错误提示
     * @param message 答案错误时的提示，可选
     */
    void mismatch(const std::string &input, const std::string &expected, const execution_outcome &actual,
                  const std::optional<std::string> &message = std::nullopt);

    grading_report build() const;

private:
    std::string tid;
    bool failed = false;
    grading_stats stats;
    std::optional<std::string> message;
    std::optional<counter_example> example;
};

/**
 * @brief 双执行模式：比较学生程序和标准程序在同一数据集上的运行结果
 * 任意一方的结果不是 CHECKED 时该数据点都视为不通过。标准程序没有正常给出结果时，
 * 反例中的标准答案是标准程序的结果行，比如 "exception:ZeroDivisionError: division by zero"。
 * @param hints 每个数据点答案错误时的提示，可以比数据集短
 * @throw alignment_error 数据集长度与任意一方的运行结果个数不一致
 */
grading_report grade(const std::string &tid, const test_dataset &dataset,
                     const std::vector<execution_outcome> &submission,
                     const std::vector<execution_outcome> &reference,
                     const std::vector<std::optional<std::string>> &hints = {});

/**
 * @brief 期望值模式：比较学生程序的结果和数据点的期望输出
 * 期望输出比较前去掉末尾的换行符。
 * @throw alignment_error 数据点个数与运行结果个数不一致
 */
grading_report grade(const std::string &tid, const std::vector<expected_case> &cases,
                     const std::vector<execution_outcome> &submission);

/**
 * @brief 学生程序的 runner 进程本身崩溃时的评测报告
 */
grading_report grade_runner_failure(const std::string &tid, const std::string &message);

}  // namespace grader
