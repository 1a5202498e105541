#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

/**
 * 这个头文件包含评测报告的结构体和 JSON 序列化函数
 * 可选字段没有值时在 JSON 中省略，而不是输出 null
 */
namespace grader {

enum class grading_status {
    SUCCESS,
    FAILED
};

/**
 * @brief 第一个没有通过的数据点
 */
struct counter_example {
    /**
     * @brief 数据点的输入，unit 类题目为 "(v1,v2,...)"
     */
    std::string input;

    /**
     * @brief 标准答案
     */
    std::string expected;

    /**
     * @brief 学生程序的答案，学生程序没有正常给出答案时没有值
     */
    std::optional<std::string> actual;
};

void to_json(nlohmann::json &j, const counter_example &example);

struct grading_stats {
    int succeeded = 0;
    int total = 0;
};

void to_json(nlohmann::json &j, const grading_stats &stats);

struct grading_feedback {
    std::optional<std::string> message;
    std::optional<counter_example> example;
    std::optional<grading_stats> stats;

    /**
     * @brief 得分，为 succeeded / total
     */
    double score = 0;
};

void to_json(nlohmann::json &j, const grading_feedback &feedback);

struct grading_report {
    /**
     * @brief 任务 id，总是输出
     */
    std::string tid;

    grading_status status = grading_status::SUCCESS;

    std::optional<grading_feedback> feedback;
};

void to_json(nlohmann::json &j, const grading_report &report);

}  // namespace grader
