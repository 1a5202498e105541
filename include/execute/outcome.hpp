#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace grader {

/**
 * @brief 某一方在某个数据点上的运行结果
 * status 为 CHECKED 时 payload 为程序的答案，否则为诊断信息
 */
struct execution_outcome {
    outcome_status status;
    std::string payload;

    bool checked() const;

    bool operator==(const execution_outcome &other) const;
    bool operator!=(const execution_outcome &other) const;
};

/**
 * @brief 编码为运行结果文件中的一行 "status:payload"
 * payload 中的换行符和反斜杠会被转义，保证一个结果只占一行
 */
std::string format_outcome(const execution_outcome &outcome);

/**
 * @brief 解析运行结果文件中的一行
 * @throw data_error 缺少 ':'、未知的状态名或非法的转义序列
 */
execution_outcome parse_outcome(const std::string &line);

/**
 * @brief 写入某一方的运行结果文件，只允许写入一次
 */
void write_outcomes(const std::filesystem::path &path, const std::vector<execution_outcome> &outcomes);

std::vector<execution_outcome> read_outcomes(const std::filesystem::path &path);

/**
 * @brief io 类题目 res.json 中使用的格式 {"status": "checked", "output": "..."}
 */
void to_json(nlohmann::json &j, const execution_outcome &outcome);

void from_json(const nlohmann::json &j, execution_outcome &outcome);

std::ostream &operator<<(std::ostream &os, const execution_outcome &outcome);

}  // namespace grader
