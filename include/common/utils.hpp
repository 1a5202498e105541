#pragma once

#include <chrono>
#include <string>

namespace grader {

/**
 * @brief 去掉字符串末尾的所有换行符（'\n' 和 '\r'）
 */
std::string trim_line_separators(const std::string &text);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace grader
