#pragma once

#include <string>

namespace grader {

/**
 * @brief 表示某一方（学生或标准程序）在某个数据点上的运行结果分类
 */
enum class outcome_status {
    /**
     * @brief 程序正常结束，输出即为程序的答案
     */
    CHECKED = 0,

    /**
     * @brief 程序以非零返回值退出，或者被信号终止
     * 诊断信息为标准错误流的内容，若标准错误流为空则为标准输出流的内容
     */
    ERROR = 1,

    /**
     * @brief 进程内调用被测函数时抛出了异常
     * 仅影响当前数据点，不会影响剩余数据点的运行
     */
    EXCEPTION = 2,

    /**
     * @brief 程序运行超过了墙钟时间限制，被强制终止
     */
    TIMED_OUT = 3
};

/**
 * @brief 运行结果文件中使用的状态名称：checked, error, exception, timeout
 */
const char *get_status_name(outcome_status status);

/**
 * @brief 解析运行结果文件中的状态名称
 * @throw data_error 未知的状态名称
 */
outcome_status parse_status_name(const std::string &name);

}  // namespace grader
