#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace grader {

struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是工作目录被破坏或者调用方式不正确
 */
struct internal_error : public grader_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 随机数据生成器的描述串不符合语法
 * 这是出题时的错误，不是学生的错误
 */
struct malformed_descriptor : public grader_exception {
    explicit malformed_descriptor(const std::string &message);
};

/**
 * @brief 题目的测试配置不符合格式
 */
struct malformed_spec : public grader_exception {
    explicit malformed_spec(const std::string &message);
};

/**
 * @brief 工作目录中的数据文件（数据集、运行结果）无法解析
 */
struct data_error : public grader_exception {
    explicit data_error(const std::string &message);
};

/**
 * @brief 外部程序根本无法启动（比如可执行文件不存在、没有执行权限）
 * 注意程序启动后以非零返回值退出不属于这种错误
 */
struct spawn_error : public grader_exception {
    spawn_error(const std::string &message, int error_code);

    /**
     * @brief 子进程在 exec 失败时的 errno
     */
    int error_code;
};

/**
 * @brief 外部程序以非零返回值退出，且没有任何输出可以作为诊断信息
 */
struct execution_error : public grader_exception {
    explicit execution_error(const std::string &message);
};

/**
 * @brief 数据集的长度和运行结果的长度不一致
 * 此时按位置对齐的前提已经被破坏，不能继续评分
 */
struct alignment_error : public grader_exception {
    explicit alignment_error(const std::string &message);
};

/**
 * @brief 标准程序在某个数据点上没有正常给出结果
 */
struct reference_error : public grader_exception {
    explicit reference_error(const std::string &message);
};

}  // namespace grader
