#pragma once

#include <vector>
#include "execute/outcome.hpp"
#include "generator/record.hpp"

namespace grader {

/**
 * @brief 在一个长期存活的进程中逐个数据点调用被测函数
 * 由具体语言的适配层实现，评测核心只依赖这个接口，不关心被测代码如何加载。
 */
class function_runner {
public:
    virtual ~function_runner() = default;

    /**
     * @brief 以一个数据点为参数调用被测函数
     * 被测函数抛出的异常应当转换为 EXCEPTION 结果返回
     */
    virtual execution_outcome call(const test_record &record) = 0;
};

/**
 * @brief 按顺序对每个数据点调用一次被测函数
 * 某个数据点上抛出的异常记为 EXCEPTION，不影响剩余的数据点。
 * 评测系统自身的错误（grader_exception）仍然向上抛出。
 * @return 与数据集下标一一对应的运行结果
 */
std::vector<execution_outcome> run_records(function_runner &runner, const test_dataset &dataset);

}  // namespace grader
