#pragma once

#include <boost/python.hpp>
#include <filesystem>
#include <string>
#include <vector>
#include "execute/runner.hpp"
#include "generator/test_spec.hpp"

namespace grader {

/**
 * @brief 通过嵌入的 Python 解释器调用被测函数
 * 需要先构造 python_interpreter。
 */
class python_function_runner : public function_runner {
public:
    /**
     * @brief 从 directory 中导入模块 module，取出函数 function
     * @param types 参数类型，用于将数据点的字段转换为 Python 对象；为空时所有字段作为 str 传入
     * @throw execution_error 模块无法导入或函数不存在
     */
    python_function_runner(const std::filesystem::path &directory, const std::string &module,
                           const std::string &function, std::vector<argument_type> types);

    execution_outcome call(const test_record &record) override;

private:
    boost::python::object function;
    std::vector<argument_type> types;
};

}  // namespace grader
