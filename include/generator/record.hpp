#pragma once

#include <string>
#include <vector>

namespace grader {

/**
 * @brief 一个测试数据点：按参数声明顺序排列的参数值的文本表示
 * 无论是预定义数据还是随机生成的数据，下游都以同样的方式处理。
 */
typedef std::vector<std::string> test_record;

/**
 * @brief 有序的测试数据集
 * 数据点的下标是学生程序和标准程序运行结果对齐的依据，生成后不能重新排序。
 */
typedef std::vector<test_record> test_dataset;

/**
 * @brief 解析预定义数据点，比如 "(1, 2, abc)"
 * 去掉首尾的括号后按 ',' 分割，每个字段去掉首尾空白字符。"()" 表示没有参数。
 * @throw malformed_spec 缺少首尾的括号
 */
test_record parse_literal_record(const std::string &literal);

/**
 * @brief 将数据点渲染为反馈中展示的输入，比如 "(1,2,abc)"
 */
std::string render_record(const test_record &record);

}  // namespace grader
