#pragma once

#include <filesystem>
#include "generator/descriptor.hpp"
#include "generator/record.hpp"
#include "generator/test_spec.hpp"

namespace grader {

/**
 * @brief 生成测试数据集
 * 先按声明顺序放入所有预定义数据点，再按生成顺序放入 random.n 个随机数据点。
 * 每个随机数据点的每个字段都由对应的生成器独立生成。
 * @param spec 测试配置
 * @param rng 随机数引擎
 * @throw malformed_spec 预定义数据点格式错误或字段个数与参数个数不一致
 * @throw malformed_descriptor 生成器描述串不合法
 */
test_dataset synthesize(const task_spec &spec, random_engine &rng);

/**
 * @brief 将数据集写入以 ';' 分隔的 CSV 文件，每个记录一个数据点
 * 数据集只允许写入一次，写入后文件为只读。
 * @throw data_error 数据集文件已经存在
 */
void write_dataset(const std::filesystem::path &path, const test_dataset &dataset);

/**
 * @brief 按写入顺序读回数据集
 * @throw data_error 文件不存在或者不是合法的 CSV
 */
test_dataset read_dataset(const std::filesystem::path &path);

}  // namespace grader
