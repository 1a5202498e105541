#pragma once

#include <random>
#include <string>
#include <variant>
#include <vector>

namespace grader {

/**
 * @brief 随机数据生成使用的随机数引擎
 * 总是由调用者显式传入，以便测试时可以固定种子
 */
typedef std::mt19937_64 random_engine;

/**
 * @brief int(a,b)：在 [a,b] 中均匀随机的整数
 */
struct int_descriptor {
    long long min, max;
};

/**
 * @brief float(a,b)：在 [a,b) 中均匀随机的浮点数，输出保留六位小数
 * [a,b) 中没有六位小数能表示的值时（包括 a == b）总是输出 a。
 */
struct float_descriptor {
    double min, max;
};

/**
 * @brief bool：true 或 false
 */
struct bool_descriptor {};

/**
 * @brief str(a,b)：长度在 [a,b] 中均匀随机的字符串，字符集为大小写字母和数字
 */
struct string_descriptor {
    std::size_t min_length, max_length;
};

/**
 * @brief enum(v1,v2,...)：从列表中均匀随机选择一个值
 */
struct enum_descriptor {
    std::vector<std::string> values;
};

typedef std::variant<int_descriptor, float_descriptor, bool_descriptor, string_descriptor, enum_descriptor> generator_descriptor;

/**
 * @brief 解析随机数据生成器的描述串
 * @param text 描述串，比如 "int(1,100)"，区分大小写，不允许空白字符
 * @return 解析后的描述
 * @throw malformed_descriptor 描述串不符合任何一种语法，或者下界大于上界
 */
generator_descriptor parse_descriptor(const std::string &text);

/**
 * @brief 按顺序解析一组描述串
 * @throw malformed_descriptor 错误信息中包含出错的描述串的下标
 */
std::vector<generator_descriptor> parse_descriptors(const std::vector<std::string> &texts);

/**
 * @brief 根据描述生成一个随机值的文本表示
 * 整数为十进制，浮点数为保留六位小数的定点表示，布尔值为 true/false
 */
std::string generate(const generator_descriptor &descriptor, random_engine &rng);

}  // namespace grader
