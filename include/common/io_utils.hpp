#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw data_error 文件不存在或无法读取
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 按行读取文本文件，行分隔符为 '\n'
 * 文件末尾的换行符不会产生额外的空行
 */
std::vector<std::string> read_file_lines(const std::filesystem::path &path);

/**
 * @brief 覆盖写入文本文件，会自动创建父目录
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 写入一个只允许写一次的文件
 * 工作目录中的数据集和运行结果在写入后不允许再修改，
 * 否则后续阶段按位置对齐时可能对齐到不同的数据。
 * 写入完成后文件权限被设置为只读。
 * @throw data_error 文件已经存在
 */
void write_once(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 用于检查从命令行或配置中拿到的模块名、文件名
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

}  // namespace grader
