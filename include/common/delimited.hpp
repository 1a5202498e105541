#pragma once

#include <string>
#include <vector>

namespace grader {

/**
 * @brief 将一组字段编码为一个以 ';' 分隔的 CSV 记录，不包含末尾的换行符
 * 字段包含 ';'、'"'、回车或换行，或者以空白字符开头时用 '"' 包围，
 * 包围内的 '"' 写作 ""，换行原样保留。
 * 只有一个空字段的记录写作 ""，以区分没有字段的空记录。
 */
std::string format_record(const std::vector<std::string> &fields);

/**
 * @brief 解析整个 CSV 文本，每个记录以换行符（或 \r\n）结束
 * 引号包围的字段中可以包含换行符，因此一个记录可能跨越多行。
 * 空行是没有字段的空记录。
 * @throw data_error 引号没有闭合，或者引号出现在没有被包围的字段中
 */
std::vector<std::vector<std::string>> parse_records(const std::string &content);

/**
 * @brief 解析一个 CSV 记录
 * @throw data_error 格式错误，或者文本包含多于一个记录
 */
std::vector<std::string> parse_record(const std::string &line);

}  // namespace grader
