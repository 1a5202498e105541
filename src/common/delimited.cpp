#include "common/delimited.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

static const char SEPARATOR = ';';
static const char QUOTE = '"';

static bool need_quote(const string &field) {
    if (field.empty()) return false;
    if (field[0] == ' ' || field[0] == '\t') return true;
    return field.find_first_of(";\"\r\n") != string::npos;
}

static string quote(const string &field) {
    string result;
    result.reserve(field.size() + 2);
    result += QUOTE;
    for (char ch : field) {
        if (ch == QUOTE) result += QUOTE;
        result += ch;
    }
    result += QUOTE;
    return result;
}

string format_record(const vector<string> &fields) {
    if (fields.size() == 1 && fields[0].empty())
        return string(2, QUOTE);

    string line;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) line += SEPARATOR;
        line += need_quote(fields[i]) ? quote(fields[i]) : fields[i];
    }
    return line;
}

static bool at_line_end(const string &content, size_t pos) {
    return pos >= content.size() || content[pos] == '\n' ||
           (content[pos] == '\r' && (pos + 1 == content.size() || content[pos + 1] == '\n'));
}

static bool at_field_end(const string &content, size_t pos) {
    return at_line_end(content, pos) || content[pos] == SEPARATOR;
}

static void skip_line_end(const string &content, size_t &pos) {
    if (pos < content.size() && content[pos] == '\r') ++pos;
    if (pos < content.size() && content[pos] == '\n') ++pos;
}

/**
 * @brief 从 pos 开始解析一个记录，结束后 pos 指向下一个记录的开头
 */
static vector<string> parse_one(const string &content, size_t &pos) {
    vector<string> fields;
    if (at_line_end(content, pos)) {
        skip_line_end(content, pos);
        return fields;
    }

    while (true) {
        string field;
        if (pos < content.size() && content[pos] == QUOTE) {
            size_t start = pos++;
            while (true) {
                if (pos >= content.size())
                    throw data_error(fmt::format("Unterminated quoted field starting at offset {}", start));
                char ch = content[pos++];
                if (ch != QUOTE) {
                    field += ch;
                } else if (pos < content.size() && content[pos] == QUOTE) {
                    field += QUOTE;
                    ++pos;
                } else {
                    break;
                }
            }
            if (!at_field_end(content, pos))
                throw data_error(fmt::format("Unexpected character after quoted field at offset {}", pos));
        } else {
            while (!at_field_end(content, pos)) {
                if (content[pos] == QUOTE)
                    throw data_error(fmt::format("Bare quote in unquoted field at offset {}", pos));
                field += content[pos++];
            }
        }
        fields.push_back(move(field));

        if (pos < content.size() && content[pos] == SEPARATOR) {
            ++pos;
        } else {
            skip_line_end(content, pos);
            return fields;
        }
    }
}

vector<vector<string>> parse_records(const string &content) {
    vector<vector<string>> records;
    size_t pos = 0;
    while (pos < content.size())
        records.push_back(parse_one(content, pos));
    return records;
}

vector<string> parse_record(const string &line) {
    size_t pos = 0;
    vector<string> fields = parse_one(line, pos);
    if (pos != line.size())
        throw data_error("Malformed record \"" + line + "\": more than one record");
    return fields;
}

}  // namespace grader
