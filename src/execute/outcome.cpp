#include "execute/outcome.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader {
using namespace nlohmann;
using namespace std;

bool execution_outcome::checked() const {
    return status == outcome_status::CHECKED;
}

bool execution_outcome::operator==(const execution_outcome &other) const {
    return status == other.status && payload == other.payload;
}

bool execution_outcome::operator!=(const execution_outcome &other) const {
    return !(*this == other);
}

static string escape(const string &payload) {
    string result;
    result.reserve(payload.size());
    for (char ch : payload) {
        switch (ch) {
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            default: result += ch;
        }
    }
    return result;
}

static string unescape(const string &payload) {
    string result;
    result.reserve(payload.size());
    for (size_t i = 0; i < payload.size(); ++i) {
        if (payload[i] != '\\') {
            result += payload[i];
            continue;
        }
        if (++i == payload.size())
            throw data_error("Outcome payload cannot end with escape");
        switch (payload[i]) {
            case '\\': result += '\\'; break;
            case 'n': result += '\n'; break;
            case 'r': result += '\r'; break;
            default:
                throw data_error(string("Unknown escape sequence \\") + payload[i] + " in outcome payload");
        }
    }
    return result;
}

string format_outcome(const execution_outcome &outcome) {
    return string(get_status_name(outcome.status)) + ":" + escape(outcome.payload);
}

execution_outcome parse_outcome(const string &line) {
    auto idx = line.find(':');
    if (idx == string::npos)
        throw data_error("Malformed outcome " + line);
    return execution_outcome{parse_status_name(line.substr(0, idx)), unescape(line.substr(idx + 1))};
}

void write_outcomes(const filesystem::path &path, const vector<execution_outcome> &outcomes) {
    string content;
    for (auto &outcome : outcomes)
        content += format_outcome(outcome) + "\n";
    write_once(path, content);
}

vector<execution_outcome> read_outcomes(const filesystem::path &path) {
    vector<execution_outcome> outcomes;
    for (auto &line : read_file_lines(path))
        outcomes.push_back(parse_outcome(line));
    return outcomes;
}

void to_json(json &j, const execution_outcome &outcome) {
    j = {{"status", get_status_name(outcome.status)},
         {"output", outcome.payload}};
}

void from_json(const json &j, execution_outcome &outcome) {
    outcome.status = parse_status_name(j.at("status").get<string>());
    j.at("output").get_to(outcome.payload);
}

ostream &operator<<(ostream &os, const execution_outcome &outcome) {
    return os << format_outcome(outcome);
}

}  // namespace grader
