#include "generator/record.hpp"
#include <boost/algorithm/string.hpp>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

test_record parse_literal_record(const string &literal) {
    string text = boost::trim_copy(literal);
    if (text.size() < 2 || text.front() != '(' || text.back() != ')')
        throw malformed_spec("Predefined test " + literal + " should be enclosed in parentheses");

    string body = text.substr(1, text.size() - 2);
    test_record record;
    if (boost::trim_copy(body).empty())
        return record;
    boost::split(record, body, boost::is_any_of(","));
    for (auto &field : record)
        boost::trim(field);
    return record;
}

string render_record(const test_record &record) {
    return "(" + boost::join(record, ",") + ")";
}

}  // namespace grader
