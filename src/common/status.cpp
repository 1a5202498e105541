#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<outcome_status, const char *> status_string = boost::assign::map_list_of
    (outcome_status::CHECKED, "checked")
    (outcome_status::ERROR, "error")
    (outcome_status::EXCEPTION, "exception")
    (outcome_status::TIMED_OUT, "timeout");

static const unordered_map<string, outcome_status> status_value = boost::assign::map_list_of
    ("checked", outcome_status::CHECKED)
    ("error", outcome_status::ERROR)
    ("exception", outcome_status::EXCEPTION)
    ("timeout", outcome_status::TIMED_OUT);
// clang-format on

const char *get_status_name(outcome_status status) {
    return status_string.at(status);
}

outcome_status parse_status_name(const string &name) {
    auto it = status_value.find(name);
    if (it == status_value.end())
        throw data_error("Unrecognized outcome status " + name);
    return it->second;
}

}  // namespace grader
