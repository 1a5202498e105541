#include "common/utils.hpp"
#include <boost/algorithm/string/trim.hpp>

namespace grader {
using namespace std;

string trim_line_separators(const string &text) {
    return boost::algorithm::trim_right_copy_if(text, [](char ch) { return ch == '\n' || ch == '\r'; });
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace grader
