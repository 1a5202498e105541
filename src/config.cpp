#include "config.hpp"

namespace grader {
using namespace std;

filesystem::path WORK_DIR = "/tmp/work";
filesystem::path TASK_DIR = "/task";
int TIME_LIMIT = 10;  // 10s
bool DEBUG = false;

}  // namespace grader
