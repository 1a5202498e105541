#pragma once

#include <Python.h>

namespace grader {

/**
 * @brief 初始化嵌入的 Python 解释器
 * 整个进程只应该存在一个实例。Boost.Python 不支持 Py_Finalize，
 * 因此解释器一直存活到进程退出。
 */
class python_interpreter {
public:
    explicit python_interpreter(const char *program_name);

private:
    wchar_t *program_name;
};

class GIL_guard {
public:
    GIL_guard();
    ~GIL_guard();

private:
    PyGILState_STATE state;
};

}  // namespace grader
