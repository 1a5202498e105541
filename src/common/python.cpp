#include "common/python.hpp"

namespace grader {

python_interpreter::python_interpreter(const char *name) {
    program_name = Py_DecodeLocale(name, nullptr);
    Py_SetProgramName(program_name);
    Py_Initialize();
}

GIL_guard::GIL_guard() {
    state = PyGILState_Ensure();
}

GIL_guard::~GIL_guard() {
    PyGILState_Release(state);
}

}  // namespace grader
