#include "execute/python_runner.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include "common/exceptions.hpp"
#include "common/python.hpp"

namespace grader {
namespace bp = boost::python;
using namespace std;

/**
 * @brief 取出当前的 Python 异常，格式为 "类型: 信息"，并清除异常状态
 */
static string fetch_python_error() {
    PyObject *type = nullptr, *value = nullptr, *traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    bp::handle<> htype(bp::allow_null(type)), hvalue(bp::allow_null(value)), htraceback(bp::allow_null(traceback));
    if (!htype) return "Unknown error";

    string name = bp::extract<string>(bp::object(htype).attr("__name__"));
    if (!hvalue) return name;
    string message = bp::extract<string>(bp::str(bp::object(hvalue)));
    return message.empty() ? name : name + ": " + message;
}

static bp::object to_python(const string &field, argument_type type) {
    switch (type) {
        case argument_type::INT:
            return bp::object(boost::lexical_cast<long long>(field));
        case argument_type::FLOAT:
            return bp::object(boost::lexical_cast<double>(field));
        case argument_type::BOOL:
            if (field == "true") return bp::object(true);
            if (field == "false") return bp::object(false);
            throw invalid_argument("Invalid boolean value " + field);
        case argument_type::STRING:
        case argument_type::ENUM:
        default:
            return bp::str(field);
    }
}

static string from_python(const bp::object &result) {
    if (PyBool_Check(result.ptr()))
        return result.ptr() == Py_True ? "true" : "false";
    return bp::extract<string>(bp::str(result));
}

python_function_runner::python_function_runner(const filesystem::path &directory, const string &module,
                                               const string &function_name, vector<argument_type> types)
    : types(move(types)) {
    GIL_guard guard;
    try {
        bp::object sys = bp::import("sys");
        sys.attr("path").attr("insert")(0, directory.string());
        bp::object mod = bp::import(bp::str(module));
        function = mod.attr(function_name.c_str());
    } catch (bp::error_already_set &) {
        throw execution_error(fmt::format("Unable to load {}.{} from {}: {}", module, function_name, directory.string(), fetch_python_error()));
    }
    LOG(INFO) << "Loaded function " << function_name << " from " << (directory / (module + ".py"));
}

execution_outcome python_function_runner::call(const test_record &record) {
    if (!types.empty() && record.size() != types.size())
        throw data_error(fmt::format("Test has {} fields but the function takes {} arguments", record.size(), types.size()));

    GIL_guard guard;
    try {
        bp::list args;
        for (size_t i = 0; i < record.size(); ++i) {
            if (types.empty())
                args.append(bp::str(record[i]));
            else
                args.append(to_python(record[i], types[i]));
        }

        bp::tuple arguments(args);
        bp::object result(bp::handle<>(PyObject_CallObject(function.ptr(), arguments.ptr())));
        return {outcome_status::CHECKED, from_python(result)};
    } catch (bp::error_already_set &) {
        return {outcome_status::EXCEPTION, fetch_python_error()};
    }
}

}  // namespace grader
