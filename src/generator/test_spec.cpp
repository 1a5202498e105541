#include "generator/test_spec.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "generator/descriptor.hpp"

namespace grader {
using namespace nlohmann;
using namespace std;

argument_type parse_argument_type(const string &name) {
    if (name == "int")
        return argument_type::INT;
    else if (name == "float")
        return argument_type::FLOAT;
    else if (name == "bool")
        return argument_type::BOOL;
    else if (name == "string")
        return argument_type::STRING;
    else if (name == "enum")
        return argument_type::ENUM;
    else
        throw malformed_spec("Unrecognized argument type " + name);
}

void from_json(const json &j, argument &arg) {
    j.at("name").get_to(arg.name);
    arg.type = parse_argument_type(j.at("type").get<string>());
}

void from_json(const json &j, predefined_test &test) {
    j.at("data").get_to(test.data);
    if (exists(j, "feedback"))
        j.at("feedback").get_to(test.feedback);
}

optional<string> predefined_test::hint() const {
    auto it = feedback.find("message");
    if (it == feedback.end()) return nullopt;
    return it->second;
}

void from_json(const json &j, random_tests &tests) {
    tests.n = j.value("n", 0);
    if (exists(j, "args"))
        j.at("args").get_to(tests.args);
}

void from_json(const json &j, task_spec &spec) {
    spec.name = j.value("name", "");
    if (exists(j, "args"))
        j.at("args").get_to(spec.args);
    if (exists(j, "predefined"))
        j.at("predefined").get_to(spec.predefined);
    if (exists(j, "random"))
        j.at("random").get_to(spec.random);
}

/**
 * @brief 生成器产生的值能否作为该类型的参数
 */
static bool generates(const generator_descriptor &descriptor, argument_type type) {
    switch (type) {
        case argument_type::INT:
            return holds_alternative<int_descriptor>(descriptor);
        case argument_type::FLOAT:
            return holds_alternative<float_descriptor>(descriptor) || holds_alternative<int_descriptor>(descriptor);
        case argument_type::BOOL:
            return holds_alternative<bool_descriptor>(descriptor);
        case argument_type::STRING:
            return holds_alternative<string_descriptor>(descriptor) || holds_alternative<enum_descriptor>(descriptor);
        case argument_type::ENUM:
            return holds_alternative<enum_descriptor>(descriptor);
        default:
            return false;
    }
}

void validate(const task_spec &spec) {
    if (spec.random.n < 0)
        throw malformed_spec(fmt::format("Number of random tests should not be negative, got {}", spec.random.n));
    if (spec.args.empty() || spec.random.n == 0) return;

    if (spec.random.args.size() != spec.args.size())
        throw malformed_spec(fmt::format("Function {} declares {} arguments but {} generators are given",
                                         spec.name, spec.args.size(), spec.random.args.size()));

    vector<generator_descriptor> generators = parse_descriptors(spec.random.args);
    for (size_t i = 0; i < generators.size(); ++i)
        if (!generates(generators[i], spec.args[i].type))
            throw malformed_spec(fmt::format("Argument {} of function {} cannot be generated by {}",
                                             spec.args[i].name, spec.name, spec.random.args[i]));
}

void from_json(const json &j, io_test &test) {
    j.at("input").get_to(test.input);
    j.at("output").get_to(test.output);
    test.message = get_optional<string>(j, "message");
}

void from_json(const json &j, io_task_spec &spec) {
    if (exists(j, "predefined"))
        j.at("predefined").get_to(spec.predefined);
}

template <typename SpecT>
SpecT load_spec(const filesystem::path &path) {
    string content = read_file_content(path);
    try {
        return json::parse(content).get<SpecT>();
    } catch (json::exception &e) {
        throw malformed_spec(fmt::format("Test configuration {} is malformed: {}", path.string(), e.what()));
    }
}

template task_spec load_spec<task_spec>(const filesystem::path &path);
template io_task_spec load_spec<io_task_spec>(const filesystem::path &path);

}  // namespace grader
