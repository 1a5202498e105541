#include "task/subcommands.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <random>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "execute/process.hpp"
#include "execute/python_runner.hpp"
#include "generator/synthesizer.hpp"
#include "generator/test_spec.hpp"
#include "grade/grading.hpp"

namespace grader {
using namespace nlohmann;
using namespace std;
namespace fs = std::filesystem;

task_type parse_task_type(const string &name) {
    if (name == "unit")
        return task_type::UNIT;
    else if (name == "io")
        return task_type::IO;
    else
        throw internal_error("Unrecognized task type " + name + ", should be unit or io");
}

command_options::command_options(workspace work) : work(move(work)) {}

static process_options make_process_options(const command_options &options) {
    process_options result;
    result.time_limit = options.time_limit;
    result.working_dir = options.work.root;
    return result;
}

static const vector<string> &require_command(const command_options &options, const string &subcommand) {
    if (options.arguments.empty())
        throw internal_error(fmt::format("Subcommand {} requires a command after --", subcommand));
    return options.arguments;
}

static void print_report(const grading_report &report, ostream &out) {
    out << json(report).dump() << endl;
}

void preprocess(const command_options &options, istream &in) {
    string content((istreambuf_iterator<char>(in)), istreambuf_iterator<char>());
    // 输入可能以 NUL 填充
    content.erase(content.find_last_not_of('\0') + 1);

    json input;
    try {
        input = json::parse(content);
    } catch (json::exception &e) {
        throw malformed_spec(string("Task input is not valid JSON: ") + e.what());
    }
    if (!input.contains("tid") || !input.at("tid").is_string())
        throw malformed_spec("Task input should contain a string tid");

    string tid = input.at("tid").get<string>();
    options.work.reset();
    options.work.write_tid(tid);
    write_file_content(options.work.fields_file(), input.value("fields", json::object()).dump());
    LOG(INFO) << "Prepared working directory " << options.work.root << " for task " << tid;
}

void generate(const command_options &options) {
    task_spec spec = load_spec<task_spec>(options.spec_file);
    uint64_t seed = options.seed ? *options.seed : random_device{}();
    LOG(INFO) << "Generating tests for " << spec.name << " with seed " << seed;

    random_engine rng(seed);
    write_dataset(options.work.dataset_file(), synthesize(spec, rng));
}

void run_actor(const command_options &options) {
    if (options.arguments.size() != 1)
        throw internal_error("Subcommand run requires exactly one actor, student or teacher");
    const string &actor = options.arguments[0];

    task_spec spec = load_spec<task_spec>(options.spec_file);
    vector<argument_type> types;
    for (auto &arg : spec.args)
        types.push_back(arg.type);

    python_function_runner runner(options.work.actor_dir(actor), assert_safe_path(options.module), spec.name, types);
    vector<execution_outcome> outcomes = run_records(runner, read_dataset(options.work.dataset_file()));

    fs::path target = actor == "student" ? options.work.submission_outcomes_file() : options.work.reference_outcomes_file();
    write_outcomes(target, outcomes);
    LOG(INFO) << "Wrote " << outcomes.size() << " outcomes of " << actor << " to " << target;
}

void execute_unit(const command_options &options) {
    execution_outcome outcome = classify(run_process(require_command(options, "execute"), make_process_options(options)));
    if (!outcome.checked()) {
        LOG(WARNING) << "Runner of submission failed: " << outcome;
        write_once(options.work.runner_error_file(), outcome.payload);
    }
}

void feedback_unit(const command_options &options, ostream &out) {
    string tid = options.work.tid();
    if (fs::exists(options.work.runner_error_file())) {
        string diagnostic = read_file_content(options.work.runner_error_file());
        print_report(grade_runner_failure(tid, "An error occurred with your code: " + diagnostic), out);
        return;
    }

    if (!options.arguments.empty()) {
        execution_outcome outcome = classify(run_process(options.arguments, make_process_options(options)));
        if (!outcome.checked())
            throw reference_error("Runner of reference solution failed: " + outcome.payload);
    }

    // 预定义数据点位于数据集的开头，它们的提示按下标对应
    task_spec spec = load_spec<task_spec>(options.spec_file);
    vector<optional<string>> hints;
    for (auto &test : spec.predefined)
        hints.push_back(test.hint());

    test_dataset dataset = read_dataset(options.work.dataset_file());
    vector<execution_outcome> submission = read_outcomes(options.work.submission_outcomes_file());
    vector<execution_outcome> reference = read_outcomes(options.work.reference_outcomes_file());
    print_report(grade(tid, dataset, submission, reference, hints), out);
}

void execute_io(const command_options &options) {
    io_task_spec spec = load_spec<io_task_spec>(options.spec_file);

    optional<vector<string>> compile_command;
    if (options.compile)
        compile_command = vector<string>{"/bin/sh", "-c", *options.compile};
    program_driver driver(require_command(options, "execute"), make_process_options(options), compile_command);

    vector<string> inputs;
    for (auto &test : spec.predefined)
        inputs.push_back(test.input);
    vector<execution_outcome> outcomes = driver.run_all(inputs);

    write_once(options.work.results_file(), json{{"results", outcomes}}.dump());
    LOG(INFO) << "Wrote " << outcomes.size() << " results to " << options.work.results_file();
}

void feedback_io(const command_options &options, ostream &out) {
    io_task_spec spec = load_spec<io_task_spec>(options.spec_file);

    vector<execution_outcome> outcomes;
    try {
        outcomes = json::parse(read_file_content(options.work.results_file())).at("results").get<vector<execution_outcome>>();
    } catch (json::exception &e) {
        throw data_error(string("Results file is malformed: ") + e.what());
    }

    vector<expected_case> cases;
    for (auto &test : spec.predefined)
        cases.push_back({test.input, test.output, test.message});
    print_report(grade(options.work.tid(), cases, outcomes), out);
}

void test_io(const command_options &options, ostream &out) {
    execute_io(options);
    feedback_io(options, out);
}

void run_subcommand(const string &name, task_type type, const command_options &options) {
    if (name == "preprocess") {
        preprocess(options, cin);
    } else if (name == "generate") {
        if (type == task_type::UNIT)
            generate(options);
        else
            LOG(INFO) << "Input/output tasks only use predefined tests, nothing to generate";
    } else if (name == "run") {
        if (type != task_type::UNIT)
            throw internal_error("Subcommand run is only available for unit tasks");
        run_actor(options);
    } else if (name == "execute") {
        if (type == task_type::UNIT)
            execute_unit(options);
        else
            execute_io(options);
    } else if (name == "feedback") {
        if (type == task_type::UNIT)
            feedback_unit(options, cout);
        else
            feedback_io(options, cout);
    } else if (name == "test") {
        if (type != task_type::IO)
            throw internal_error("Subcommand test is only available for io tasks");
        test_io(options, cout);
    } else {
        throw internal_error("Unrecognized subcommand " + name);
    }
}

}  // namespace grader
