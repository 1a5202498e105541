#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <memory>
#include "common/exceptions.hpp"
#include "common/python.hpp"
#include "config.hpp"
#include "task/subcommands.hpp"
using namespace std;

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    // 标准输出只用于输出评测报告
    FLAGS_logtostderr = true;

    namespace po = boost::program_options;
    po::options_description desc("grader options");
    po::options_description hidden;
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("type", po::value<string>()->default_value("unit"), "set the task type, unit for unit-testing tasks, io for input/output tasks")
        ("work-dir", po::value<string>(), "set the working directory of this grading attempt, default to /tmp/work. You can either pass it from environ WORKDIR")
        ("task-dir", po::value<string>(), "set the task directory containing config/test.json, default to /task. You can either pass it from environ TASKDIR")
        ("spec", po::value<string>(), "set the test configuration file, default to <task-dir>/config/test.json")
        ("time-limit", po::value<int>(), "set wall time limit in seconds for each external command, default to 10, 0 for unlimited. You can either pass it from environ TIMELIMIT")
        ("seed", po::value<uint64_t>(), "set the seed for generating random tests")
        ("compile", po::value<string>(), "set the compile command of io tasks, executed by /bin/sh -c in the working directory")
        ("module", po::value<string>()->default_value("program"), "set the Python module containing the function under test")
        ("debug", "turn on the debug mode to print stack traces of errors")
        ("help", "display this help text")
        ("version", "display version of this application");

    hidden.add_options()
        ("subcommand", po::value<string>(), "preprocess, generate, run, execute, feedback or test")
        ("arguments", po::value<vector<string>>(), "arguments of the subcommand");
    // clang-format on

    positional.add("subcommand", 1).add("arguments", -1);

    po::options_description all;
    all.add(desc).add(hidden);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "grader: generate tests, run submissions and grade them" << endl
             << "Usage: " << argv[0] << " <subcommand> [options] [-- command...]" << endl
             << "Subcommands:" << endl
             << "\tpreprocess: read {\"tid\", \"fields\"} from stdin and prepare the working directory" << endl
             << "\tgenerate: synthesize the test dataset (unit)" << endl
             << "\trun <student|teacher>: call the function under test for each test (unit)" << endl
             << "\texecute -- <command...>: run the submission" << endl
             << "\tfeedback [-- <command...>]: run the reference solution (unit) and print the grading report" << endl
             << "\ttest -- <command...>: execute and feedback in one step (io)" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "grader 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug")) {
        grader::DEBUG = true;
    } else if (getenv("DEBUG")) {
        grader::DEBUG = true;
    }

    if (!vm.count("subcommand")) {
        cerr << "Missing subcommand" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("work-dir")) {
        grader::WORK_DIR = filesystem::path(vm.at("work-dir").as<string>());
    } else if (getenv("WORKDIR")) {
        grader::WORK_DIR = filesystem::path(getenv("WORKDIR"));
    }

    if (vm.count("task-dir")) {
        grader::TASK_DIR = filesystem::path(vm.at("task-dir").as<string>());
    } else if (getenv("TASKDIR")) {
        grader::TASK_DIR = filesystem::path(getenv("TASKDIR"));
    }

    try {
        if (vm.count("time-limit")) {
            grader::TIME_LIMIT = vm["time-limit"].as<int>();
        } else if (getenv("TIMELIMIT")) {
            grader::TIME_LIMIT = boost::lexical_cast<int>(getenv("TIMELIMIT"));
        }
    } catch (boost::bad_lexical_cast& e) {
        cerr << "TIMELIMIT should be an integer" << endl;
        return EXIT_FAILURE;
    }

    string subcommand = vm["subcommand"].as<string>();

    // run 的标准错误会原样作为学生看到的错误信息，只保留下面输出的诊断信息
    if (subcommand == "run" && !grader::DEBUG)
        FLAGS_minloglevel = google::GLOG_FATAL;

    grader::command_options options{grader::workspace(grader::WORK_DIR)};
    options.spec_file = vm.count("spec") ? filesystem::path(vm["spec"].as<string>()) : grader::TASK_DIR / "config" / "test.json";
    options.time_limit = chrono::seconds(grader::TIME_LIMIT);
    options.module = vm["module"].as<string>();
    if (vm.count("seed")) options.seed = vm["seed"].as<uint64_t>();
    if (vm.count("compile")) options.compile = vm["compile"].as<string>();
    if (vm.count("arguments")) options.arguments = vm["arguments"].as<vector<string>>();

    // 只有在进程内调用被测函数时才需要 Python 解释器
    unique_ptr<grader::python_interpreter> interpreter;
    if (subcommand == "run")
        interpreter = make_unique<grader::python_interpreter>(argv[0]);

    try {
        grader::run_subcommand(subcommand, grader::parse_task_type(vm["type"].as<string>()), options);
    } catch (grader::grader_exception& e) {
        LOG(ERROR) << "Subcommand " << subcommand << " failed: " << e.what();
        if (grader::DEBUG) LOG(ERROR) << e;
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    } catch (std::exception& e) {
        LOG(ERROR) << "Subcommand " << subcommand << " failed: " << e.what();
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
