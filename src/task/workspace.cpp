#include "task/workspace.hpp"
#include <boost/algorithm/string/trim.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

workspace::workspace(fs::path root) : root(move(root)) {}

fs::path workspace::tid_file() const { return root / "tid"; }

fs::path workspace::dataset_file() const { return root / "input" / "data.csv"; }

fs::path workspace::submission_outcomes_file() const { return root / "output" / "data.res"; }

fs::path workspace::reference_outcomes_file() const { return root / "output" / "solution.res"; }

fs::path workspace::runner_error_file() const { return root / "output" / "out.err"; }

fs::path workspace::results_file() const { return root / "output" / "res.json"; }

fs::path workspace::fields_file() const { return root / "student" / "fields.json"; }

fs::path workspace::actor_dir(const string &actor) const {
    if (actor != "student" && actor != "teacher")
        throw internal_error("Unknown actor " + actor + ", should be student or teacher");
    return root / actor;
}

void workspace::reset() const {
    fs::remove_all(root);
    for (const char *dir : {"input", "output", "student", "teacher"})
        fs::create_directories(root / dir);
}

void workspace::write_tid(const string &tid) const {
    write_once(tid_file(), tid);
}

string workspace::tid() const {
    if (!fs::exists(tid_file()))
        throw data_error("Task id marker " + tid_file().string() + " does not exist, run preprocess first");
    return boost::algorithm::trim_copy(read_file_content(tid_file()));
}

}  // namespace grader
