#include "grade/grading.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;

report_builder::report_builder(string tid) : tid(move(tid)) {}

void report_builder::match() {
    ++stats.total;
    ++stats.succeeded;
}

void report_builder::mismatch(const string &input, const string &expected, const execution_outcome &actual,
                              const optional<string> &hint) {
    ++stats.total;
    failed = true;

    if (!example) {
        example = counter_example{input, expected, nullopt};
        if (actual.checked()) example->actual = actual.payload;
    }

    if (!message) {
        if (!actual.checked())
            message = fmt::format("An error occurred with your code ({}): {}", get_status_name(actual.status), actual.payload);
        else if (hint)
            message = hint;
    }
}

grading_report report_builder::build() const {
    grading_report report;
    report.tid = tid;
    report.status = failed ? grading_status::FAILED : grading_status::SUCCESS;

    grading_feedback feedback;
    feedback.message = message;
    feedback.example = example;
    feedback.stats = stats;
    // 没有任何数据点时视为全部通过
    feedback.score = stats.total == 0 ? 1.0 : (double)stats.succeeded / stats.total;
    report.feedback = feedback;
    return report;
}

grading_report grade(const string &tid, const test_dataset &dataset,
                     const vector<execution_outcome> &submission,
                     const vector<execution_outcome> &reference,
                     const vector<optional<string>> &hints) {
    if (submission.size() != dataset.size())
        throw alignment_error(fmt::format("Dataset has {} tests but submission produced {} outcomes", dataset.size(), submission.size()));
    if (reference.size() != dataset.size())
        throw alignment_error(fmt::format("Dataset has {} tests but reference produced {} outcomes", dataset.size(), reference.size()));

    report_builder builder(tid);
    for (size_t i = 0; i < dataset.size(); ++i) {
        optional<string> hint;
        if (i < hints.size()) hint = hints[i];

        if (!reference[i].checked()) {
            LOG(WARNING) << "Reference solution failed on test " << i << " " << render_record(dataset[i]) << ": " << reference[i];
            builder.mismatch(render_record(dataset[i]), format_outcome(reference[i]), submission[i], hint);
        } else if (submission[i].checked() && submission[i].payload == reference[i].payload) {
            builder.match();
        } else {
            builder.mismatch(render_record(dataset[i]), reference[i].payload, submission[i], hint);
        }
    }

    grading_report report = builder.build();
    LOG(INFO) << "Graded " << dataset.size() << " tests, score " << report.feedback->score;
    return report;
}

grading_report grade(const string &tid, const vector<expected_case> &cases,
                     const vector<execution_outcome> &submission) {
    if (submission.size() != cases.size())
        throw alignment_error(fmt::format("Task has {} tests but submission produced {} outcomes", cases.size(), submission.size()));

    report_builder builder(tid);
    for (size_t i = 0; i < cases.size(); ++i) {
        string expected = trim_line_separators(cases[i].expected);
        if (submission[i].checked() && submission[i].payload == expected)
            builder.match();
        else
            builder.mismatch(cases[i].input, expected, submission[i], cases[i].message);
    }

    grading_report report = builder.build();
    LOG(INFO) << "Graded " << cases.size() << " tests, score " << report.feedback->score;
    return report;
}

grading_report grade_runner_failure(const string &tid, const string &message) {
    grading_report report;
    report.tid = tid;
    report.status = grading_status::FAILED;
    grading_feedback feedback;
    feedback.message = message;
    feedback.score = 0;
    report.feedback = feedback;
    return report;
}

}  // namespace grader
