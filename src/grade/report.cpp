#include "grade/report.hpp"

namespace grader {
using namespace nlohmann;
using namespace std;

void to_json(json &j, const counter_example &example) {
    j = {{"input", example.input},
         {"expected", example.expected}};
    if (example.actual) j["actual"] = *example.actual;
}

void to_json(json &j, const grading_stats &stats) {
    j = {{"succeeded", stats.succeeded},
         {"total", stats.total}};
}

void to_json(json &j, const grading_feedback &feedback) {
    j = {{"score", feedback.score}};
    if (feedback.message) j["message"] = *feedback.message;
    if (feedback.example) j["example"] = *feedback.example;
    if (feedback.stats) j["stats"] = *feedback.stats;
}

void to_json(json &j, const grading_report &report) {
    j = {{"tid", report.tid},
         {"status", report.status == grading_status::SUCCESS ? "success" : "failed"}};
    if (report.feedback) j["feedback"] = *report.feedback;
}

}  // namespace grader
