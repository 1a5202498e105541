#include "execute/runner.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

vector<execution_outcome> run_records(function_runner &runner, const test_dataset &dataset) {
    vector<execution_outcome> outcomes;
    outcomes.reserve(dataset.size());
    for (size_t i = 0; i < dataset.size(); ++i) {
        try {
            outcomes.push_back(runner.call(dataset[i]));
        } catch (grader_exception &) {
            throw;
        } catch (exception &e) {
            LOG(WARNING) << "Test " << i << " raised an exception: " << e.what();
            outcomes.push_back({outcome_status::EXCEPTION, e.what()});
        }
        DLOG(INFO) << "Test " << i << ": " << outcomes.back();
    }
    return outcomes;
}

}  // namespace grader
