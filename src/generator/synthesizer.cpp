#include "generator/synthesizer.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/delimited.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader {
using namespace std;

test_dataset synthesize(const task_spec &spec, random_engine &rng) {
    validate(spec);

    test_dataset dataset;
    for (size_t i = 0; i < spec.predefined.size(); ++i) {
        test_record record = parse_literal_record(spec.predefined[i].data);
        if (!spec.args.empty() && record.size() != spec.args.size())
            throw malformed_spec(fmt::format("Predefined test {} has {} fields but function {} declares {} arguments",
                                             i, record.size(), spec.name, spec.args.size()));
        dataset.push_back(move(record));
    }

    vector<generator_descriptor> generators = parse_descriptors(spec.random.args);
    for (int i = 0; i < spec.random.n; ++i) {
        test_record record;
        for (auto &generator : generators)
            record.push_back(generate(generator, rng));
        dataset.push_back(move(record));
    }

    LOG(INFO) << "Synthesized " << dataset.size() << " tests (" << spec.predefined.size()
              << " predefined, " << spec.random.n << " random)";
    return dataset;
}

void write_dataset(const filesystem::path &path, const test_dataset &dataset) {
    string content;
    for (auto &record : dataset)
        content += format_record(record) + "\n";
    write_once(path, content);
}

test_dataset read_dataset(const filesystem::path &path) {
    return parse_records(read_file_content(path));
}

}  // namespace grader
