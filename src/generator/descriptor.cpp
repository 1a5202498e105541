#include "generator/descriptor.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <cmath>
#include <regex>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"

namespace grader {
using namespace std;

static const double FLOAT_SCALE = 1e6;
static const double MAX_EXACT_STEPS = 9007199254740992.0;
static const char ALPHABET[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

static const regex int_regex(R"(^int\((-?[0-9]+),(-?[0-9]+)\)$)");
static const regex float_regex(R"(^float\((-?[0-9]+(?:\.[0-9]+)?),(-?[0-9]+(?:\.[0-9]+)?)\)$)");
static const regex bool_regex(R"(^bool$)");
static const regex string_regex(R"(^str\(([0-9]+),([0-9]+)\)$)");
static const regex enum_regex(R"(^enum\((.+)\)$)");

/**
 * @brief 最小的 k，使得 k / FLOAT_SCALE >= value
 * 乘法的舍入误差可能使 ceil 的结果偏离一步，用除法的结果校正
 */
static double first_step_not_below(double value) {
    double steps = ceil(value * FLOAT_SCALE);
    // 超出 double 能精确表示的整数范围时无法按步校正
    if (!(fabs(steps) < MAX_EXACT_STEPS)) return steps;
    while ((steps - 1) / FLOAT_SCALE >= value) --steps;
    while (steps / FLOAT_SCALE < value) ++steps;
    return steps;
}

template <typename T>
static T parse_bound(const string &text, const string &descriptor) {
    try {
        return boost::lexical_cast<T>(text);
    } catch (boost::bad_lexical_cast &) {
        throw malformed_descriptor(fmt::format("Bound {} of generator {} is out of range", text, descriptor));
    }
}

generator_descriptor parse_descriptor(const string &text) {
    smatch matches;
    if (regex_match(text, matches, int_regex)) {
        int_descriptor desc{parse_bound<long long>(matches[1], text), parse_bound<long long>(matches[2], text)};
        if (desc.min > desc.max)
            throw malformed_descriptor(fmt::format("Lower bound of generator {} is greater than upper bound", text));
        return desc;
    } else if (regex_match(text, matches, float_regex)) {
        float_descriptor desc{parse_bound<double>(matches[1], text), parse_bound<double>(matches[2], text)};
        if (desc.min > desc.max)
            throw malformed_descriptor(fmt::format("Lower bound of generator {} is greater than upper bound", text));
        return desc;
    } else if (regex_match(text, bool_regex)) {
        return bool_descriptor{};
    } else if (regex_match(text, matches, string_regex)) {
        string_descriptor desc{parse_bound<size_t>(matches[1], text), parse_bound<size_t>(matches[2], text)};
        if (desc.min_length > desc.max_length)
            throw malformed_descriptor(fmt::format("Minimum length of generator {} is greater than maximum length", text));
        return desc;
    } else if (regex_match(text, matches, enum_regex)) {
        enum_descriptor desc;
        string values = matches[1].str();
        boost::split(desc.values, values, boost::is_any_of(","));
        return desc;
    } else {
        throw malformed_descriptor("Unrecognized generator " + text);
    }
}

vector<generator_descriptor> parse_descriptors(const vector<string> &texts) {
    vector<generator_descriptor> descriptors;
    for (size_t i = 0; i < texts.size(); ++i) {
        try {
            descriptors.push_back(parse_descriptor(texts[i]));
        } catch (malformed_descriptor &e) {
            throw malformed_descriptor(fmt::format("Argument {}: {}", i, e.what()));
        }
    }
    return descriptors;
}

string generate(const generator_descriptor &descriptor, random_engine &rng) {
    return visit(overloaded{
                     [&](const int_descriptor &desc) {
                         uniform_int_distribution<long long> dist(desc.min, desc.max);
                         return to_string(dist(rng));
                     },
                     [&](const float_descriptor &desc) {
                         // 输出保留六位小数，按 1e-6 的步数取值，保证输出的值仍在 [min,max) 中
                         double lower = first_step_not_below(desc.min), upper = first_step_not_below(desc.max) - 1;
                         if (lower > upper)
                             return fmt::format("{:f}", desc.min);
                         uniform_real_distribution<double> dist(desc.min, desc.max);
                         double steps = clamp(floor(dist(rng) * FLOAT_SCALE), lower, upper);
                         return fmt::format("{:f}", steps / FLOAT_SCALE);
                     },
                     [&](const bool_descriptor &) {
                         bernoulli_distribution dist(0.5);
                         return string(dist(rng) ? "true" : "false");
                     },
                     [&](const string_descriptor &desc) {
                         uniform_int_distribution<size_t> length(desc.min_length, desc.max_length);
                         uniform_int_distribution<size_t> index(0, sizeof(ALPHABET) - 2);
                         string result(length(rng), ' ');
                         for (char &ch : result)
                             ch = ALPHABET[index(rng)];
                         return result;
                     },
                     [&](const enum_descriptor &desc) {
                         uniform_int_distribution<size_t> index(0, desc.values.size() - 1);
                         return desc.values[index(rng)];
                     }},
                 descriptor);
}

}  // namespace grader
