#include <map>
#include <regex>
#include "common/exceptions.hpp"
#include "generator/descriptor.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace grader;

class DescriptorTest : public ::testing::Test {
protected:
    random_engine rng{20240901};
};

TEST_F(DescriptorTest, ParseIntTest) {
    auto desc = get<int_descriptor>(parse_descriptor("int(-5,12)"));
    EXPECT_EQ(desc.min, -5);
    EXPECT_EQ(desc.max, 12);

    auto zero = get<int_descriptor>(parse_descriptor("int(0,0)"));
    EXPECT_EQ(zero.min, 0);
    EXPECT_EQ(zero.max, 0);
}

TEST_F(DescriptorTest, ParseOtherKindsTest) {
    auto f = get<float_descriptor>(parse_descriptor("float(-1.5,2)"));
    EXPECT_DOUBLE_EQ(f.min, -1.5);
    EXPECT_DOUBLE_EQ(f.max, 2);

    EXPECT_TRUE(holds_alternative<bool_descriptor>(parse_descriptor("bool")));

    auto s = get<string_descriptor>(parse_descriptor("str(0,8)"));
    EXPECT_EQ(s.min_length, 0u);
    EXPECT_EQ(s.max_length, 8u);

    auto e = get<enum_descriptor>(parse_descriptor("enum(red,green,blue)"));
    EXPECT_EQ(e.values, (vector<string>{"red", "green", "blue"}));
}

TEST_F(DescriptorTest, MalformedTest) {
    for (const char *text : {"", "int", "int(1,2", "Int(1,2)", "int(1, 2)", "int(5,1)",
                             "float(a,b)", "float(3,1)", "str(-1,2)", "str(4,2)", "enum()",
                             "boolean", "int(99999999999999999999,1)"}) {
        EXPECT_THROW(parse_descriptor(text), malformed_descriptor) << text;
    }
}

TEST_F(DescriptorTest, ParseListReportsIndexTest) {
    try {
        parse_descriptors({"int(1,2)", "nonsense"});
        FAIL() << "malformed_descriptor expected";
    } catch (malformed_descriptor &e) {
        EXPECT_NE(string(e.what()).find("Argument 1"), string::npos) << e.what();
    }
}

TEST_F(DescriptorTest, IntRangeAndUniformityTest) {
    auto desc = parse_descriptor("int(1,10)");
    map<long long, int> counts;
    const int samples = 10000;
    for (int i = 0; i < samples; ++i) {
        long long value = stoll(generate(desc, rng));
        ASSERT_GE(value, 1);
        ASSERT_LE(value, 10);
        ++counts[value];
    }

    ASSERT_EQ(counts.size(), 10u);
    double expected = samples / 10.0, chi_square = 0;
    for (auto &[value, count] : counts)
        chi_square += (count - expected) * (count - expected) / expected;
    // 自由度为 9，显著性水平 0.001 的临界值
    EXPECT_LT(chi_square, 27.88);
}

TEST_F(DescriptorTest, NegativeIntTest) {
    auto desc = parse_descriptor("int(-3,-1)");
    for (int i = 0; i < 1000; ++i) {
        long long value = stoll(generate(desc, rng));
        EXPECT_GE(value, -3);
        EXPECT_LE(value, -1);
    }
}

TEST_F(DescriptorTest, FloatFormatTest) {
    static const regex fixed(R"(^-?[0-9]+\.[0-9]{6}$)");
    auto desc = parse_descriptor("float(-2.5,2.5)");
    for (int i = 0; i < 1000; ++i) {
        string text = generate(desc, rng);
        EXPECT_TRUE(regex_match(text, fixed)) << text;
        double value = stod(text);
        EXPECT_GE(value, -2.5);
        EXPECT_LT(value, 2.5);
    }

    EXPECT_EQ(generate(parse_descriptor("float(1.5,1.5)"), rng), "1.500000");
}

TEST_F(DescriptorTest, FloatUpperBoundIsExclusiveTest) {
    auto narrow = parse_descriptor("float(0,0.000001)");
    for (int i = 0; i < 1000; ++i)
        EXPECT_EQ(generate(narrow, rng), "0.000000");

    auto unit = parse_descriptor("float(0.999998,1)");
    for (int i = 0; i < 1000; ++i) {
        string text = generate(unit, rng);
        EXPECT_TRUE(text == "0.999998" || text == "0.999999") << text;
    }

    // 区间内没有六位小数能表示的值
    EXPECT_EQ(generate(parse_descriptor("float(0.0000001,0.0000002)"), rng), "0.000000");
}

TEST_F(DescriptorTest, BoolTest) {
    auto desc = parse_descriptor("bool");
    int trues = 0;
    for (int i = 0; i < 1000; ++i) {
        string value = generate(desc, rng);
        ASSERT_TRUE(value == "true" || value == "false") << value;
        trues += value == "true";
    }
    EXPECT_GT(trues, 400);
    EXPECT_LT(trues, 600);
}

TEST_F(DescriptorTest, StringLengthAndAlphabetTest) {
    auto desc = parse_descriptor("str(2,7)");
    for (int i = 0; i < 10000; ++i) {
        string value = generate(desc, rng);
        ASSERT_GE(value.size(), 2u);
        ASSERT_LE(value.size(), 7u);
        for (char ch : value)
            ASSERT_TRUE(isalnum((unsigned char)ch)) << value;
    }

    EXPECT_EQ(generate(parse_descriptor("str(0,0)"), rng), "");
}

TEST_F(DescriptorTest, EnumFrequencyTest) {
    auto desc = parse_descriptor("enum(x,y,z)");
    map<string, int> counts;
    for (int i = 0; i < 9000; ++i)
        ++counts[generate(desc, rng)];

    ASSERT_EQ(counts.size(), 3u);
    for (auto &[value, count] : counts) {
        EXPECT_TRUE(value == "x" || value == "y" || value == "z") << value;
        EXPECT_GT(count, 2700) << value;
        EXPECT_LT(count, 3300) << value;
    }
}

TEST_F(DescriptorTest, SeededGenerationIsReproducibleTest) {
    auto desc = parse_descriptor("str(1,20)");
    random_engine a(7), b(7);
    for (int i = 0; i < 100; ++i)
        EXPECT_EQ(generate(desc, a), generate(desc, b));
}
