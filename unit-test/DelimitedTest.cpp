#include "common/delimited.hpp"
#include "common/exceptions.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace grader;

TEST(DelimitedTest, PlainFieldsTest) {
    EXPECT_EQ(format_record({"1", "2", "abc"}), "1;2;abc");
    EXPECT_EQ(parse_record("1;2;abc"), (vector<string>{"1", "2", "abc"}));
}

TEST(DelimitedTest, QuotedFieldsTest) {
    EXPECT_EQ(format_record({"a;b", "c"}), "\"a;b\";c");
    EXPECT_EQ(format_record({"say \"hi\"", "x"}), R"("say ""hi""";x)");
    EXPECT_EQ(format_record({"back\\slash"}), "back\\slash");
    EXPECT_EQ(format_record({" padded"}), "\" padded\"");
    EXPECT_EQ(parse_record(R"("a;b";"say ""hi""")"), (vector<string>{"a;b", "say \"hi\""}));
}

// 由 Go encoding/csv (Comma = ';') 写出的数据集
TEST(DelimitedTest, StandardCsvTest) {
    string content = "plain;\"say \"\"hi\"\"\";x\n"
                     "\"two\nlines\";\"a;b\";\\n\n"
                     ";;\r\n";
    vector<vector<string>> records = parse_records(content);
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0], (vector<string>{"plain", "say \"hi\"", "x"}));
    EXPECT_EQ(records[1], (vector<string>{"two\nlines", "a;b", "\\n"}));
    EXPECT_EQ(records[2], (vector<string>{"", "", ""}));
}

TEST(DelimitedTest, RoundTripTest) {
    vector<vector<string>> records = {
        {"a,b", "", "c;d"},
        {"e\"f", "g\\h", "line\nbreak"},
        {"", ""},
        {""},
        {},
        {"  padded  ", ",", ";"},
    };
    string content;
    for (auto &record : records) {
        EXPECT_EQ(parse_record(format_record(record)), record) << format_record(record);
        content += format_record(record) + "\n";
    }
    EXPECT_EQ(parse_records(content), records);
}

TEST(DelimitedTest, EmptyLineIsEmptyRecordTest) {
    EXPECT_TRUE(parse_record("").empty());
    EXPECT_EQ(parse_record("\"\""), (vector<string>{""}));
    EXPECT_TRUE(parse_records("").empty());
    EXPECT_EQ(parse_records("\n1\n"), (vector<vector<string>>{{}, {"1"}}));
}

TEST(DelimitedTest, MalformedTest) {
    EXPECT_THROW(parse_record("\"abc"), data_error);
    EXPECT_THROW(parse_record("\"abc\"d;e"), data_error);
    EXPECT_THROW(parse_record("ab\"c"), data_error);
    EXPECT_THROW(parse_record("a\nb"), data_error);
}
