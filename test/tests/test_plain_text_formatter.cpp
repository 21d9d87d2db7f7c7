#include <gtest/gtest.h>
#include "stencil_log.hpp"
#include "utils/test_utils.hpp"
#include <string>

using stencil::FieldMap;
using stencil::FormatterConfiguration;
using stencil::LogLevel;

class PlainTextFormatterTest : public ::testing::Test {
protected:
    const std::string timePair = R"(time="2026-02-16T12:34:56Z")";
};

TEST_F(PlainTextFormatterTest, LogfmtLineWithSortedFields) {
    stencil::PlainTextFormatter formatter;
    auto record = TestUtils::makeRecord(LogLevel::INFO, "user logged in",
        FieldMap{{"region", "us-east"}, {"count", 3}});
    EXPECT_EQ(formatter.format(record),
              timePair + R"( level=info msg="user logged in" count=3 region=us-east)" + "\n");
}

TEST_F(PlainTextFormatterTest, EmptyMessageStaysBare) {
    stencil::PlainTextFormatter formatter;
    auto record = TestUtils::makeRecord(LogLevel::WARN, "");
    EXPECT_EQ(formatter.format(record), timePair + " level=warn msg=\n");
}

TEST_F(PlainTextFormatterTest, QuotesAndEscapesSpecialValues) {
    stencil::PlainTextFormatter formatter;
    auto record = TestUtils::makeRecord(LogLevel::ERROR, R"(say "hi")",
        FieldMap{{"cfg", FieldMap{{"a", 1}}}, {"path", "/var/log"}});
    EXPECT_EQ(formatter.format(record),
              timePair + R"( level=error msg="say \"hi\"" cfg="map[a:1]" path=/var/log)" + "\n");
}

TEST_F(PlainTextFormatterTest, QuotedValuesUseJsonEscapes) {
    stencil::PlainTextFormatter formatter;
    auto record = TestUtils::makeRecord(LogLevel::INFO, std::string("a\x01" "b"),
        FieldMap{{"bad", std::string("x\xff")}, {"tab", "a\tb"}});
    EXPECT_EQ(formatter.format(record),
              timePair + R"( level=info msg="a\u0001b" bad="x)" "\xEF\xBF\xBD" R"(" tab="a\tb")" + "\n");
}

TEST_F(PlainTextFormatterTest, RequestIdIsAnOrdinaryField) {
    stencil::PlainTextFormatter formatter;
    auto record = TestUtils::makeRecord(LogLevel::DEBUG, "x", FieldMap{{"X-Request-ID", "abc123"}});
    EXPECT_EQ(formatter.format(record), timePair + " level=debug msg=x X-Request-ID=abc123\n");
}

TEST_F(PlainTextFormatterTest, EmptyTemplateFallsBackToPlainText) {
    auto record = TestUtils::makeRecord(LogLevel::INFO, "hello", FieldMap{{"region", "eu"}});
    std::string expected = timePair + " level=info msg=hello region=eu\n";

    EXPECT_EQ(FormatterConfiguration().build().format(record), expected);
    EXPECT_EQ(FormatterConfiguration().jsonOutput().build().format(record), expected);
    EXPECT_EQ(FormatterConfiguration::defaults().logTemplate("").build().format(record), expected);
}

TEST_F(PlainTextFormatterTest, IgnoresTimeLayout) {
    auto formatter = FormatterConfiguration().timeLayout("%H:%M").build();
    auto record = TestUtils::makeRecord(LogLevel::INFO, "hello");
    EXPECT_EQ(formatter.format(record), timePair + " level=info msg=hello\n");
}
