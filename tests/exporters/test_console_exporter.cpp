/*
 * test_console_exporter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-10

Description: Tests for ConsoleExporter and the shared line format

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "core/exception.hpp"
#include "exporters/console_exporter.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace otellogger;

namespace {

// JSON escape sequence for a code point given as four hex digits
auto jsonEscape(const std::string& hex) -> std::string {
    return std::string(1, '\x5c') + "u" + hex;
}

}  // namespace

class ConsoleExporterTest : public ::testing::Test {
protected:
    LogEntry createEntry(const std::string& message, Level level,
                         Attributes attributes) {
        LogEntry entry;
        entry.timestamp = "10.03.2025 17:00:00";
        entry.level = level;
        entry.message = message;
        entry.logger_name = "OTelLogger";
        entry.service_name = "Default";
        entry.trace_id = "1234567890";
        entry.span_id = "00000000000";
        entry.attributes = std::move(attributes);
        return entry;
    }

    std::ostringstream out_;
};

TEST_F(ConsoleExporterTest, FormatLogLine) {
    auto line =
        formatLogLine(createEntry("test message 1", Level::INFO, {{"key1", "val1"}}));

    EXPECT_EQ(line,
              "[INFO] [10.03.2025 17:00:00] "
              R"({"Timestamp":"10.03.2025 17:00:00","Severity":"INFO",)"
              R"("Message":"test message 1","LoggerName":"OTelLogger",)"
              R"("ServiceName":"Default","TraceID":"1234567890",)"
              R"("SpanID":"00000000000","Attributes":{"key1":"val1"}})"
              "\n");
}

TEST_F(ConsoleExporterTest, WritesOneLinePerEntry) {
    ConsoleExporter exporter(out_);
    std::vector<LogEntry> entries{
        createEntry("test message 1", Level::INFO, {{"key1", "val1"}}),
        createEntry("test message 2", Level::ERROR, {{"key2", "val2"}})};

    exporter.exportLogs("1234567890", entries, std::nullopt);

    EXPECT_EQ(out_.str(), formatLogLine(entries[0]) + formatLogLine(entries[1]));
    EXPECT_THAT(out_.str(), ::testing::StartsWith("[INFO] "));
    EXPECT_THAT(out_.str(),
                ::testing::HasSubstr("\n[ERROR] [10.03.2025 17:00:00] "));
}

TEST_F(ConsoleExporterTest, IgnoresConfig) {
    ConsoleExporter exporter(out_);
    std::vector<LogEntry> entries{createEntry("msg", Level::WARNING, {})};

    exporter.exportLogs("1234567890", entries,
                        ExporterConfig{{"filepath", "/nowhere"}});

    EXPECT_EQ(out_.str(), formatLogLine(entries[0]));
}

TEST_F(ConsoleExporterTest, EmptyEntriesWriteNothing) {
    ConsoleExporter exporter(out_);
    exporter.exportLogs("1234567890", {}, std::nullopt);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(ConsoleExporterTest, FailedStreamThrows) {
    out_.setstate(std::ios::badbit);
    ConsoleExporter exporter(out_);
    std::vector<LogEntry> entries{createEntry("msg", Level::INFO, {})};

    EXPECT_THROW(exporter.exportLogs("1234567890", entries, std::nullopt),
                 ExporterIOException);
}

TEST_F(ConsoleExporterTest, InvalidUtf8IsReplaced) {
    ConsoleExporter exporter(out_);
    std::vector<LogEntry> entries{
        createEntry("caf\xe9 latin-1", Level::ERROR, {{"raw", "\xff\xfe"}})};

    ASSERT_NO_THROW(exporter.exportLogs("1234567890", entries, std::nullopt));

    // One U+FFFD per invalid byte
    EXPECT_THAT(out_.str(),
                ::testing::HasSubstr("\"Message\":\"caf\xef\xbf\xbd latin-1\""));
    EXPECT_THAT(out_.str(), ::testing::HasSubstr(
                                "\"raw\":\"\xef\xbf\xbd\xef\xbf\xbd\""));
}

TEST_F(ConsoleExporterTest, HtmlAndLineSeparatorsAreEscaped) {
    auto line = formatLogLine(
        createEntry("<b>&</b>\xe2\x80\xa8\xe2\x80\xa9", Level::INFO, {}));

    auto expected = "\"Message\":\"" + jsonEscape("003c") + "b" +
                    jsonEscape("003e") + jsonEscape("0026") +
                    jsonEscape("003c") + "/b" + jsonEscape("003e") +
                    jsonEscape("2028") + jsonEscape("2029") + "\"";

    EXPECT_THAT(line, ::testing::HasSubstr(expected));
    EXPECT_EQ(line.find('<'), std::string::npos);
    EXPECT_EQ(line.find('&'), std::string::npos);
    EXPECT_EQ(line.find("\xe2\x80\xa8"), std::string::npos);
}

TEST(DumpJsonTest, EscapedOutputParsesBack) {
    nlohmann::ordered_json j = nlohmann::ordered_json::array();
    j.push_back({{"Message", "a<b & c>d"}});

    auto compact = dumpJson(j);
    auto indented = dumpJson(j, 2);

    EXPECT_EQ(compact.find('<'), std::string::npos);
    EXPECT_THAT(indented, ::testing::StartsWith("[\n  {\n    \"Message\": "));
    EXPECT_EQ(nlohmann::json::parse(compact)[0]["Message"], "a<b & c>d");
    EXPECT_EQ(nlohmann::json::parse(indented)[0]["Message"], "a<b & c>d");
}
