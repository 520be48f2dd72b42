/*
 * test_file_exporters.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-10

Description: Tests for JsonFileExporter and TextFileExporter

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "core/exception.hpp"
#include "exporters/json_file_exporter.hpp"
#include "exporters/text_file_exporter.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace otellogger;
using ::testing::HasSubstr;

namespace fs = std::filesystem;

class FileExporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() /
                    ("otellogger_exporter_test_" +
                     std::to_string(reinterpret_cast<std::uintptr_t>(this)));
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir_, ec);
    }

    LogEntry createEntry(const std::string& message, Level level) {
        LogEntry entry;
        entry.timestamp = "10.03.2025 17:00:00";
        entry.level = level;
        entry.message = message;
        entry.logger_name = "OTelLogger";
        entry.service_name = "Default";
        entry.trace_id = "1234567890";
        entry.span_id = "42";
        entry.attributes = {{"key1", "val1"}};
        return entry;
    }

    auto config() const -> ExporterConfig {
        return {{"filepath", test_dir_.string()}, {"filename", "test"}};
    }

    static auto readFile(const fs::path& path) -> std::string {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    template <typename ExporterT>
    void expectConfigError(const std::optional<ExporterConfig>& cfg,
                           const std::string& message) {
        ExporterT exporter;
        std::vector<LogEntry> entries{createEntry("msg", Level::INFO)};
        try {
            exporter.exportLogs("1234567890", entries, cfg);
            FAIL() << "Expected ConfigurationException";
        } catch (const ConfigurationException& e) {
            EXPECT_THAT(e.what(), HasSubstr(message));
        }
    }

    fs::path test_dir_;
};

// ============================================================================
// Output Path
// ============================================================================

TEST_F(FileExporterTest, ResolveOutputPath) {
    auto path = resolveOutputPath(config(), "99", ".json");
    EXPECT_EQ(path, test_dir_ / "test_99.json");
}

TEST_F(FileExporterTest, ResolveOutputPathErrors) {
    EXPECT_THROW(resolveOutputPath(std::nullopt, "1", ".txt"),
                 ConfigurationException);
    EXPECT_THROW(resolveOutputPath(ExporterConfig{}, "1", ".txt"),
                 ConfigurationException);
}

// ============================================================================
// JsonFileExporter Tests
// ============================================================================

TEST_F(FileExporterTest, JsonWritesArray) {
    JsonFileExporter exporter;
    std::vector<LogEntry> entries{createEntry("first", Level::INFO),
                                  createEntry("second", Level::ERROR)};

    exporter.exportLogs("1234567890", entries, config());

    auto path = test_dir_ / "test_1234567890.json";
    ASSERT_TRUE(fs::exists(path));

    auto json = nlohmann::json::parse(readFile(path));
    ASSERT_TRUE(json.is_array());
    ASSERT_EQ(json.size(), 2u);
    EXPECT_EQ(json[0]["Message"], "first");
    EXPECT_EQ(json[1]["Severity"], "ERROR");
    EXPECT_EQ(json[1]["Attributes"]["key1"], "val1");
    EXPECT_EQ(LogEntry::fromJson(json[0]), entries[0]);
}

TEST_F(FileExporterTest, JsonIsIndentedWithTwoSpaces) {
    JsonFileExporter exporter;
    exporter.exportLogs("1", {createEntry("msg", Level::INFO)}, config());

    auto content = readFile(test_dir_ / "test_1.json");
    EXPECT_THAT(content, ::testing::StartsWith("[\n  {\n    \"Timestamp\""));
}

TEST_F(FileExporterTest, JsonTruncatesExistingFile) {
    JsonFileExporter exporter;
    exporter.exportLogs("1", {createEntry("old", Level::INFO),
                              createEntry("old", Level::INFO)},
                        config());
    exporter.exportLogs("1", {createEntry("new", Level::INFO)}, config());

    auto json = nlohmann::json::parse(readFile(test_dir_ / "test_1.json"));
    ASSERT_EQ(json.size(), 1u);
    EXPECT_EQ(json[0]["Message"], "new");
}

TEST_F(FileExporterTest, JsonCreatesMissingDirectory) {
    JsonFileExporter exporter;
    ExporterConfig cfg{{"filepath", (test_dir_ / "nested" / "dir").string()},
                       {"filename", "out"}};

    exporter.exportLogs("7", {createEntry("msg", Level::INFO)}, cfg);

    EXPECT_TRUE(fs::exists(test_dir_ / "nested" / "dir" / "out_7.json"));
}

TEST_F(FileExporterTest, JsonEmptyEntriesIsNoop) {
    JsonFileExporter exporter;
    EXPECT_NO_THROW(exporter.exportLogs("1", {}, std::nullopt));
    EXPECT_NO_THROW(exporter.exportLogs("1", {}, config()));
    EXPECT_FALSE(fs::exists(test_dir_ / "test_1.json"));
}

TEST_F(FileExporterTest, JsonConfigErrors) {
    expectConfigError<JsonFileExporter>(std::nullopt, "no config provided");
    expectConfigError<JsonFileExporter>(ExporterConfig{},
                                        "no filepath in config");
    expectConfigError<JsonFileExporter>(
        ExporterConfig{{"filename", "test"}}, "no filepath in config");
    expectConfigError<JsonFileExporter>(
        ExporterConfig{{"filepath", test_dir_.string()}},
        "no filename in config");
}

// ============================================================================
// TextFileExporter Tests
// ============================================================================

TEST_F(FileExporterTest, TextWritesFormattedLines) {
    TextFileExporter exporter;
    std::vector<LogEntry> entries{createEntry("first", Level::INFO),
                                  createEntry("second", Level::WARNING)};

    exporter.exportLogs("1234567890", entries, config());

    auto content = readFile(test_dir_ / "test_1234567890.txt");
    EXPECT_EQ(content, formatLogLine(entries[0]) + formatLogLine(entries[1]));
}

TEST_F(FileExporterTest, TextAppendsToExistingFile) {
    TextFileExporter exporter;
    auto first = createEntry("first", Level::INFO);
    auto second = createEntry("second", Level::ERROR);

    exporter.exportLogs("1", {first}, config());
    exporter.exportLogs("1", {second}, config());

    auto content = readFile(test_dir_ / "test_1.txt");
    EXPECT_EQ(content, formatLogLine(first) + formatLogLine(second));
}

TEST_F(FileExporterTest, TextEmptyEntriesIsNoop) {
    TextFileExporter exporter;
    EXPECT_NO_THROW(exporter.exportLogs("1", {}, std::nullopt));
    EXPECT_FALSE(fs::exists(test_dir_ / "test_1.txt"));
}

TEST_F(FileExporterTest, TextConfigErrors) {
    expectConfigError<TextFileExporter>(std::nullopt, "no config provided");
    expectConfigError<TextFileExporter>(ExporterConfig{},
                                        "no filepath in config");
    expectConfigError<TextFileExporter>(
        ExporterConfig{{"filepath", test_dir_.string()}},
        "no filename in config");
}

TEST_F(FileExporterTest, TextUnwritableTargetThrows) {
    // A regular file where the directory should be
    auto blocker = test_dir_ / "blocker";
    std::ofstream(blocker) << "x";

    TextFileExporter exporter;
    ExporterConfig cfg{{"filepath", (blocker / "sub").string()},
                       {"filename", "out"}};

    EXPECT_THROW(exporter.exportLogs("1", {createEntry("m", Level::INFO)}, cfg),
                 ExporterIOException);
}

TEST_F(FileExporterTest, JsonInvalidUtf8IsReplaced) {
    JsonFileExporter exporter;
    ASSERT_NO_THROW(exporter.exportLogs(
        "1", {createEntry("caf\xe9 latin-1", Level::ERROR)}, config()));

    auto json = nlohmann::json::parse(readFile(test_dir_ / "test_1.json"));
    ASSERT_EQ(json.size(), 1u);
    EXPECT_EQ(json[0]["Message"], "caf\xef\xbf\xbd latin-1");
}

TEST_F(FileExporterTest, TextInvalidUtf8IsReplaced) {
    TextFileExporter exporter;
    ASSERT_NO_THROW(exporter.exportLogs(
        "1", {createEntry("caf\xe9 latin-1", Level::ERROR)}, config()));

    EXPECT_THAT(readFile(test_dir_ / "test_1.txt"),
                HasSubstr("caf\xef\xbf\xbd latin-1"));
}
