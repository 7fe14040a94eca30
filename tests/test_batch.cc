#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "batch_processor.hpp"
#include "csv_writer.hpp"
#include "evaluator.hpp"
#include "file_utils.hpp"

namespace fs = std::filesystem;
using namespace logic;

class BatchTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        workDir = fs::temp_directory_path() / (std::string("logic_solver_") + info->name());
        fs::remove_all(workDir);
        fs::create_directories(workDir);
    }

    void TearDown() override {
        std::error_code error;
        fs::remove_all(workDir, error);
    }

    fs::path writeInput(const std::string& name, const std::string& contents) {
        fs::path path = workDir / name;
        std::ofstream out(path, std::ios::binary);
        out << contents;
        return path;
    }

    static std::vector<std::string> readLines(const fs::path& path) {
        std::ifstream input(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(input, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    fs::path workDir;
    ExpressionEvaluator evaluator;
};

TEST_F(BatchTest, ProcessesEveryLine) {
    fs::path input = writeInput("input.txt", "1 ^ 1\n1 1\np := 0 ~p\n\n<1\r\n");
    fs::path output = workDir / "out.csv";

    BatchSummary summary;
    {
        CsvWriter writer(output);
        summary = processStatementFile(input, evaluator, writer);
    }

    EXPECT_EQ(summary.total, 5u);
    EXPECT_EQ(summary.succeeded, 2u);
    EXPECT_EQ(summary.failed, 3u);

    auto lines = readLines(output);
    ASSERT_EQ(lines.size(), 6u);
    EXPECT_EQ(lines[0], "line,statement,status,result,message");
    EXPECT_EQ(lines[1], "1,\"1 ^ 1\",success,1,\"\"");
    EXPECT_EQ(lines[2].rfind("2,\"1 1\",error,,\"", 0), 0u);
    EXPECT_EQ(lines[3], "3,\"p := 0 ~p\",success,1,\"\"");
    EXPECT_EQ(lines[4], "4,\"\",error,,\"Пустая строка\"");
    // Символ '\r' в конце строки отбрасывается
    EXPECT_EQ(lines[5].rfind("5,\"<1\",error,,\"", 0), 0u);
}

TEST_F(BatchTest, MissingInputThrows) {
    CsvWriter writer(workDir / "out.csv");
    EXPECT_THROW(processStatementFile(workDir / "missing.txt", evaluator, writer), std::runtime_error);
}

TEST_F(BatchTest, QuotesAreReplacedInFields) {
    fs::path output = workDir / "quotes.csv";
    {
        CsvWriter writer(output);
        EvaluationRecord record;
        record.lineNumber = 7;
        record.statement = "say \"hi\"";
        record.status = "error";
        record.message = "bad \"token\"";
        writer.write({record});
    }

    auto lines = readLines(output);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "7,\"say 'hi'\",error,,\"bad 'token'\"");
}

TEST_F(BatchTest, FalseResultWrittenAsZero) {
    fs::path output = workDir / "zero.csv";
    {
        CsvWriter writer(output);
        writer.writeRecord(evaluateLine(evaluator, 1, "1 => 0"));
    }
    auto lines = readLines(output);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "1,\"1 => 0\",success,0,\"\"");
}

TEST_F(BatchTest, UnwritableOutputThrows) {
    EXPECT_THROW(CsvWriter(workDir / "no_such_dir" / "out.csv"), std::runtime_error);
}

TEST_F(BatchTest, EvaluateLineRecordsErrors) {
    auto blank = evaluateLine(evaluator, 3, "   \t");
    EXPECT_EQ(blank.lineNumber, 3u);
    EXPECT_EQ(blank.status, "error");
    EXPECT_EQ(blank.message, "Пустая строка");
    EXPECT_FALSE(blank.value.has_value());

    auto undefined = evaluateLine(evaluator, 4, "p ^ 1");
    EXPECT_EQ(undefined.status, "error");
    EXPECT_NE(undefined.message.find('p'), std::string::npos);

    auto ok = evaluateLine(evaluator, 5, "~0");
    EXPECT_EQ(ok.status, "success");
    EXPECT_EQ(ok.value, std::optional<bool>(true));
    EXPECT_TRUE(ok.message.empty());
}

TEST_F(BatchTest, ReadFileKeepsNewlines) {
    fs::path input = writeInput("multi.txt", "p := 1\np ^ 1\n");
    EXPECT_EQ(readFile(input), "p := 1\np ^ 1\n");
    EXPECT_THROW(readFile(workDir / "missing.txt"), std::runtime_error);
}

TEST_F(BatchTest, FindTxtFilesIsSortedAndCaseInsensitive) {
    writeInput("b.txt", "1");
    writeInput("a.TXT", "1");
    writeInput("c.csv", "1");

    auto files = findTxtFiles(workDir);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].filename().string(), "a.TXT");
    EXPECT_EQ(files[1].filename().string(), "b.txt");

    EXPECT_TRUE(findTxtFiles(workDir / "missing").empty());
}

TEST_F(BatchTest, DefaultResultsPathSitsBesideInput) {
    fs::path result = defaultResultsPath(workDir / "statements.txt");

    EXPECT_TRUE(result.parent_path() == workDir);
    EXPECT_EQ(result.extension().string(), ".csv");
    EXPECT_EQ(result.filename().string().rfind("statements_results_", 0), 0u);
}
