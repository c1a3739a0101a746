// =====================================================================================
//
//       Filename:  RegReportApp_Test.cpp
//
//    Description:  end to end tests of the program using its options.
//
//        Version:  1.0
//        Created:  09/24/2026 09:05:44 AM
//       Revision:  none
//       Compiler:  g++
//
//         Author:
//        License:  GNU General Public License v3
//        Company:
//
// =====================================================================================

	/* This file is part of RegReport_Engine. */

	/* RegReport_Engine is free software: you can redistribute it and/or modify */
	/* it under the terms of the GNU General Public License as published by */
	/* the Free Software Foundation, either version 3 of the License, or */
	/* (at your option) any later version. */

	/* RegReport_Engine is distributed in the hope that it will be useful, */
	/* but WITHOUT ANY WARRANTY; without even the implied warranty of */
	/* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the */
	/* GNU General Public License for more details. */

	/* You should have received a copy of the GNU General Public License */
	/* along with RegReport_Engine.  If not, see <http://www.gnu.org/licenses/>. */

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "RegReportApp.h"
#include "RegReport_Utils.h"
#include "ResultsSink.h"
#include "XBRL_Parser.h"

using namespace testing;

namespace fs = std::filesystem;

const fs::path test_data_dir{REGREPORT_TEST_DATA_DIR};

const std::string SAMPLE_SUBMISSION{(test_data_dir / "sample_submission.csv").string()};
const std::string SAMPLE_REPORT{(test_data_dir / "sample_report.csv").string()};
const std::string SAMPLE_RULES{(test_data_dir / "sample_rules.txt").string()};
const std::string SAMPLE_INSTANCE{(test_data_dir / "sample_instance.xml").string()};
const std::string SAMPLE_TAXONOMY{(test_data_dir / "sample_taxonomy.xsd").string()};
const std::string SAMPLE_LABELS{(test_data_dir / "sample_labels.xml").string()};

class RunProgram : public Test
{
public:

    void SetUp() override
    {
        work_dir_ = fs::temp_directory_path() / "RegReportApp_Test";
        fs::remove_all(work_dir_);
        fs::create_directories(work_dir_);
        output_dir_ = work_dir_ / "output";
    }

    void TearDown() override
    {
        fs::remove_all(work_dir_);
    }

    fs::path WriteFile(const std::string& name, const std::string& content) const
    {
        auto file_name = work_dir_ / name;
        std::ofstream output{file_name};
        output << content;
        return file_name;
    }

    static std::string ReadFile(const fs::path& file_name)
    {
        return LoadDataFileForUse(RR::FileName{file_name});
    }

    static std::tuple<int, int, int> RunWith(const std::vector<std::string>& tokens)
    {
        RegReportApp app{tokens};
        if (! app.Startup())
        {
            throw std::runtime_error("startup failed");
        }
        auto counters = app.Run();
        app.Shutdown();
        return counters;
    }

    fs::path work_dir_;
    fs::path output_dir_;
};

TEST_F(RunProgram, MissingModeFailsStartup)
{
    RegReportApp app{{"-f", SAMPLE_SUBMISSION, "-r", SAMPLE_RULES}};
    EXPECT_FALSE(app.Startup());
}

TEST_F(RunProgram, UnknownModeFailsStartup)
{
    RegReportApp app{{"--mode", "transmogrify", "-f", SAMPLE_SUBMISSION, "-r", SAMPLE_RULES}};
    EXPECT_FALSE(app.Startup());
}

TEST_F(RunProgram, ValidateNeedsARulesFile)
{
    RegReportApp app{{"--mode", "validate", "-f", SAMPLE_SUBMISSION}};
    EXPECT_FALSE(app.Startup());
}

TEST_F(RunProgram, MissingInputFileFailsStartup)
{
    RegReportApp app{{"--mode", "validate", "-f", (work_dir_ / "nothing.csv").string(), "-r", SAMPLE_RULES}};
    EXPECT_FALSE(app.Startup());
}

TEST_F(RunProgram, GenerateChecksItsSettings)
{
    RegReportApp bad_currency{{"--mode", "xbrl-generate", "-f", SAMPLE_REPORT, "-r", SAMPLE_RULES, "-t", SAMPLE_TAXONOMY,
        "--entity", "0000123456", "--period-end", "2025-12-31", "--currency", "usd", "--output-dir", output_dir_.string()}};
    EXPECT_FALSE(bad_currency.Startup());

    RegReportApp backwards{{"--mode", "xbrl-generate", "-f", SAMPLE_REPORT, "-r", SAMPLE_RULES, "-t", SAMPLE_TAXONOMY,
        "--entity", "0000123456", "--period-start", "2026-01-01", "--period-end", "2025-12-31", "--output-dir", output_dir_.string()}};
    EXPECT_FALSE(backwards.Startup());

    RegReportApp no_entity{{"--mode", "xbrl-generate", "-f", SAMPLE_REPORT, "-r", SAMPLE_RULES, "-t", SAMPLE_TAXONOMY,
        "--period-end", "2025-12-31", "--output-dir", output_dir_.string()}};
    EXPECT_FALSE(no_entity.Startup());
}

TEST_F(RunProgram, ValidateOneSubmission)
{
    auto counters = RunWith({"--mode", "validate", "-f", SAMPLE_SUBMISSION, "-r", SAMPLE_RULES,
        "--output-dir", output_dir_.string(), "--submission-id", "42"});

    EXPECT_EQ(counters, std::make_tuple(1, 0, 0));

    const auto results_file = output_dir_ / "sample_submission_results.tsv";
    ASSERT_TRUE(fs::exists(results_file));

    auto results = split_string<std::string>(ReadFile(results_file), '\n');
    EXPECT_THAT(results.front(), StartsWith("submission\trule\tsheet\tcell"));
    EXPECT_THAT(results, Contains(StartsWith("42\t10\tSheet1\tA2\t2\t1\tA\tCompany Name\trequired\tNOT_EMPTY\tExample Holdings Ltd\tyes")));
    EXPECT_THAT(results, Contains("# summary\tstatus: passed\trules: 5\tchecks: 8\tpassed: 8\tfailed: 0\terrors: 0\twarnings: 0"));
}

TEST_F(RunProgram, FailingSubmissionIsASkip)
{
    auto rules = WriteFile("strict_rules.txt",
            "FIELD: Amount\nRULE: range\nCONDITION: max:100\nERROR: Amount too large\nALL_ROWS: yes\n");

    auto counters = RunWith({"--mode", "validate", "-f", SAMPLE_SUBMISSION, "-r", rules.string(),
        "-o", (work_dir_ / "strict.tsv").string()});

    EXPECT_EQ(counters, std::make_tuple(0, 1, 0));
    EXPECT_THAT(ReadFile(work_dir_ / "strict.tsv"), HasSubstr("status: failed\trules: 1\tchecks: 2\tpassed: 0\tfailed: 2\terrors: 2"));
}

TEST_F(RunProgram, UnsupportedSubmissionIsAnError)
{
    auto odd_file = WriteFile("submission.ods", "not really a spreadsheet");

    auto counters = RunWith({"--mode", "validate", "-f", odd_file.string(), "-r", SAMPLE_RULES});

    EXPECT_EQ(counters, std::make_tuple(0, 0, 1));
}

TEST_F(RunProgram, ConfigFileSuppliesOptions)
{
    auto config = WriteFile("regreport.conf", catenate(
                "mode = validate\n",
                "rules = ", SAMPLE_RULES, '\n',
                "output-dir = ", output_dir_.string(), '\n',
                "submission-id = 5\n"));

    auto counters = RunWith({"--config", config.string(), "-f", SAMPLE_SUBMISSION, "--submission-id", "9"});

    EXPECT_EQ(counters, std::make_tuple(1, 0, 0));

    // the command line wins.

    auto results = ReadFile(output_dir_ / "sample_submission_results.tsv");
    EXPECT_THAT(results, HasSubstr("\n9\t10\t"));
    EXPECT_THAT(results, Not(HasSubstr("\n5\t10\t")));
}

TEST_F(RunProgram, ValidateAnInstance)
{
    auto counters = RunWith({"--mode", "xbrl-validate", "-i", SAMPLE_INSTANCE, "-t", SAMPLE_TAXONOMY, "--labels", SAMPLE_LABELS,
        "--output-dir", output_dir_.string()});

    EXPECT_EQ(counters, std::make_tuple(1, 0, 0));
    auto report = ReadFile(output_dir_ / "sample_instance_xbrl_report.txt");
    EXPECT_THAT(report, StartsWith("status: valid\n"));
    EXPECT_THAT(report, Not(HasSubstr("error\t")));
}

TEST_F(RunProgram, IncompleteInstanceIsASkip)
{
    auto instance = WriteFile("short_instance.xml", R"(<?xml version="1.0"?>
<xbrli:xbrl xmlns:xbrli="http://www.xbrl.org/2003/instance" xmlns:iso4217="http://www.xbrl.org/2003/iso4217"
            xmlns:rr="http://example.com/regreport/2026">
  <xbrli:context id="c1"><xbrli:entity><xbrli:identifier scheme="s">E1</xbrli:identifier></xbrli:entity>
    <xbrli:period><xbrli:instant>2025-12-31</xbrli:instant></xbrli:period></xbrli:context>
  <xbrli:unit id="USD"><xbrli:measure>iso4217:USD</xbrli:measure></xbrli:unit>
  <rr:Assets contextRef="c1" unitRef="USD" decimals="0">100</rr:Assets>
</xbrli:xbrl>)");

    auto counters = RunWith({"--mode", "xbrl-validate", "-i", instance.string(), "-t", SAMPLE_TAXONOMY,
        "-o", (work_dir_ / "short_report.txt").string()});

    EXPECT_EQ(counters, std::make_tuple(0, 1, 0));
    EXPECT_THAT(ReadFile(work_dir_ / "short_report.txt"), StartsWith(
                "status: invalid\nerror\tMissing required concepts: Revenue, CompanyName, NumberOfEmployees\n"));
}

TEST_F(RunProgram, ParseAnInstance)
{
    auto counters = RunWith({"--mode", "xbrl-parse", "-i", SAMPLE_INSTANCE, "--output-dir", output_dir_.string()});

    EXPECT_EQ(counters, std::make_tuple(1, 0, 0));

    auto facts = split_string<std::string>(ReadFile(output_dir_ / "sample_instance_facts.tsv"), '\n');
    ASSERT_EQ(facts.size(), 6);
    EXPECT_EQ(facts[0], "name\ttype\tperiod\tcontext\tunit\tdecimals\tvalue");
    EXPECT_EQ(facts[1], "rr:Revenue\tmonetary\tduration\tFY2025\tUSD\t-3\t1250000");
    EXPECT_EQ(facts[3], "rr:CompanyName\tstring\tduration\tFY2025\t\t\tExample Holdings Ltd");
    EXPECT_EQ(facts[5], "");
}

TEST_F(RunProgram, GenerateAReport)
{
    auto rules = WriteFile("report_rules.txt",
            "FIELD: Value\nRULE: required\nCONDITION: NOT_EMPTY\nERROR: Every item needs a value\nALL_ROWS: yes\n");
    const auto report_file = work_dir_ / "report.xml";

    auto counters = RunWith({"--mode", "xbrl-generate", "-f", SAMPLE_REPORT, "-r", rules.string(), "-t", SAMPLE_TAXONOMY,
        "--labels", SAMPLE_LABELS, "--entity", "0000123456", "--period-start", "2025-01-01", "--period-end", "2025-12-31",
        "--schema-ref", "sample_taxonomy.xsd", "--language", "en", "-o", report_file.string()});

    EXPECT_EQ(counters, std::make_tuple(1, 0, 0));
    ASSERT_TRUE(fs::exists(report_file));

    auto instance = LoadXBRLInstance(RR::FileName{report_file});

    EXPECT_EQ(instance.schema_ref_, "sample_taxonomy.xsd");
    EXPECT_EQ(instance.metadata_, (RR::InstanceMetadata{"0000123456", "2025-12-31", "USD", "en"}));
    EXPECT_THAT(instance.facts_, ElementsAre(
                AllOf(Field(&RR::XBRLFact::name_, "rr:Revenue"), Field(&RR::XBRLFact::value_, "1250000")),
                AllOf(Field(&RR::XBRLFact::name_, "rr:Assets"), Field(&RR::XBRLFact::value_, "4800000")),
                AllOf(Field(&RR::XBRLFact::name_, "rr:CompanyName"), Field(&RR::XBRLFact::value_, "Example Holdings Ltd"))));
    EXPECT_THAT(ReadFile(report_file), HasSubstr(R"(xmlns:rr="http://example.com/regreport/2026")"));
}

TEST_F(RunProgram, NoReportForAFailedSubmission)
{
    auto rules = WriteFile("report_rules.txt",
            "FIELD: Value\nRULE: format\nCONDITION: numeric\nERROR: Every value must be a number\nALL_ROWS: yes\n");
    const auto report_file = work_dir_ / "report.xml";

    auto counters = RunWith({"--mode", "xbrl-generate", "-f", SAMPLE_REPORT, "-r", rules.string(), "-t", SAMPLE_TAXONOMY,
        "--entity", "0000123456", "--period-end", "2025-12-31", "-o", report_file.string()});

    EXPECT_EQ(counters, std::make_tuple(0, 0, 1));
    EXPECT_FALSE(fs::exists(report_file));
}

TEST_F(RunProgram, ListOfFiles)
{
    auto second = WriteFile("second.csv", "Company Name,Amount,Email\nOther Co,12,x@example.com\n");
    auto failing = WriteFile("failing.csv", "Company Name,Amount,Email\n,abc,x@example.com\n");
    auto list = WriteFile("files.txt", catenate(SAMPLE_SUBMISSION, '\n', second.string(), '\n', failing.string(), '\n',
                (work_dir_ / "missing.csv").string(), '\n'));

    auto counters = RunWith({"--mode", "validate", "--list-file", list.string(), "-r", SAMPLE_RULES,
        "--output-dir", output_dir_.string()});

    EXPECT_EQ(counters, std::make_tuple(2, 2, 0));
    EXPECT_TRUE(fs::exists(output_dir_ / "second_results.tsv"));
    EXPECT_TRUE(fs::exists(output_dir_ / "failing_results.tsv"));
}

TEST_F(RunProgram, ListOfFilesConcurrently)
{
    std::string list_content;
    for (int i = 0; i < 6; ++i)
    {
        auto file_name = WriteFile(catenate("submission_", i, ".csv"),
                catenate("Company Name,Amount,Email\nCompany ", i, ',', i * 100, ",c", i, "@example.com\n"));
        list_content += catenate(file_name.string(), '\n');
    }
    auto list = WriteFile("files.txt", list_content);

    auto counters = RunWith({"--mode", "validate", "--list-file", list.string(), "-r", SAMPLE_RULES,
        "--output-dir", output_dir_.string(), "-k", "3"});

    EXPECT_EQ(counters, std::make_tuple(6, 0, 0));
    for (int i = 0; i < 6; ++i)
    {
        EXPECT_TRUE(fs::exists(output_dir_ / catenate("submission_", i, "_results.tsv")));
    }
}

class FormatResults : public Test
{
};

TEST_F(FormatResults, FieldSeparatorsAreCleanedOut)
{
    RR::SubmissionValidation validation;
    validation.submission_ID_ = 3;

    RR::ValidationResult result;
    result.submission_ID_ = 3;
    result.rule_ID_ = 7;
    result.field_ = "Note";
    result.rule_type_ = RR::RuleType::e_Custom;
    result.cell_value_ = "line one\nline\ttwo";
    result.message_ = "bad note";
    validation.results_.push_back(result);
    validation.diagnostics_.push_back({7, "Note", "Sheet1", "Unrecognized condition"});
    validation.summary_ = {1, 1, 0, 1, 1, 0};
    validation.status_ = RR::ValidationStatus::e_Failed;

    auto lines = split_string<std::string>(FormatValidationResults(validation), '\n');

    ASSERT_EQ(lines.size(), 5);
    EXPECT_EQ(lines[1], "3\t7\t\t\t\t\t\tNote\tcustom\t\tline one line two\tno\terror\tbad note");
    EXPECT_EQ(lines[2], "# diagnostic\trule: 7\tsheet: Sheet1\tfield: Note\tUnrecognized condition");
    EXPECT_EQ(lines[3], "# summary\tstatus: failed\trules: 1\tchecks: 1\tpassed: 0\tfailed: 1\terrors: 1\twarnings: 0");
}

TEST_F(FormatResults, XBRLReport)
{
    RR::XBRLValidationReport report{false, {"Missing required concepts: Revenue"}, {"Context c1 has an invalid date: 'x'"}};

    EXPECT_EQ(FormatXBRLValidationReport(report),
            "status: invalid\nerror\tMissing required concepts: Revenue\nwarning\tContext c1 has an invalid date: 'x'\n");
}
