// =====================================================================================
//
//       Filename:  RulesFile_Test.cpp
//
//    Description:  tests for reading validation rule files.
//
//        Version:  1.0
//        Created:  09/21/2026 09:40:12 AM
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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "RegReport_Utils.h"
#include "RulesFile.h"

using namespace testing;

namespace fs = std::filesystem;

const fs::path test_data_dir{REGREPORT_TEST_DATA_DIR};

class ReadRulesFiles : public Test
{
};

TEST_F(ReadRulesFiles, SampleFileHasFiveRules)
{
    auto [rules, diagnostics] = LoadRulesFile(RR::FileName{test_data_dir / "sample_rules.txt"}, 3);

    EXPECT_THAT(diagnostics, IsEmpty());
    ASSERT_EQ(rules.size(), 5);

    EXPECT_EQ(rules[0].id_, 10);
    EXPECT_EQ(rules[0].field_, "Company Name");
    EXPECT_EQ(rules[0].rule_type_, RR::RuleType::e_Required);
    EXPECT_EQ(rules[0].condition_, "NOT_EMPTY");
    EXPECT_EQ(rules[0].error_message_, "Company name is required");
    EXPECT_EQ(rules[0].template_ID_, 3);

    // rules without an ID follow the highest one given.

    EXPECT_THAT(rules, ElementsAre(Field(&RR::ValidationRule::id_, 10), Field(&RR::ValidationRule::id_, 11),
                Field(&RR::ValidationRule::id_, 12), Field(&RR::ValidationRule::id_, 13), Field(&RR::ValidationRule::id_, 14)));

    EXPECT_TRUE(rules[1].apply_to_all_rows_);
    EXPECT_EQ(rules[2].severity_, RR::Severity::e_Warning);
    EXPECT_EQ(rules[3].condition_, "min:0,max:10000000");
    EXPECT_THAT(rules[3].row_range_, Optional(std::string{"2-*"}));
    EXPECT_EQ(rules[4].condition_, "equals:Company Name");
    EXPECT_THAT(rules[4].cell_range_, Optional(std::string{"A1"}));
}

TEST_F(ReadRulesFiles, IncompleteBlocksAreSkipped)
{
    const char* content = R"(
ID: 1
FIELD: Amount
RULE: format
CONDITION: numeric
ERROR: Amount must be a number
---
FIELD: Name
RULE: required
ERROR: Name is required
---
FIELD: Code
RULE: sometimes
CONDITION: NOT_EMPTY
ERROR: Code is required
)";

    auto [rules, diagnostics] = ParseRulesContent(RR::RulesContent{content});

    ASSERT_EQ(rules.size(), 1);
    EXPECT_EQ(rules[0].field_, "Amount");
    ASSERT_EQ(diagnostics.size(), 2);
    EXPECT_EQ(diagnostics[0].message_, "Rule block at line 8: FIELD, RULE, CONDITION and ERROR are all needed. Rule skipped.");
    EXPECT_EQ(diagnostics[0].field_, "Name");
    EXPECT_EQ(diagnostics[1].message_, "Rule block at line 12: unknown rule type: 'sometimes'. Rule skipped.");
}

TEST_F(ReadRulesFiles, AddressingAndSheetKeys)
{
    const char* content =
        "field: Total\n"
        "rule: Range\n"
        "condition: value >= 0\n"
        "error: Total can't be negative\n"
        "sheet: 2\n"
        "rows: 5-9\n"
        "columns: C-D\n"
        "severity: Warning\n";

    auto [rules, diagnostics] = ParseRulesContent(RR::RulesContent{content});

    ASSERT_EQ(rules.size(), 1);
    EXPECT_THAT(diagnostics, IsEmpty());
    EXPECT_EQ(rules[0].id_, 1);
    EXPECT_THAT(rules[0].sheet_ID_, Optional(2));
    EXPECT_THAT(rules[0].row_range_, Optional(std::string{"5-9"}));
    EXPECT_THAT(rules[0].column_range_, Optional(std::string{"C-D"}));
    EXPECT_EQ(rules[0].severity_, RR::Severity::e_Warning);
    EXPECT_FALSE(rules[0].apply_to_all_rows_);
}

TEST_F(ReadRulesFiles, UnreadableValuesAreReportedAndDefaulted)
{
    const char* content =
        "ID: seven\n"
        "SHEET: two\n"
        "FIELD: Total\n"
        "RULE: range\n"
        "CONDITION: min:0\n"
        "ERROR: Total can't be negative\n"
        "SEVERITY: fatal\n";

    auto [rules, diagnostics] = ParseRulesContent(RR::RulesContent{content});

    // the rule itself is kept.

    ASSERT_EQ(rules.size(), 1);
    EXPECT_EQ(rules[0].id_, 1);
    EXPECT_EQ(rules[0].sheet_ID_, std::nullopt);
    EXPECT_EQ(rules[0].severity_, RR::Severity::e_Error);

    EXPECT_THAT(diagnostics, ElementsAre(
                Field(&RR::RuleDiagnostic::message_, "Rule block at line 1: ID is not a number: 'seven'. A new ID is assigned."),
                Field(&RR::RuleDiagnostic::message_, "Rule block at line 1: SHEET is not a number: 'two'. Rule applies to every sheet."),
                Field(&RR::RuleDiagnostic::message_, "Rule block at line 1: unknown severity: 'fatal'. Using error.")));
    EXPECT_THAT(diagnostics, Each(Field(&RR::RuleDiagnostic::field_, "Total")));
}

TEST_F(ReadRulesFiles, EmptyContentHasNoRules)
{
    auto [rules, diagnostics] = ParseRulesContent(RR::RulesContent{"# nothing here\n\n---\n"});

    EXPECT_THAT(rules, IsEmpty());
    EXPECT_THAT(diagnostics, IsEmpty());
}

TEST_F(ReadRulesFiles, MissingFileThrows)
{
    EXPECT_THROW(LoadRulesFile(RR::FileName{test_data_dir / "no_such_rules.txt"}), std::exception);
}
