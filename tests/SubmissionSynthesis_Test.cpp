// =====================================================================================
//
//       Filename:  SubmissionSynthesis_Test.cpp
//
//    Description:  tests for turning validated submissions into XBRL instances.
//
//        Version:  1.0
//        Created:  09/23/2026 02:37:18 PM
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
#include "SheetSource.h"
#include "SubmissionSynthesis.h"
#include "ValidationEngine.h"
#include "XBRL_Parser.h"

using namespace testing;

namespace fs = std::filesystem;

const fs::path test_data_dir{REGREPORT_TEST_DATA_DIR};

class BuildInstances : public Test
{
public:

    void SetUp() override
    {
        taxonomy_ = LoadXBRLTaxonomy(RR::FileName{test_data_dir / "sample_taxonomy.xsd"},
                RR::FileName{test_data_dir / "sample_labels.xml"});
        sheets_ = LoadSubmissionSheets(RR::FileName{test_data_dir / "sample_report.csv"});

        settings_.entity_ = "0000123456";
        settings_.period_start_ = "2025-01-01";
        settings_.period_end_ = "2025-12-31";
        settings_.schema_ref_ = "sample_taxonomy.xsd";
        settings_.language_ = "en";

        passed_.submission_ID_ = 1;
        passed_.status_ = RR::ValidationStatus::e_Passed;
    }

    RR::XBRLTaxonomy taxonomy_;
    RR::SheetGrids sheets_;
    SynthesisSettings settings_;
    RR::SubmissionValidation passed_;
};

TEST_F(BuildInstances, FailedSubmissionsAreRefused)
{
    RR::ValidationRule rule;
    rule.id_ = 1;
    rule.field_ = "B20";
    rule.rule_type_ = RR::RuleType::e_Required;
    rule.condition_ = "NOT_EMPTY";
    rule.error_message_ = "B20 needed";

    auto failed = ValidateSubmission(RR::SubmissionID{2}, {rule}, sheets_);
    ASSERT_EQ(failed.status_, RR::ValidationStatus::e_Failed);

    EXPECT_THROW(BuildInstanceFromSubmission(failed, sheets_, taxonomy_, settings_), PreconditionException);
}

TEST_F(BuildInstances, EntityAndPeriodEndAreNeeded)
{
    auto no_entity = settings_;
    no_entity.entity_.clear();
    EXPECT_THROW(BuildInstanceFromSubmission(passed_, sheets_, taxonomy_, no_entity), PreconditionException);

    auto no_period = settings_;
    no_period.period_end_.clear();
    EXPECT_THROW(BuildInstanceFromSubmission(passed_, sheets_, taxonomy_, no_period), PreconditionException);
}

TEST_F(BuildInstances, RowsAreMatchedByLabel)
{
    auto instance = BuildInstanceFromSubmission(passed_, sheets_, taxonomy_, settings_);

    EXPECT_THAT(instance.contexts_, ElementsAre(
                RR::XBRLContext{"D_2025-01-01_2025-12-31", "0000123456", RR::DurationPeriod{"2025-01-01", "2025-12-31"}},
                RR::XBRLContext{"I_2025-12-31", "0000123456", RR::InstantPeriod{"2025-12-31"}}));
    EXPECT_THAT(instance.units_, ElementsAre(RR::XBRLUnit{"USD", "iso4217:USD"}));

    ASSERT_EQ(instance.facts_.size(), 3);

    EXPECT_EQ(instance.facts_[0], (RR::XBRLFact{"rr:Revenue", "xbrli:monetaryItemType", "duration", "1250000", "USD",
                "D_2025-01-01_2025-12-31", "0", "rr"}));
    EXPECT_EQ(instance.facts_[1], (RR::XBRLFact{"rr:Assets", "xbrli:monetaryItemType", "instant", "4800000", "USD",
                "I_2025-12-31", "0", "rr"}));
    EXPECT_EQ(instance.facts_[2], (RR::XBRLFact{"rr:CompanyName", "xbrli:stringItemType", "duration", "Example Holdings Ltd",
                std::nullopt, "D_2025-01-01_2025-12-31", std::nullopt, "rr"}));

    EXPECT_EQ(instance.metadata_, (RR::InstanceMetadata{"0000123456", "2025-12-31", "USD", "en"}));
    EXPECT_EQ(instance.schema_ref_, "sample_taxonomy.xsd");
}

TEST_F(BuildInstances, FirstValueForAConceptWins)
{
    RR::SheetGrids sheets{RR::SheetGrid{"Sheet1", {
        {std::string{"Revenue"}, MakeCellValue("10")},
        {std::string{"revenue  from OPERATIONS"}, MakeCellValue("20")},
        {std::string{"StatementAbstract"}, MakeCellValue("30")}
    }}};

    auto instance = BuildInstanceFromSubmission(passed_, sheets, taxonomy_, settings_);

    ASSERT_EQ(instance.facts_.size(), 1);
    EXPECT_EQ(instance.facts_[0].value_, "10");
}

TEST_F(BuildInstances, MissingStartMeansPeriodEnd)
{
    settings_.period_start_.clear();

    auto instance = BuildInstanceFromSubmission(passed_, sheets_, taxonomy_, settings_);

    EXPECT_EQ(instance.contexts_[0].ID_, "D_2025-12-31_2025-12-31");
}

TEST_F(BuildInstances, GeneratorSettingsBindThePrefix)
{
    auto generator_settings = MakeGeneratorSettings(taxonomy_, settings_, "http://example.com/ids");

    EXPECT_EQ(generator_settings.entity_scheme_, "http://example.com/ids");
    EXPECT_THAT(generator_settings.namespaces_.fact_namespaces_,
            ElementsAre(Pair("rr", "http://example.com/regreport/2026")));
}

TEST_F(BuildInstances, GeneratedReportReadsBackTheSame)
{
    auto instance = BuildInstanceFromSubmission(passed_, sheets_, taxonomy_, settings_);
    auto text = SerializeXBRLDocument(BuildXBRLDocument(instance, MakeGeneratorSettings(taxonomy_, settings_, "http://www.sec.gov/CIK")));

    auto parsed = ParseXBRLInstance(RR::XMLContent{text}, {}, &taxonomy_);

    EXPECT_EQ(parsed, instance);
}
