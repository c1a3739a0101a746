// =====================================================================================
//
//       Filename:  ValidationEngine.cpp
//
//    Description:  run a rule set over the sheets of one submission and collect
//                  one result for every rule and cell it addresses.
//
//        Version:  1.0
//        Created:  09/10/2026 01:41:09 PM
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

#include "ValidationEngine.h"

#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/view/filter.hpp>

namespace rng = ranges;

#include <spdlog/spdlog.h>

#include "RegReport_Utils.h"
#include "RuleEvaluator.h"

namespace
{
    // fields common to every result for a rule.

    RR::ValidationResult StartResult(RR::SubmissionID submission_ID, const RR::ValidationRule& rule)
    {
        RR::ValidationResult result;
        result.submission_ID_ = submission_ID.get();
        result.rule_ID_ = rule.id_;
        result.field_ = rule.field_;
        result.rule_type_ = rule.rule_type_;
        result.condition_ = rule.condition_;
        result.severity_ = rule.severity_;
        return result;
    }

    RR::ValidationResult MissingFieldResult(RR::SubmissionID submission_ID, const RR::ValidationRule& rule,
            std::optional<std::string> sheet_name)
    {
        auto result = StartResult(submission_ID, rule);
        result.message_ = catenate(rule.error_message_, " (field '", rule.field_, "' not found in ",
                sheet_name ? "sheet)" : "any sheet)");
        result.is_valid_ = false;
        result.sheet_name_ = std::move(sheet_name);
        return result;
    }

    void NoteUnrecognizedCondition(const RR::ValidationRule& rule, const RR::Condition& condition,
            const std::optional<std::string>& sheet_name, RR::RuleDiagnostics& diagnostics)
    {
        if (IsOtherCondition(condition))
        {
            auto msg = catenate("Unrecognized condition: '", rule.condition_, "'. Treated as informational pass.");
            spdlog::warn(catenate("rule: ", rule.id_, ". ", msg));
            diagnostics.push_back({rule.id_, rule.field_, sheet_name, std::move(msg)});
        }
    }

    // returns false when the rule's field is not on this sheet. the failing
    // result for that is added only when report_missing_field is set.

    bool ApplyRuleToSheet(RR::SubmissionID submission_ID, const RR::ValidationRule& rule, const RR::Condition& condition,
            const RR::SheetGrid& grid, RR::RuleDiagnostics& diagnostics, std::size_t max_cells_per_rule,
            RR::ValidationResults& results, bool report_missing_field)
    {
        std::optional<RR::RuleAddress> address;
        try
        {
            address = ResolveRuleAddress(rule, grid, max_cells_per_rule);
        }
        catch (const RuleException& e)
        {
            // fail closed. the rule is skipped for this sheet.

            spdlog::warn(catenate("rule: ", rule.id_, " skipped for sheet: ", grid.GetSheetName(), ". ", e.what()));
            diagnostics.push_back({rule.id_, rule.field_, grid.GetSheetName(), e.what()});
            return true;
        }

        if (! address)
        {
            if (report_missing_field)
            {
                results.push_back(MissingFieldResult(submission_ID, rule, grid.GetSheetName()));
            }
            return false;
        }

        for (const auto& [row, column] : address->Expand())
        {
            auto result = StartResult(submission_ID, rule);
            result.cell_value_ = CellValueToString(grid.CellAt(row, column));

            auto outcome = EvaluateCondition(condition, result.cell_value_, rule.error_message_);
            result.is_valid_ = outcome.is_valid_;
            result.message_ = std::move(outcome.message_);
            result.cell_reference_ = MakeCellReference(row, column);
            result.sheet_name_ = grid.GetSheetName();
            result.row_number_ = row;
            result.column_number_ = column;
            result.column_name_ = OrdinalToColumn(column);
            results.push_back(std::move(result));
        }
        return true;
    }

}  // namespace

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ValidateSheet
 *  Description:
 * =====================================================================================
 */
RR::ValidationResults ValidateSheet (RR::SubmissionID submission_ID, const RR::ValidationRules& rules,
        const RR::SheetGrid& grid, RR::RuleDiagnostics& diagnostics, std::size_t max_cells_per_rule)
{
    RR::ValidationResults results;

    for (const auto& rule : rules)
    {
        auto before = results.size();
        const auto condition = ParseCondition(rule.rule_type_, rule.condition_);
        NoteUnrecognizedCondition(rule, condition, grid.GetSheetName(), diagnostics);
        ApplyRuleToSheet(submission_ID, rule, condition, grid, diagnostics, max_cells_per_rule, results, true);
        spdlog::debug(catenate("rule: ", rule.id_, " field: ", rule.field_, " produced: ", results.size() - before, " results."));
    }
    return results;
}		// -----  end of function ValidateSheet  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ValidateSubmission
 *  Description:
 * =====================================================================================
 */
RR::SubmissionValidation ValidateSubmission (RR::SubmissionID submission_ID, const RR::ValidationRules& rules,
        const RR::SheetGrids& sheets, std::size_t max_cells_per_rule)
{
    RR::SubmissionValidation validation;
    validation.submission_ID_ = submission_ID.get();

    auto sheet_not_found = [&validation, submission_ID](const RR::ValidationRule& rule, int sheet_number)
    {
        auto result = StartResult(submission_ID, rule);
        result.message_ = catenate("Sheet not found: ", sheet_number);
        result.severity_ = RR::Severity::e_Error;
        result.is_valid_ = false;
        validation.results_.push_back(std::move(result));
    };

    for (const auto& rule : rules)
    {
        const auto condition = ParseCondition(rule.rule_type_, rule.condition_);

        if (rule.sheet_ID_)
        {
            const int sheet_number = *rule.sheet_ID_;
            if (sheet_number < 1 || sheet_number > static_cast<int>(sheets.size()))
            {
                sheet_not_found(rule, sheet_number);
                continue;
            }
            const auto& grid = sheets[sheet_number - 1];
            NoteUnrecognizedCondition(rule, condition, grid.GetSheetName(), validation.diagnostics_);
            ApplyRuleToSheet(submission_ID, rule, condition, grid, validation.diagnostics_, max_cells_per_rule,
                    validation.results_, true);
            continue;
        }

        // no sheet given so the rule applies to every sheet. a named field
        // is checked on the sheets which have it and fails only when none do.

        if (sheets.empty())
        {
            sheet_not_found(rule, 1);
            continue;
        }

        NoteUnrecognizedCondition(rule, condition, std::nullopt, validation.diagnostics_);

        bool field_found{false};
        for (const auto& grid : sheets)
        {
            if (ApplyRuleToSheet(submission_ID, rule, condition, grid, validation.diagnostics_, max_cells_per_rule,
                    validation.results_, false))
            {
                field_found = true;
            }
        }
        if (! field_found)
        {
            validation.results_.push_back(MissingFieldResult(submission_ID, rule,
                    sheets.size() == 1 ? std::optional<std::string>{sheets.front().GetSheetName()} : std::nullopt));
        }
    }

    validation.summary_ = SummarizeResults(validation.results_, static_cast<int>(rules.size()));
    validation.status_ = DetermineStatus(validation.summary_);

    spdlog::info(catenate("submission: ", submission_ID.get(), " checks: ", validation.summary_.total_checks_,
        " errors: ", validation.summary_.error_count_, " warnings: ", validation.summary_.warning_count_,
        " diagnostics: ", validation.diagnostics_.size(), " status: ", StatusToString(validation.status_)));

    return validation;
}		// -----  end of function ValidateSubmission  -----

RR::ValidationSummary SummarizeResults (const RR::ValidationResults& results, int total_rules)
{
    RR::ValidationSummary summary;
    summary.total_rules_ = total_rules;
    summary.total_checks_ = static_cast<int>(results.size());
    summary.passed_checks_ = static_cast<int>(rng::count_if(results, [](const auto& r) { return r.is_valid_; }));
    summary.failed_checks_ = summary.total_checks_ - summary.passed_checks_;

    for (const auto& failure : results | rng::views::filter([](const auto& r) { return ! r.is_valid_; }))
    {
        if (failure.severity_ == RR::Severity::e_Error)
        {
            ++summary.error_count_;
        }
        else
        {
            ++summary.warning_count_;
        }
    }
    return summary;
}		// -----  end of function SummarizeResults  -----

RR::ValidationStatus DetermineStatus (const RR::ValidationSummary& summary)
{
    return summary.error_count_ > 0 ? RR::ValidationStatus::e_Failed : RR::ValidationStatus::e_Passed;
}		// -----  end of function DetermineStatus  -----
