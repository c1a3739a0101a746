// =====================================================================================
//
//       Filename:  ValidationRules.h
//
//    Description:  rules, results and summaries shared by the sheet validation code.
//
//        Version:  1.0
//        Created:  09/09/2026 09:32:05 AM
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

#ifndef  VALIDATIONRULES_INC
#define  VALIDATIONRULES_INC

#include <optional>
#include <string>
#include <vector>

#include "RegReport.h"

namespace RegReport
{
    enum class RuleType
    {
        e_Required,
        e_Format,
        e_Range,
        e_Custom,
        e_Cell
    };

    enum class Severity
    {
        e_Error,
        e_Warning
    };

    enum class ValidationStatus
    {
        e_Passed,
        e_Failed
    };

    // at most one addressing mode is used. precedence is:
    // cell_range_, then row_range_/column_range_, then apply_to_all_rows_,
    // then field_ alone.

    struct ValidationRule
    {
        int id_ = 0;
        int template_ID_ = 0;
        std::optional<int> sheet_ID_;
        RuleType rule_type_ = RuleType::e_Required;
        std::string field_;
        std::string condition_;
        std::string error_message_;
        Severity severity_ = Severity::e_Error;
        std::optional<std::string> row_range_;
        std::optional<std::string> column_range_;
        std::optional<std::string> cell_range_;
        bool apply_to_all_rows_ = false;

        bool operator==(const ValidationRule& rhs) const = default;
    };

    using ValidationRules = std::vector<ValidationRule>;

    struct ValidationResult
    {
        int submission_ID_ = 0;
        std::optional<int> rule_ID_;
        std::string field_;
        std::optional<RuleType> rule_type_;
        std::optional<std::string> condition_;
        std::optional<std::string> cell_reference_;
        std::string cell_value_;
        std::string message_;
        Severity severity_ = Severity::e_Error;
        bool is_valid_ = false;
        std::optional<std::string> sheet_name_;
        std::optional<int> row_number_;
        std::optional<int> column_number_;
        std::optional<std::string> column_name_;

        bool operator==(const ValidationResult& rhs) const = default;
    };

    using ValidationResults = std::vector<ValidationResult>;

    // rule authoring problems. these never decide pass/fail.

    struct RuleDiagnostic
    {
        std::optional<int> rule_ID_;
        std::string field_;
        std::optional<std::string> sheet_name_;
        std::string message_;

        bool operator==(const RuleDiagnostic& rhs) const = default;
    };

    using RuleDiagnostics = std::vector<RuleDiagnostic>;

    struct ValidationSummary
    {
        int total_rules_ = 0;
        int total_checks_ = 0;
        int passed_checks_ = 0;
        int failed_checks_ = 0;
        int error_count_ = 0;
        int warning_count_ = 0;

        bool operator==(const ValidationSummary& rhs) const = default;
    };

    struct SubmissionValidation
    {
        int submission_ID_ = 0;
        ValidationResults results_;
        RuleDiagnostics diagnostics_;
        ValidationSummary summary_;
        ValidationStatus status_ = ValidationStatus::e_Passed;
    };

}		// namespace RegReport

// text forms are the ones used in rule files and result files.

std::string RuleTypeToString(RR::RuleType rule_type);
std::optional<RR::RuleType> StringToRuleType(RR::sv text);

std::string SeverityToString(RR::Severity severity);
std::optional<RR::Severity> StringToSeverity(RR::sv text);

std::string StatusToString(RR::ValidationStatus status);

#endif   // ----- #ifndef VALIDATIONRULES_INC  -----
