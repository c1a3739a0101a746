// =====================================================================================
//
//       Filename:  ResultsSink.cpp
//
//    Description:  text forms of validation results and XBRL validation reports.
//
//        Version:  1.0
//        Created:  09/14/2026 10:21:09 AM
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

#include "ResultsSink.h"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>

#include "RegReport_Utils.h"

namespace
{
    // values go in unchanged except for the field and record separators.

    std::string CleanField (RR::sv text)
    {
        std::string result{text};
        std::replace_if(result.begin(), result.end(), [](char c) { return c == '\t' || c == '\n' || c == '\r'; }, ' ');
        return result;
    }

    template<typename T>
    std::string OptionalField (const std::optional<T>& value)
    {
        if (! value)
        {
            return {};
        }
        return CleanField(fmt::format("{}", *value));
    }
}  // namespace

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  FormatValidationResults
 *  Description:
 * =====================================================================================
 */
std::string FormatValidationResults (const RR::SubmissionValidation& validation)
{
    std::string result{"submission\trule\tsheet\tcell\trow\tcolumn\tcolumn_name\tfield\trule_type\tcondition\tvalue\tvalid\tseverity\tmessage\n"};

    auto out = std::back_inserter(result);
    for (const auto& a_result : validation.results_)
    {
        fmt::format_to(out, "{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\n",
                a_result.submission_ID_,
                OptionalField(a_result.rule_ID_),
                OptionalField(a_result.sheet_name_),
                OptionalField(a_result.cell_reference_),
                OptionalField(a_result.row_number_),
                OptionalField(a_result.column_number_),
                OptionalField(a_result.column_name_),
                CleanField(a_result.field_),
                a_result.rule_type_ ? RuleTypeToString(*a_result.rule_type_) : std::string{},
                OptionalField(a_result.condition_),
                CleanField(a_result.cell_value_),
                a_result.is_valid_ ? "yes" : "no",
                SeverityToString(a_result.severity_),
                CleanField(a_result.message_));
    }

    for (const auto& diagnostic : validation.diagnostics_)
    {
        fmt::format_to(out, "# diagnostic\trule: {}\tsheet: {}\tfield: {}\t{}\n", OptionalField(diagnostic.rule_ID_),
                OptionalField(diagnostic.sheet_name_), CleanField(diagnostic.field_), CleanField(diagnostic.message_));
    }

    const auto& summary = validation.summary_;
    fmt::format_to(out, "# summary\tstatus: {}\trules: {}\tchecks: {}\tpassed: {}\tfailed: {}\terrors: {}\twarnings: {}\n",
            StatusToString(validation.status_), summary.total_rules_, summary.total_checks_, summary.passed_checks_,
            summary.failed_checks_, summary.error_count_, summary.warning_count_);

    return result;
}		// -----  end of function FormatValidationResults  -----

std::string FormatXBRLValidationReport (const RR::XBRLValidationReport& report)
{
    std::string result = catenate("status: ", report.is_valid_ ? "valid" : "invalid", '\n');
    for (const auto& error : report.errors_)
    {
        result += catenate("error\t", CleanField(error), '\n');
    }
    for (const auto& warning : report.warnings_)
    {
        result += catenate("warning\t", CleanField(warning), '\n');
    }
    return result;
}		// -----  end of function FormatXBRLValidationReport  -----

std::string FormatXBRLFacts (const RR::XBRLInstance& instance)
{
    std::string result{"name\ttype\tperiod\tcontext\tunit\tdecimals\tvalue\n"};

    auto out = std::back_inserter(result);
    for (const auto& fact : instance.facts_)
    {
        fmt::format_to(out, "{}\t{}\t{}\t{}\t{}\t{}\t{}\n", CleanField(fact.name_), CleanField(fact.type_), fact.period_,
                OptionalField(fact.context_), OptionalField(fact.unit_), OptionalField(fact.decimals_), CleanField(fact.value_));
    }
    return result;
}		// -----  end of function FormatXBRLFacts  -----

void WriteValidationResults (const RR::SubmissionValidation& validation, const RR::FileName& output_file_name,
        std::stop_token stop_token)
{
    WriteDataToFileAtomically(output_file_name, FormatValidationResults(validation), stop_token);
}		// -----  end of function WriteValidationResults  -----
