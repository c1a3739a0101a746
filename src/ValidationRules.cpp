// =====================================================================================
//
//       Filename:  ValidationRules.cpp
//
//    Description:  text forms for rule types, severities and status.
//
//        Version:  1.0
//        Created:  09/09/2026 09:58:20 AM
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

#include "ValidationRules.h"

#include <boost/algorithm/string/case_conv.hpp>

#include "RegReport_Utils.h"

std::string RuleTypeToString (RR::RuleType rule_type)
{
    switch (rule_type)
    {
        case RR::RuleType::e_Required: return "required";
        case RR::RuleType::e_Format: return "format";
        case RR::RuleType::e_Range: return "range";
        case RR::RuleType::e_Custom: return "custom";
        case RR::RuleType::e_Cell: return "cell";
    }
    return "unknown";
}		// -----  end of function RuleTypeToString  -----

std::optional<RR::RuleType> StringToRuleType (RR::sv text)
{
    const std::string rule_type = boost::algorithm::to_lower_copy(TrimCopy(text));

    if (rule_type == "required")
    {
        return RR::RuleType::e_Required;
    }
    if (rule_type == "format")
    {
        return RR::RuleType::e_Format;
    }
    if (rule_type == "range")
    {
        return RR::RuleType::e_Range;
    }
    if (rule_type == "custom")
    {
        return RR::RuleType::e_Custom;
    }
    if (rule_type == "cell")
    {
        return RR::RuleType::e_Cell;
    }
    return std::nullopt;
}		// -----  end of function StringToRuleType  -----

std::string SeverityToString (RR::Severity severity)
{
    return severity == RR::Severity::e_Error ? "error" : "warning";
}		// -----  end of function SeverityToString  -----

std::optional<RR::Severity> StringToSeverity (RR::sv text)
{
    const std::string severity = boost::algorithm::to_lower_copy(TrimCopy(text));

    if (severity == "error")
    {
        return RR::Severity::e_Error;
    }
    if (severity == "warning")
    {
        return RR::Severity::e_Warning;
    }
    return std::nullopt;
}		// -----  end of function StringToSeverity  -----

std::string StatusToString (RR::ValidationStatus status)
{
    return status == RR::ValidationStatus::e_Passed ? "passed" : "failed";
}		// -----  end of function StatusToString  -----
