// =====================================================================================
//
//       Filename:  RuleEvaluator.h
//
//    Description:  turn a rule's condition text into a typed condition and apply
//                  it to a single cell value.
//
//        Version:  1.0
//        Created:  09/10/2026 08:12:36 AM
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

#ifndef  RULEEVALUATOR_INC
#define  RULEEVALUATOR_INC

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <boost/regex.hpp>

#include "RegReport.h"
#include "ValidationRules.h"

namespace RegReport
{
    namespace Conditions
    {
        struct NotEmpty {};
        struct Numeric {};
        struct Email {};
        struct Phone {};
        struct Date {};

        struct Range
        {
            std::optional<double> min_;
            std::optional<double> max_;
        };

        // matches anywhere in the value unless the pattern is anchored.

        struct Regex
        {
            std::string pattern_;
            boost::regex regex_;
        };

        struct Exact
        {
            std::string expected_;
        };

        struct OneOf
        {
            std::vector<std::string> choices_;
        };

        // value > 100 AND value < 1000 OR value = 0
        // AND binds tighter than OR.

        struct ComparisonTerm
        {
            enum class Op
            {
                e_Less,
                e_LessEqual,
                e_Greater,
                e_GreaterEqual,
                e_Equal,
                e_NotEqual
            };

            Op op_ = Op::e_Equal;
            std::string operand_;
            std::optional<double> number_;
        };

        struct Comparison
        {
            std::vector<std::vector<ComparisonTerm>> any_of_;
        };

        // anything we don't understand. always passes.

        struct Other
        {
            std::string text_;
        };

    }		// namespace Conditions

    using Condition = std::variant<Conditions::NotEmpty, Conditions::Numeric, Conditions::Range,
          Conditions::Email, Conditions::Phone, Conditions::Date, Conditions::Regex,
          Conditions::Exact, Conditions::OneOf, Conditions::Comparison, Conditions::Other>;

    struct ConditionOutcome
    {
        bool is_valid_ = true;
        std::string message_;
    };

}		// namespace RegReport

// condition names are matched without regard to case.
// the rule type decides what an otherwise unrecognized condition means:
// a required rule still requires a value and a format rule treats the
// text as a regular expression. everything else becomes Other.

RR::Condition ParseCondition(RR::RuleType rule_type, RR::sv condition);

[[nodiscard]] inline bool IsOtherCondition(const RR::Condition& condition)
{
    return std::holds_alternative<RR::Conditions::Other>(condition);
}

// message is empty when the value is valid, otherwise the rule's error
// message. range checks on values which are not numbers say so.

RR::ConditionOutcome EvaluateCondition(const RR::Condition& condition, RR::sv cell_value, RR::sv error_message);

#endif   // ----- #ifndef RULEEVALUATOR_INC  -----
