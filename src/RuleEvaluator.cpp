// =====================================================================================
//
//       Filename:  RuleEvaluator.cpp
//
//    Description:  turn a rule's condition text into a typed condition and apply
//                  it to a single cell value.
//
//        Version:  1.0
//        Created:  09/10/2026 08:47:02 AM
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

#include "RuleEvaluator.h"

#include <array>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/find.hpp>

namespace rng = ranges;

#include <spdlog/spdlog.h>

#include "RegReport_Utils.h"

namespace RC = RR::Conditions;

// helpers for taking conditions apart.

namespace
{
    template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
    template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

    std::string Unquote(const std::string& text)
    {
        if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') && text.back() == text.front())
        {
            return text.substr(1, text.size() - 2);
        }
        return text;
    }

    std::optional<boost::regex> CompilePattern(const std::string& pattern)
    {
        try
        {
            return boost::regex{pattern};
        }
        catch (const boost::regex_error& e)
        {
            spdlog::debug(catenate("Can't use pattern: '", pattern, "' ", e.what()));
        }
        return std::nullopt;
    }

    std::optional<RC::Range> ParseRangeCondition(const std::string& condition)
    {
        static const boost::regex regex_bound{R"***(^[[:space:]]*(min|max)[[:space:]]*[:=][[:space:]]*(\S+)[[:space:]]*$)***",
            boost::regex_constants::icase};

        auto parts = split_string<std::string>(condition, ',');
        if (parts.empty() || parts.size() > 2)
        {
            return std::nullopt;
        }

        RC::Range result;

        // plain 'min,max' pair

        if (parts.size() == 2)
        {
            auto low = ParseDecimal(parts[0]);
            auto high = ParseDecimal(parts[1]);
            if (low && high)
            {
                result.min_ = low;
                result.max_ = high;
                return result;
            }
        }

        for (const auto& part : parts)
        {
            boost::smatch matches;
            if (! boost::regex_match(part, matches, regex_bound))
            {
                return std::nullopt;
            }
            auto value = ParseDecimal(matches.str(2));
            if (! value)
            {
                return std::nullopt;
            }
            if (boost::algorithm::iequals(matches.str(1), "min"))
            {
                result.min_ = value;
            }
            else
            {
                result.max_ = value;
            }
        }
        return result;
    }

    std::optional<RC::Comparison> ParseComparison(const std::string& condition)
    {
        static const boost::regex regex_or{R"***([[:space:]]+OR[[:space:]]+)***", boost::regex_constants::icase};
        static const boost::regex regex_and{R"***([[:space:]]+AND[[:space:]]+)***", boost::regex_constants::icase};
        static const boost::regex regex_term{R"***(^[[:space:]]*value[[:space:]]*(>=|<=|!=|==|=|>|<)[[:space:]]*(.+?)[[:space:]]*$)***",
            boost::regex_constants::icase};

        using Op = RC::ComparisonTerm::Op;

        RC::Comparison result;

        boost::sregex_token_iterator or_end;
        for (boost::sregex_token_iterator or_itor(condition.begin(), condition.end(), regex_or, -1); or_itor != or_end; ++or_itor)
        {
            const std::string conjunction = or_itor->str();
            std::vector<RC::ComparisonTerm> terms;

            for (boost::sregex_token_iterator and_itor(conjunction.begin(), conjunction.end(), regex_and, -1);
                    and_itor != or_end; ++and_itor)
            {
                const std::string term_text = and_itor->str();
                boost::smatch matches;
                if (! boost::regex_match(term_text, matches, regex_term))
                {
                    return std::nullopt;
                }

                RC::ComparisonTerm term;
                const std::string op = matches.str(1);
                if (op == "<") { term.op_ = Op::e_Less; }
                else if (op == "<=") { term.op_ = Op::e_LessEqual; }
                else if (op == ">") { term.op_ = Op::e_Greater; }
                else if (op == ">=") { term.op_ = Op::e_GreaterEqual; }
                else if (op == "!=") { term.op_ = Op::e_NotEqual; }
                else { term.op_ = Op::e_Equal; }

                const std::string operand = matches.str(2);
                term.operand_ = Unquote(operand);
                if (term.operand_ == operand)
                {
                    // not quoted so it has to be a number.

                    term.number_ = ParseDecimal(operand);
                    if (! term.number_)
                    {
                        return std::nullopt;
                    }
                }
                else if (term.op_ != Op::e_Equal && term.op_ != Op::e_NotEqual)
                {
                    // strings are only tested for (in)equality.

                    return std::nullopt;
                }
                terms.push_back(std::move(term));
            }
            if (terms.empty())
            {
                return std::nullopt;
            }
            result.any_of_.push_back(std::move(terms));
        }
        if (result.any_of_.empty())
        {
            return std::nullopt;
        }
        return result;
    }

    // 'VALUE IN ["a", "b"]' or 'in:a|b|c'

    std::optional<RC::OneOf> ParseChoices(const std::string& condition)
    {
        static const boost::regex regex_value_in{R"***(^[[:space:]]*value[[:space:]]+in[[:space:]]*\[(.*)\][[:space:]]*$)***",
            boost::regex_constants::icase};
        static const boost::regex regex_in{R"***(^[[:space:]]*(?:in|one_of)[[:space:]]*:(.*)$)***",
            boost::regex_constants::icase};

        boost::smatch matches;
        char delim = ',';
        if (! boost::regex_match(condition, matches, regex_value_in))
        {
            if (! boost::regex_match(condition, matches, regex_in))
            {
                return std::nullopt;
            }
            delim = '|';
        }

        RC::OneOf result;
        for (const auto& choice : split_string<std::string>(matches.str(1), delim))
        {
            auto the_choice = Unquote(TrimCopy(choice));
            if (! the_choice.empty())
            {
                result.choices_.push_back(std::move(the_choice));
            }
        }
        if (result.choices_.empty())
        {
            return std::nullopt;
        }
        return result;
    }

    bool LooksLikeDate(const std::string& value)
    {
        static const std::array<std::string, 6> date_formats{"%Y-%m-%d", "%Y/%m/%d", "%m/%d/%Y", "%d-%b-%Y", "%d %b %Y", "%b %d, %Y"};

        return rng::any_of(date_formats, [&value](const auto& fmt) { return StringToDateYMD(fmt, value).has_value(); });
    }

    bool ApplyTerm(const RC::ComparisonTerm& term, const std::string& value)
    {
        using Op = RC::ComparisonTerm::Op;

        if (! term.number_)
        {
            return term.op_ == Op::e_Equal ? value == term.operand_ : value != term.operand_;
        }
        auto number = ParseDecimal(value);
        if (! number)
        {
            return false;
        }
        switch (term.op_)
        {
            case Op::e_Less: return *number < *term.number_;
            case Op::e_LessEqual: return *number <= *term.number_;
            case Op::e_Greater: return *number > *term.number_;
            case Op::e_GreaterEqual: return *number >= *term.number_;
            case Op::e_Equal: return *number == *term.number_;
            case Op::e_NotEqual: return *number != *term.number_;
        }
        return false;
    }

}  // namespace

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ParseCondition
 *  Description:
 * =====================================================================================
 */
RR::Condition ParseCondition (RR::RuleType rule_type, RR::sv condition)
{
    const std::string the_condition = TrimCopy(condition);
    const std::string lc_condition = boost::algorithm::to_lower_copy(the_condition);

    if (lc_condition == "not_empty" || lc_condition == "required" || lc_condition == "not empty")
    {
        return RC::NotEmpty{};
    }
    if (lc_condition == "numeric" || lc_condition == "number" || lc_condition == "format=number"
            || lc_condition == "type_is_number" || lc_condition == "type_is_numeric"
            || lc_condition == "type_is_decimal")
    {
        return RC::Numeric{};
    }
    if (lc_condition == "email" || lc_condition == "type_is_email")
    {
        return RC::Email{};
    }
    if (lc_condition == "phone")
    {
        return RC::Phone{};
    }
    if (lc_condition == "date" || lc_condition == "type_is_date")
    {
        return RC::Date{};
    }

    // explicit patterns keep their original case.

    static const boost::regex regex_pattern_call{R"***(^regex\((.*)\)$)***", boost::regex_constants::icase};
    std::optional<std::string> pattern;
    if (lc_condition.starts_with("regex:"))
    {
        pattern = the_condition.substr(6);
    }
    else if (boost::smatch matches; boost::regex_match(the_condition, matches, regex_pattern_call))
    {
        pattern = Unquote(TrimCopy(matches.str(1)));
    }
    if (pattern)
    {
        if (auto compiled = CompilePattern(*pattern); compiled)
        {
            return RC::Regex{*pattern, std::move(*compiled)};
        }
        return RC::Other{the_condition};
    }

    if (lc_condition.starts_with("equals:") || lc_condition.starts_with("exact:"))
    {
        return RC::Exact{the_condition.substr(the_condition.find(':') + 1)};
    }
    if (auto choices = ParseChoices(the_condition); choices)
    {
        return *choices;
    }
    if (auto range = ParseRangeCondition(the_condition); range)
    {
        return *range;
    }
    if (lc_condition.find("value") != std::string::npos)
    {
        if (auto comparison = ParseComparison(the_condition); comparison)
        {
            return *comparison;
        }
    }

    if (rule_type == RR::RuleType::e_Required)
    {
        return RC::NotEmpty{};
    }
    if (rule_type == RR::RuleType::e_Format && ! the_condition.empty())
    {
        if (auto compiled = CompilePattern(the_condition); compiled)
        {
            return RC::Regex{the_condition, std::move(*compiled)};
        }
    }
    return RC::Other{the_condition};
}		// -----  end of function ParseCondition  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  EvaluateCondition
 *  Description:  format checks (email, phone, date, regex) let empty values
 *                through. use NOT_EMPTY to require a value.
 * =====================================================================================
 */
RR::ConditionOutcome EvaluateCondition (const RR::Condition& condition, RR::sv cell_value, RR::sv error_message)
{
    static const boost::regex regex_email{R"***(^[^[:space:]@]+@[^[:space:]@]+\.[^[:space:]@]+$)***"};
    static const boost::regex regex_phone{R"***(^\+?[0-9[:space:]()-]+$)***"};

    const std::string value = TrimCopy(cell_value);
    std::string extra_message;

    bool is_valid = std::visit(overloaded {
        [&value](const RC::NotEmpty&) { return ! value.empty(); },
        [&value](const RC::Numeric&) { return ParseDecimal(value).has_value(); },
        [&value, &extra_message](const RC::Range& range)
        {
            auto number = ParseDecimal(value);
            if (! number)
            {
                extra_message = " (not a number)";
                return false;
            }
            return (! range.min_ || *number >= *range.min_) && (! range.max_ || *number <= *range.max_);
        },
        [&value](const RC::Email&) { return value.empty() || boost::regex_match(value, regex_email); },
        [&value](const RC::Phone&) { return value.empty() || boost::regex_match(value, regex_phone); },
        [&value](const RC::Date&) { return value.empty() || LooksLikeDate(value); },
        [&value](const RC::Regex& regex) { return value.empty() || boost::regex_search(value, regex.regex_); },
        [&value](const RC::Exact& exact) { return value == exact.expected_; },
        [&value](const RC::OneOf& one_of) { return rng::find(one_of.choices_, value) != one_of.choices_.end(); },
        [&value](const RC::Comparison& comparison)
        {
            return rng::any_of(comparison.any_of_, [&value](const auto& terms)
                { return rng::all_of(terms, [&value](const auto& term) { return ApplyTerm(term, value); }); });
        },
        [](const RC::Other&) { return true; }
    }, condition);

    if (is_valid)
    {
        return {true, {}};
    }
    return {false, catenate(error_message, extra_message)};
}		// -----  end of function EvaluateCondition  -----
