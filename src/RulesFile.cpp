// =====================================================================================
//
//       Filename:  RulesFile.cpp
//
//    Description:  read validation rules from the plain text rule file format.
//
//        Version:  1.0
//        Created:  09/11/2026 09:29:14 AM
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

#include "RulesFile.h"

#include <algorithm>
#include <charconv>

#include <boost/algorithm/string/case_conv.hpp>

#include <spdlog/spdlog.h>

#include "RegReport_Utils.h"

namespace
{
    struct RuleBlock
    {
        int first_line_ = 0;
        std::vector<std::pair<std::string, std::string>> entries_;
    };

    std::optional<int> ParseInt(const std::string& text)
    {
        int result = 0;
        auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
        if (ec != std::errc() || p != text.data() + text.size())
        {
            return std::nullopt;
        }
        return result;
    }

    std::vector<RuleBlock> SplitIntoBlocks(RR::sv rules_content)
    {
        std::vector<RuleBlock> blocks;
        RuleBlock current;

        auto lines = split_string<RR::sv>(rules_content, '\n');
        for (int line_number = 1; const auto& line : lines)
        {
            const std::string the_line = TrimCopy(line);
            if (the_line == "---")
            {
                if (! current.entries_.empty())
                {
                    blocks.push_back(std::move(current));
                }
                current = {};
            }
            else if (! the_line.empty() && ! the_line.starts_with('#'))
            {
                if (auto pos = the_line.find(':'); pos != std::string::npos)
                {
                    if (current.entries_.empty())
                    {
                        current.first_line_ = line_number;
                    }
                    current.entries_.emplace_back(boost::algorithm::to_upper_copy(TrimCopy(RR::sv{the_line}.substr(0, pos))),
                            TrimCopy(RR::sv{the_line}.substr(pos + 1)));
                }
            }
            ++line_number;
        }
        if (! current.entries_.empty())
        {
            blocks.push_back(std::move(current));
        }
        return blocks;
    }

}  // namespace

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ParseRulesContent
 *  Description:
 * =====================================================================================
 */
RulesFileContent ParseRulesContent (RR::RulesContent rules_content, int template_ID)
{
    RulesFileContent result;

    std::vector<bool> needs_ID;

    for (const auto& block : SplitIntoBlocks(rules_content.get()))
    {
        RR::ValidationRule rule;
        rule.template_ID_ = template_ID;

        bool have_rule_type = false;
        bool have_ID = false;
        std::string bad_rule_type;
        std::vector<std::string> bad_values;

        auto note_problem = [&result, &rule, &block](const std::string& problem)
        {
            auto msg = catenate("Rule block at line ", block.first_line_, ": ", problem);
            spdlog::warn(msg);
            result.diagnostics_.push_back({std::nullopt, rule.field_, std::nullopt, std::move(msg)});
        };

        for (const auto& [key, value] : block.entries_)
        {
            if (key == "ID")
            {
                if (auto id = ParseInt(value); id)
                {
                    rule.id_ = *id;
                    have_ID = true;
                }
                else
                {
                    bad_values.push_back(catenate("ID is not a number: '", value, "'. A new ID is assigned."));
                }
            }
            else if (key == "SHEET")
            {
                if (auto sheet = ParseInt(value); sheet)
                {
                    rule.sheet_ID_ = *sheet;
                }
                else
                {
                    bad_values.push_back(catenate("SHEET is not a number: '", value, "'. Rule applies to every sheet."));
                }
            }
            else if (key == "FIELD")
            {
                rule.field_ = value;
            }
            else if (key == "RULE")
            {
                if (auto rule_type = StringToRuleType(value); rule_type)
                {
                    rule.rule_type_ = *rule_type;
                    have_rule_type = true;
                }
                else
                {
                    bad_rule_type = value;
                }
            }
            else if (key == "CONDITION")
            {
                rule.condition_ = value;
            }
            else if (key == "ERROR")
            {
                rule.error_message_ = value;
            }
            else if (key == "SEVERITY")
            {
                if (auto severity = StringToSeverity(value); severity)
                {
                    rule.severity_ = *severity;
                }
                else
                {
                    bad_values.push_back(catenate("unknown severity: '", value, "'. Using error."));
                }
            }
            else if (key == "ROWS")
            {
                rule.row_range_ = value;
            }
            else if (key == "COLUMNS")
            {
                rule.column_range_ = value;
            }
            else if (key == "CELLS")
            {
                rule.cell_range_ = value;
            }
            else if (key == "ALL_ROWS")
            {
                const std::string flag = boost::algorithm::to_lower_copy(value);
                rule.apply_to_all_rows_ = flag == "yes" || flag == "true" || flag == "1";
            }
        }

        for (const auto& problem : bad_values)
        {
            note_problem(problem);
        }
        if (! bad_rule_type.empty())
        {
            note_problem(catenate("unknown rule type: '", bad_rule_type, "'. Rule skipped."));
            continue;
        }
        if (! AllNotEmpty(rule.field_, rule.condition_, rule.error_message_) || ! have_rule_type)
        {
            note_problem("FIELD, RULE, CONDITION and ERROR are all needed. Rule skipped.");
            continue;
        }
        needs_ID.push_back(! have_ID);
        result.rules_.push_back(std::move(rule));
    }

    // now number the rules which came without an ID.

    int next_ID = 0;
    for (const auto& rule : result.rules_)
    {
        next_ID = std::max(next_ID, rule.id_);
    }
    for (size_t i = 0; i < result.rules_.size(); ++i)
    {
        if (needs_ID[i])
        {
            result.rules_[i].id_ = ++next_ID;
        }
    }

    spdlog::debug(catenate("found: ", result.rules_.size(), " rules. ", result.diagnostics_.size(), " problems."));
    return result;
}		// -----  end of function ParseRulesContent  -----

RulesFileContent LoadRulesFile (const RR::FileName& rules_file_name, int template_ID, std::stop_token stop_token)
{
    const std::string rules_text = LoadDataFileForUse(rules_file_name, stop_token);
    return ParseRulesContent(RR::RulesContent{rules_text}, template_ID);
}		// -----  end of function LoadRulesFile  -----
