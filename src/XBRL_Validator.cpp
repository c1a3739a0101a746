// =====================================================================================
//
//       Filename:  XBRL_Validator.cpp
//
//    Description:  check an XBRL instance against a template built from its taxonomy.
//
//        Version:  1.0
//        Created:  09/13/2026 09:58:40 AM
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

#include "XBRL_Validator.h"

#include <map>
#include <set>

#include <fmt/format.h>

#include <range/v3/algorithm/contains.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

namespace rng = ranges;

#include <spdlog/spdlog.h>

#include "RegReport_Utils.h"

namespace
{
    void CheckPeriodDates (const RR::XBRLContext& context, std::vector<std::string>& warnings)
    {
        const auto* duration = std::get_if<RR::DurationPeriod>(&context.period_);
        if (duration == nullptr)
        {
            if (const auto* instant = std::get_if<RR::InstantPeriod>(&context.period_);
                    instant != nullptr && ! StringToDateYMD("%F", instant->instant_))
            {
                warnings.push_back(catenate("Context ", context.ID_, " has an invalid date: '", instant->instant_, "'"));
            }
            return;
        }

        auto start_date = StringToDateYMD("%F", duration->start_date_);
        auto end_date = StringToDateYMD("%F", duration->end_date_);
        if (! start_date)
        {
            warnings.push_back(catenate("Context ", context.ID_, " has an invalid date: '", duration->start_date_, "'"));
        }
        if (! end_date)
        {
            warnings.push_back(catenate("Context ", context.ID_, " has an invalid date: '", duration->end_date_, "'"));
        }
        if (start_date && end_date && *start_date > *end_date)
        {
            warnings.push_back(catenate("Context ", context.ID_, " period starts after it ends: ",
                        duration->start_date_, " > ", duration->end_date_));
        }
    }
}  // namespace

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  CreateXBRLTemplate
 *  Description:
 * =====================================================================================
 */
RR::XBRLTemplate CreateXBRLTemplate (const RR::XBRLTaxonomy& taxonomy)
{
    RR::XBRLTemplate result;
    result.taxonomy_ = taxonomy;

    for (const auto& a_concept : taxonomy.concepts_ | rng::views::filter([](const auto& c) { return ! c.abstract_; }))
    {
        result.required_concepts_.push_back(a_concept.name_);
        result.validation_rules_.push_back({a_concept.name_,
                IsMonetaryType(a_concept.type_) ? RR::TemplateRuleKind::e_Numeric : RR::TemplateRuleKind::e_Required,
                catenate(a_concept.label_.empty() ? a_concept.name_ : a_concept.label_, " is required")});
    }

    result.reporting_periods_ = {"quarterly", "annual"};
    result.currencies_ = {"USD", "EUR", "GBP", "INR"};

    spdlog::debug(catenate("template: required concepts: ", result.required_concepts_.size()));
    return result;
}		// -----  end of function CreateXBRLTemplate  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ValidateXBRLInstance
 *  Description:  concepts are matched on their local names. the instance
 *                prefixes are whatever the filer chose.
 * =====================================================================================
 */
RR::XBRLValidationReport ValidateXBRLInstance (const RR::XBRLInstance& instance, const RR::XBRLTemplate& xbrl_template)
{
    RR::XBRLValidationReport result;

    const auto provided_concepts = instance.facts_
        | rng::views::transform([](const auto& f) { return LocalName(f.name_); })
        | rng::to<std::set<std::string>>();

    std::vector<std::string> missing_concepts;
    for (const auto& required : xbrl_template.required_concepts_)
    {
        if (! provided_concepts.contains(LocalName(required)))
        {
            missing_concepts.push_back(required);
        }
    }
    if (! missing_concepts.empty())
    {
        result.errors_.push_back(catenate("Missing required concepts: ", fmt::join(missing_concepts, ", ")));
    }

    std::multimap<std::string, const RR::TemplateRule*> rules_by_concept;
    for (const auto& rule : xbrl_template.validation_rules_)
    {
        rules_by_concept.emplace(LocalName(rule.concept_), &rule);
    }
    const auto known_concepts = xbrl_template.taxonomy_.concepts_
        | rng::views::transform([](const auto& c) { return c.name_; })
        | rng::to<std::set<std::string>>();

    std::set<std::string> context_IDs;
    for (const auto& context : instance.contexts_)
    {
        if (! context_IDs.insert(context.ID_).second)
        {
            result.errors_.push_back(catenate("Duplicate context id: ", context.ID_));
        }
    }
    const auto unit_IDs = instance.units_
        | rng::views::transform([](const auto& u) { return u.ID_; })
        | rng::to<std::set<std::string>>();

    for (const auto& fact : instance.facts_)
    {
        const std::string local_name = LocalName(fact.name_);

        auto [first_rule, last_rule] = rules_by_concept.equal_range(local_name);
        for (auto rule = first_rule; rule != last_rule; ++rule)
        {
            switch (rule->second->rule_)
            {
                case RR::TemplateRuleKind::e_Numeric:
                    if (! ParseDecimal(fact.value_))
                    {
                        result.errors_.push_back(catenate(fact.name_, ": ", fact.name_, " must be a valid number"));
                    }
                    if (! fact.unit_)
                    {
                        result.warnings_.push_back(catenate(fact.name_, ": numeric value without a unit"));
                    }
                    break;

                case RR::TemplateRuleKind::e_Required:
                    if (fact.value_.empty())
                    {
                        result.errors_.push_back(catenate(fact.name_, ": ", fact.name_, " is required"));
                    }
                    break;
            }
        }

        if (! known_concepts.empty() && ! known_concepts.contains(local_name))
        {
            result.warnings_.push_back(catenate(fact.name_, ": concept not found in taxonomy"));
        }
        if (fact.context_ && ! context_IDs.contains(*fact.context_))
        {
            result.errors_.push_back(catenate(fact.name_, ": context '", *fact.context_, "' is not defined"));
        }
        if (fact.unit_ && ! unit_IDs.contains(*fact.unit_))
        {
            result.errors_.push_back(catenate(fact.name_, ": unit '", *fact.unit_, "' is not defined"));
        }
    }

    for (const auto& context : instance.contexts_)
    {
        if (context.entity_.empty())
        {
            result.errors_.push_back(catenate("Context ", context.ID_, " missing entity information"));
        }
        CheckPeriodDates(context, result.warnings_);
    }

    for (const auto& unit : instance.units_)
    {
        if (NamePrefix(unit.measure_) != "iso4217")
        {
            continue;
        }
        if (auto currency = LocalName(unit.measure_); ! rng::contains(xbrl_template.currencies_, currency))
        {
            result.warnings_.push_back(catenate("Unit ", unit.ID_, " currency ", currency, " is not one of: ",
                        fmt::join(xbrl_template.currencies_, ", ")));
        }
    }

    result.is_valid_ = result.errors_.empty();

    spdlog::info(catenate("instance: ", instance.metadata_.entity_, " facts: ", instance.facts_.size(),
        " errors: ", result.errors_.size(), " warnings: ", result.warnings_.size()));
    return result;
}		// -----  end of function ValidateXBRLInstance  -----
