// =====================================================================================
//
//       Filename:  SubmissionSynthesis.cpp
//
//    Description:  turn the label/value rows of a validated submission into an
//                  XBRL instance.
//
//        Version:  1.0
//        Created:  09/13/2026 03:29:51 PM
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

#include "SubmissionSynthesis.h"

#include <map>
#include <set>

#include <spdlog/spdlog.h>

#include "RegReport_Utils.h"

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  BuildInstanceFromSubmission
 *  Description:
 * =====================================================================================
 */
RR::XBRLInstance BuildInstanceFromSubmission (const RR::SubmissionValidation& validation, const RR::SheetGrids& sheets,
        const RR::XBRLTaxonomy& taxonomy, const SynthesisSettings& settings)
{
    if (validation.status_ != RR::ValidationStatus::e_Passed)
    {
        throw PreconditionException(catenate("Submission: ", validation.submission_ID_,
                    " has status: ", StatusToString(validation.status_), ". Only passed submissions can be reported."));
    }
    if (settings.entity_.empty() || settings.period_end_.empty())
    {
        throw PreconditionException("Reporting entity and period end are required to build an XBRL report.");
    }

    // both names and labels can identify a concept.

    std::map<std::string, const RR::TaxonomyConcept*> concepts_by_label;
    for (const auto& a_concept : taxonomy.concepts_)
    {
        if (a_concept.abstract_)
        {
            continue;
        }
        concepts_by_label.try_emplace(NormalizeLabel(a_concept.name_), &a_concept);
        concepts_by_label.try_emplace(NormalizeLabel(a_concept.label_), &a_concept);
    }

    const std::string period_start = settings.period_start_.empty() ? settings.period_end_ : settings.period_start_;
    const std::string duration_ID = catenate("D_", period_start, "_", settings.period_end_);
    const std::string instant_ID = catenate("I_", settings.period_end_);

    RR::XBRLInstance result;
    result.schema_ref_ = settings.schema_ref_;
    result.contexts_.push_back({duration_ID, settings.entity_, RR::DurationPeriod{period_start, settings.period_end_}});
    result.contexts_.push_back({instant_ID, settings.entity_, RR::InstantPeriod{settings.period_end_}});
    result.units_.push_back({settings.currency_, catenate("iso4217:", settings.currency_)});

    std::set<std::string> reported;

    for (const auto& sheet : sheets)
    {
        for (int row = 1; row <= sheet.RowCount(); ++row)
        {
            const std::string label = NormalizeLabel(CellValueToString(sheet.CellAt(row, 1)));
            if (label.empty())
            {
                continue;
            }
            auto found = concepts_by_label.find(label);
            if (found == concepts_by_label.end())
            {
                continue;
            }
            const auto& a_concept = *found->second;
            const std::string value = TrimCopy(CellValueToString(sheet.CellAt(row, 2)));
            if (value.empty())
            {
                continue;
            }
            if (! reported.insert(a_concept.name_).second)
            {
                spdlog::debug(catenate("sheet: ", sheet.GetSheetName(), " row: ", row, " repeats concept: ", a_concept.name_));
                continue;
            }

            RR::XBRLFact fact;
            fact.name_ = settings.concept_prefix_.empty() ? a_concept.name_ : catenate(settings.concept_prefix_, ':', a_concept.name_);
            if (! settings.concept_prefix_.empty())
            {
                fact.namespace_ = settings.concept_prefix_;
            }
            fact.type_ = a_concept.type_;
            fact.value_ = value;

            if (a_concept.period_type_.value_or("duration") == "instant")
            {
                fact.period_ = "instant";
                fact.context_ = instant_ID;
            }
            else
            {
                fact.period_ = "duration";
                fact.context_ = duration_ID;
            }
            if (IsMonetaryType(a_concept.type_))
            {
                fact.unit_ = settings.currency_;
                fact.decimals_ = settings.decimals_;
            }
            result.facts_.push_back(std::move(fact));
        }
    }

    if (! settings.concept_prefix_.empty() && ! taxonomy.target_namespace_.empty())
    {
        result.fact_namespaces_[settings.concept_prefix_] = taxonomy.target_namespace_;
    }

    // same derivation the parser uses.

    result.metadata_.entity_ = settings.entity_;
    result.metadata_.period_ = settings.period_end_;
    result.metadata_.currency_ = settings.currency_;
    result.metadata_.language_ = settings.language_;

    spdlog::info(catenate("submission: ", validation.submission_ID_, " mapped: ", result.facts_.size(),
        " facts from: ", sheets.size(), " sheets."));
    return result;
}		// -----  end of function BuildInstanceFromSubmission  -----

GeneratorSettings MakeGeneratorSettings (const RR::XBRLTaxonomy& taxonomy, const SynthesisSettings& settings,
        const std::string& entity_scheme)
{
    GeneratorSettings result;
    result.entity_scheme_ = entity_scheme;
    if (! settings.concept_prefix_.empty())
    {
        if (taxonomy.target_namespace_.empty())
        {
            spdlog::warn(catenate("taxonomy has no targetNamespace. prefix: ", settings.concept_prefix_, " is left undeclared."));
        }
        else
        {
            result.namespaces_.fact_namespaces_[settings.concept_prefix_] = taxonomy.target_namespace_;
        }
    }
    return result;
}		// -----  end of function MakeGeneratorSettings  -----
