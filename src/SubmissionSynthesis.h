// =====================================================================================
//
//       Filename:  SubmissionSynthesis.h
//
//    Description:  turn the label/value rows of a validated submission into an
//                  XBRL instance.
//
//        Version:  1.0
//        Created:  09/13/2026 03:10:26 PM
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

#ifndef  SUBMISSIONSYNTHESIS_INC
#define  SUBMISSIONSYNTHESIS_INC

#include <string>

#include "RegReport.h"
#include "SheetGrid.h"
#include "ValidationRules.h"
#include "XBRL_Generator.h"
#include "XBRL_Model.h"

struct SynthesisSettings
{
    std::string entity_;
    std::string period_start_;
    std::string period_end_;
    std::string currency_ = "USD";
    std::string decimals_ = "0";
    std::string schema_ref_;
    std::string concept_prefix_ = "rr";
    std::string language_;
};

// column A holds a concept name or label, column B its value. rows which
// match no non-abstract concept are ignored. the first value found for a
// concept wins.
// throws PreconditionException when the submission did not pass or the
// reporting entity or period end is missing.

RR::XBRLInstance BuildInstanceFromSubmission(const RR::SubmissionValidation& validation, const RR::SheetGrids& sheets,
        const RR::XBRLTaxonomy& taxonomy, const SynthesisSettings& settings);

// binds the concept prefix to the taxonomy's target namespace.

GeneratorSettings MakeGeneratorSettings(const RR::XBRLTaxonomy& taxonomy, const SynthesisSettings& settings,
        const std::string& entity_scheme);

#endif   // ----- #ifndef SUBMISSIONSYNTHESIS_INC  -----
