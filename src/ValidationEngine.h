// =====================================================================================
//
//       Filename:  ValidationEngine.h
//
//    Description:  run a rule set over the sheets of one submission and collect
//                  one result for every rule and cell it addresses.
//
//        Version:  1.0
//        Created:  09/10/2026 01:15:44 PM
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

#ifndef  VALIDATIONENGINE_INC
#define  VALIDATIONENGINE_INC

#include <cstddef>

#include "RangeAddress.h"
#include "RegReport.h"
#include "SheetGrid.h"
#include "ValidationRules.h"

// sheet_ID_ is the 1-based position of the sheet in the submission.
// rules without one apply to every sheet. a named field is checked on the
// sheets which have it and gives one failing result when none do.

RR::SubmissionValidation ValidateSubmission(RR::SubmissionID submission_ID, const RR::ValidationRules& rules,
        const RR::SheetGrids& sheets, std::size_t max_cells_per_rule = RR::DEFAULT_MAX_CELLS_PER_RULE);

// all of the rules are applied to the given sheet. addressing problems and
// conditions we can't interpret are added to diagnostics.

RR::ValidationResults ValidateSheet(RR::SubmissionID submission_ID, const RR::ValidationRules& rules,
        const RR::SheetGrid& grid, RR::RuleDiagnostics& diagnostics,
        std::size_t max_cells_per_rule = RR::DEFAULT_MAX_CELLS_PER_RULE);

RR::ValidationSummary SummarizeResults(const RR::ValidationResults& results, int total_rules);

// failed if and only if there is at least one failing error.

RR::ValidationStatus DetermineStatus(const RR::ValidationSummary& summary);

#endif   // ----- #ifndef VALIDATIONENGINE_INC  -----
