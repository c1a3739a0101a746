// =====================================================================================
//
//       Filename:  ResultsSink.h
//
//    Description:  text forms of validation results and XBRL validation reports.
//
//        Version:  1.0
//        Created:  09/14/2026 10:05:33 AM
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

#ifndef  RESULTSSINK_INC
#define  RESULTSSINK_INC

#include <stop_token>
#include <string>

#include "RegReport.h"
#include "ValidationRules.h"
#include "XBRL_Model.h"

// one tab separated line per result after a header line. diagnostics and
// the summary follow as '#' lines.

std::string FormatValidationResults(const RR::SubmissionValidation& validation);

// status line, then one line per error and warning.

std::string FormatXBRLValidationReport(const RR::XBRLValidationReport& report);

// one tab separated line per fact.

std::string FormatXBRLFacts(const RR::XBRLInstance& instance);

void WriteValidationResults(const RR::SubmissionValidation& validation, const RR::FileName& output_file_name,
        std::stop_token stop_token = {});

#endif   // ----- #ifndef RESULTSSINK_INC  -----
