// =====================================================================================
//
//       Filename:  RulesFile.h
//
//    Description:  read validation rules from the plain text rule file format.
//
//                  # comment
//                  ID: 12
//                  SHEET: 1
//                  FIELD: A27
//                  RULE: required
//                  CONDITION: NOT_EMPTY
//                  ERROR: A27 must be filled in
//                  SEVERITY: error
//                  ROWS: 2-*
//                  COLUMNS: C-E
//                  CELLS: B2:B10
//                  ALL_ROWS: yes
//                  ---
//
//        Version:  1.0
//        Created:  09/11/2026 09:05:51 AM
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

#ifndef  RULESFILE_INC
#define  RULESFILE_INC

#include <stop_token>

#include "RegReport.h"
#include "ValidationRules.h"

struct RulesFileContent
{
    RR::ValidationRules rules_;
    RR::RuleDiagnostics diagnostics_;
};

// blocks lacking FIELD, RULE, CONDITION or ERROR are skipped and reported.
// an ID, SHEET or SEVERITY which can't be read is reported and left at its default.
// rules without an ID are numbered in file order after the highest ID given.

RulesFileContent ParseRulesContent(RR::RulesContent rules_content, int template_ID = 0);

RulesFileContent LoadRulesFile(const RR::FileName& rules_file_name, int template_ID = 0, std::stop_token stop_token = {});

#endif   // ----- #ifndef RULESFILE_INC  -----
