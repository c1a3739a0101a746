// =====================================================================================
//
//       Filename:  SheetSource.h
//
//    Description:  load the sheets of a submission file.
//
//        Version:  1.0
//        Created:  09/11/2026 03:40:22 PM
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

#ifndef  SHEETSOURCE_INC
#define  SHEETSOURCE_INC

#include <stop_token>
#include <string>

#include "RegReport.h"
#include "SheetGrid.h"

// .xlsx gives every worksheet in workbook order. .csv gives one sheet
// named Sheet1. anything else throws RegReportException.

RR::SheetGrids LoadSubmissionSheets(const RR::FileName& submission_file_name, std::stop_token stop_token = {});

// comma separated with double quote quoting. a quoted value may not span lines.

RR::SheetGrid ParseCSVContent(RR::CSVContent csv_content, const std::string& sheet_name = "Sheet1");

#endif   // ----- #ifndef SHEETSOURCE_INC  -----
