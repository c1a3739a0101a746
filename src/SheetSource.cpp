// =====================================================================================
//
//       Filename:  SheetSource.cpp
//
//    Description:  load the sheets of a submission file.
//
//        Version:  1.0
//        Created:  09/11/2026 03:58:47 PM
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

#include "SheetSource.h"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/tokenizer.hpp>

#include <spdlog/spdlog.h>

#include "RegReport_Utils.h"
#include "XLS_Data.h"

RR::SheetGrids LoadSubmissionSheets (const RR::FileName& submission_file_name, std::stop_token stop_token)
{
    const std::string extension = boost::algorithm::to_lower_copy(submission_file_name.get().extension().string());

    if (extension == ".xlsx")
    {
        auto content = LoadDataFileForUse(submission_file_name, stop_token);
        XLS_File workbook{std::vector<char>(content.begin(), content.end())};
        auto sheets = workbook.ReadAllSheets(stop_token);
        spdlog::debug(catenate("workbook: ", submission_file_name.get(), " has: ", sheets.size(), " sheets."));
        return sheets;
    }
    if (extension == ".csv")
    {
        auto content = LoadDataFileForUse(submission_file_name, stop_token);
        RR::SheetGrids sheets;
        sheets.push_back(ParseCSVContent(RR::CSVContent{content}));
        return sheets;
    }
    throw RegReportException(catenate("Unsupported submission file type: ", submission_file_name.get()));
}		// -----  end of function LoadSubmissionSheets  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ParseCSVContent
 *  Description:
 * =====================================================================================
 */
RR::SheetGrid ParseCSVContent (RR::CSVContent csv_content, const std::string& sheet_name)
{
    using Tokenizer = boost::tokenizer<boost::escaped_list_separator<char>>;

    // no escape character. backslashes in values are kept as they are.

    const boost::escaped_list_separator<char> separator{'\0', ',', '"'};

    std::vector<RR::GridRow> rows;

    for (auto line : split_string<RR::sv>(csv_content.get(), '\n'))
    {
        if (line.ends_with('\r'))
        {
            line.remove_suffix(1);
        }

        RR::GridRow row;
        const std::string the_line{line};
        try
        {
            Tokenizer tokens{the_line, separator};
            for (const auto& token : tokens)
            {
                row.push_back(MakeCellValue(token));
            }
        }
        catch (const boost::escaped_list_error& e)
        {
            throw RegReportException(catenate("Malformed CSV in line ", rows.size() + 1, ": ", e.what()));
        }
        rows.push_back(std::move(row));
    }

    // a trailing newline leaves an empty last line.

    while (! rows.empty() && (rows.back().empty() || (rows.back().size() == 1 && std::holds_alternative<std::monostate>(rows.back().front()))))
    {
        rows.pop_back();
    }

    return RR::SheetGrid{sheet_name, std::move(rows)};
}		// -----  end of function ParseCSVContent  -----
