// =====================================================================================
//
//       Filename:  XLS_Data.cpp
//
//    Description:  access to the worksheets of an xlsx workbook.
//
//        Version:  1.0
//        Created:  09/11/2026 02:31:08 PM
//       Revision:  none
//       Compiler:  g++
//
//         Author:
//        License:  GNU General Public License -v3
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

#include "XLS_Data.h"

#include <cstdlib>

#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/transform.hpp>
#include <range/v3/iterator.hpp>

namespace rng = ranges;

#include <boost/algorithm/string/predicate.hpp>

#include <spdlog/spdlog.h>

#include "RegReport_Utils.h"

//--------------------------------------------------------------------------------------
//       Class:  XLS_File
//      Method:  XLS_File
// Description:  constructor
//--------------------------------------------------------------------------------------

XLS_File::XLS_File (const std::vector<char>& content)
    : content_{content}
{
}  // -----  end of method XLS_File::XLS_File  (constructor)  -----

XLS_File::XLS_File (std::vector<char>&& content)
    : content_{std::move(content)}
{
}  // -----  end of method XLS_File::XLS_File  (constructor)  -----

XLS_File::XLS_Reader XLS_File::OpenWorkbook () const
{
    auto file_closer = [](xlsxioreader file) { if (file != nullptr) { xlsxioread_close(file); } };
    XLS_Reader xlsxioread {xlsxioread_open_memory (const_cast<char*>(content_.data()), content_.size(), 0), file_closer};
    if (! xlsxioread)
    {
        throw RegReportException("Can't read workbook content. Not an xlsx file?");
    }
    return xlsxioread;
}		// -----  end of method XLS_File::OpenWorkbook  -----

std::vector<std::string> XLS_File::GetSheetNames () const
{
    if (content_.empty())
    {
        return {};
    }

    auto xlsxioread = OpenWorkbook();

    std::vector<std::string> results;

    auto list_closer = [](xlsxioreadersheetlist sheet_list) { if (sheet_list != nullptr) { xlsxioread_sheetlist_close(sheet_list); } };

    std::unique_ptr<xlsxio_read_sheetlist_struct, std::function<void(xlsxioreadersheetlist)>> temp_list =
        {xlsxioread_sheetlist_open(xlsxioread.get()), list_closer};
    if (temp_list)
    {
        const XLSXIOCHAR* tempname = nullptr;
        while ((tempname = xlsxioread_sheetlist_next(temp_list.get())) != nullptr)
        {
            results.emplace_back(tempname);
        }
    }
    return results;
}		// -----  end of method XLS_File::GetSheetNames  -----

std::optional<RR::SheetGrid> XLS_File::ReadSheet (RR::sv sheet_name, std::stop_token stop_token) const
{
    if (content_.empty() || sheet_name.empty())
    {
        return std::nullopt;
    }

    auto sheet_names = GetSheetNames();
    auto pos = rng::find_if(sheet_names, [sheet_name] (const auto& x) { return boost::algorithm::iequals(x, sheet_name); });
    if (pos == sheet_names.end())
    {
        return std::nullopt;
    }

    auto xlsxioread = OpenWorkbook();
    return ReadSheetRows(xlsxioread.get(), *pos, stop_token);
}		// -----  end of method XLS_File::ReadSheet  -----

RR::SheetGrids XLS_File::ReadAllSheets (std::stop_token stop_token) const
{
    RR::SheetGrids results;

    auto sheet_names = GetSheetNames();
    if (sheet_names.empty())
    {
        return results;
    }

    auto xlsxioread = OpenWorkbook();
    rng::transform(sheet_names, rng::back_inserter(results),
            [this, &xlsxioread, &stop_token](const auto& name) { return ReadSheetRows(xlsxioread.get(), name, stop_token); });

    return results;
}		// -----  end of method XLS_File::ReadAllSheets  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  XLS_File::ReadSheetRows
 *  Description:  empty rows are kept so row numbers match the workbook.
 * =====================================================================================
 */
RR::SheetGrid XLS_File::ReadSheetRows (xlsxioreader workbook, const std::string& sheet_name,
        std::stop_token stop_token) const
{
    auto sheet_closer = [](xlsxioreadersheet sheet_reader) { if (sheet_reader != nullptr) { xlsxioread_sheet_close(sheet_reader); } };

    std::unique_ptr<xlsxio_read_sheet_struct, std::function<void(xlsxioreadersheet)>> the_sheet =
        {xlsxioread_sheet_open(workbook, sheet_name.c_str(), XLSXIOREAD_SKIP_NONE), sheet_closer};
    if (! the_sheet)
    {
        throw RegReportException(catenate("Can't open worksheet: ", sheet_name));
    }

    std::vector<RR::GridRow> rows;

    // let's build this just once
    auto cell_deleter = [](XLSXIOCHAR* cell) { if (cell) free(cell); };

    while (xlsxioread_sheet_next_row(the_sheet.get()))
    {
        if (stop_token.stop_requested())
        {
            throw OperationCancelled(catenate("Read of worksheet: ", sheet_name, " was cancelled."));
        }

        RR::GridRow row;
        while (true)
        {
            std::unique_ptr<XLSXIOCHAR, std::function<void(XLSXIOCHAR*)>> next_cell =
                {xlsxioread_sheet_next_cell(the_sheet.get()), cell_deleter};
            if (! next_cell)
            {
                break;
            }
            row.push_back(MakeCellValue(next_cell.get()));
        }
        rows.push_back(std::move(row));
    }

    // trailing empty rows carry nothing.

    while (! rows.empty() && rng::find_if(rows.back(), [](const auto& c) { return ! std::holds_alternative<std::monostate>(c); }) == rows.back().end())
    {
        rows.pop_back();
    }

    spdlog::debug(catenate("worksheet: ", sheet_name, " has: ", rows.size(), " rows."));
    return RR::SheetGrid{sheet_name, std::move(rows)};
}		// -----  end of method XLS_File::ReadSheetRows  -----
