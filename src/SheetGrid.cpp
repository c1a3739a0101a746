// =====================================================================================
//
//       Filename:  SheetGrid.cpp
//
//    Description:  read-only rows of cell values for one worksheet of a submission.
//
//        Version:  1.0
//        Created:  09/09/2026 08:55:40 AM
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

#include "SheetGrid.h"

#include <boost/algorithm/string/predicate.hpp>

#include <range/v3/algorithm/max_element.hpp>

namespace rng = ranges;

#include "RegReport_Utils.h"

//--------------------------------------------------------------------------------------
//       Class:  SheetGrid
//      Method:  SheetGrid
// Description:  constructor
//--------------------------------------------------------------------------------------

RR::SheetGrid::SheetGrid (std::string sheet_name, std::vector<GridRow> rows)
    : sheet_name_{std::move(sheet_name)}, rows_{std::move(rows)}
{
    if (! rows_.empty())
    {
        column_count_ = static_cast<int>(rng::max_element(rows_, {}, [](const auto& r) { return r.size(); })->size());
    }
}  // -----  end of method SheetGrid::SheetGrid  (constructor)  -----

const RR::CellValue& RR::SheetGrid::CellAt (int row_number, int column_number) const
{
    static const CellValue empty_cell{};

    if (row_number < 1 || row_number > RowCount())
    {
        return empty_cell;
    }
    const auto& row = rows_[row_number - 1];
    if (column_number < 1 || column_number > static_cast<int>(row.size()))
    {
        return empty_cell;
    }
    return row[column_number - 1];
}		// -----  end of method SheetGrid::CellAt  -----

std::optional<int> RR::SheetGrid::FindHeaderColumn (sv header) const
{
    if (rows_.empty())
    {
        return std::nullopt;
    }
    const std::string looking_for = TrimCopy(header);
    if (looking_for.empty())
    {
        return std::nullopt;
    }

    const auto& header_row = rows_.front();
    for (int i = 0; i < static_cast<int>(header_row.size()); ++i)
    {
        if (boost::algorithm::iequals(TrimCopy(CellValueToString(header_row[i])), looking_for))
        {
            return i + 1;
        }
    }
    return std::nullopt;
}		// -----  end of method SheetGrid::FindHeaderColumn  -----

std::string CellValueToString (const RR::CellValue& value)
{
    if (const auto* text = std::get_if<std::string>(&value); text != nullptr)
    {
        return *text;
    }
    if (const auto* number = std::get_if<RR::NumericCell>(&value); number != nullptr)
    {
        return number->text_;
    }
    return {};
}		// -----  end of function CellValueToString  -----

RR::CellValue MakeCellValue (RR::sv text)
{
    if (text.empty())
    {
        return {};
    }
    if (auto number = ParseDecimal(text); number)
    {
        return RR::NumericCell{*number, std::string{text}};
    }
    return std::string{text};
}		// -----  end of function MakeCellValue  -----
