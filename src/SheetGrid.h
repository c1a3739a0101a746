// =====================================================================================
//
//       Filename:  SheetGrid.h
//
//    Description:  read-only rows of cell values for one worksheet of a submission.
//
//        Version:  1.0
//        Created:  09/09/2026 08:41:17 AM
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

#ifndef  SHEETGRID_INC
#define  SHEETGRID_INC

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "RegReport.h"

namespace RegReport
{
    // numbers keep the text they were read from. rules always see the text
    // so '01234' stays '01234'.

    struct NumericCell
    {
        double value_ = 0.0;
        std::string text_;

        bool operator==(const NumericCell& rhs) const = default;
    };

    // a cell is text, a number or nothing at all.

    using CellValue = std::variant<std::monostate, std::string, NumericCell>;
    using GridRow = std::vector<CellValue>;

    // =====================================================================================
    //        Class:  SheetGrid
    //  Description:  row and column numbers are 1-based, as in a spreadsheet.
    //                asking for a cell outside the data gives an empty cell.
    // =====================================================================================

    class SheetGrid
    {
    public:
        // ====================  LIFECYCLE     =======================================

        SheetGrid () = default;
        SheetGrid (std::string sheet_name, std::vector<GridRow> rows);

        // ====================  ACCESSORS     =======================================

        [[nodiscard]] const std::string& GetSheetName() const { return sheet_name_; }
        [[nodiscard]] const std::vector<GridRow>& GetRows() const { return rows_; }

        [[nodiscard]] int RowCount() const { return static_cast<int>(rows_.size()); }
        [[nodiscard]] int ColumnCount() const { return column_count_; }
        [[nodiscard]] bool empty() const { return rows_.empty(); }

        const CellValue& CellAt(int row_number, int column_number) const;

        // look for a header in row 1. match ignores case and surrounding blanks.

        std::optional<int> FindHeaderColumn(sv header) const;

        // ====================  OPERATORS     =======================================

        bool operator==(const SheetGrid& rhs) const = default;

    private:
        // ====================  DATA MEMBERS  =======================================

        std::string sheet_name_;
        std::vector<GridRow> rows_;
        int column_count_ = 0;

    }; // -----  end of class SheetGrid  -----

    using SheetGrids = std::vector<SheetGrid>;

}		// namespace RegReport

// the text of the cell as it was read. empty cells become empty strings.

std::string CellValueToString(const RR::CellValue& value);

// text which looks like a number is stored as one, along with the text.

RR::CellValue MakeCellValue(RR::sv text);

#endif   // ----- #ifndef SHEETGRID_INC  -----
