// =====================================================================================
//
//       Filename:  RangeAddress.h
//
//    Description:  spreadsheet style addressing for validation rules.
//                  A1 style cells, A1:B10 boxes, row ranges like 2-100 or 10-*
//                  and column ranges like C-E.
//
//        Version:  1.0
//        Created:  09/09/2026 10:02:48 AM
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

#ifndef  RANGEADDRESS_INC
#define  RANGEADDRESS_INC

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "RegReport.h"
#include "SheetGrid.h"
#include "ValidationRules.h"

namespace RegReport
{
    // XFD is the last column in current spreadsheet programs.

    constexpr int MAX_COLUMN_ORDINAL = 16384;
    constexpr std::size_t DEFAULT_MAX_CELLS_PER_RULE = 1'000'000;

    // the first data row. row 1 holds headers.

    constexpr int FIRST_DATA_ROW = 2;

    struct CellAddress
    {
        int row_ = 0;
        int column_ = 0;

        bool operator==(const CellAddress& rhs) const = default;
    };

    struct CellBox
    {
        int first_row_ = 0;
        int last_row_ = 0;
        int first_column_ = 0;
        int last_column_ = 0;

        bool operator==(const CellBox& rhs) const = default;
    };

    // an empty last_ means 'to the end of the sheet'

    struct RowSpan
    {
        int first_ = 0;
        std::optional<int> last_;

        bool operator==(const RowSpan& rhs) const = default;
    };

    struct ColumnSpan
    {
        int first_ = 0;
        int last_ = 0;

        bool operator==(const ColumnSpan& rhs) const = default;
    };

    // =====================================================================================
    //        Class:  RuleAddress
    //  Description:  the resolved set of coordinates one rule applies to.
    //                Matches() honors an open ended row span. Expand() stops at
    //                last_row_to_expand_ which is fixed against the sheet when the
    //                address is resolved.
    // =====================================================================================

    class RuleAddress
    {
    public:
        // ====================  LIFECYCLE     =======================================

        RuleAddress () = default;
        RuleAddress (RowSpan rows, ColumnSpan columns, int last_row_to_expand);

        // ====================  ACCESSORS     =======================================

        [[nodiscard]] bool Matches(int row_number, int column_number) const;

        // row major order

        [[nodiscard]] std::vector<CellAddress> Expand() const;

        [[nodiscard]] std::uintmax_t CellCount() const;

        [[nodiscard]] const RowSpan& GetRows() const { return rows_; }
        [[nodiscard]] const ColumnSpan& GetColumns() const { return columns_; }
        [[nodiscard]] int GetLastRowToExpand() const { return last_row_to_expand_; }

        bool operator==(const RuleAddress& rhs) const = default;

    private:
        // ====================  DATA MEMBERS  =======================================

        RowSpan rows_;
        ColumnSpan columns_;
        int last_row_to_expand_ = 0;

    }; // -----  end of class RuleAddress  -----

}		// namespace RegReport

// column letters are base 26 with A = 1. nothing is returned for text
// which is not 1 to 3 letters or which is beyond XFD.

std::optional<int> ColumnToOrdinal(RR::sv letters);

// throws RuleException for ordinals outside 1 to 16384.

std::string OrdinalToColumn(int ordinal);

std::optional<RR::CellAddress> ParseCellAddress(RR::sv text);
std::optional<RR::CellBox> ParseCellRange(RR::sv text);
std::optional<RR::RowSpan> ParseRowRange(RR::sv text);
std::optional<RR::ColumnSpan> ParseColumnRange(RR::sv text);

// A27 style reference for results.

std::string MakeCellReference(int row_number, int column_number);

// decide which cells a rule applies to on the given sheet.
//
// malformed addressing throws RuleException (the caller skips the rule).
// a field is a row 1 header first, then a cell reference or box, then
// upper case column letters. a field which is none of these gives nullopt.

std::optional<RR::RuleAddress> ResolveRuleAddress(const RR::ValidationRule& rule, const RR::SheetGrid& grid,
        std::size_t max_cells_per_rule = RR::DEFAULT_MAX_CELLS_PER_RULE);

#endif   // ----- #ifndef RANGEADDRESS_INC  -----
