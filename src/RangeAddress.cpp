// =====================================================================================
//
//       Filename:  RangeAddress.cpp
//
//    Description:  spreadsheet style addressing for validation rules.
//
//        Version:  1.0
//        Created:  09/09/2026 10:31:12 AM
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

#include "RangeAddress.h"

#include <algorithm>
#include <cctype>

#include <boost/regex.hpp>

#include <range/v3/algorithm/all_of.hpp>

namespace rng = ranges;

#include <spdlog/spdlog.h>

#include "RegReport_Utils.h"

namespace
{
    // where a rule's field points us.

    struct FieldTarget
    {
        std::optional<RR::CellBox> box_;
        std::optional<int> column_;
        bool header_missing_ = false;
    };

    bool HasText(const std::optional<std::string>& value)
    {
        return value.has_value() && ! TrimCopy(*value).empty();
    }

    std::optional<int> ParseRowNumber(const std::string& digits)
    {
        // keep well away from int overflow. no sheet has this many rows.

        if (digits.empty() || digits.size() > 9)
        {
            return std::nullopt;
        }
        int result = std::stoi(digits);
        if (result < 1)
        {
            return std::nullopt;
        }
        return result;
    }

    FieldTarget ResolveField(RR::sv field, const RR::SheetGrid& grid)
    {
        FieldTarget result;

        const std::string the_field = TrimCopy(field);
        if (the_field.empty())
        {
            return result;
        }
        // headers such as FY2024 or Q1 are also cell references. the header
        // wins when row 1 has it.

        if (auto column = grid.FindHeaderColumn(the_field); column)
        {
            result.column_ = column;
            return result;
        }
        if (auto box = ParseCellRange(the_field); box)
        {
            result.box_ = box;
            return result;
        }

        // a bare column letter has to be written in upper case so it can't be
        // mistaken for a header which happens to be short.

        if (rng::all_of(the_field, [](unsigned char c) { return std::isupper(c); }))
        {
            if (auto column = ColumnToOrdinal(the_field); column)
            {
                result.column_ = column;
                return result;
            }
        }
        result.header_missing_ = true;
        return result;
    }

    RR::ColumnSpan AllColumns(const RR::SheetGrid& grid)
    {
        return {1, std::max(grid.ColumnCount(), 1)};
    }

}  // namespace

//--------------------------------------------------------------------------------------
//       Class:  RuleAddress
//      Method:  RuleAddress
// Description:  constructor
//--------------------------------------------------------------------------------------

RR::RuleAddress::RuleAddress (RowSpan rows, ColumnSpan columns, int last_row_to_expand)
    : rows_{rows}, columns_{columns}, last_row_to_expand_{last_row_to_expand}
{
    if (rows_.last_)
    {
        last_row_to_expand_ = *rows_.last_;
    }
}  // -----  end of method RuleAddress::RuleAddress  (constructor)  -----

bool RR::RuleAddress::Matches (int row_number, int column_number) const
{
    if (row_number < rows_.first_ || (rows_.last_ && row_number > *rows_.last_))
    {
        return false;
    }
    return column_number >= columns_.first_ && column_number <= columns_.last_;
}		// -----  end of method RuleAddress::Matches  -----

std::vector<RR::CellAddress> RR::RuleAddress::Expand () const
{
    std::vector<CellAddress> result;
    result.reserve(CellCount());

    for (int row = rows_.first_; row <= last_row_to_expand_; ++row)
    {
        for (int column = columns_.first_; column <= columns_.last_; ++column)
        {
            result.push_back({row, column});
        }
    }
    return result;
}		// -----  end of method RuleAddress::Expand  -----

std::uintmax_t RR::RuleAddress::CellCount () const
{
    if (last_row_to_expand_ < rows_.first_ || columns_.last_ < columns_.first_)
    {
        return 0;
    }
    std::uintmax_t rows = last_row_to_expand_ - rows_.first_ + 1;
    std::uintmax_t columns = columns_.last_ - columns_.first_ + 1;
    return rows * columns;
}		// -----  end of method RuleAddress::CellCount  -----

std::optional<int> ColumnToOrdinal (RR::sv letters)
{
    if (letters.empty() || letters.size() > 3)
    {
        return std::nullopt;
    }
    int result = 0;
    for (unsigned char c : letters)
    {
        if (! std::isalpha(c))
        {
            return std::nullopt;
        }
        result = result * 26 + (std::toupper(c) - 'A' + 1);
    }
    if (result > RR::MAX_COLUMN_ORDINAL)
    {
        return std::nullopt;
    }
    return result;
}		// -----  end of function ColumnToOrdinal  -----

std::string OrdinalToColumn (int ordinal)
{
    if (ordinal < 1 || ordinal > RR::MAX_COLUMN_ORDINAL)
    {
        throw RuleException(catenate("Column number out of range: ", ordinal));
    }

    // base 26 with no zero digit.

    std::string result;
    while (ordinal > 0)
    {
        int remainder = (ordinal - 1) % 26;
        result.insert(result.begin(), static_cast<char>('A' + remainder));
        ordinal = (ordinal - 1) / 26;
    }
    return result;
}		// -----  end of function OrdinalToColumn  -----

std::optional<RR::CellAddress> ParseCellAddress (RR::sv text)
{
    static const boost::regex regex_cell{R"***(^([A-Za-z]{1,3})([0-9]+)$)***"};

    const std::string the_text = TrimCopy(text);
    boost::smatch matches;
    if (! boost::regex_match(the_text, matches, regex_cell))
    {
        return std::nullopt;
    }
    auto column = ColumnToOrdinal(matches.str(1));
    auto row = ParseRowNumber(matches.str(2));
    if (! column || ! row)
    {
        return std::nullopt;
    }
    return RR::CellAddress{*row, *column};
}		// -----  end of function ParseCellAddress  -----

std::optional<RR::CellBox> ParseCellRange (RR::sv text)
{
    const std::string the_text = TrimCopy(text);
    if (the_text.empty())
    {
        return std::nullopt;
    }

    auto pos = the_text.find(':');
    if (pos == std::string::npos)
    {
        auto cell = ParseCellAddress(the_text);
        if (! cell)
        {
            return std::nullopt;
        }
        return RR::CellBox{cell->row_, cell->row_, cell->column_, cell->column_};
    }

    auto top_left = ParseCellAddress(RR::sv{the_text}.substr(0, pos));
    auto bottom_right = ParseCellAddress(RR::sv{the_text}.substr(pos + 1));
    if (! top_left || ! bottom_right)
    {
        return std::nullopt;
    }

    // allow corners to be given in either order.

    return RR::CellBox{std::min(top_left->row_, bottom_right->row_), std::max(top_left->row_, bottom_right->row_),
        std::min(top_left->column_, bottom_right->column_), std::max(top_left->column_, bottom_right->column_)};
}		// -----  end of function ParseCellRange  -----

std::optional<RR::RowSpan> ParseRowRange (RR::sv text)
{
    static const boost::regex regex_rows{R"***(^([0-9]+)(?:[[:space:]]*-[[:space:]]*([0-9]+|\*))?$)***"};

    const std::string the_text = TrimCopy(text);
    boost::smatch matches;
    if (! boost::regex_match(the_text, matches, regex_rows))
    {
        return std::nullopt;
    }
    auto first = ParseRowNumber(matches.str(1));
    if (! first)
    {
        return std::nullopt;
    }
    if (! matches[2].matched)
    {
        return RR::RowSpan{*first, *first};
    }
    if (matches.str(2) == "*")
    {
        return RR::RowSpan{*first, std::nullopt};
    }
    auto last = ParseRowNumber(matches.str(2));
    if (! last || *last < *first)
    {
        return std::nullopt;
    }
    return RR::RowSpan{*first, *last};
}		// -----  end of function ParseRowRange  -----

std::optional<RR::ColumnSpan> ParseColumnRange (RR::sv text)
{
    static const boost::regex regex_columns{R"***(^([A-Za-z]{1,3})(?:[[:space:]]*-[[:space:]]*([A-Za-z]{1,3}))?$)***"};

    const std::string the_text = TrimCopy(text);
    boost::smatch matches;
    if (! boost::regex_match(the_text, matches, regex_columns))
    {
        return std::nullopt;
    }
    auto first = ColumnToOrdinal(matches.str(1));
    if (! first)
    {
        return std::nullopt;
    }
    if (! matches[2].matched)
    {
        return RR::ColumnSpan{*first, *first};
    }
    auto last = ColumnToOrdinal(matches.str(2));
    if (! last || *last < *first)
    {
        return std::nullopt;
    }
    return RR::ColumnSpan{*first, *last};
}		// -----  end of function ParseColumnRange  -----

std::string MakeCellReference (int row_number, int column_number)
{
    return catenate(OrdinalToColumn(column_number), row_number);
}		// -----  end of function MakeCellReference  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ResolveRuleAddress
 *  Description:  open ended row spans run to the last row of the sheet but never
 *                stop short of their first row. so a rule for rows 10-* on a
 *                5 row sheet still checks row 10.
 * =====================================================================================
 */
std::optional<RR::RuleAddress> ResolveRuleAddress (const RR::ValidationRule& rule, const RR::SheetGrid& grid,
        std::size_t max_cells_per_rule)
{
    auto last_data_row = [&grid](int first_row) { return std::max(grid.RowCount(), first_row); };

    std::optional<RR::RuleAddress> result;

    if (HasText(rule.cell_range_))
    {
        auto box = ParseCellRange(*rule.cell_range_);
        if (! box)
        {
            throw RuleException(catenate("Malformed cell range: '", *rule.cell_range_, "'"));
        }
        result = RR::RuleAddress{RR::RowSpan{box->first_row_, box->last_row_},
            RR::ColumnSpan{box->first_column_, box->last_column_}, box->last_row_};
    }
    else if (HasText(rule.row_range_) || HasText(rule.column_range_))
    {
        RR::RowSpan rows{RR::FIRST_DATA_ROW, std::nullopt};
        if (HasText(rule.row_range_))
        {
            auto span = ParseRowRange(*rule.row_range_);
            if (! span)
            {
                throw RuleException(catenate("Malformed row range: '", *rule.row_range_, "'"));
            }
            rows = *span;
        }

        RR::ColumnSpan columns;
        if (HasText(rule.column_range_))
        {
            auto span = ParseColumnRange(*rule.column_range_);
            if (! span)
            {
                throw RuleException(catenate("Malformed column range: '", *rule.column_range_, "'"));
            }
            columns = *span;
        }
        else
        {
            // no columns given so use the field's column if it has one.

            auto target = ResolveField(rule.field_, grid);
            if (target.box_)
            {
                columns = {target.box_->first_column_, target.box_->last_column_};
            }
            else if (target.column_)
            {
                columns = {*target.column_, *target.column_};
            }
            else
            {
                columns = AllColumns(grid);
            }
        }
        result = RR::RuleAddress{rows, columns, last_data_row(rows.first_)};
    }
    else if (rule.apply_to_all_rows_)
    {
        auto target = ResolveField(rule.field_, grid);
        if (target.header_missing_)
        {
            return std::nullopt;
        }

        RR::ColumnSpan columns = AllColumns(grid);
        if (target.box_)
        {
            columns = {target.box_->first_column_, target.box_->last_column_};
        }
        else if (target.column_)
        {
            columns = {*target.column_, *target.column_};
        }
        result = RR::RuleAddress{RR::RowSpan{RR::FIRST_DATA_ROW, std::nullopt}, columns,
            last_data_row(RR::FIRST_DATA_ROW)};
    }
    else
    {
        auto target = ResolveField(rule.field_, grid);
        if (target.header_missing_)
        {
            return std::nullopt;
        }
        if (target.box_)
        {
            result = RR::RuleAddress{RR::RowSpan{target.box_->first_row_, target.box_->last_row_},
                RR::ColumnSpan{target.box_->first_column_, target.box_->last_column_}, target.box_->last_row_};
        }
        else if (target.column_)
        {
            // a named field is the value just below its header.

            result = RR::RuleAddress{RR::RowSpan{RR::FIRST_DATA_ROW, RR::FIRST_DATA_ROW},
                RR::ColumnSpan{*target.column_, *target.column_}, RR::FIRST_DATA_ROW};
        }
        else
        {
            throw RuleException("Rule has neither a field nor any addressing.");
        }
    }

    if (result->CellCount() > max_cells_per_rule)
    {
        throw RuleException(catenate("Rule addresses ", result->CellCount(), " cells. Limit is: ", max_cells_per_rule));
    }
    spdlog::debug(catenate("rule: ", rule.id_, " addresses: ", result->CellCount(), " cells on sheet: ", grid.GetSheetName()));
    return result;
}		// -----  end of function ResolveRuleAddress  -----
