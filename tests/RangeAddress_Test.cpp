// =====================================================================================
//
//       Filename:  RangeAddress_Test.cpp
//
//    Description:  tests for spreadsheet coordinates and rule addressing.
//
//        Version:  1.0
//        Created:  09/20/2026 02:11:47 PM
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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "RangeAddress.h"
#include "RegReport_Utils.h"

using namespace testing;

namespace
{
    RR::SheetGrid MakeGrid(int data_rows)
    {
        std::vector<RR::GridRow> rows;
        rows.push_back({std::string{"Name"}, std::string{"Amount"}, std::string{"Email"}});
        for (int i = 0; i < data_rows; ++i)
        {
            rows.push_back({std::string{"x"}, MakeCellValue(std::to_string(i)), std::string{"a@b.com"}});
        }
        return RR::SheetGrid{"Sheet1", std::move(rows)};
    }

    RR::ValidationRule MakeRule(const std::string& field)
    {
        RR::ValidationRule rule;
        rule.id_ = 1;
        rule.field_ = field;
        rule.condition_ = "NOT_EMPTY";
        rule.error_message_ = "missing";
        return rule;
    }
}  // namespace

class ColumnLetters : public Test
{
};

TEST_F(ColumnLetters, KnownValues)
{
    EXPECT_THAT(ColumnToOrdinal("A"), Optional(1));
    EXPECT_THAT(ColumnToOrdinal("Z"), Optional(26));
    EXPECT_THAT(ColumnToOrdinal("AA"), Optional(27));
    EXPECT_THAT(ColumnToOrdinal("AZ"), Optional(52));
    EXPECT_THAT(ColumnToOrdinal("ZZ"), Optional(702));
    EXPECT_THAT(ColumnToOrdinal("XFD"), Optional(16384));
    EXPECT_THAT(ColumnToOrdinal("xfd"), Optional(16384));

    EXPECT_EQ(OrdinalToColumn(1), "A");
    EXPECT_EQ(OrdinalToColumn(26), "Z");
    EXPECT_EQ(OrdinalToColumn(27), "AA");
    EXPECT_EQ(OrdinalToColumn(703), "AAA");
    EXPECT_EQ(OrdinalToColumn(16384), "XFD");
}

TEST_F(ColumnLetters, BadLettersGiveNothing)
{
    EXPECT_EQ(ColumnToOrdinal(""), std::nullopt);
    EXPECT_EQ(ColumnToOrdinal("A1"), std::nullopt);
    EXPECT_EQ(ColumnToOrdinal("XFE"), std::nullopt);
    EXPECT_EQ(ColumnToOrdinal("ABCD"), std::nullopt);
}

TEST_F(ColumnLetters, OrdinalsOutOfRangeThrow)
{
    EXPECT_THROW(OrdinalToColumn(0), RuleException);
    EXPECT_THROW(OrdinalToColumn(16385), RuleException);
}

TEST_F(ColumnLetters, ConversionIsOneToOneThroughZZ)
{
    for (int ordinal = 1; ordinal <= 702; ++ordinal)
    {
        auto letters = OrdinalToColumn(ordinal);
        ASSERT_THAT(ColumnToOrdinal(letters), Optional(ordinal)) << "letters: " << letters;
    }
}

class ParseAddresses : public Test
{
};

TEST_F(ParseAddresses, CellAddress)
{
    EXPECT_THAT(ParseCellAddress("A27"), Optional(RR::CellAddress{27, 1}));
    EXPECT_THAT(ParseCellAddress(" ab3 "), Optional(RR::CellAddress{3, 28}));
    EXPECT_EQ(ParseCellAddress("A0"), std::nullopt);
    EXPECT_EQ(ParseCellAddress("27A"), std::nullopt);
    EXPECT_EQ(ParseCellAddress("A"), std::nullopt);
}

TEST_F(ParseAddresses, CellRangeCornersInEitherOrder)
{
    EXPECT_THAT(ParseCellRange("B2:D5"), Optional(RR::CellBox{2, 5, 2, 4}));
    EXPECT_THAT(ParseCellRange("D5:B2"), Optional(RR::CellBox{2, 5, 2, 4}));
    EXPECT_THAT(ParseCellRange("C7"), Optional(RR::CellBox{7, 7, 3, 3}));
    EXPECT_EQ(ParseCellRange("B2:"), std::nullopt);
    EXPECT_EQ(ParseCellRange("Amount"), std::nullopt);
}

TEST_F(ParseAddresses, RowRange)
{
    EXPECT_THAT(ParseRowRange("2-10"), Optional(RR::RowSpan{2, 10}));
    EXPECT_THAT(ParseRowRange("5"), Optional(RR::RowSpan{5, 5}));
    EXPECT_THAT(ParseRowRange("10-*"), Optional(RR::RowSpan{10, std::nullopt}));
    EXPECT_THAT(ParseRowRange("3 - 4"), Optional(RR::RowSpan{3, 4}));
    EXPECT_EQ(ParseRowRange("10-2"), std::nullopt);
    EXPECT_EQ(ParseRowRange("0-2"), std::nullopt);
    EXPECT_EQ(ParseRowRange("a-b"), std::nullopt);
}

TEST_F(ParseAddresses, ColumnRange)
{
    EXPECT_THAT(ParseColumnRange("B-D"), Optional(RR::ColumnSpan{2, 4}));
    EXPECT_THAT(ParseColumnRange("c"), Optional(RR::ColumnSpan{3, 3}));
    EXPECT_EQ(ParseColumnRange("D-B"), std::nullopt);
    EXPECT_EQ(ParseColumnRange("B-4"), std::nullopt);
}

TEST_F(ParseAddresses, CellReference)
{
    EXPECT_EQ(MakeCellReference(27, 1), "A27");
    EXPECT_EQ(MakeCellReference(2, 28), "AB2");
}

class RuleAddressing : public Test
{
};

TEST_F(RuleAddressing, OpenEndedRowsMatchBeyondTheSheet)
{
    RR::RuleAddress address{RR::RowSpan{10, std::nullopt}, RR::ColumnSpan{2, 2}, 10};

    EXPECT_TRUE(address.Matches(10, 2));
    EXPECT_TRUE(address.Matches(5000, 2));
    EXPECT_FALSE(address.Matches(9, 2));
    EXPECT_FALSE(address.Matches(10, 3));

    EXPECT_THAT(address.Expand(), ElementsAre(RR::CellAddress{10, 2}));
}

TEST_F(RuleAddressing, ExpandIsRowMajor)
{
    RR::RuleAddress address{RR::RowSpan{2, 3}, RR::ColumnSpan{1, 2}, 0};

    EXPECT_EQ(address.CellCount(), 4);
    EXPECT_THAT(address.Expand(), ElementsAre(RR::CellAddress{2, 1}, RR::CellAddress{2, 2},
                RR::CellAddress{3, 1}, RR::CellAddress{3, 2}));
}

TEST_F(RuleAddressing, CellRangeWinsOverEverythingElse)
{
    auto grid = MakeGrid(5);
    auto rule = MakeRule("Amount");
    rule.cell_range_ = "C3:C4";
    rule.row_range_ = "2-6";
    rule.apply_to_all_rows_ = true;

    auto address = ResolveRuleAddress(rule, grid);
    ASSERT_TRUE(address);
    EXPECT_THAT(address->Expand(), ElementsAre(RR::CellAddress{3, 3}, RR::CellAddress{4, 3}));
}

TEST_F(RuleAddressing, RowRangeUsesFieldColumn)
{
    auto grid = MakeGrid(5);
    auto rule = MakeRule("Amount");
    rule.row_range_ = "2-*";

    auto address = ResolveRuleAddress(rule, grid);
    ASSERT_TRUE(address);
    EXPECT_EQ(address->GetColumns(), (RR::ColumnSpan{2, 2}));
    EXPECT_EQ(address->GetLastRowToExpand(), 6);
    EXPECT_EQ(address->CellCount(), 5);
}

TEST_F(RuleAddressing, OpenRowRangePastEndStillChecksFirstRow)
{
    auto grid = MakeGrid(4);
    auto rule = MakeRule("Amount");
    rule.row_range_ = "10-*";

    auto address = ResolveRuleAddress(rule, grid);
    ASSERT_TRUE(address);
    EXPECT_THAT(address->Expand(), ElementsAre(RR::CellAddress{10, 2}));
}

TEST_F(RuleAddressing, AllRowsCoversEveryDataRow)
{
    auto grid = MakeGrid(3);
    auto rule = MakeRule("Email");
    rule.apply_to_all_rows_ = true;

    auto address = ResolveRuleAddress(rule, grid);
    ASSERT_TRUE(address);
    EXPECT_THAT(address->Expand(), ElementsAre(RR::CellAddress{2, 3}, RR::CellAddress{3, 3}, RR::CellAddress{4, 3}));
}

TEST_F(RuleAddressing, NamedFieldIsTheCellBelowItsHeader)
{
    auto grid = MakeGrid(3);
    auto rule = MakeRule("amount");

    auto address = ResolveRuleAddress(rule, grid);
    ASSERT_TRUE(address);
    EXPECT_THAT(address->Expand(), ElementsAre(RR::CellAddress{2, 2}));
}

TEST_F(RuleAddressing, UpperCaseColumnLetterField)
{
    auto grid = MakeGrid(3);
    auto rule = MakeRule("C");

    auto address = ResolveRuleAddress(rule, grid);
    ASSERT_TRUE(address);
    EXPECT_THAT(address->Expand(), ElementsAre(RR::CellAddress{2, 3}));
}

TEST_F(RuleAddressing, CellReferenceFieldOutsideTheSheet)
{
    auto grid = MakeGrid(1);
    auto rule = MakeRule("A27");

    auto address = ResolveRuleAddress(rule, grid);
    ASSERT_TRUE(address);
    EXPECT_THAT(address->Expand(), ElementsAre(RR::CellAddress{27, 1}));
}

TEST_F(RuleAddressing, HeaderWinsOverCellReference)
{
    RR::SheetGrid grid{"Sheet1", {
        {std::string{"Item"}, std::string{"FY2024"}, std::string{"Q1"}},
        {std::string{"Revenue"}, MakeCellValue("100"), MakeCellValue("25")}
    }};

    auto fiscal_year = ResolveRuleAddress(MakeRule("FY2024"), grid);
    ASSERT_TRUE(fiscal_year);
    EXPECT_THAT(fiscal_year->Expand(), ElementsAre(RR::CellAddress{2, 2}));

    auto quarter = ResolveRuleAddress(MakeRule("Q1"), grid);
    ASSERT_TRUE(quarter);
    EXPECT_THAT(quarter->Expand(), ElementsAre(RR::CellAddress{2, 3}));

    // not a header so it is the cell.

    auto cell = ResolveRuleAddress(MakeRule("Q4"), grid);
    ASSERT_TRUE(cell);
    EXPECT_THAT(cell->Expand(), ElementsAre(RR::CellAddress{4, 17}));
}

TEST_F(RuleAddressing, MissingHeaderGivesNothing)
{
    auto grid = MakeGrid(3);
    auto rule = MakeRule("Phone number");

    EXPECT_EQ(ResolveRuleAddress(rule, grid), std::nullopt);
}

TEST_F(RuleAddressing, MalformedRangesThrow)
{
    auto grid = MakeGrid(3);

    auto rule = MakeRule("Amount");
    rule.cell_range_ = "B2:";
    EXPECT_THROW(ResolveRuleAddress(rule, grid), RuleException);

    rule = MakeRule("Amount");
    rule.row_range_ = "9-3";
    EXPECT_THROW(ResolveRuleAddress(rule, grid), RuleException);

    rule = MakeRule("Amount");
    rule.column_range_ = "D-A";
    EXPECT_THROW(ResolveRuleAddress(rule, grid), RuleException);
}

TEST_F(RuleAddressing, TooManyCellsThrows)
{
    auto grid = MakeGrid(3);
    auto rule = MakeRule("Amount");
    rule.cell_range_ = "A1:Z100";

    EXPECT_THROW(ResolveRuleAddress(rule, grid, 1000), RuleException);
    EXPECT_NO_THROW(ResolveRuleAddress(rule, grid, 2600));
}
