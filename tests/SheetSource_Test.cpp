// =====================================================================================
//
//       Filename:  SheetSource_Test.cpp
//
//    Description:  tests for loading submission sheets.
//
//        Version:  1.0
//        Created:  09/21/2026 10:55:38 AM
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

#include "RegReport_Utils.h"
#include "SheetSource.h"

using namespace testing;

namespace fs = std::filesystem;

const fs::path test_data_dir{REGREPORT_TEST_DATA_DIR};

class ReadCSVContent : public Test
{
};

TEST_F(ReadCSVContent, NumbersAndTextAreSeparated)
{
    auto grid = ParseCSVContent(RR::CSVContent{"Name,Amount\nfirst,12.5\nsecond,n/a\n"});

    EXPECT_EQ(grid.GetSheetName(), "Sheet1");
    EXPECT_EQ(grid.RowCount(), 3);
    EXPECT_EQ(grid.ColumnCount(), 2);
    EXPECT_THAT(grid.CellAt(2, 2), VariantWith<RR::NumericCell>(Field(&RR::NumericCell::value_, 12.5)));
    EXPECT_THAT(grid.CellAt(3, 2), VariantWith<std::string>("n/a"));
    EXPECT_EQ(CellValueToString(grid.CellAt(2, 2)), "12.5");
}

TEST_F(ReadCSVContent, NumbersKeepTheirText)
{
    auto grid = ParseCSVContent(RR::CSVContent{"Zip,Price,Account,Rate\n01234,1.50,12345678901234567890,0.00005\n"});

    EXPECT_THAT(grid.CellAt(2, 1), VariantWith<RR::NumericCell>(Field(&RR::NumericCell::text_, "01234")));
    EXPECT_EQ(CellValueToString(grid.CellAt(2, 1)), "01234");
    EXPECT_EQ(CellValueToString(grid.CellAt(2, 2)), "1.50");
    EXPECT_EQ(CellValueToString(grid.CellAt(2, 3)), "12345678901234567890");
    EXPECT_EQ(CellValueToString(grid.CellAt(2, 4)), "0.00005");
}

TEST_F(ReadCSVContent, QuotedValuesKeepTheirCommas)
{
    auto grid = ParseCSVContent(RR::CSVContent{"Name,Note\r\n\"Smith, J\",\"back\\slash\"\r\n"}, "People");

    EXPECT_EQ(grid.GetSheetName(), "People");
    ASSERT_EQ(grid.RowCount(), 2);
    EXPECT_EQ(CellValueToString(grid.CellAt(2, 1)), "Smith, J");
    EXPECT_EQ(CellValueToString(grid.CellAt(2, 2)), R"(back\slash)");
}

TEST_F(ReadCSVContent, EmptyCellsAreEmpty)
{
    auto grid = ParseCSVContent(RR::CSVContent{"A,B,C\n1,,3\n"});

    EXPECT_TRUE(std::holds_alternative<std::monostate>(grid.CellAt(2, 2)));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(grid.CellAt(40, 2)));
    EXPECT_EQ(CellValueToString(grid.CellAt(2, 2)), "");
}

TEST_F(ReadCSVContent, HeaderLookupIgnoresCase)
{
    auto grid = ParseCSVContent(RR::CSVContent{"Company Name , Amount\nx,1\n"});

    EXPECT_THAT(grid.FindHeaderColumn("company name"), Optional(1));
    EXPECT_THAT(grid.FindHeaderColumn("AMOUNT"), Optional(2));
    EXPECT_EQ(grid.FindHeaderColumn("Email"), std::nullopt);
}

class LoadSubmissionFiles : public Test
{
};

TEST_F(LoadSubmissionFiles, CSVFileIsOneSheet)
{
    auto sheets = LoadSubmissionSheets(RR::FileName{test_data_dir / "sample_submission.csv"});

    ASSERT_EQ(sheets.size(), 1);
    EXPECT_EQ(sheets[0].RowCount(), 3);
    EXPECT_EQ(CellValueToString(sheets[0].CellAt(1, 1)), "Company Name");
    EXPECT_EQ(CellValueToString(sheets[0].CellAt(2, 2)), "1250000");
    EXPECT_EQ(CellValueToString(sheets[0].CellAt(3, 3)), "ops@example.com");
}

TEST_F(LoadSubmissionFiles, OtherFileTypesAreRejected)
{
    EXPECT_THROW(LoadSubmissionSheets(RR::FileName{test_data_dir / "sample_rules.txt"}), RegReportException);
}
