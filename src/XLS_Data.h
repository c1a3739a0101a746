// =====================================================================================
//
//       Filename:  XLS_Data.h
//
//    Description:  access to the worksheets of an xlsx workbook.
//
//        Version:  1.0
//        Created:  09/11/2026 02:12:40 PM
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

#ifndef  XLS_DATA_INC
#define  XLS_DATA_INC

#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <xlsxio_read.h>

#include "RegReport.h"
#include "SheetGrid.h"

// =====================================================================================
//        Class:  XLS_File
//  Description:  manage access to XLS data held in memory.
//                sheets are returned in workbook order.
// =====================================================================================

class XLS_File
{
public:
    // ====================  LIFECYCLE     =======================================

    XLS_File () = default;                             // constructor
    explicit XLS_File(const std::vector<char>& content);
    explicit XLS_File(std::vector<char>&& content);

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] bool empty() const { return content_.empty(); }

    std::vector<std::string> GetSheetNames() const;

    // sheet names are matched without regard to case.

    std::optional<RR::SheetGrid> ReadSheet(RR::sv sheet_name, std::stop_token stop_token = {}) const;

    RR::SheetGrids ReadAllSheets(std::stop_token stop_token = {}) const;

private:

    using XLS_Reader = std::unique_ptr<xlsxio_read_struct, std::function<void(xlsxioreader)>>;

    // ====================  METHODS       =======================================

    XLS_Reader OpenWorkbook() const;

    RR::SheetGrid ReadSheetRows(xlsxioreader workbook, const std::string& sheet_name, std::stop_token stop_token) const;

    // ====================  DATA MEMBERS  =======================================

    std::vector<char> content_;

}; // -----  end of class XLS_File  -----

#endif   // ----- #ifndef XLS_DATA_INC  -----
