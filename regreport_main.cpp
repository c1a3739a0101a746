// =====================================================================================
//
//       Filename:  regreport_main.cpp
//
//    Description:  validate regulatory report submissions and produce XBRL.
//
//        Version:  1.0
//        Created:  09/14/2026 04:12:55 PM
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

#include <exception>
#include <iostream>

#include <spdlog/spdlog.h>

#include "RegReportApp.h"

int main(int argc, char* argv[])
{
    auto result{0};

    try
    {
        RegReportApp app(argc, argv);
        if (! app.Startup())
        {
            return 1;
        }

        auto [success_counter, skipped_counter, error_counter] = app.Run();
        app.Shutdown();

        // failed validations are results, not failures of the program.

        result = error_counter > 0 ? 1 : 0;
    }
    catch (std::exception& e)
    {
        spdlog::error(catenate("Problem running regreport: ", e.what()));
        std::cerr << e.what() << '\n';
        result = 1;
    }

    return result;
}        // -----  end of method main  -----
