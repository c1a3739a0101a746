// =====================================================================================
//
//       Filename:  RegReportApp.h
//
//    Description:  command line application: validate submissions, check and
//                  generate XBRL reports.
//
//        Version:  1.0
//        Created:  09/14/2026 01:40:12 PM
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

// =====================================================================================
//        Class:  RegReportApp
//  Description:
// =====================================================================================

#ifndef REGREPORTAPP_H_
#define REGREPORTAPP_H_

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <tuple>
#include <vector>

namespace fs = std::filesystem;

#include <boost/program_options.hpp>

#include <spdlog/spdlog.h>

namespace po = boost::program_options;

#include "RangeAddress.h"
#include "RegReport.h"
#include "RegReport_Utils.h"
#include "SubmissionSynthesis.h"
#include "ValidationRules.h"
#include "XBRL_Model.h"

class RegReportApp
{
public:
    RegReportApp(int argc, char *argv[]);

    // use ctor below for testing with predefined options

    explicit RegReportApp(const std::vector<std::string> &tokens);

    RegReportApp() = delete;
    RegReportApp(const RegReportApp &rhs) = delete;
    RegReportApp(RegReportApp &&rhs) = delete;

    ~RegReportApp() = default;

    RegReportApp &operator=(const RegReportApp &rhs) = delete;
    RegReportApp &operator=(RegReportApp &&rhs) = delete;

    static bool SignalReceived()
    {
        return had_signal_;
    }

    bool Startup();
    std::tuple<int, int, int> Run();
    void Shutdown();

protected:
    enum class RunMode
    {
        e_Validate,
        e_XBRLValidate,
        e_XBRLParse,
        e_XBRLGenerate
    };

    //	Setup for parsing program options.

    void SetupProgramOptions();
    void ParseProgramOptions();
    void ParseProgramOptions(const std::vector<std::string> &tokens);
    void ParseConfigFile();

    void ConfigureLogging();

    bool CheckArgs();

    void BuildListOfFilesToProcess();
    void LoadSharedInputs();

    std::tuple<int, int, int> ProcessSingleFile(const RR::FileName &input_file_name);
    std::tuple<int, int, int> ProcessFilesFromList();
    std::tuple<int, int, int> ProcessFilesFromListConcurrently();

    void Do_SingleFile(int &success_counter, int &skipped_counter, int &error_counter,
                       const RR::FileName &file_name, int submission_ID);

    std::tuple<int, int, int> ProcessFile(const RR::FileName &file_name, int submission_ID, std::stop_token stop_token);

    std::tuple<int, int, int> ValidateSubmissionFile(const RR::FileName &file_name, int submission_ID,
                                                     std::stop_token stop_token);
    std::tuple<int, int, int> ValidateInstanceFile(const RR::FileName &file_name, std::stop_token stop_token);
    std::tuple<int, int, int> ParseInstanceFile(const RR::FileName &file_name, std::stop_token stop_token);
    std::tuple<int, int, int> GenerateReportFile(const RR::FileName &file_name, int submission_ID,
                                                 std::stop_token stop_token);

    // --output wins for a single file. otherwise the input stem plus suffix
    // in --output-dir. nothing when neither is given.

    std::optional<RR::FileName> MakeOutputFileName(const RR::FileName &input_file_name, RR::sv suffix) const;

private:
    static void HandleSignal(int signal);

    // ====================  DATA MEMBERS  =======================================

    po::positional_options_description mPositional;       //	old style options
    std::unique_ptr<po::options_description> mNewOptions; //	new style options (with identifiers)
    po::variables_map mVariableMap;

    int mArgc = 0;
    char **mArgv = nullptr;
    const std::vector<std::string> tokens_;

    std::string mode_;
    std::string logging_level_{"information"};
    std::string entity_scheme_{"http://www.sec.gov/CIK"};
    std::string file_list_data_;

    RunMode run_mode_{RunMode::e_Validate};

    SynthesisSettings synthesis_settings_;

    // program_options works with our FileName type through the
    // stream operators in RegReport.h

    RR::FileName config_file_path_name_;
    RR::FileName list_of_files_to_process_path_;
    RR::FileName log_file_path_name_;
    RR::FileName single_file_to_process_;
    RR::FileName rules_file_name_;
    RR::FileName taxonomy_file_name_;
    RR::FileName labels_file_name_;
    RR::FileName instance_file_name_;
    RR::FileName output_file_name_;
    RR::FileName output_directory_;

    std::vector<RR::sv> list_of_files_to_process_;

    // loaded once before any file is processed and only read after that.

    RR::ValidationRules rules_;
    std::optional<RR::XBRLTaxonomy> taxonomy_;
    std::optional<RR::XBRLTemplate> template_;

    std::shared_ptr<spdlog::logger> logger_;

    std::stop_source stop_source_;

    std::size_t max_cells_per_rule_{RR::DEFAULT_MAX_CELLS_PER_RULE};
    int submission_ID_{1};
    int max_at_a_time_{-1}; // how many concurrent tasks allowed

    bool help_requested_{false};

    static std::atomic<bool> had_signal_;

}; // -----  end of class RegReportApp  -----

#endif /* REGREPORTAPP_H_ */
