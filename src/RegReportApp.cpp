// =====================================================================================
//
//       Filename:  RegReportApp.cpp
//
//    Description:  command line application: validate submissions, check and
//                  generate XBRL reports.
//
//        Version:  1.0
//        Created:  09/14/2026 02:03:47 PM
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

#include "RegReportApp.h"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <exception>
#include <fstream>
#include <future>
#include <iostream>
#include <map>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <boost/assert.hpp>
#include <boost/regex.hpp>

#include <range/v3/algorithm/for_each.hpp>

#include "spdlog/sinks/basic_file_sink.h"

#include "ResultsSink.h"
#include "RulesFile.h"
#include "SheetSource.h"
#include "ValidationEngine.h"
#include "XBRL_Generator.h"
#include "XBRL_Parser.h"
#include "XBRL_Validator.h"

using namespace std::string_literals;

std::atomic<bool> RegReportApp::had_signal_ = false;

// code from "The C++ Programming Language" 4th Edition. p. 1243.
// with modifications.
//
// return index of ready future
// if no future is ready, wait for d before trying again

template<typename T>
int wait_for_any(std::vector<std::future<T>>& vf, int continue_here, std::chrono::steady_clock::duration d)
{
    while(true)
    {
        for (int i=continue_here; i!=vf.size(); ++i)
        {
            if (!vf[i].valid())
            {
                continue;
            }
            switch (vf[i].wait_for(std::chrono::seconds{0}))
            {
            case std::future_status::ready:
                    return i;

            case std::future_status::timeout:
                break;

            case std::future_status::deferred:
                throw std::runtime_error("wait_for_all(): deferred future");
            }
        }
        continue_here = 0;

        if (RegReportApp::SignalReceived())
        {
            break;
        }

        std::this_thread::sleep_for(d);
    }

    return -1;
}

/*
 *--------------------------------------------------------------------------------------
 *       Class:  RegReportApp
 *      Method:  RegReportApp
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
RegReportApp::RegReportApp (int argc, char* argv[])
    : mArgc{argc}, mArgv{argv}
{
}  /* -----  end of method RegReportApp::RegReportApp  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  RegReportApp
 *      Method:  RegReportApp
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
RegReportApp::RegReportApp (const std::vector<std::string>& tokens)
    : tokens_{tokens}
{
}  /* -----  end of method RegReportApp::RegReportApp  (constructor)  ----- */

void RegReportApp::ConfigureLogging()
{
    // we need to set log level if specified and also log file.

    if (! log_file_path_name_.get().empty())
    {
        // if we are running inside our test harness, logging may already by
        // running so we don't want to clobber it.
        // different tests may use different names.

        auto logger_name = log_file_path_name_.get().filename().string();
        logger_ = spdlog::get(logger_name);
        if (! logger_)
        {
            fs::path log_dir = log_file_path_name_.get().parent_path();
            if (! log_dir.empty() && ! fs::exists(log_dir))
            {
                fs::create_directories(log_dir);
            }

            logger_ = spdlog::basic_logger_mt(logger_name, log_file_path_name_.get().string());
            spdlog::set_default_logger(logger_);
        }
    }

    // we are running before 'CheckArgs' so we need to do a little editiing ourselves.

    const std::map<std::string, spdlog::level::level_enum> levels
    {
        {"none", spdlog::level::off},
        {"error", spdlog::level::err},
        {"information", spdlog::level::info},
        {"debug", spdlog::level::debug}
    };

    auto which_level = levels.find(logging_level_);
    if (which_level != levels.end())
    {
        spdlog::set_level(which_level->second);
    }

}		/* -----  end of method RegReportApp::ConfigureLogging  ----- */

bool RegReportApp::Startup()
{
    spdlog::info(catenate("\n\n*** Begin run ", UTCDateTimeAsString(std::chrono::system_clock::now()), " ***\n"));
    bool result{true};
	try
	{	
		SetupProgramOptions();
        if (tokens_.empty())
        {
            ParseProgramOptions();
        }
        else
        {
            ParseProgramOptions(tokens_);
        }
        ConfigureLogging();
		result = CheckArgs ();
	}
	catch(std::exception& e)
	{
        spdlog::error(catenate("Problem in startup: ", e.what(), '\n'));
		//	we're outta here!

		this->Shutdown();
        result = false;
    }
    return result;
}		/* -----  end of method RegReportApp::Startup  ----- */

void RegReportApp::SetupProgramOptions ()
{
    mNewOptions = std::make_unique<po::options_description>();

	mNewOptions->add_options()
		("help,h", "produce help message")
		("config", po::value<RR::FileName>(&config_file_path_name_),
         "path to INI style file of option values. Command line values take precedence.")
		("mode,m", po::value<std::string>(&mode_)->required(),
         "Must be 'validate' or 'xbrl-validate' or 'xbrl-parse' or 'xbrl-generate'.")
		("file,f", po::value<RR::FileName>(&single_file_to_process_), "single submission file (.xlsx or .csv) to be processed.")
		("list-file", po::value<RR::FileName>(&list_of_files_to_process_path_),"path to file with list of files to process.")
		("rules,r", po::value<RR::FileName>(&rules_file_name_), "path to validation rules file.")
		("taxonomy,t", po::value<RR::FileName>(&taxonomy_file_name_), "path to taxonomy schema file.")
		("labels", po::value<RR::FileName>(&labels_file_name_), "path to separate taxonomy label linkbase file.")
		("instance,i", po::value<RR::FileName>(&instance_file_name_), "single XBRL instance file to be processed.")
		("output,o", po::value<RR::FileName>(&output_file_name_), "output file for a single input file.")
		("output-dir", po::value<RR::FileName>(&output_directory_), "directory to write output files to.")
		("submission-id", po::value<int>(&submission_ID_)->default_value(1),
         "submission id used in results. Files in a list are numbered from here. Default is 1.")
		("entity", po::value<std::string>(&synthesis_settings_.entity_), "reporting entity identifier for generated reports.")
		("entity-scheme", po::value<std::string>(&entity_scheme_)->default_value("http://www.sec.gov/CIK"),
         "identifier scheme for generated contexts. Default is 'http://www.sec.gov/CIK'.")
		("period-start", po::value<std::string>(&synthesis_settings_.period_start_), "reporting period start date. YYYY-MM-DD.")
		("period-end", po::value<std::string>(&synthesis_settings_.period_end_), "reporting period end date. YYYY-MM-DD.")
		("currency", po::value<std::string>(&synthesis_settings_.currency_)->default_value("USD"),
         "ISO 4217 currency code for monetary facts. Default is 'USD'.")
		("decimals", po::value<std::string>(&synthesis_settings_.decimals_)->default_value("0"),
         "decimals attribute for monetary facts. Default is '0'.")
		("schema-ref", po::value<std::string>(&synthesis_settings_.schema_ref_), "schemaRef href for generated reports.")
		("concept-prefix", po::value<std::string>(&synthesis_settings_.concept_prefix_)->default_value("rr"),
         "namespace prefix for generated facts. Default is 'rr'.")
		("language", po::value<std::string>(&synthesis_settings_.language_), "xml:lang for generated reports.")
		("max-cells-per-rule", po::value<std::size_t>(&max_cells_per_rule_)->default_value(RR::DEFAULT_MAX_CELLS_PER_RULE),
         "largest number of cells one rule may address.")
		("concurrent,k", po::value<int>(&max_at_a_time_)->default_value(-1),
         "Maximun number of concurrent processes. Default of -1 -- process list sequentially.")
		("log-level,l", po::value<std::string>(&logging_level_),
         "logging level. Must be 'none|error|information|debug'. Default is 'information'.")
		("log-path", po::value<RR::FileName>(&log_file_path_name_),	"path name for log file.")
		;
}		/* -----  end of method RegReportApp::SetupProgramOptions  ----- */

void RegReportApp::ParseProgramOptions ()
{
	auto options = po::parse_command_line(mArgc, mArgv, *mNewOptions);
	po::store(options, mVariableMap);
	if (this->mArgc == 1 ||	mVariableMap.count("help") == 1)
	{
		std::cout << *mNewOptions << "\n";
        help_requested_ = true;
		throw std::runtime_error("\nExiting after 'help'.");
	}
    ParseConfigFile();
	po::notify(mVariableMap);    

}		/* -----  end of method RegReportApp::ParseProgramOptions  ----- */

void RegReportApp::ParseProgramOptions (const std::vector<std::string>& tokens)
{
	auto options = po::command_line_parser(tokens).options(*mNewOptions).run();
	po::store(options, mVariableMap);
	if (mVariableMap.count("help") == 1)
	{
		std::cout << *mNewOptions << "\n";
        help_requested_ = true;
		throw std::runtime_error("\nExiting after 'help'.");
	}
    ParseConfigFile();
	po::notify(mVariableMap);    
}		/* -----  end of method RegReportApp::ParseProgramOptions  ----- */

void RegReportApp::ParseConfigFile ()
{
    // values already stored from the command line are not replaced.

    if (mVariableMap.count("config") == 0)
    {
        return;
    }
    const auto config_file_name = mVariableMap["config"].as<RR::FileName>();
    BOOST_ASSERT_MSG(fs::is_regular_file(config_file_name.get()),
            catenate("Can't find config file: ", config_file_name.get()).c_str());

    std::ifstream config_file{config_file_name.get()};
    po::store(po::parse_config_file(config_file, *mNewOptions), mVariableMap);
}		/* -----  end of method RegReportApp::ParseConfigFile  ----- */

bool RegReportApp::CheckArgs ()
{
    const std::map<std::string, RunMode> modes
    {
        {"validate", RunMode::e_Validate},
        {"xbrl-validate", RunMode::e_XBRLValidate},
        {"xbrl-parse", RunMode::e_XBRLParse},
        {"xbrl-generate", RunMode::e_XBRLGenerate}
    };

    auto which_mode = modes.find(mode_);
    BOOST_ASSERT_MSG(which_mode != modes.end(), "Mode must be: 'validate' or 'xbrl-validate' or 'xbrl-parse' or 'xbrl-generate'.");
    run_mode_ = which_mode->second;

    auto check_input_file = [](const RR::FileName& file_name, const char* what)
    {
        if (! file_name.get().empty())
        {
            BOOST_ASSERT_MSG(fs::exists(file_name.get()), catenate("Can't find ", what, " file: ", file_name.get()).c_str());
            BOOST_ASSERT_MSG(fs::is_regular_file(file_name.get()), catenate("Path: ", file_name.get(),
                        " is not a regular file.").c_str());
        }
    };

    check_input_file(single_file_to_process_, "submission");
    check_input_file(instance_file_name_, "instance");
    check_input_file(rules_file_name_, "rules");
    check_input_file(taxonomy_file_name_, "taxonomy");
    check_input_file(labels_file_name_, "labels");
    check_input_file(list_of_files_to_process_path_, "list");

    if (! list_of_files_to_process_path_.get().empty())
    {
        BuildListOfFilesToProcess();
    }

    const bool uses_instances = run_mode_ == RunMode::e_XBRLValidate || run_mode_ == RunMode::e_XBRLParse;

    if (uses_instances)
    {
        BOOST_ASSERT_MSG(NotAllEmpty(instance_file_name_.get(), list_of_files_to_process_), "No instance files to process found.");
    }
    else
    {
        BOOST_ASSERT_MSG(NotAllEmpty(single_file_to_process_.get(), list_of_files_to_process_), "No submission files to process found.");
        BOOST_ASSERT_MSG(! rules_file_name_.get().empty(), "Must specify rules file.");
    }

    if (run_mode_ == RunMode::e_XBRLValidate || run_mode_ == RunMode::e_XBRLGenerate)
    {
        BOOST_ASSERT_MSG(! taxonomy_file_name_.get().empty(), "Must specify taxonomy file.");
    }

    if (run_mode_ == RunMode::e_XBRLGenerate)
    {
        BOOST_ASSERT_MSG(! synthesis_settings_.entity_.empty(), "Must specify reporting entity.");
        BOOST_ASSERT_MSG(! synthesis_settings_.period_end_.empty(), "Must specify reporting period end.");
        BOOST_ASSERT_MSG(NotAllEmpty(output_file_name_.get(), output_directory_.get()), "Must specify output file or output directory.");
        if (! list_of_files_to_process_.empty())
        {
            BOOST_ASSERT_MSG(! output_directory_.get().empty(), "Must specify output directory when processing a list of files.");
        }

        static const boost::regex regex_currency{R"***(^[A-Z]{3}$)***"};
        BOOST_ASSERT_MSG(boost::regex_match(synthesis_settings_.currency_, regex_currency),
                catenate("Currency must be a 3 letter ISO 4217 code: ", synthesis_settings_.currency_).c_str());
    }

    std::optional<date::year_month_day> begin_date;
    if (! synthesis_settings_.period_start_.empty())
    {
        begin_date = StringToDateYMD("%F", synthesis_settings_.period_start_);
        BOOST_ASSERT_MSG(begin_date, catenate("Unable to parse period start date: ", synthesis_settings_.period_start_).c_str());
    }
    if (! synthesis_settings_.period_end_.empty())
    {
        auto end_date = StringToDateYMD("%F", synthesis_settings_.period_end_);
        BOOST_ASSERT_MSG(end_date, catenate("Unable to parse period end date: ", synthesis_settings_.period_end_).c_str());
        if (begin_date)
        {
            BOOST_ASSERT_MSG(*begin_date <= *end_date, "Period start must not be after period end.");
        }
    }

    BOOST_ASSERT_MSG(max_cells_per_rule_ > 0, "max-cells-per-rule must be greater than 0.");
    BOOST_ASSERT_MSG(submission_ID_ > 0, "submission-id must be greater than 0.");

    if (! output_directory_.get().empty() && ! fs::exists(output_directory_.get()))
    {
        fs::create_directories(output_directory_.get());
    }

    return true;
}       // -----  end of method RegReportApp::CheckArgs  -----

void RegReportApp::BuildListOfFilesToProcess()
{
    list_of_files_to_process_.clear();      //  in case of reprocessing.

    file_list_data_ = LoadDataFileForUse(list_of_files_to_process_path_);

    // could be a lot of files so use list of string_views

    list_of_files_to_process_ = split_string<RR::sv>(file_list_data_, '\n');

    // the splitter can end up with an empty entry so, filter for that.

    std::erase_if(list_of_files_to_process_, [](RR::sv file_name) { return file_name.empty(); });

    spdlog::info(catenate("Found: ", list_of_files_to_process_.size(), " files in list."));
}		/* -----  end of method RegReportApp::BuildListOfFilesToProcess  ----- */

void RegReportApp::LoadSharedInputs ()
{
    auto stop_token = stop_source_.get_token();

    if (! rules_file_name_.get().empty())
    {
        auto [rules, diagnostics] = LoadRulesFile(rules_file_name_, 0, stop_token);
        for (const auto& diagnostic : diagnostics)
        {
            spdlog::warn(catenate("rules file: ", rules_file_name_.get(), ": ", diagnostic.message_));
        }
        rules_ = std::move(rules);
        spdlog::info(catenate("Loaded: ", rules_.size(), " rules from: ", rules_file_name_.get()));
    }

    if (! taxonomy_file_name_.get().empty())
    {
        std::optional<RR::FileName> labels_file_name;
        if (! labels_file_name_.get().empty())
        {
            labels_file_name = labels_file_name_;
        }
        taxonomy_ = LoadXBRLTaxonomy(taxonomy_file_name_, labels_file_name, {}, stop_token);
        template_ = CreateXBRLTemplate(*taxonomy_);
    }
}		/* -----  end of method RegReportApp::LoadSharedInputs  ----- */

std::tuple<int, int, int> RegReportApp::Run()
{
    LoadSharedInputs();

    std::tuple<int, int, int> single_counters{0, 0, 0};

    const auto& single_file = run_mode_ == RunMode::e_XBRLValidate || run_mode_ == RunMode::e_XBRLParse
        ? instance_file_name_ : single_file_to_process_;

    if (! single_file.get().empty())
    {
        single_counters = this->ProcessSingleFile(single_file);
    }

    std::tuple<int, int, int> list_counters{0, 0, 0};

    if (! list_of_files_to_process_.empty())
    {
        if (max_at_a_time_ < 1)
        {
            list_counters = this->ProcessFilesFromList();
        }
        else
        {
            list_counters = this->ProcessFilesFromListConcurrently();
        }
    }

    std::tuple<int, int, int> counters{0, 0, 0};
    counters = AddTs(counters, single_counters);
    counters = AddTs(counters, list_counters);

    auto [success_counter, skipped_counter, error_counter] = counters;

    spdlog::info(catenate("Processed: ", SumT(counters), " files. Successes: ",
            success_counter, ". Skips: ", skipped_counter , ". Errors: ", error_counter, "."));

    return counters;
}		/* -----  end of method RegReportApp::Run  ----- */

std::tuple<int, int, int> RegReportApp::ProcessSingleFile(const RR::FileName& input_file_name)
{
    int success_counter{0};
    int skipped_counter{0};
    int error_counter{0};

    Do_SingleFile(success_counter, skipped_counter, error_counter, input_file_name, submission_ID_);

    return {success_counter, skipped_counter, error_counter};
}		/* -----  end of method RegReportApp::ProcessSingleFile  ----- */

std::tuple<int, int, int> RegReportApp::ProcessFilesFromList()
{
    int success_counter{0};
    int skipped_counter{0};
    int error_counter{0};

    int submission_ID{submission_ID_};

    auto process_file([this, &submission_ID, &success_counter, &skipped_counter, &error_counter](const auto& file_name)
    {
        Do_SingleFile(success_counter, skipped_counter, error_counter, RR::FileName{file_name}, submission_ID++);
    });

    ranges::for_each(list_of_files_to_process_, process_file);

    return {success_counter, skipped_counter, error_counter};
}		/* -----  end of method RegReportApp::ProcessFilesFromList  ----- */

void RegReportApp::Do_SingleFile(int& success_counter, int& skipped_counter, int& error_counter,
        const RR::FileName& file_name, int submission_ID)
{
    try
    {
        auto [successes, skips, errors] = ProcessFile(file_name, submission_ID, stop_source_.get_token());
        success_counter += successes;
        skipped_counter += skips;
        error_counter += errors;
    }
    catch(OperationCancelled& e)
    {
        ++error_counter;
        spdlog::error(catenate("Processing cancelled: ", file_name.get(), ". ", e.what()));
        throw;
    }
    catch(std::system_error& e)
    {
        // file system problems probably affect everything else too so let's get out of here.

        ++error_counter;
        spdlog::error(catenate("Problem processing file: ", file_name.get(), ". ", e.what()));
        spdlog::error(catenate("Processed: ", (success_counter + skipped_counter + error_counter) ,
                " files. Successes: ", success_counter, ". Skips: ", skipped_counter ,
                ". Errors: ", error_counter, "."));
        throw;
    }
    catch(std::exception& e)
    {
        ++error_counter;
        spdlog::error(catenate("Problem processing file: ", file_name.get(), ". ", e.what()));
    }
}		/* -----  end of method RegReportApp::Do_SingleFile  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  RegReportApp
 *      Method:  RegReportApp :: ProcessFile
 * Description:  counters are success, skip, error. a skip is a file which was
 *               processed but did not pass.
 *--------------------------------------------------------------------------------------
 */
std::tuple<int, int, int> RegReportApp::ProcessFile (const RR::FileName& file_name, int submission_ID, std::stop_token stop_token)
{
    if (! fs::is_regular_file(file_name.get()))
    {
        spdlog::info(catenate(file_name.get(), ": File skipped because it is not a regular file."));
        return {0, 1, 0};
    }

    spdlog::info(catenate("Processing file: ", file_name.get()));

    switch (run_mode_)
    {
        case RunMode::e_Validate:
            return ValidateSubmissionFile(file_name, submission_ID, stop_token);

        case RunMode::e_XBRLValidate:
            return ValidateInstanceFile(file_name, stop_token);

        case RunMode::e_XBRLParse:
            return ParseInstanceFile(file_name, stop_token);

        case RunMode::e_XBRLGenerate:
            return GenerateReportFile(file_name, submission_ID, stop_token);
    }
    return {0, 1, 0};
}		// -----  end of method RegReportApp::ProcessFile  -----

std::tuple<int, int, int> RegReportApp::ValidateSubmissionFile (const RR::FileName& file_name, int submission_ID,
        std::stop_token stop_token)
{
    auto sheets = LoadSubmissionSheets(file_name, stop_token);
    auto validation = ValidateSubmission(RR::SubmissionID{submission_ID}, rules_, sheets, max_cells_per_rule_);

    for (const auto& diagnostic : validation.diagnostics_)
    {
        spdlog::warn(catenate(file_name.get(), ": rule: ", diagnostic.rule_ID_.value_or(0), ": ", diagnostic.message_));
    }

    if (auto output_file_name = MakeOutputFileName(file_name, "_results.tsv"); output_file_name)
    {
        WriteValidationResults(validation, *output_file_name, stop_token);
    }

    if (validation.status_ == RR::ValidationStatus::e_Passed)
    {
        return {1, 0, 0};
    }
    return {0, 1, 0};
}		// -----  end of method RegReportApp::ValidateSubmissionFile  -----

std::tuple<int, int, int> RegReportApp::ValidateInstanceFile (const RR::FileName& file_name, std::stop_token stop_token)
{
    auto instance = LoadXBRLInstance(file_name, {}, &taxonomy_.value(), stop_token);
    auto report = ValidateXBRLInstance(instance, template_.value());

    for (const auto& error : report.errors_)
    {
        spdlog::debug(catenate(file_name.get(), ": error: ", error));
    }
    for (const auto& warning : report.warnings_)
    {
        spdlog::debug(catenate(file_name.get(), ": warning: ", warning));
    }

    if (auto output_file_name = MakeOutputFileName(file_name, "_xbrl_report.txt"); output_file_name)
    {
        WriteDataToFileAtomically(*output_file_name, FormatXBRLValidationReport(report), stop_token);
    }

    if (report.is_valid_)
    {
        return {1, 0, 0};
    }
    return {0, 1, 0};
}		// -----  end of method RegReportApp::ValidateInstanceFile  -----

std::tuple<int, int, int> RegReportApp::ParseInstanceFile (const RR::FileName& file_name, std::stop_token stop_token)
{
    auto instance = LoadXBRLInstance(file_name, {}, taxonomy_ ? &taxonomy_.value() : nullptr, stop_token);

    spdlog::info(catenate(file_name.get(), ": entity: ", instance.metadata_.entity_, " period: ", instance.metadata_.period_,
        " contexts: ", instance.contexts_.size(), " units: ", instance.units_.size(), " facts: ", instance.facts_.size()));

    if (auto output_file_name = MakeOutputFileName(file_name, "_facts.tsv"); output_file_name)
    {
        WriteDataToFileAtomically(*output_file_name, FormatXBRLFacts(instance), stop_token);
    }
    return {1, 0, 0};
}		// -----  end of method RegReportApp::ParseInstanceFile  -----

std::tuple<int, int, int> RegReportApp::GenerateReportFile (const RR::FileName& file_name, int submission_ID,
        std::stop_token stop_token)
{
    auto sheets = LoadSubmissionSheets(file_name, stop_token);
    auto validation = ValidateSubmission(RR::SubmissionID{submission_ID}, rules_, sheets, max_cells_per_rule_);

    // throws if the submission did not pass. nothing gets written then.

    auto instance = BuildInstanceFromSubmission(validation, sheets, taxonomy_.value(), synthesis_settings_);

    auto output_file_name = MakeOutputFileName(file_name, ".xml");
    BOOST_ASSERT_MSG(output_file_name, "Must specify output file or output directory.");

    WriteXBRLReport(instance, *output_file_name, MakeGeneratorSettings(*taxonomy_, synthesis_settings_, entity_scheme_), stop_token);
    return {1, 0, 0};
}		// -----  end of method RegReportApp::GenerateReportFile  -----

std::optional<RR::FileName> RegReportApp::MakeOutputFileName (const RR::FileName& input_file_name, RR::sv suffix) const
{
    if (! output_file_name_.get().empty() && list_of_files_to_process_.empty())
    {
        return output_file_name_;
    }
    if (! output_directory_.get().empty())
    {
        return RR::FileName{output_directory_.get() / catenate(input_file_name.get().stem(), suffix)};
    }
    return std::nullopt;
}		// -----  end of method RegReportApp::MakeOutputFileName  -----

std::tuple<int, int, int> RegReportApp::ProcessFilesFromListConcurrently()
{
    // a long list can run for quite a while so it's a good idea to provide
    // a way to break into this processing and shut it down cleanly.
    // so, a little bit of C...(taken from "Advanced Unix Programming" by Warren W. Gay, p. 317)

    struct sigaction sa_old;
    struct sigaction sa_new;

    // ok, get ready to handle keyboard interrupts, if any.

    sa_new.sa_handler = RegReportApp::HandleSignal;
    sigemptyset(&sa_new.sa_mask);
    sa_new.sa_flags = 0;
    sigaction(SIGINT, &sa_new, &sa_old);

    RegReportApp::had_signal_ = false;

    // If some kind of system error occurs, it may affect more than 1 of
    // our our tasks so let's check each of them and log any exceptions
    // which occur. We'll then rethrow our first exception.

    std::exception_ptr ep{nullptr};

    std::tuple<int, int, int> counters{0, 0, 0};  // success, skips, errors

    // keep track of our async processes here.

    std::vector<std::future<std::tuple<int, int, int>>> tasks;
    tasks.reserve(max_at_a_time_);

    auto start_task = [this](size_t which_file)
    {
        return std::async(std::launch::async, &RegReportApp::ProcessFile, this,
                RR::FileName{list_of_files_to_process_[which_file]}, submission_ID_ + static_cast<int>(which_file),
                stop_source_.get_token());
    };

    // prime the pump...

    size_t current_file{0};
    for ( ; tasks.size() < max_at_a_time_ && current_file < list_of_files_to_process_.size(); ++current_file)
    {
        // queue up our tasks up to the limit.

        tasks.emplace_back(start_task(current_file));
    }

    int continue_here{0};
    int ready_task{-1};

    for ( ; current_file < list_of_files_to_process_.size(); ++current_file)
    {
        // we want to keep max_at_a_time_ tasks going so, as one finishes,
        // we replace it with another
    
        ready_task = wait_for_any(tasks, continue_here, std::chrono::microseconds{100});
        if (ready_task < 0)
        {
            break;
        }
        try
        {
            auto result = tasks[ready_task].get();
            counters = AddTs(counters, result);
        }
        catch (std::system_error& e)
        {
            // any system problems, we eventually abort, but only after finishing work in process.

            spdlog::error(e.what());
            auto ec = e.code();
            spdlog::error(catenate("Category: ", ec.category().name(), ". Value: ", ec.value(),
                    ". Message: ", ec.message()));
            counters = AddTs(counters, {0, 0, 1});

            // OK, let's be sure this propagates

            ep = std::current_exception();
            break;
        }
        catch (RegReportException& e)
        {
            // any 'expected' problems, we'll document them and continue on.

            spdlog::error(e.what());
            counters = AddTs(counters, {0, 0, 1});
        }
        catch (std::exception& e)
        {
            spdlog::error(e.what());
            counters = AddTs(counters, {0, 0, 1});

            // OK, let's remember our first time here.

            if (! ep)
            {
                ep = std::current_exception();
            }
        }

        if (RegReportApp::had_signal_)
        {
            break;
        }

        //  let's keep going

        tasks[ready_task] = start_task(current_file);
        continue_here = (ready_task + 1) % max_at_a_time_;
    }

    // tasks still running see the stop request and bail out.

    if (RegReportApp::had_signal_ || ep)
    {
        stop_source_.request_stop();
    }

    // need to clean up the last set of tasks

    for (auto& task : tasks)
    {
        try
        {
            if (task.valid())
            {
                auto result = task.get();
                counters = AddTs(counters, result);
            }
        }
        catch (RegReportException& e)
        {
            // any problems, we'll document them and continue.

            spdlog::error(e.what());
            counters = AddTs(counters, {0, 0, 1});
        }
        catch(std::exception& e)
        {
            spdlog::error(e.what());
            counters = AddTs(counters, {0, 0, 1});
            if (! ep)
            {
                ep = std::current_exception();
            }
        }
    }

    // restore the default

    sigaction(SIGINT, &sa_old, 0);

    auto [success_counter, skipped_counter, error_counter] = counters;

    if (ep)
    {
        spdlog::error(catenate("Processed: ", SumT(counters), " files. Successes: ", success_counter,
                ". Skips: ", skipped_counter, ". Errors: ", error_counter, "."));
        std::rethrow_exception(ep);
    }

    if (RegReportApp::had_signal_)
    {
        spdlog::error(catenate("Processed: ", SumT(counters), " files. Successes: ", success_counter,
                ". Skips: ", skipped_counter, ". Errors: ", error_counter, "."));
        throw std::runtime_error("Received keyboard interrupt.  Processing manually terminated after processing: "
            + std::to_string(success_counter) + " files.");
    }

    return counters;

}		/* -----  end of method RegReportApp::ProcessFilesFromListConcurrently  ----- */

void RegReportApp::HandleSignal(int signal)

{
    std::signal(SIGINT, RegReportApp::HandleSignal);

    // only thing we need to do

    RegReportApp::had_signal_ = true;

}		/* -----  end of method RegReportApp::HandleSignal  ----- */

void RegReportApp::Shutdown ()
{
    spdlog::info(catenate("\n\n*** End run ", UTCDateTimeAsString(std::chrono::system_clock::now()), " ***\n"));
}       // -----  end of method RegReportApp::Shutdown  -----
