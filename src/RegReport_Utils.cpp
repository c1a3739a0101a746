/*
 * =====================================================================================
 *
 *       Filename:  RegReport_Utils.cpp
 *
 *    Description:  Routines shared by the sheet validation and XBRL modules.
 *
 *        Version:  1.0
 *        Created:  09/08/2026 11:14:03 AM
 *       Revision:  none
 *       Compiler:  gcc
 *
 *         Author:
 *   Organization:
 *
 * =====================================================================================
 */

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

#include "RegReport_Utils.h"

#include <array>
#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <system_error>

#include <boost/algorithm/string/trim.hpp>
#include <boost/regex.hpp>

#include <range/v3/algorithm/for_each.hpp>

namespace rng = ranges;

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

using namespace std::string_literals;

// file I/O is done in chunks so a stop request is noticed reasonably quickly.

constexpr std::streamsize IO_CHUNK_SIZE{1024 * 1024};

std::string UTCDateTimeAsString(std::chrono::system_clock::time_point a_date_time) {
  auto tp = date::floor<std::chrono::seconds>(a_date_time);
  return date::format("%a, %b %d, %Y at %H:%M:%S UTC", tp);
} // -----  end of function UTCDateTimeAsString  -----

std::optional<date::year_month_day> StringToDateYMD(const std::string &input_format,
                                                    const std::string &the_date) {
  std::istringstream in{the_date};
  date::sys_days tp;
  date::from_stream(in, input_format.data(), tp);
  if (in.fail() || in.bad()) {
    return std::nullopt;
  }
  date::year_month_day result = tp;
  if (!result.ok()) {
    return std::nullopt;
  }
  return result;
} // -----  end of method StringToDateYMD  -----

/*
 *--------------------------------------------------------------------------------------
 *       Class:  RegReportException
 *      Method:  RegReportException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
RegReportException::RegReportException(const char *text)
    : std::runtime_error(text) {
} /* -----  end of method RegReportException::RegReportException  (constructor)
     ----- */

RegReportException::RegReportException(const std::string &text)
    : std::runtime_error(text) {
} /* -----  end of method RegReportException::RegReportException  (constructor)
     ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  AssertionException
 *      Method:  AssertionException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
AssertionException::AssertionException(const char *text)
    : std::invalid_argument(text) {
} /* -----  end of method AssertionException::AssertionException  (constructor)
     ----- */

AssertionException::AssertionException(const std::string &text)
    : std::invalid_argument(text) {
} /* -----  end of method AssertionException::AssertionException  (constructor)
     ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  XBRLException
 *      Method:  XBRLException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
XBRLException::XBRLException(const char *text)
    : RegReportException(text) {
} /* -----  end of method XBRLException::XBRLException  (constructor)  ----- */

XBRLException::XBRLException(const std::string &text)
    : RegReportException(text) {
} /* -----  end of method XBRLException::XBRLException  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  RuleException
 *      Method:  RuleException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
RuleException::RuleException(const char *text)
    : RegReportException(text) {
} /* -----  end of method RuleException::RuleException  (constructor)  ----- */

RuleException::RuleException(const std::string &text)
    : RegReportException(text) {
} /* -----  end of method RuleException::RuleException  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  PreconditionException
 *      Method:  PreconditionException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
PreconditionException::PreconditionException(const char *text)
    : RegReportException(text) {
} /* -----  end of method PreconditionException::PreconditionException  (constructor)
     ----- */

PreconditionException::PreconditionException(const std::string &text)
    : RegReportException(text) {
} /* -----  end of method PreconditionException::PreconditionException  (constructor)
     ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  OperationCancelled
 *      Method:  OperationCancelled
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
OperationCancelled::OperationCancelled(const char *text)
    : RegReportException(text) {
} /* -----  end of method OperationCancelled::OperationCancelled  (constructor)
     ----- */

OperationCancelled::OperationCancelled(const std::string &text)
    : RegReportException(text) {
} /* -----  end of method OperationCancelled::OperationCancelled  (constructor)
     ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  LoadDataFileForUse
 *  Description:  read the whole file. nothing is returned if we are asked to stop.
 * =====================================================================================
 */
std::string LoadDataFileForUse(const RR::FileName &file_name, std::stop_token stop_token) {
  std::error_code ec;
  auto file_size = fs::file_size(file_name.get(), ec);
  if (ec) {
    throw RegReportException(catenate("Can't read file: ", file_name.get(), ". ", ec.message()));
  }

  std::ifstream input_file{file_name.get(), std::ios_base::in | std::ios_base::binary};
  if (!input_file) {
    throw RegReportException(catenate("Can't open input file: ", file_name.get()));
  }

  std::string file_content(file_size, '\0');
  std::streamsize bytes_read{0};
  while (bytes_read < static_cast<std::streamsize>(file_size)) {
    if (stop_token.stop_requested()) {
      throw OperationCancelled(catenate("Read of file: ", file_name.get(), " was cancelled."));
    }
    auto want = std::min(IO_CHUNK_SIZE, static_cast<std::streamsize>(file_size) - bytes_read);
    input_file.read(&file_content[bytes_read], want);
    if (input_file.gcount() != want) {
      throw RegReportException(catenate("Short read on file: ", file_name.get()));
    }
    bytes_read += want;
  }

  return file_content;
} /* -----  end of function LoadDataFileForUse  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  WriteDataToFileAtomically
 *  Description:  write to a temp file next to the target then rename it into place.
 *                the target is never left partially written.
 * =====================================================================================
 */
void WriteDataToFileAtomically(const RR::FileName &output_file_name, RR::sv document,
                               std::stop_token stop_token) {
  const auto &target = output_file_name.get();
  if (target.has_parent_path() && !fs::exists(target.parent_path())) {
    fs::create_directories(target.parent_path());
  }

  fs::path temp_name{target};
  temp_name += ".partial";

  auto discard_temp = [&temp_name]() {
    std::error_code ec;
    fs::remove(temp_name, ec);
  };

  {
    std::ofstream output_file(temp_name, std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
    if (!output_file) {
      throw RegReportException(catenate("Can't open output file: ", temp_name));
    }

    for (size_t written = 0; written < document.size();) {
      if (stop_token.stop_requested()) {
        output_file.close();
        discard_temp();
        throw OperationCancelled(catenate("Write of file: ", target, " was cancelled."));
      }
      auto chunk = std::min(static_cast<size_t>(IO_CHUNK_SIZE), document.size() - written);
      output_file.write(document.data() + written, chunk);
      written += chunk;
    }
    output_file.close();
    if (!output_file) {
      discard_temp();
      throw RegReportException(catenate("Problem writing output file: ", temp_name));
    }
  }

  if (stop_token.stop_requested()) {
    discard_temp();
    throw OperationCancelled(catenate("Write of file: ", target, " was cancelled."));
  }

  std::error_code ec;
  fs::rename(temp_name, target, ec);
  if (ec) {
    discard_temp();
    throw RegReportException(catenate("Can't move output into place: ", target, ". ", ec.message()));
  }
  spdlog::debug(catenate("Wrote: ", document.size(), " bytes to: ", target));
} /* -----  end of function WriteDataToFileAtomically  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ParseDecimal
 *  Description:
 * =====================================================================================
 */
std::optional<double> ParseDecimal(RR::sv text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  if (text.starts_with('+')) {
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return std::nullopt;
  }

  double result{0.0};
  auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
  if (ec != std::errc() || p != text.data() + text.size() || !std::isfinite(result)) {
    return std::nullopt;
  }
  return result;
} // -----  end of function ParseDecimal  -----

std::string TrimCopy(RR::sv text) {
  return boost::algorithm::trim_copy(std::string{text});
} // -----  end of function TrimCopy  -----

// ===  FUNCTION  ======================================================================
//         Name:  NormalizeLabel
//  Description:
// =====================================================================================

std::string NormalizeLabel(RR::sv label) {
  static const std::string delete_this{""};
  static const std::string single_space{" "};
  static const boost::regex regex_punctuation{R"***([[:punct:]])***"};
  static const boost::regex regex_leading_space{R"***(^[[:space:]]+)***"};
  static const boost::regex regex_trailing_space{R"***([[:space:]]{1,}$)***"};
  static const boost::regex regex_double_space{R"***([[:space:]]{2,})***"};

  std::string cleaned_label =
      boost::regex_replace(std::string{label}, regex_punctuation, single_space);
  cleaned_label =
      boost::regex_replace(cleaned_label, regex_leading_space, delete_this);
  cleaned_label =
      boost::regex_replace(cleaned_label, regex_trailing_space, delete_this);
  cleaned_label =
      boost::regex_replace(cleaned_label, regex_double_space, single_space);

  // lastly, lowercase

  rng::for_each(cleaned_label, [](char &c) { c = std::tolower(static_cast<unsigned char>(c)); });

  return cleaned_label;
} // -----  end of function NormalizeLabel  -----

namespace boost {
// these functions are declared in the library headers but left to the user to
// define. so here they are...
//
/*
 * ===  FUNCTION  ======================================================================
 *         Name:  assertion_failed_msg
 *  Description:  defined in boost header but left to us to implement.
 * =====================================================================================
 */

void assertion_failed_msg(char const *expr, char const *msg,
                          char const *function, char const *file, long line) {
  throw AssertionException(catenate(
      "\n*** Assertion failed *** test: ", expr, " in function: ", function,
      " from file: ", file, " at line: ", line, ".\nassertion msg: ", msg));
} /* -----  end of function assertion_failed_msg  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  assertion_failed
 *  Description:
 * =====================================================================================
 */
void assertion_failed(char const *expr, char const *function, char const *file,
                      long line) {
  throw AssertionException(catenate("\n*** Assertion failed *** test: ", expr,
                                    " in function: ", function,
                                    " from file: ", file, " at line: ", line));
} /* -----  end of function assertion_failed  ----- */
} /* end namespace boost */
