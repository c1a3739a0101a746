/*
 * =====================================================================================
 *
 *       Filename:  RegReport_Utils.h
 *
 *    Description:  Routines shared by the sheet validation and XBRL modules.
 *
 *        Version:  1.0
 *        Created:  09/08/2026 09:56:52 AM
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

#ifndef _REGREPORT_UTILS_INC_
#define _REGREPORT_UTILS_INC_

#include <chrono>
#include <exception>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <tuple>
#include <type_traits>
#include <vector>

#include <date/date.h>

#include <fmt/format.h>

#include "RegReport.h"

namespace fs = std::filesystem;

using namespace std::string_literals;

// custom fmtlib formatter for filesytem paths

template <>
struct fmt::formatter<std::filesystem::path> : formatter<std::string> {
  // parse is inherited from formatter<string_view>.
  template <typename FormatContext>
  auto format(const std::filesystem::path &p, FormatContext &ctx) const {
    std::string f_name = p.string();
    return formatter<std::string>::format(f_name, ctx);
  }
};

// custom fmtlib formatter for date year_month_day

template <>
struct fmt::formatter<date::year_month_day> : formatter<std::string> {
  // parse is inherited from formatter<string_view>.
  template <typename FormatContext>
  auto format(date::year_month_day d, FormatContext &ctx) const {
    std::string s_date = date::format("%Y-%m-%d", d);
    return formatter<std::string>::format(s_date, ctx);
  }
};

template <typename... Ts> inline std::string catenate(Ts &&...ts) {

  constexpr auto N = sizeof...(Ts);

  // first, construct our format string

  std::string f_string;
  for (int i = 0; i < N; ++i) {
    f_string.append("{}");
  }

  return fmt::vformat(f_string, fmt::make_format_args(ts...));
}

// let's add tuples...
// based on code techniques from C++17 STL Cookbook zipping tuples.
// (works for any class which supports the '+' operator)

template <typename... Ts>
std::tuple<Ts...> AddTs(std::tuple<Ts...> const &t1,
                        std::tuple<Ts...> const &t2) {
  auto z_([](auto... xs) {
    return [xs...](auto... ys) { return std::make_tuple((xs + ys)...); };
  });

  return std::apply(std::apply(z_, t1), t2);
}

// let's sum the contents of a single tuple
// (from C++ Templates...second edition p.58
// and C++17 STL Cookbook.

template <typename... Ts> auto SumT(const std::tuple<Ts...> &t) {
  auto z_([](auto... ys) { return (... + ys); });
  return std::apply(z_, t);
}

// run start/stop banners in the log

std::string UTCDateTimeAsString(std::chrono::system_clock::time_point a_date_time);

// period dates in XBRL contexts are ISO 8601 dates.
// returns nullopt if the string does not hold a valid date.

std::optional<date::year_month_day> StringToDateYMD(const std::string &input_format,
                                                    const std::string &the_date);

// boundary I/O. Both honor a stop request and leave nothing half done.

std::string LoadDataFileForUse(const RR::FileName &file_name, std::stop_token stop_token = {});

void WriteDataToFileAtomically(const RR::FileName &output_file_name, RR::sv document,
                               std::stop_token stop_token = {});

// numeric cell and fact values. Leading/trailing white space is ignored.
// the whole remaining text must be a finite decimal number.

std::optional<double> ParseDecimal(RR::sv text);

std::string TrimCopy(RR::sv text);

// collapse runs of white space and lower case. used for matching
// sheet labels against concept names and labels.

std::string NormalizeLabel(RR::sv label);

// so we can recognize our errors if we want to do something special

class RegReportException : public std::runtime_error {
public:
  explicit RegReportException(const char *what);

  explicit RegReportException(const std::string &what);
};

class AssertionException : public std::invalid_argument {
public:
  explicit AssertionException(const char *what);

  explicit AssertionException(const std::string &what);
};

class XBRLException : public RegReportException {
public:
  explicit XBRLException(const char *what);

  explicit XBRLException(const std::string &what);
};

// rule authoring problems: bad addressing, bad rule file content.

class RuleException : public RegReportException {
public:
  explicit RuleException(const char *what);

  explicit RuleException(const std::string &what);
};

// caller asked for something it is not entitled to yet, e.g. an XBRL report
// for a submission which did not pass validation.

class PreconditionException : public RegReportException {
public:
  explicit PreconditionException(const char *what);

  explicit PreconditionException(const std::string &what);
};

class OperationCancelled : public RegReportException {
public:
  explicit OperationCancelled(const char *what);

  explicit OperationCancelled(const std::string &what);
};

//  let's do a little 'template normal' programming again

// function to split a string on a delimiter and return a vector of items.
// use concepts to restrict to strings and string_views.

template <typename T>
inline std::vector<T> split_string(RR::sv string_data, char delim)
  requires std::is_same_v<T, std::string> || std::is_same_v<T, RR::sv>
{
  std::vector<T> results;
  for (size_t it = 0; it != T::npos; ++it) {
    auto pos = string_data.find(delim, it);
    if (pos != T::npos) {
      results.emplace_back(string_data.substr(it, pos - it));
    } else {
      results.emplace_back(string_data.substr(it));
      break;
    }
    it = pos;
  }
  return results;
}

// utility function

template <typename... Ts> auto NotAllEmpty(const Ts &...ts) {
  return ((!ts.empty()) || ...);
}

template <typename... Ts> auto AllNotEmpty(const Ts &...ts) {
  return ((!ts.empty()) && ...);
}

#endif /* ----- #ifndef _REGREPORT_UTILS_INC_  ----- */
