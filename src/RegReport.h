// =====================================================================================
//
//       Filename:  RegReport.h
//
//    Description:  holds some common type defs shared by the validation and
//                  XBRL modules.
//
//        Version:  1.0
//        Created:  09/08/2026 09:14:22 AM
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

#ifndef REGREPORT_H_
#define REGREPORT_H_


#include <filesystem>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace RegReport
{
    // thanks to Jonathan Boccara of fluentcpp.com for his articles on
    // Strong Types and the NamedType library.
    //
    // this code is a simplified and somewhat stripped down version of his.

    // =====================================================================================
    //        Class:  UniqType
    //  Description: Provides a wrapper which makes embedded common data types distinguisable
    // =====================================================================================

    template <typename T, typename Uniqueifier>
    class UniqType
    {
    public:
        // ====================  LIFECYCLE     =======================================

        UniqType() requires std::is_default_constructible_v<T>
            : value_{} {}

        UniqType(const UniqType<T, Uniqueifier>& rhs) requires std::is_copy_constructible_v<T>
            : value_{rhs.value_} {}

        explicit UniqType(T const& value) requires std::is_copy_constructible_v<T>
            : value_{value} {}

        UniqType(UniqType<T, Uniqueifier>&& rhs) requires std::is_move_constructible_v<T>
            : value_(std::move(rhs.value_)) {}

        explicit UniqType(T&& value) requires std::is_move_constructible_v<T>
            : value_(std::move(value)) {}

        // ====================  ACCESSORS     =======================================

        T& get() { return value_; }
        const T& get() const { return value_; }

        // ====================  OPERATORS     =======================================

        UniqType& operator=(const UniqType<T, Uniqueifier>& rhs) requires std::is_copy_assignable_v<T>
        {
            if (this != &rhs)
            {
                value_ = rhs.value_;
            }
            return *this;
        }
        UniqType& operator=(const T& rhs) requires std::is_copy_assignable_v<T>
        {
            if (&value_ != &rhs)
            {
                value_ = rhs;
            }
            return *this;
        }
        UniqType& operator=(UniqType<T, Uniqueifier>&& rhs) requires std::is_move_assignable_v<T>
        {
            if (this != &rhs)
            {
                value_ = std::move(rhs.value_);
            }
            return *this;
        }
        UniqType& operator=(T&& rhs) requires std::is_move_assignable_v<T>
        {
            if (&value_ != &rhs)
            {
                value_ = std::move(rhs);
            }
            return *this;
        }

    private:
        // ====================  DATA MEMBERS  =======================================

        T value_;

    }; // -----  end of class UniqType  -----

    using sv = std::string_view;
    using std::filesystem::path;

    // we don't want to have naked strings and string_views all over the place so
    // lets' add a little type safety based on ideas from fluentcpp

    using FileName = UniqType<path, struct FileNameTag>;
    using XMLContent = UniqType<sv, struct XMLContentTag>;
    using RulesContent = UniqType<sv, struct RulesContentTag>;
    using CSVContent = UniqType<sv, struct CSVContentTag>;
    using SubmissionID = UniqType<int, struct SubmissionIDTag>;

}		// namespace RegReport

namespace RR = RegReport;

//  seems to be needed by boost program options

template <typename T, typename Uniqueifier>
std::ostream& operator<<(std::ostream& os, const RR::UniqType<T, Uniqueifier>& a_type)
{
    os << a_type.get();
    return os;
}

template <typename T, typename Uniqueifier>
std::istream& operator>>(std::istream& is, RR::UniqType<T, Uniqueifier>& a_type)
{
    T temp = a_type.get();
    is >> temp;
    a_type = temp;
    return is;
}

#endif /* end of include guard: REGREPORT_H_ */
