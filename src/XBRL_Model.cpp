// =====================================================================================
//
//       Filename:  XBRL_Model.cpp
//
//    Description:  small helpers for the XBRL document model.
//
//        Version:  1.0
//        Created:  09/12/2026 10:02:51 AM
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

#include "XBRL_Model.h"

#include <algorithm>
#include <cmath>

#include "RegReport_Utils.h"

std::string LocalName (RR::sv qualified_name)
{
    if (auto pos = qualified_name.find(':'); pos != RR::sv::npos)
    {
        qualified_name.remove_prefix(pos + 1);
    }
    return std::string{qualified_name};
}		// -----  end of function LocalName  -----

std::string NamePrefix (RR::sv qualified_name)
{
    if (auto pos = qualified_name.find(':'); pos != RR::sv::npos)
    {
        return std::string{qualified_name.substr(0, pos)};
    }
    return {};
}		// -----  end of function NamePrefix  -----

bool IsMonetaryType (RR::sv concept_type)
{
    const std::string type = LocalName(concept_type);
    return type == "monetary" || type.ends_with("monetaryItemType");
}		// -----  end of function IsMonetaryType  -----

std::string PeriodShape (const RR::XBRLPeriod& period)
{
    if (std::holds_alternative<RR::InstantPeriod>(period))
    {
        return "instant";
    }
    if (std::holds_alternative<RR::DurationPeriod>(period))
    {
        return "duration";
    }
    return {};
}		// -----  end of function PeriodShape  -----

std::string PeriodEnd (const RR::XBRLPeriod& period)
{
    if (const auto* instant = std::get_if<RR::InstantPeriod>(&period); instant != nullptr)
    {
        return instant->instant_;
    }
    if (const auto* duration = std::get_if<RR::DurationPeriod>(&period); duration != nullptr)
    {
        return duration->end_date_;
    }
    return {};
}		// -----  end of function PeriodEnd  -----

bool FactsEquivalent (const RR::XBRLFact& lhs, const RR::XBRLFact& rhs)
{
    if (lhs.name_ != rhs.name_ || lhs.context_ != rhs.context_ || lhs.unit_ != rhs.unit_ || lhs.decimals_ != rhs.decimals_)
    {
        return false;
    }
    if (lhs.value_ == rhs.value_)
    {
        return true;
    }

    auto lhs_value = ParseDecimal(lhs.value_);
    auto rhs_value = ParseDecimal(rhs.value_);
    if (! lhs_value || ! rhs_value)
    {
        return false;
    }

    // allow for the last digit or so of a printed double.

    const double scale = std::max({1.0, std::fabs(*lhs_value), std::fabs(*rhs_value)});
    return std::fabs(*lhs_value - *rhs_value) <= scale * 1e-12;
}		// -----  end of function FactsEquivalent  -----
