// =====================================================================================
//
//       Filename:  XBRL_Model.h
//
//    Description:  in memory form of XBRL instance documents and taxonomies.
//
//        Version:  1.0
//        Created:  09/12/2026 09:20:33 AM
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

#ifndef  XBRL_MODEL_INC
#define  XBRL_MODEL_INC

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "RegReport.h"

namespace RegReport
{
    // namespace URIs we depend on. documents may bind them to any prefix
    // they like. fact_namespaces_ (prefix -> URI) are declared on the
    // documents we generate.

    struct XBRL_Namespaces
    {
        std::string xbrli_ = "http://www.xbrl.org/2003/instance";
        std::string link_ = "http://www.xbrl.org/2003/linkbase";
        std::string xlink_ = "http://www.w3.org/1999/xlink";
        std::string xsi_ = "http://www.w3.org/2001/XMLSchema-instance";
        std::string xs_ = "http://www.w3.org/2001/XMLSchema";
        std::string iso4217_ = "http://www.xbrl.org/2003/iso4217";
        std::map<std::string, std::string> fact_namespaces_;
    };

    struct InstantPeriod
    {
        std::string instant_;

        bool operator==(const InstantPeriod& rhs) const = default;
    };

    struct DurationPeriod
    {
        std::string start_date_;
        std::string end_date_;

        bool operator==(const DurationPeriod& rhs) const = default;
    };

    // monostate only when the document gave no usable period.

    using XBRLPeriod = std::variant<std::monostate, InstantPeriod, DurationPeriod>;

    struct XBRLContext
    {
        std::string ID_;
        std::string entity_;
        XBRLPeriod period_;

        bool operator==(const XBRLContext& rhs) const = default;
    };

    struct XBRLUnit
    {
        std::string ID_;
        std::string measure_;

        bool operator==(const XBRLUnit& rhs) const = default;
    };

    // name_ is the qualified name, e.g. us-gaap:Revenues, and namespace_
    // is its prefix. period_ is 'instant' or 'duration' from the context.

    struct XBRLFact
    {
        std::string name_;
        std::string type_;
        std::string period_;
        std::string value_;
        std::optional<std::string> unit_;
        std::optional<std::string> context_;
        std::optional<std::string> decimals_;
        std::optional<std::string> namespace_;

        bool operator==(const XBRLFact& rhs) const = default;
    };

    struct InstanceMetadata
    {
        std::string entity_;
        std::string period_;
        std::string currency_;
        std::string language_;

        bool operator==(const InstanceMetadata& rhs) const = default;
    };

    struct XBRLInstance
    {
        std::string schema_ref_;
        std::vector<XBRLContext> contexts_;
        std::vector<XBRLUnit> units_;
        std::vector<XBRLFact> facts_;
        InstanceMetadata metadata_;

        // prefix -> URI for the prefixes used by fact names and unit measures.

        std::map<std::string, std::string> fact_namespaces_;

        bool operator==(const XBRLInstance& rhs) const = default;
    };

    struct TaxonomyConcept
    {
        std::string ID_;
        std::string name_;
        std::string type_;
        std::string label_;
        std::optional<std::string> documentation_;
        bool abstract_ = false;
        std::optional<std::string> period_type_;
        std::optional<std::string> balance_;

        bool operator==(const TaxonomyConcept& rhs) const = default;
    };

    struct PresentationEntry
    {
        std::string name_;
        double order_ = 0.0;
        std::optional<std::string> parent_;

        bool operator==(const PresentationEntry& rhs) const = default;
    };

    struct PresentationRole
    {
        std::string role_;
        std::vector<PresentationEntry> concepts_;

        bool operator==(const PresentationRole& rhs) const = default;
    };

    struct XBRLTaxonomy
    {
        std::string target_namespace_;
        std::vector<TaxonomyConcept> concepts_;
        std::vector<PresentationRole> presentations_;

        bool operator==(const XBRLTaxonomy& rhs) const = default;
    };

    enum class TemplateRuleKind
    {
        e_Numeric,
        e_Required
    };

    struct TemplateRule
    {
        std::string concept_;
        TemplateRuleKind rule_ = TemplateRuleKind::e_Required;
        std::string message_;

        bool operator==(const TemplateRule& rhs) const = default;
    };

    struct XBRLTemplate
    {
        XBRLTaxonomy taxonomy_;
        std::vector<std::string> required_concepts_;
        std::vector<TemplateRule> validation_rules_;
        std::vector<std::string> reporting_periods_;
        std::vector<std::string> currencies_;
    };

    struct XBRLValidationReport
    {
        bool is_valid_ = true;
        std::vector<std::string> errors_;
        std::vector<std::string> warnings_;
    };

    // id -> label text

    using XBRL_Labels = std::map<std::string, std::string>;

}		// namespace RegReport

// us-gaap:Revenues -> Revenues

std::string LocalName(RR::sv qualified_name);

// us-gaap:Revenues -> us-gaap. empty when there is no prefix.

std::string NamePrefix(RR::sv qualified_name);

// monetary item types and the short 'monetary' form.

bool IsMonetaryType(RR::sv concept_type);

// 'instant', 'duration' or empty.

std::string PeriodShape(const RR::XBRLPeriod& period);

// the date a period ends on. the instant for instants.

std::string PeriodEnd(const RR::XBRLPeriod& period);

// facts match when name, context, unit and decimals are the same and the
// values are equal. values which are both numbers are compared as numbers.

bool FactsEquivalent(const RR::XBRLFact& lhs, const RR::XBRLFact& rhs);

#endif   // ----- #ifndef XBRL_MODEL_INC  -----
