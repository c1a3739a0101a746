// =====================================================================================
//
//       Filename:  XBRL_Generator.cpp
//
//    Description:  build XBRL instance documents from the document model.
//
//        Version:  1.0
//        Created:  09/13/2026 01:36:48 PM
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

#include "XBRL_Generator.h"

#include <sstream>

#include <spdlog/spdlog.h>

#include "RegReport_Utils.h"

namespace
{
    void AddPeriod (pugi::xml_node period_node, const RR::XBRLPeriod& period)
    {
        if (const auto* instant = std::get_if<RR::InstantPeriod>(&period); instant != nullptr)
        {
            period_node.append_child("xbrli:instant").text().set(instant->instant_.c_str());
        }
        else if (const auto* duration = std::get_if<RR::DurationPeriod>(&period); duration != nullptr)
        {
            period_node.append_child("xbrli:startDate").text().set(duration->start_date_.c_str());
            period_node.append_child("xbrli:endDate").text().set(duration->end_date_.c_str());
        }
    }

    bool IsGeneratorPrefix (RR::sv prefix)
    {
        return prefix == "xbrli" || prefix == "link" || prefix == "xlink" || prefix == "xsi" || prefix == "iso4217";
    }

    std::string FactElementName (const RR::XBRLFact& fact)
    {
        if (fact.name_.find(':') != std::string::npos || ! fact.namespace_ || fact.namespace_->empty())
        {
            return fact.name_;
        }
        return catenate(*fact.namespace_, ':', fact.name_);
    }
}  // namespace

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  BuildXBRLDocument
 *  Description:  contexts, units and facts are emitted in the order given.
 *                a fact or measure prefix nobody declared throws.
 * =====================================================================================
 */
pugi::xml_document BuildXBRLDocument (const RR::XBRLInstance& instance, const GeneratorSettings& settings)
{
    const auto& namespaces = settings.namespaces_;

    pugi::xml_document doc;
    auto declaration = doc.append_child(pugi::node_declaration);
    declaration.append_attribute("version") = "1.0";
    declaration.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("xbrli:xbrl");
    root.append_attribute("xmlns:xbrli") = namespaces.xbrli_.c_str();
    root.append_attribute("xmlns:link") = namespaces.link_.c_str();
    root.append_attribute("xmlns:xlink") = namespaces.xlink_.c_str();
    root.append_attribute("xmlns:xsi") = namespaces.xsi_.c_str();
    root.append_attribute("xmlns:iso4217") = namespaces.iso4217_.c_str();

    // the instance's own declarations plus the settings. the settings win.

    auto fact_namespaces = instance.fact_namespaces_;
    for (const auto& [prefix, uri] : namespaces.fact_namespaces_)
    {
        fact_namespaces[prefix] = uri;
    }
    for (const auto& [prefix, uri] : fact_namespaces)
    {
        if (IsGeneratorPrefix(prefix))
        {
            continue;
        }
        const std::string attr_name = prefix.empty() ? std::string{"xmlns"} : catenate("xmlns:", prefix);
        root.append_attribute(attr_name.c_str()) = uri.c_str();
    }

    auto check_declared = [&fact_namespaces](RR::sv qualified_name, RR::sv what)
    {
        if (auto prefix = NamePrefix(qualified_name); ! prefix.empty() && ! IsGeneratorPrefix(prefix) && ! fact_namespaces.contains(prefix))
        {
            throw XBRLException(catenate(what, ": ", qualified_name, " uses undeclared namespace prefix: ", prefix));
        }
    };

    if (! instance.metadata_.language_.empty())
    {
        root.append_attribute("xml:lang") = instance.metadata_.language_.c_str();
    }

    auto schema_ref = root.append_child("link:schemaRef");
    schema_ref.append_attribute("xlink:type") = "simple";
    schema_ref.append_attribute("xlink:href") = instance.schema_ref_.c_str();

    for (const auto& context : instance.contexts_)
    {
        auto context_node = root.append_child("xbrli:context");
        context_node.append_attribute("id") = context.ID_.c_str();

        auto identifier = context_node.append_child("xbrli:entity").append_child("xbrli:identifier");
        identifier.append_attribute("scheme") = settings.entity_scheme_.c_str();
        identifier.text().set(context.entity_.c_str());

        AddPeriod(context_node.append_child("xbrli:period"), context.period_);
    }

    for (const auto& unit : instance.units_)
    {
        auto unit_node = root.append_child("xbrli:unit");
        unit_node.append_attribute("id") = unit.ID_.c_str();

        // ratio units, e.g. iso4217:USD/xbrli:shares

        if (auto slash = unit.measure_.find('/'); slash != std::string::npos)
        {
            check_declared(unit.measure_.substr(0, slash), "measure");
            check_declared(unit.measure_.substr(slash + 1), "measure");

            auto divide = unit_node.append_child("xbrli:divide");
            divide.append_child("xbrli:unitNumerator").append_child("xbrli:measure").text().set(unit.measure_.substr(0, slash).c_str());
            divide.append_child("xbrli:unitDenominator").append_child("xbrli:measure").text().set(unit.measure_.substr(slash + 1).c_str());
        }
        else
        {
            check_declared(unit.measure_, "measure");
            unit_node.append_child("xbrli:measure").text().set(unit.measure_.c_str());
        }
    }

    for (const auto& fact : instance.facts_)
    {
        const std::string element_name = FactElementName(fact);
        check_declared(element_name, "fact");

        auto fact_node = root.append_child(element_name.c_str());
        fact_node.append_attribute("contextRef") = fact.context_.value_or("default").c_str();
        if (fact.unit_)
        {
            fact_node.append_attribute("unitRef") = fact.unit_->c_str();
        }
        if (fact.decimals_)
        {
            fact_node.append_attribute("decimals") = fact.decimals_->c_str();
        }
        fact_node.text().set(fact.value_.c_str());
    }

    return doc;
}		// -----  end of function BuildXBRLDocument  -----

std::string SerializeXBRLDocument (const pugi::xml_document& doc)
{
    std::ostringstream output;
    doc.save(output, "  ", pugi::format_indent, pugi::encoding_utf8);
    return output.str();
}		// -----  end of function SerializeXBRLDocument  -----

void WriteXBRLReport (const RR::XBRLInstance& instance, const RR::FileName& output_file_name,
        const GeneratorSettings& settings, std::stop_token stop_token)
{
    auto document = SerializeXBRLDocument(BuildXBRLDocument(instance, settings));
    WriteDataToFileAtomically(output_file_name, document, stop_token);

    spdlog::info(catenate("wrote XBRL report: ", output_file_name.get(), " facts: ", instance.facts_.size()));
}		// -----  end of function WriteXBRLReport  -----
