// =====================================================================================
//
//       Filename:  XBRL_Parser.cpp
//
//    Description:  read XBRL instance documents and taxonomy schemas into the
//                  document model.
//
//        Version:  1.0
//        Created:  09/12/2026 11:52:06 AM
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

#include "XBRL_Parser.h"

#include <algorithm>
#include <set>

#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/max.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

namespace rng = ranges;

#include <spdlog/spdlog.h>

#include "RegReport_Utils.h"

namespace
{
    void CollectElements(const pugi::xml_node& node, std::vector<pugi::xml_node>& elements)
    {
        for (auto child : node.children())
        {
            if (child.type() == pugi::node_element)
            {
                elements.push_back(child);
                CollectElements(child, elements);
            }
        }
    }

    std::vector<pugi::xml_node> FindElementsNamed(const pugi::xml_node& top_node, const std::string& node_name)
    {
        std::vector<pugi::xml_node> result;
        for (const auto& node : CollectAllElements(top_node))
        {
            if (node_name == node.name())
            {
                result.push_back(node);
            }
        }
        return result;
    }

    // linkbases don't always use the prefix for the link elements themselves.

    std::vector<pugi::xml_node> FindLinkElements(const pugi::xml_node& top_node, const std::string& link_prefix, RR::sv local_name)
    {
        auto result = FindElementsNamed(top_node, DocumentPrefixes::QName(link_prefix, local_name));
        if (result.empty() && ! link_prefix.empty())
        {
            result = FindElementsNamed(top_node, std::string{local_name});
        }
        return result;
    }

    std::string ChildLinkName(const std::vector<pugi::xml_node>& links, const std::string& link_prefix, RR::sv local_name)
    {
        // sometimes, the namespace prefix is not used for the actual link nodes.

        const std::string qualified_name = DocumentPrefixes::QName(link_prefix, local_name);
        for (const auto& link : links)
        {
            if (link.child(qualified_name.c_str()))
            {
                return qualified_name;
            }
        }
        return std::string{local_name};
    }

    std::string CanonicalMeasure(const std::string& measure, const DocumentPrefixes& prefixes)
    {
        const std::string prefix = NamePrefix(measure);
        auto bound_to_same = [&prefixes, &prefix](const std::string& usual_prefix)
        {
            if (prefix == usual_prefix)
            {
                return true;
            }
            auto declared = prefixes.declared_.find(prefix);
            auto usual = prefixes.declared_.find(usual_prefix);
            return declared != prefixes.declared_.end() && usual != prefixes.declared_.end() && declared->second == usual->second;
        };

        if (bound_to_same(prefixes.iso4217_))
        {
            return catenate("iso4217:", LocalName(measure));
        }
        if (bound_to_same(prefixes.xbrli_))
        {
            return catenate("xbrli:", LocalName(measure));
        }
        return measure;
    }

    RR::sv HrefFragment(RR::sv href)
    {
        auto pos = href.find('#');
        if (pos == RR::sv::npos)
        {
            throw XBRLException(catenate("Can't find href label start in: '", href, "'"));
        }
        href.remove_prefix(pos + 1);
        return href;
    }

}  // namespace

std::string DocumentPrefixes::QName (const std::string& prefix, RR::sv local_name)
{
    if (prefix.empty())
    {
        return std::string{local_name};
    }
    return catenate(prefix, ':', local_name);
}		// -----  end of method DocumentPrefixes::QName  -----

pugi::xml_document ParseXMLContent (RR::XMLContent document)
{
    pugi::xml_document doc;
    auto result = doc.load_buffer(document.get().data(), document.get().size(), pugi::parse_default | pugi::parse_wnorm_attribute);
    if (! result)
    {
        throw XBRLException{catenate("Error description: ", result.description(), "\nError offset: ", result.offset, '\n')};
    }
    if (! doc.document_element())
    {
        throw XBRLException("Document has no root element.");
    }

    return doc;
}		// -----  end of function ParseXMLContent  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ResolveDocumentPrefixes
 *  Description:
 * =====================================================================================
 */
DocumentPrefixes ResolveDocumentPrefixes (const pugi::xml_node& root, const RR::XBRL_Namespaces& namespaces)
{
    std::map<std::string, std::string> uri_to_prefix;
    DocumentPrefixes result;

    for (auto attr : root.attributes())
    {
        RR::sv attr_name{attr.name()};
        if (attr_name == "xmlns")
        {
            uri_to_prefix.try_emplace(attr.value(), "");
            result.declared_[""] = attr.value();
        }
        else if (attr_name.starts_with("xmlns:"))
        {
            uri_to_prefix.try_emplace(attr.value(), std::string{attr_name.substr(6)});
            result.declared_[std::string{attr_name.substr(6)}] = attr.value();
        }
    }

    auto use_declared = [&uri_to_prefix](const std::string& uri, std::string& prefix)
    {
        if (auto found = uri_to_prefix.find(uri); found != uri_to_prefix.end())
        {
            prefix = found->second;
        }
    };

    use_declared(namespaces.xbrli_, result.xbrli_);
    use_declared(namespaces.link_, result.link_);
    use_declared(namespaces.xlink_, result.xlink_);
    use_declared(namespaces.xs_, result.xs_);
    use_declared(namespaces.iso4217_, result.iso4217_);

    return result;
}		// -----  end of function ResolveDocumentPrefixes  -----

std::vector<pugi::xml_node> CollectAllElements (const pugi::xml_node& top_node)
{
    std::vector<pugi::xml_node> elements;
    CollectElements(top_node, elements);
    return elements;
}		// -----  end of function CollectAllElements  -----

bool IsFactElement (const pugi::xml_node& node, const DocumentPrefixes& prefixes)
{
    if (node.type() != pugi::node_element || ! node.attribute("contextRef"))
    {
        return false;
    }
    const std::string prefix = NamePrefix(node.name());
    return prefix != prefixes.xbrli_ && prefix != prefixes.link_;
}		// -----  end of function IsFactElement  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ExtractContexts
 *  Description:  a context with neither instant nor start/end gets no period.
 * =====================================================================================
 */
std::vector<RR::XBRLContext> ExtractContexts (const pugi::xml_document& instance_xml, const DocumentPrefixes& prefixes)
{
    std::vector<RR::XBRLContext> result;

    auto top_level_node = instance_xml.document_element();           //  should be <xbrl> node.

    const std::string node_name = DocumentPrefixes::QName(prefixes.xbrli_, "context");
    const std::string entity_label = DocumentPrefixes::QName(prefixes.xbrli_, "entity");
    const std::string identifier_label = DocumentPrefixes::QName(prefixes.xbrli_, "identifier");
    const std::string period_label = DocumentPrefixes::QName(prefixes.xbrli_, "period");
    const std::string start_label = DocumentPrefixes::QName(prefixes.xbrli_, "startDate");
    const std::string end_label = DocumentPrefixes::QName(prefixes.xbrli_, "endDate");
    const std::string instant_label = DocumentPrefixes::QName(prefixes.xbrli_, "instant");

    for (auto context_node : top_level_node.children(node_name.c_str()))
    {
        RR::XBRLContext context;
        context.ID_ = context_node.attribute("id").value();
        context.entity_ = TrimCopy(context_node.child(entity_label.c_str()).child(identifier_label.c_str()).child_value());

        auto period = context_node.child(period_label.c_str());

        if (auto instant = period.child(instant_label.c_str()); instant)
        {
            context.period_ = RR::InstantPeriod{TrimCopy(instant.child_value())};
        }
        else if (auto begin = period.child(start_label.c_str()), end = period.child(end_label.c_str()); begin || end)
        {
            context.period_ = RR::DurationPeriod{TrimCopy(begin.child_value()), TrimCopy(end.child_value())};
        }
        result.push_back(std::move(context));
    }

    spdlog::debug(catenate("found: ", result.size(), " contexts."));
    return result;
}		// -----  end of function ExtractContexts  -----

std::vector<RR::XBRLUnit> ExtractUnits (const pugi::xml_document& instance_xml, const DocumentPrefixes& prefixes)
{
    std::vector<RR::XBRLUnit> result;

    auto top_level_node = instance_xml.document_element();

    const std::string node_name = DocumentPrefixes::QName(prefixes.xbrli_, "unit");
    const std::string measure_label = DocumentPrefixes::QName(prefixes.xbrli_, "measure");
    const std::string divide_label = DocumentPrefixes::QName(prefixes.xbrli_, "divide");
    const std::string numerator_label = DocumentPrefixes::QName(prefixes.xbrli_, "unitNumerator");
    const std::string denominator_label = DocumentPrefixes::QName(prefixes.xbrli_, "unitDenominator");

    for (auto unit_node : top_level_node.children(node_name.c_str()))
    {
        RR::XBRLUnit unit;
        unit.ID_ = unit_node.attribute("id").value();

        if (auto measure = unit_node.child(measure_label.c_str()); measure)
        {
            unit.measure_ = CanonicalMeasure(TrimCopy(measure.child_value()), prefixes);
        }
        else if (auto divide = unit_node.child(divide_label.c_str()); divide)
        {
            // e.g. iso4217:USD/xbrli:shares

            unit.measure_ = catenate(
                    CanonicalMeasure(TrimCopy(divide.child(numerator_label.c_str()).child(measure_label.c_str()).child_value()), prefixes), '/',
                    CanonicalMeasure(TrimCopy(divide.child(denominator_label.c_str()).child(measure_label.c_str()).child_value()), prefixes));
        }
        result.push_back(std::move(unit));
    }

    spdlog::debug(catenate("found: ", result.size(), " units."));
    return result;
}		// -----  end of function ExtractUnits  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ExtractFacts
 *  Description:  two passes. collect every element then keep the facts.
 * =====================================================================================
 */
std::vector<RR::XBRLFact> ExtractFacts (const pugi::xml_document& instance_xml, const DocumentPrefixes& prefixes,
        const std::vector<RR::XBRLContext>& contexts, const std::vector<RR::XBRLUnit>& units,
        const RR::XBRLTaxonomy* taxonomy)
{
    std::map<RR::sv, const RR::XBRLContext*> context_lookup;
    for (const auto& context : contexts)
    {
        context_lookup.emplace(context.ID_, &context);
    }
    std::map<RR::sv, const RR::XBRLUnit*> unit_lookup;
    for (const auto& unit : units)
    {
        unit_lookup.emplace(unit.ID_, &unit);
    }
    std::map<std::string, std::string> concept_types;
    if (taxonomy != nullptr)
    {
        for (const auto& a_concept : taxonomy->concepts_)
        {
            concept_types.emplace(a_concept.name_, a_concept.type_);
        }
    }

    auto all_elements = CollectAllElements(instance_xml.document_element());

    std::vector<RR::XBRLFact> result;

    for (const auto& node : all_elements | rng::views::filter([&prefixes](const auto& n) { return IsFactElement(n, prefixes); }))
    {
        RR::XBRLFact fact;
        fact.name_ = node.name();
        if (auto prefix = NamePrefix(fact.name_); ! prefix.empty())
        {
            fact.namespace_ = prefix;
        }
        fact.value_ = TrimCopy(node.child_value());
        fact.context_ = node.attribute("contextRef").value();
        if (auto unit_ref = node.attribute("unitRef"); unit_ref)
        {
            fact.unit_ = unit_ref.value();
        }
        if (auto decimals = node.attribute("decimals"); decimals)
        {
            fact.decimals_ = decimals.value();
        }

        if (auto context = context_lookup.find(*fact.context_); context != context_lookup.end())
        {
            fact.period_ = PeriodShape(context->second->period_);
        }

        if (auto known = concept_types.find(LocalName(fact.name_)); known != concept_types.end())
        {
            fact.type_ = known->second;
        }
        else if (fact.unit_)
        {
            fact.type_ = "decimal";
            if (auto unit = unit_lookup.find(*fact.unit_); unit != unit_lookup.end()
                    && NamePrefix(unit->second->measure_) == "iso4217")
            {
                fact.type_ = "monetary";
            }
        }
        else
        {
            fact.type_ = "string";
        }
        result.push_back(std::move(fact));
    }

    spdlog::debug(catenate("scanned: ", all_elements.size(), " elements. found: ", result.size(), " facts."));
    return result;
}		// -----  end of function ExtractFacts  -----

std::string ExtractSchemaReference (const pugi::xml_document& instance_xml, const DocumentPrefixes& prefixes)
{
    auto schema_ref = instance_xml.document_element().child(DocumentPrefixes::QName(prefixes.link_, "schemaRef").c_str());
    return schema_ref.attribute(DocumentPrefixes::QName(prefixes.xlink_, "href").c_str()).value();
}		// -----  end of function ExtractSchemaReference  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ExtractInstanceMetadata
 *  Description:  everything comes from the document. anything not found is
 *                left empty.
 * =====================================================================================
 */
RR::InstanceMetadata ExtractInstanceMetadata (const pugi::xml_document& instance_xml, const DocumentPrefixes& prefixes,
        const std::vector<RR::XBRLContext>& contexts, const std::vector<RR::XBRLUnit>& units)
{
    RR::InstanceMetadata result;

    if (! contexts.empty())
    {
        result.entity_ = contexts.front().entity_;

        // ISO dates sort as strings.

        result.period_ = rng::max(contexts | rng::views::transform([](const auto& c) { return PeriodEnd(c.period_); }));
    }

    // ratio units like USD per share don't name the reporting currency.

    if (auto currency = rng::find_if(units, [](const auto& u)
                { return NamePrefix(u.measure_) == "iso4217" && u.measure_.find('/') == std::string::npos; });
            currency != units.end())
    {
        result.currency_ = LocalName(currency->measure_);
    }

    auto root = instance_xml.document_element();
    result.language_ = root.attribute("xml:lang").value();
    if (result.language_.empty())
    {
        for (const auto& node : CollectAllElements(root))
        {
            if (auto lang = node.attribute("xml:lang"); lang && IsFactElement(node, prefixes))
            {
                result.language_ = lang.value();
                break;
            }
        }
    }
    return result;
}		// -----  end of function ExtractInstanceMetadata  -----

std::map<std::string, std::string> ExtractFactNamespaces (const DocumentPrefixes& prefixes,
        const std::vector<RR::XBRLFact>& facts, const std::vector<RR::XBRLUnit>& units)
{
    std::vector<std::string> used_prefixes;
    for (const auto& fact : facts)
    {
        used_prefixes.push_back(NamePrefix(fact.name_));
    }
    for (const auto& unit : units)
    {
        // e.g. iso4217:USD/xbrli:shares

        std::string numerator = unit.measure_;
        std::string denominator;
        if (auto slash = numerator.find('/'); slash != std::string::npos)
        {
            denominator = numerator.substr(slash + 1);
            numerator.resize(slash);
        }
        for (const auto& measure : {numerator, denominator})
        {
            if (auto prefix = NamePrefix(measure); ! prefix.empty() && prefix != "iso4217" && prefix != "xbrli")
            {
                used_prefixes.push_back(prefix);
            }
        }
    }

    std::map<std::string, std::string> result;
    for (const auto& prefix : used_prefixes)
    {
        if (auto declared = prefixes.declared_.find(prefix); declared != prefixes.declared_.end())
        {
            result.emplace(prefix, declared->second);
        }
        else if (! prefix.empty())
        {
            spdlog::warn(catenate("namespace prefix: ", prefix, " is used but not declared on the root element."));
        }
    }
    return result;
}		// -----  end of function ExtractFactNamespaces  -----

RR::XBRLInstance ParseXBRLInstance (RR::XMLContent instance_content, const RR::XBRL_Namespaces& namespaces,
        const RR::XBRLTaxonomy* taxonomy)
{
    auto instance_xml = ParseXMLContent(instance_content);
    auto prefixes = ResolveDocumentPrefixes(instance_xml.document_element(), namespaces);

    if (LocalName(instance_xml.document_element().name()) != "xbrl")
    {
        spdlog::warn(catenate("root element is: <", instance_xml.document_element().name(), ">. Expected an xbrl instance."));
    }

    RR::XBRLInstance result;
    result.schema_ref_ = ExtractSchemaReference(instance_xml, prefixes);
    result.contexts_ = ExtractContexts(instance_xml, prefixes);
    result.units_ = ExtractUnits(instance_xml, prefixes);
    result.facts_ = ExtractFacts(instance_xml, prefixes, result.contexts_, result.units_, taxonomy);
    result.metadata_ = ExtractInstanceMetadata(instance_xml, prefixes, result.contexts_, result.units_);
    result.fact_namespaces_ = ExtractFactNamespaces(prefixes, result.facts_, result.units_);

    return result;
}		// -----  end of function ParseXBRLInstance  -----

RR::XBRLInstance LoadXBRLInstance (const RR::FileName& instance_file_name, const RR::XBRL_Namespaces& namespaces,
        const RR::XBRLTaxonomy* taxonomy, std::stop_token stop_token)
{
    const std::string instance_content = LoadDataFileForUse(instance_file_name, stop_token);
    try
    {
        return ParseXBRLInstance(RR::XMLContent{instance_content}, namespaces, taxonomy);
    }
    catch (const XBRLException& e)
    {
        throw XBRLException(catenate("Can't parse instance file: ", instance_file_name.get(), ". ", e.what()));
    }
}		// -----  end of function LoadXBRLInstance  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ExtractConcepts
 *  Description:  top level element declarations in the schema.
 * =====================================================================================
 */
std::vector<RR::TaxonomyConcept> ExtractConcepts (const pugi::xml_document& schema_xml, const DocumentPrefixes& prefixes)
{
    std::vector<RR::TaxonomyConcept> result;

    auto top_level_node = schema_xml.document_element();           //  should be <schema> node.

    const std::string element_name = DocumentPrefixes::QName(prefixes.xs_, "element");
    const std::string annotation_name = DocumentPrefixes::QName(prefixes.xs_, "annotation");
    const std::string documentation_name = DocumentPrefixes::QName(prefixes.xs_, "documentation");
    const std::string period_type_name = DocumentPrefixes::QName(prefixes.xbrli_, "periodType");
    const std::string balance_name = DocumentPrefixes::QName(prefixes.xbrli_, "balance");

    for (auto element_node : top_level_node.children(element_name.c_str()))
    {
        RR::TaxonomyConcept a_concept;
        a_concept.name_ = element_node.attribute("name").value();
        if (a_concept.name_.empty())
        {
            continue;
        }
        a_concept.ID_ = element_node.attribute("id").value();
        a_concept.type_ = element_node.attribute("type").value();
        a_concept.label_ = a_concept.name_;
        a_concept.abstract_ = element_node.attribute("abstract").as_bool(false);

        if (auto period_type = element_node.attribute(period_type_name.c_str()); period_type)
        {
            a_concept.period_type_ = period_type.value();
        }
        if (auto balance = element_node.attribute(balance_name.c_str()); balance)
        {
            a_concept.balance_ = balance.value();
        }
        if (auto documentation = element_node.child(annotation_name.c_str()).child(documentation_name.c_str()); documentation)
        {
            a_concept.documentation_ = TrimCopy(documentation.child_value());
        }
        result.push_back(std::move(a_concept));
    }

    spdlog::debug(catenate("found: ", result.size(), " concepts."));
    return result;
}		// -----  end of function ExtractConcepts  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ExtractPresentations
 *  Description:  one role per presentationLink. concepts no arc points to
 *                come first as roots, then one entry per arc in document order.
 * =====================================================================================
 */
std::vector<RR::PresentationRole> ExtractPresentations (const pugi::xml_node& top_node, const DocumentPrefixes& prefixes,
        const std::vector<RR::TaxonomyConcept>& concepts)
{
    std::map<RR::sv, RR::sv> names_by_ID;
    for (const auto& a_concept : concepts)
    {
        if (! a_concept.ID_.empty())
        {
            names_by_ID.emplace(a_concept.ID_, a_concept.name_);
        }
    }

    const std::string xlink_label = DocumentPrefixes::QName(prefixes.xlink_, "label");
    const std::string xlink_href = DocumentPrefixes::QName(prefixes.xlink_, "href");
    const std::string xlink_from = DocumentPrefixes::QName(prefixes.xlink_, "from");
    const std::string xlink_to = DocumentPrefixes::QName(prefixes.xlink_, "to");
    const std::string xlink_role = DocumentPrefixes::QName(prefixes.xlink_, "role");

    auto links = FindLinkElements(top_node, prefixes.link_, "presentationLink");
    const std::string loc_node_name = ChildLinkName(links, prefixes.link_, "loc");
    const std::string arc_node_name = ChildLinkName(links, prefixes.link_, "presentationArc");

    std::vector<RR::PresentationRole> result;

    for (const auto& link : links)
    {
        RR::PresentationRole role;
        role.role_ = link.attribute(xlink_role.c_str()).value();

        std::vector<std::pair<RR::sv, std::string>> locs;
        for (auto loc_node : link.children(loc_node_name.c_str()))
        {
            auto fragment = HrefFragment(loc_node.attribute(xlink_href.c_str()).value());
            auto found = names_by_ID.find(fragment);
            locs.emplace_back(loc_node.attribute(xlink_label.c_str()).value(),
                    found != names_by_ID.end() ? std::string{found->second} : std::string{fragment});
        }
        auto concept_for = [&locs](RR::sv label) -> std::string
        {
            auto pos = rng::find_if(locs, [label](const auto& l) { return l.first == label; });
            return pos != locs.end() ? pos->second : std::string{label};
        };

        std::set<RR::sv> children;
        for (auto arc_node : link.children(arc_node_name.c_str()))
        {
            children.insert(arc_node.attribute(xlink_to.c_str()).value());
        }

        for (const auto& [label, name] : locs)
        {
            if (! children.contains(label))
            {
                role.concepts_.push_back({name, 0.0, std::nullopt});
            }
        }
        for (auto arc_node : link.children(arc_node_name.c_str()))
        {
            if (RR::sv{arc_node.attribute("use").value()} == "prohibited")
            {
                continue;
            }
            role.concepts_.push_back({concept_for(arc_node.attribute(xlink_to.c_str()).value()),
                    arc_node.attribute("order").as_double(1.0),
                    concept_for(arc_node.attribute(xlink_from.c_str()).value())});
        }
        if (! role.concepts_.empty())
        {
            result.push_back(std::move(role));
        }
    }
    return result;
}		// -----  end of function ExtractPresentations  -----

// The purpose of this routine is to translate from the concept names in the
// schema to the 'user friendly' labels that reports and sheets use.
//
// Here's the path we need:
//
//  - find the link:loc element with an xlink:href attribute that points at the concept id.
//  - get the link:loc xlink:label attribute from the element found above.
//  - use the above xlink:label attribute to find the matching link:labelArc element.
//  - (matching is on the xlink:from attribute)
//  - retrieve the xlink:to attribute from the element found above.
//  - find the link:label element with a matching xlink:label attribute.
//  - retrieve the element value.
//

RR::XBRL_Labels ExtractConceptLabels (const pugi::xml_node& top_node, const DocumentPrefixes& prefixes)
{
    // some files have separate labelLink sections for each link element set !!

    auto label_links = FindLinkElements(top_node, prefixes.link_, "labelLink");
    if (label_links.empty())
    {
        return {};
    }

    auto labels = FindLabelElements(label_links, ChildLinkName(label_links, prefixes.link_, "label"), prefixes.xlink_);
    auto locs = FindLocElements(label_links, ChildLinkName(label_links, prefixes.link_, "loc"), prefixes.xlink_);
    auto arcs = FindLabelArcElements(label_links, ChildLinkName(label_links, prefixes.link_, "labelArc"), prefixes.xlink_);

    auto result = AssembleLookupTable(labels, locs, arcs);

    spdlog::debug(catenate("found: ", result.size(), " concept labels."));
    return result;
}		// -----  end of function ExtractConceptLabels  -----

std::vector<std::pair<RR::sv, RR::sv>> FindLabelElements (const std::vector<pugi::xml_node>& label_links,
        const std::string& label_node_name, const std::string& xlink_prefix)
{
    const std::string role_name = DocumentPrefixes::QName(xlink_prefix, "role");
    const std::string label_name = DocumentPrefixes::QName(xlink_prefix, "label");

    std::vector<std::pair<RR::sv, RR::sv>> labels;

    for (const auto& links : label_links)
    {
        for (auto label_node : links.children(label_node_name.c_str()))
        {
            // standard labels only. no terse, verbose, documentation...

            RR::sv role{label_node.attribute(role_name.c_str()).value()};
            if (role.empty() || role.ends_with("/label"))
            {
                RR::sv link_name{label_node.attribute(label_name.c_str()).value()};
                labels.emplace_back(link_name, label_node.child_value());
            }
        }
    }
    return labels;
}		/* -----  end of function FindLabelElements  ----- */

std::map<RR::sv, RR::sv> FindLocElements (const std::vector<pugi::xml_node>& label_links,
        const std::string& loc_node_name, const std::string& xlink_prefix)
{
    const std::string href_name = DocumentPrefixes::QName(xlink_prefix, "href");
    const std::string label_name = DocumentPrefixes::QName(xlink_prefix, "label");

    std::map<RR::sv, RR::sv> locs;

    for (const auto& links : label_links)
    {
        for (auto loc_node : links.children(loc_node_name.c_str()))
        {
            auto href = HrefFragment(loc_node.attribute(href_name.c_str()).value());
            RR::sv link_name{loc_node.attribute(label_name.c_str()).value()};
            locs[href] = link_name;
        }
    }
    return locs;
}		/* -----  end of function FindLocElements  ----- */

std::map<RR::sv, RR::sv> FindLabelArcElements (const std::vector<pugi::xml_node>& label_links,
        const std::string& arc_node_name, const std::string& xlink_prefix)
{
    const std::string from_name = DocumentPrefixes::QName(xlink_prefix, "from");
    const std::string to_name = DocumentPrefixes::QName(xlink_prefix, "to");

    std::map<RR::sv, RR::sv> arcs;

    for (const auto& links : label_links)
    {
        for (auto arc_node : links.children(arc_node_name.c_str()))
        {
            RR::sv use{arc_node.attribute("use").value()};
            if (use == "prohibited")
            {
                continue;
            }
            RR::sv from{arc_node.attribute(from_name.c_str()).value()};
            RR::sv to{arc_node.attribute(to_name.c_str()).value()};
            arcs[from] = to;
        }
    }
    return arcs;
}		/* -----  end of function FindLabelArcElements  ----- */

RR::XBRL_Labels AssembleLookupTable (const std::vector<std::pair<RR::sv, RR::sv>>& labels,
        const std::map<RR::sv, RR::sv>& locs, const std::map<RR::sv, RR::sv>& arcs)
{
    RR::XBRL_Labels result;

    for (auto [href, label] : locs)
    {
        auto link_to = arcs.find(label);
        if (link_to == arcs.end())
        {
            // stand-alone link
            continue;
        }
        auto value = std::find_if(labels.begin(), labels.end(), [&link_to](const auto& e)
                { return e.first == link_to->second; } );
        if (value == labels.end())
        {
            spdlog::debug(catenate("missing label: ", label));
            continue;
        }
        result.emplace(href, TrimCopy(value->second));

    }
    return result;
}		/* -----  end of function AssembleLookupTable  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  ParseXBRLTaxonomy
 *  Description:  labels from a separate linkbase win over embedded ones.
 * =====================================================================================
 */
RR::XBRLTaxonomy ParseXBRLTaxonomy (RR::XMLContent schema_content, std::optional<RR::XMLContent> labels_content,
        const RR::XBRL_Namespaces& namespaces)
{
    auto schema_xml = ParseXMLContent(schema_content);
    auto schema_root = schema_xml.document_element();
    auto prefixes = ResolveDocumentPrefixes(schema_root, namespaces);

    RR::XBRLTaxonomy result;
    result.target_namespace_ = schema_root.attribute("targetNamespace").value();
    result.concepts_ = ExtractConcepts(schema_xml, prefixes);

    auto labels = ExtractConceptLabels(schema_root, prefixes);
    if (labels_content)
    {
        auto labels_xml = ParseXMLContent(*labels_content);
        auto label_prefixes = ResolveDocumentPrefixes(labels_xml.document_element(), namespaces);
        for (auto& [id, label] : ExtractConceptLabels(labels_xml.document_element(), label_prefixes))
        {
            labels.insert_or_assign(id, std::move(label));
        }
    }

    for (auto& a_concept : result.concepts_)
    {
        if (auto found = labels.find(a_concept.ID_); ! a_concept.ID_.empty() && found != labels.end())
        {
            a_concept.label_ = found->second;
        }
    }

    result.presentations_ = ExtractPresentations(schema_root, prefixes, result.concepts_);

    spdlog::info(catenate("taxonomy: ", result.target_namespace_, " concepts: ", result.concepts_.size(),
        " labels: ", labels.size(), " presentation roles: ", result.presentations_.size()));
    return result;
}		// -----  end of function ParseXBRLTaxonomy  -----

RR::XBRLTaxonomy LoadXBRLTaxonomy (const RR::FileName& schema_file_name, const std::optional<RR::FileName>& labels_file_name,
        const RR::XBRL_Namespaces& namespaces, std::stop_token stop_token)
{
    const std::string schema_content = LoadDataFileForUse(schema_file_name, stop_token);
    std::string labels_content;
    if (labels_file_name)
    {
        labels_content = LoadDataFileForUse(*labels_file_name, stop_token);
    }

    try
    {
        return ParseXBRLTaxonomy(RR::XMLContent{schema_content},
                labels_file_name ? std::optional<RR::XMLContent>{RR::XMLContent{labels_content}} : std::nullopt, namespaces);
    }
    catch (const XBRLException& e)
    {
        throw XBRLException(catenate("Can't parse taxonomy: ", schema_file_name.get(), ". ", e.what()));
    }
}		// -----  end of function LoadXBRLTaxonomy  -----
