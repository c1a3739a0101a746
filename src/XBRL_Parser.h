// =====================================================================================
//
//       Filename:  XBRL_Parser.h
//
//    Description:  read XBRL instance documents and taxonomy schemas into the
//                  document model.
//
//        Version:  1.0
//        Created:  09/12/2026 11:14:29 AM
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

#ifndef  XBRL_PARSER_INC
#define  XBRL_PARSER_INC

#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <pugixml.hpp>

#include "RegReport.h"
#include "XBRL_Model.h"

// pugixml does not do namespaces so we look at the declarations on the
// root element and find the prefix each namespace we need is bound to.
// an empty prefix means the default namespace. namespaces which are not
// declared get their conventional prefix.

struct DocumentPrefixes
{
    std::string xbrli_ = "xbrli";
    std::string link_ = "link";
    std::string xlink_ = "xlink";
    std::string xs_ = "xs";
    std::string iso4217_ = "iso4217";

    // every prefix -> URI declared on the root. "" is the default namespace.

    std::map<std::string, std::string> declared_;

    // prefix + ':' + local or just local for the default namespace.

    [[nodiscard]] static std::string QName(const std::string& prefix, RR::sv local_name);
};

pugi::xml_document ParseXMLContent(RR::XMLContent document);

DocumentPrefixes ResolveDocumentPrefixes(const pugi::xml_node& root, const RR::XBRL_Namespaces& namespaces);

// first pass: every element below top_node in document order.

std::vector<pugi::xml_node> CollectAllElements(const pugi::xml_node& top_node);

// second pass predicate: carries a contextRef and is not one of the
// xbrli or link structural elements.

bool IsFactElement(const pugi::xml_node& node, const DocumentPrefixes& prefixes);

std::vector<RR::XBRLContext> ExtractContexts(const pugi::xml_document& instance_xml, const DocumentPrefixes& prefixes);

// measures in the iso4217 or xbrli namespaces come back with those prefixes
// whatever the document bound them to, e.g. cur:USD is iso4217:USD.

std::vector<RR::XBRLUnit> ExtractUnits(const pugi::xml_document& instance_xml, const DocumentPrefixes& prefixes);

// types come from the taxonomy when one is given and it knows the concept.
// otherwise ISO 4217 units mean monetary, other units decimal and no unit string.

std::vector<RR::XBRLFact> ExtractFacts(const pugi::xml_document& instance_xml, const DocumentPrefixes& prefixes,
        const std::vector<RR::XBRLContext>& contexts, const std::vector<RR::XBRLUnit>& units,
        const RR::XBRLTaxonomy* taxonomy = nullptr);

std::string ExtractSchemaReference(const pugi::xml_document& instance_xml, const DocumentPrefixes& prefixes);

RR::InstanceMetadata ExtractInstanceMetadata(const pugi::xml_document& instance_xml, const DocumentPrefixes& prefixes,
        const std::vector<RR::XBRLContext>& contexts, const std::vector<RR::XBRLUnit>& units);

// the root declarations for the prefixes fact names and unit measures use.
// iso4217 and xbrli measures are left to the generator.

std::map<std::string, std::string> ExtractFactNamespaces(const DocumentPrefixes& prefixes,
        const std::vector<RR::XBRLFact>& facts, const std::vector<RR::XBRLUnit>& units);

// throws XBRLException for XML which is not well formed.

RR::XBRLInstance ParseXBRLInstance(RR::XMLContent instance_content, const RR::XBRL_Namespaces& namespaces = {},
        const RR::XBRLTaxonomy* taxonomy = nullptr);

RR::XBRLInstance LoadXBRLInstance(const RR::FileName& instance_file_name, const RR::XBRL_Namespaces& namespaces = {},
        const RR::XBRLTaxonomy* taxonomy = nullptr, std::stop_token stop_token = {});

// taxonomy schema plus an optional separate label linkbase. labels and
// presentation links embedded in the schema are used too.

RR::XBRLTaxonomy ParseXBRLTaxonomy(RR::XMLContent schema_content, std::optional<RR::XMLContent> labels_content = {},
        const RR::XBRL_Namespaces& namespaces = {});

RR::XBRLTaxonomy LoadXBRLTaxonomy(const RR::FileName& schema_file_name, const std::optional<RR::FileName>& labels_file_name = {},
        const RR::XBRL_Namespaces& namespaces = {}, std::stop_token stop_token = {});

std::vector<RR::TaxonomyConcept> ExtractConcepts(const pugi::xml_document& schema_xml, const DocumentPrefixes& prefixes);

std::vector<RR::PresentationRole> ExtractPresentations(const pugi::xml_node& top_node, const DocumentPrefixes& prefixes,
        const std::vector<RR::TaxonomyConcept>& concepts);

// label linkbase lookup: loc -> labelArc -> label. result is keyed by the
// concept id the loc's href points at.

RR::XBRL_Labels ExtractConceptLabels(const pugi::xml_node& top_node, const DocumentPrefixes& prefixes);

std::vector<std::pair<RR::sv, RR::sv>> FindLabelElements(const std::vector<pugi::xml_node>& label_links,
        const std::string& label_node_name, const std::string& xlink_prefix);

std::map<RR::sv, RR::sv> FindLocElements(const std::vector<pugi::xml_node>& label_links,
        const std::string& loc_node_name, const std::string& xlink_prefix);

std::map<RR::sv, RR::sv> FindLabelArcElements(const std::vector<pugi::xml_node>& label_links,
        const std::string& arc_node_name, const std::string& xlink_prefix);

RR::XBRL_Labels AssembleLookupTable(const std::vector<std::pair<RR::sv, RR::sv>>& labels,
        const std::map<RR::sv, RR::sv>& locs, const std::map<RR::sv, RR::sv>& arcs);

#endif   // ----- #ifndef XBRL_PARSER_INC  -----
