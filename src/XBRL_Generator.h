// =====================================================================================
//
//       Filename:  XBRL_Generator.h
//
//    Description:  build XBRL instance documents from the document model.
//
//        Version:  1.0
//        Created:  09/13/2026 01:22:05 PM
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

#ifndef  XBRL_GENERATOR_INC
#define  XBRL_GENERATOR_INC

#include <stop_token>
#include <string>

#include <pugixml.hpp>

#include "RegReport.h"
#include "XBRL_Model.h"

struct GeneratorSettings
{
    // all generated contexts use this identifier scheme.

    std::string entity_scheme_ = "http://www.sec.gov/CIK";
    RR::XBRL_Namespaces namespaces_;
};

// explicit tree construction. nothing is written here. the instance's
// fact_namespaces_ are declared along with the settings' ones and a fact or
// measure prefix declared by neither throws XBRLException.

pugi::xml_document BuildXBRLDocument(const RR::XBRLInstance& instance, const GeneratorSettings& settings = {});

// indented UTF-8 text with an XML declaration.

std::string SerializeXBRLDocument(const pugi::xml_document& doc);

// written to a temporary file and renamed into place.

void WriteXBRLReport(const RR::XBRLInstance& instance, const RR::FileName& output_file_name,
        const GeneratorSettings& settings = {}, std::stop_token stop_token = {});

#endif   // ----- #ifndef XBRL_GENERATOR_INC  -----
