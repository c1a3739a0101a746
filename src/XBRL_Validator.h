// =====================================================================================
//
//       Filename:  XBRL_Validator.h
//
//    Description:  check an XBRL instance against a template built from its taxonomy.
//
//        Version:  1.0
//        Created:  09/13/2026 09:41:17 AM
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

#ifndef  XBRL_VALIDATOR_INC
#define  XBRL_VALIDATOR_INC

#include "XBRL_Model.h"

// every non-abstract concept is required. monetary concepts must hold
// numbers, everything else must not be empty.

RR::XBRLTemplate CreateXBRLTemplate(const RR::XBRLTaxonomy& taxonomy);

// all problems are collected. nothing here throws for bad instance content.

RR::XBRLValidationReport ValidateXBRLInstance(const RR::XBRLInstance& instance, const RR::XBRLTemplate& xbrl_template);

#endif   // ----- #ifndef XBRL_VALIDATOR_INC  -----
