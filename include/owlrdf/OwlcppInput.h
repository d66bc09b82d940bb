/* dlvhex -- Answer-Set Programming with external interfaces.
 * Copyright (C) 2005, 2006, 2007 Roman Schindlauer
 * Copyright (C) 2006, 2007, 2008, 2009, 2010, 2011 Thomas Krennwallner
 * Copyright (C) 2009, 2010, 2011 Peter Schüller
 * Copyright (C) 2011, 2012, 2013, 2014 Christoph Redl
 * Copyright (C) 2014 Daria Stepanova
 * 
 * This file is part of dlvhex.
 *
 * dlvhex is free software; you can redistribute it and/or modify it
 * under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation; either version 2.1 of
 * the License, or (at your option) any later version.
 *
 * dlvhex is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with dlvhex; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA
 * 02110-1301 USA.
 */

/**
 * @file 	OwlcppInput.h
 *
 * @brief Feeds documents parsed by owlcpp into the triple store of a translation.
 */

#ifndef OWLRDF_OWLCPPINPUT__HPP_INCLUDED_
#define OWLRDF_OWLCPPINPUT__HPP_INCLUDED_

#include "owlrdf/TripleStore.h"

#include "dlvhex2/PlatformDefinitions.h"

#include <string>

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

// copies all triples of an owlcpp store as one new document of the target; returns the number of triples copied
// blank nodes of the source never coincide with blank nodes already in the target
std::size_t importTriples(const owlcpp::Triple_store& source, TripleStore& target, const std::string& documentIRI = "urn:owlrdf:imported");

// parses an RDF/XML document with owlcpp and copies its triples; throws InputError on failure
std::size_t loadOntologyFile(const std::string& path, TripleStore& target);

}

DLVHEX_NAMESPACE_END

#endif
