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
 * @file 	Vocabulary.cpp
 *
 * @brief Tests on reserved RDF, RDFS, OWL and XSD vocabulary.
 */

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif // HAVE_CONFIG_H

#include "owlrdf/Vocabulary.h"

#include <boost/algorithm/string/predicate.hpp>

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

bool isReservedVocabulary(const std::string& iri){
	return boost::starts_with(iri, OWLRDF_RDF_NS)
	    || boost::starts_with(iri, OWLRDF_RDFS_NS)
	    || boost::starts_with(iri, OWLRDF_OWL_NS)
	    || boost::starts_with(iri, OWLRDF_XSD_NS);
}

bool isBuiltinType(const std::string& iri){
	if (iri == vocab::OWL_THING || iri == vocab::OWL_NOTHING) return false;
	return isReservedVocabulary(iri);
}

bool isBuiltinAnnotationProperty(const std::string& iri){
	return iri == vocab::RDFS_LABEL
	    || iri == vocab::RDFS_COMMENT
	    || iri == vocab::RDFS_SEEALSO
	    || iri == vocab::RDFS_ISDEFINEDBY
	    || iri == vocab::OWL_VERSIONINFO
	    || iri == vocab::OWL_DEPRECATED
	    || iri == vocab::OWL_PRIORVERSION
	    || iri == vocab::OWL_BACKWARDCOMPATIBLEWITH
	    || iri == vocab::OWL_INCOMPATIBLEWITH;
}

bool isBuiltinDatatype(const std::string& iri){
	if (boost::starts_with(iri, OWLRDF_XSD_NS)) return true;
	return iri == vocab::RDFS_LITERAL
	    || iri == vocab::RDF_PLAIN_LITERAL
	    || iri == vocab::RDF_XML_LITERAL
	    || iri == vocab::OWL_REAL
	    || iri == vocab::OWL_RATIONAL;
}

std::string getOwlType(const std::string& iri){

	std::string::size_type pos = iri.find_last_of("#/");
	if (pos == std::string::npos) return iri;
	else return iri.substr(pos + 1);
}

}

DLVHEX_NAMESPACE_END
