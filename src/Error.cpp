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
 * @file 	Error.cpp
 *
 * @brief Diagnostics and translation errors.
 */

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif // HAVE_CONFIG_H

#include "owlrdf/Error.h"

#include <sstream>

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

namespace{

std::string printNode(const Node& node){
	std::stringstream ss;
	ss << node;
	return ss.str();
}

std::string printDiagnostic(const Diagnostic& d){
	std::stringstream ss;
	ss << d;
	return ss.str();
}

}

const char* Diagnostic::kindName(Kind kind){
	switch (kind){
		case MalformedConstruct: return "MalformedConstruct";
		case UnsupportedConstruct: return "UnsupportedConstruct";
		case CyclicConstruct: return "CyclicConstruct";
		case ResidueTriples: return "ResidueTriples";
	}
	return "?";
}

std::ostream& operator<<(std::ostream& o, const Diagnostic& d){
	o << Diagnostic::kindName(d.kind) << " at " << d.node;
	if (!d.predicate.empty()) o << " (" << d.predicate << ")";
	return o << ": " << d.message;
}

TranslationError::TranslationError(const Diagnostic& diag) :
	GeneralError(printDiagnostic(diag)), diag(diag){
}

TranslationError::TranslationError(Diagnostic::Kind kind, const Node& node, const std::string& predicate, const std::string& message) :
	GeneralError(printDiagnostic(Diagnostic(kind, printNode(node), predicate, message))),
	diag(kind, printNode(node), predicate, message){
}

}

DLVHEX_NAMESPACE_END
