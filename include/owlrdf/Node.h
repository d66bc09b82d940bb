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
 * @file 	Node.h
 *
 * @brief Graph nodes by value and their identifiers in the triple store.
 */

#ifndef OWLRDF_NODE__HPP_INCLUDED_
#define OWLRDF_NODE__HPP_INCLUDED_

#include "dlvhex2/PlatformDefinitions.h"

#include <ostream>
#include <string>

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

// the value of an owlcpp::Node_id; stable for the lifetime of the store
typedef unsigned int NodeID;

// returned by lookups which do not find a node; also serves as wildcard in TripleStore::match
const NodeID NODE_FAIL = static_cast<NodeID>(-1);

// a node of the source graph, identified by its shape and value only
struct Node{
	enum Kind{ Named, Anonymous, Literal };

	Kind kind;
	std::string value;	// IRI, graph-local label or lexical form
	std::string datatype;	// literals only, may be empty
	std::string language;	// literals only, may be empty

	Node() : kind(Named) {}
	Node(Kind kind, const std::string& value, const std::string& datatype = "", const std::string& language = "") :
		kind(kind), value(value), datatype(datatype), language(language) {}

	static Node named(const std::string& iri){ return Node(Named, iri); }
	static Node anonymous(const std::string& label){ return Node(Anonymous, label); }
	static Node literal(const std::string& lexical, const std::string& datatype = "", const std::string& language = ""){
		return Node(Literal, lexical, datatype, language);
	}

	inline bool isNamed() const{ return kind == Named; }
	inline bool isAnonymous() const{ return kind == Anonymous; }
	inline bool isLiteral() const{ return kind == Literal; }

	bool operator==(const Node& other) const;
	bool operator!=(const Node& other) const{ return !(*this == other); }
	// canonical order: kind, then value, datatype and language
	bool operator<(const Node& other) const;
};

std::ostream& operator<<(std::ostream& o, const Node& node);

}

DLVHEX_NAMESPACE_END

#endif
