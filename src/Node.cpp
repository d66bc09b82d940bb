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
 * @file 	Node.cpp
 *
 * @brief Graph nodes by value.
 */

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif // HAVE_CONFIG_H

#include "owlrdf/Node.h"

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

bool Node::operator==(const Node& other) const{
	return kind == other.kind && value == other.value && datatype == other.datatype && language == other.language;
}

bool Node::operator<(const Node& other) const{
	if (kind != other.kind) return kind < other.kind;
	if (value != other.value) return value < other.value;
	if (datatype != other.datatype) return datatype < other.datatype;
	return language < other.language;
}

std::ostream& operator<<(std::ostream& o, const Node& node){
	switch (node.kind){
		case Node::Named:
			return o << "<" << node.value << ">";
		case Node::Anonymous:
			return o << "_:" << node.value;
		case Node::Literal:
			o << "\"" << node.value << "\"";
			if (!node.language.empty()) o << "@" << node.language;
			else if (!node.datatype.empty()) o << "^^<" << node.datatype << ">";
			return o;
	}
	return o;
}

}

DLVHEX_NAMESPACE_END
