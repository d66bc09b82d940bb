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
 * @file 	Error.h
 *
 * @brief Diagnostics and the exceptions which carry them through the translator.
 */

#ifndef OWLRDF_ERROR__HPP_INCLUDED_
#define OWLRDF_ERROR__HPP_INCLUDED_

#include "owlrdf/Node.h"

#include "dlvhex2/PlatformDefinitions.h"
#include "dlvhex2/Error.h"

#include <ostream>
#include <string>

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

// a problem found while translating, attached to the offending node and predicate
struct Diagnostic{
	enum Kind{
		MalformedConstruct,	// required triple missing or of wrong arity/shape
		UnsupportedConstruct,	// recognizable but untranslatable shape
		CyclicConstruct,	// node re-entered while still in progress
		ResidueTriples		// triple left unconsumed after a full pass
	};

	Kind kind;
	std::string node;	// printed form of the node, e.g. "_:r" or "<http://...#A>"
	std::string predicate;	// IRI of the predicate involved, may be empty
	std::string message;

	Diagnostic() : kind(MalformedConstruct) {}
	Diagnostic(Kind kind, const std::string& node, const std::string& predicate, const std::string& message) :
		kind(kind), node(node), predicate(predicate), message(message) {}

	static const char* kindName(Kind kind);
};

std::ostream& operator<<(std::ostream& o, const Diagnostic& d);

// base class of all local translation failures
class TranslationError : public GeneralError{
private:
	Diagnostic diag;
public:
	TranslationError(const Diagnostic& diag);
	TranslationError(Diagnostic::Kind kind, const Node& node, const std::string& predicate, const std::string& message);
	virtual ~TranslationError() throw() {}

	inline const Diagnostic& diagnostic() const{ return diag; }
	inline Diagnostic::Kind kind() const{ return diag.kind; }
};

class MalformedConstruct : public TranslationError{
public:
	MalformedConstruct(const Node& node, const std::string& predicate, const std::string& message) :
		TranslationError(Diagnostic::MalformedConstruct, node, predicate, message) {}
};

class UnsupportedConstruct : public TranslationError{
public:
	UnsupportedConstruct(const Node& node, const std::string& predicate, const std::string& message) :
		TranslationError(Diagnostic::UnsupportedConstruct, node, predicate, message) {}
};

class CyclicConstruct : public TranslationError{
public:
	CyclicConstruct(const Node& node, const std::string& message) :
		TranslationError(Diagnostic::CyclicConstruct, node, "", message) {}
};

// a document could not be read into the triple store
class InputError : public GeneralError{
public:
	InputError(const std::string& msg) : GeneralError(msg) {}
};

// an option could not be parsed
class ConfigError : public GeneralError{
public:
	ConfigError(const std::string& msg) : GeneralError(msg) {}
};

}

DLVHEX_NAMESPACE_END

#endif
