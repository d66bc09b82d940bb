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
 * @file 	ModelPrinter.h
 *
 * @brief Functional-style rendering of model objects for messages, debugging and ordering.
 *
 * This is not a serializer: the output is meant to be read by humans and compared by the
 * translator, it is not guaranteed to be parseable.
 */

#ifndef OWLRDF_MODELPRINTER__HPP_INCLUDED_
#define OWLRDF_MODELPRINTER__HPP_INCLUDED_

#include "owlrdf/Model.h"
#include "owlrdf/TranslationContext.h"

#include "dlvhex2/PlatformDefinitions.h"

#include <ostream>
#include <sstream>
#include <string>

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

// computes the identifier of a named entity shown to the user
class ShortFormProvider{
public:
	virtual ~ShortFormProvider() {}
	virtual std::string getShortForm(const std::string& iri) const = 0;
};

// <http://example.org/onto#A>
class FullIRIShortFormProvider : public ShortFormProvider{
public:
	virtual std::string getShortForm(const std::string& iri) const;
};

// A for http://example.org/onto#A and for http://example.org/onto/A
class FragmentShortFormProvider : public ShortFormProvider{
public:
	virtual std::string getShortForm(const std::string& iri) const;
};

class ModelPrinter{
private:
	std::ostream& out;
	const ShortFormProvider& sfp;

	template<typename Ptr>
	void printAll(const std::vector<Ptr>& objects, bool& first);
	void separate(bool& first);
public:
	ModelPrinter(std::ostream& out, const ShortFormProvider& sfp);

	void print(const Literal& literal);
	void print(IndividualPtr individual);
	void print(PropertyExpressionPtr property);
	void print(DataRangePtr range);
	void print(ClassExpressionPtr expression);
	void print(AxiomPtr axiom);
	void print(const Translation& translation);

	// renders with full IRIs
	template<typename T>
	static std::string toString(const T& object){
		FullIRIShortFormProvider sfp;
		return toString(object, sfp);
	}

	template<typename T>
	static std::string toString(const T& object, const ShortFormProvider& sfp){
		std::stringstream ss;
		ModelPrinter printer(ss, sfp);
		printer.print(object);
		return ss.str();
	}
};

}

DLVHEX_NAMESPACE_END

#endif
