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
 * @file 	NodeResolver.h
 *
 * @brief Turns graph nodes into model objects: named nodes directly, anonymous nodes through the
 *        translator dispatcher with memoization and cycle detection, and RDF lists.
 */

#ifndef OWLRDF_NODERESOLVER__HPP_INCLUDED_
#define OWLRDF_NODERESOLVER__HPP_INCLUDED_

#include "owlrdf/Model.h"
#include "owlrdf/TranslationContext.h"

#include "dlvhex2/PlatformDefinitions.h"

#include <string>
#include <vector>

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

class NodeResolver{
public:
	enum NodeClass{ NamedEntity, AnonymousNode, LiteralValue };

	// one element of an RDF list
	struct ListItem{
		NodeID node;		// the element
		TripleID firstTriple;	// the rdf:first triple holding it, to be used by the caller on success

		ListItem(NodeID node, TripleID firstTriple) : node(node), firstTriple(firstTriple) {}
	};

private:
	TranslationContext& ctx;
	unsigned int depth;

	// memoized translation of an anonymous node, expected to fall into the given category unless any is set
	Translation translateAnonymous(NodeID node, Translation::Category expected, bool any = false);
public:
	NodeResolver(TranslationContext& ctx);

	inline TranslationContext& getContext(){ return ctx; }
	inline const TranslationContext& getContext() const{ return ctx; }

	// by the shape of the node only, never by the triples it occurs in
	NodeClass classify(NodeID node) const;

	ClassExpressionPtr resolveClassExpression(NodeID node);
	PropertyExpressionPtr resolveObjectPropertyExpression(NodeID node);
	PropertyExpressionPtr resolveDataProperty(NodeID node);
	// data property if typed as one, object property expression otherwise
	PropertyExpressionPtr resolvePropertyExpression(NodeID node);
	DataRangePtr resolveDataRange(NodeID node);
	// anonymous individuals are memoized, every reference yields the same object
	IndividualPtr resolveIndividual(NodeID node);
	Literal resolveLiteral(NodeID node);
	// translation of an anonymous node, whatever it denotes
	Translation resolveExpression(NodeID node);

	// walks the RDF list starting at head; the rdf:rest triples are used, the rdf:first triples are not
	std::vector<ListItem> translateList(NodeID head);

	// the object of the unique (node, predicate, *) triple; the triple is used
	NodeID useSingleton(NodeID node, const std::string& predicate);

	// uses every (node, rdf:type, type) triple
	void useType(NodeID node, const char* typeIRI);
};

}

DLVHEX_NAMESPACE_END

#endif
