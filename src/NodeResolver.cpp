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
 * @file 	NodeResolver.cpp
 *
 * @brief Resolution of graph nodes to model objects.
 */

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif // HAVE_CONFIG_H

#include "owlrdf/NodeResolver.h"
#include "owlrdf/TranslatorDispatcher.h"
#include "owlrdf/Vocabulary.h"

#include "dlvhex2/Logger.h"

#include <set>

#include <boost/lexical_cast.hpp>

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

namespace{

// keeps track of the nesting depth of anonymous nodes under translation
struct DepthGuard{
	unsigned int& depth;
	DepthGuard(unsigned int& depth) : depth(depth){ ++depth; }
	~DepthGuard(){ --depth; }
};

}

NodeResolver::NodeResolver(TranslationContext& ctx) : ctx(ctx), depth(0){
}

NodeResolver::NodeClass NodeResolver::classify(NodeID node) const{
	const Node& n = ctx.getNode(node);
	switch (n.kind){
		case Node::Named: return NamedEntity;
		case Node::Anonymous: return AnonymousNode;
		case Node::Literal: return LiteralValue;
	}
	return LiteralValue;
}

Translation NodeResolver::translateAnonymous(NodeID node, Translation::Category expected, bool any){

	const TranslationContext::CacheEntry* entry = ctx.lookup(node);
	if (entry){
		switch (entry->state){
			case TranslationContext::CacheEntry::InProgress:
				throw CyclicConstruct(ctx.getNode(node), "node is reached again while its own translation is in progress");
			case TranslationContext::CacheEntry::Failed:
				throw TranslationError(entry->failure);
			case TranslationContext::CacheEntry::Done:
				break;
		}
		if (!any && entry->translation.category != expected){
			throw UnsupportedConstruct(ctx.getNode(node), "",
				std::string("node was translated to a ") + Translation::categoryName(entry->translation.category) +
				" but is used as a " + Translation::categoryName(expected));
		}
		DBGLOG(DBG, "Reusing translation of " << ctx.getNode(node));
		ctx.use(entry->triples);
		return entry->translation;
	}

	if (depth >= ctx.getConfig().maxNesting){
		throw UnsupportedConstruct(ctx.getNode(node), "",
			"anonymous expressions are nested deeper than " + boost::lexical_cast<std::string>(ctx.getConfig().maxNesting) + " levels");
	}

	DepthGuard guard(depth);
	ctx.beginNode(node);
	Translation translation;
	std::vector<TripleID> used;
	try{
		UsageScope scope(ctx);
		translation = dispatch(*this, node);
		used = scope.close();
	}catch(const TranslationError& e){
		ctx.failNode(node, e.diagnostic());
		throw;
	}
	ctx.finishNode(node, translation, used);

	if (!any && translation.category != expected){
		throw UnsupportedConstruct(ctx.getNode(node), "",
			std::string("node denotes a ") + Translation::categoryName(translation.category) +
			" but is used as a " + Translation::categoryName(expected));
	}
	ctx.use(used);
	return translation;
}

ClassExpressionPtr NodeResolver::resolveClassExpression(NodeID node){

	switch (classify(node)){
		case NamedEntity:
			return namedClass(ctx.getNode(node).value);
		case AnonymousNode:
			return translateAnonymous(node, Translation::ClassExpressionCategory).classExpression;
		case LiteralValue:
			break;
	}
	throw UnsupportedConstruct(ctx.getNode(node), "", "a literal cannot denote a class expression");
}

PropertyExpressionPtr NodeResolver::resolveObjectPropertyExpression(NodeID node){

	switch (classify(node)){
		case NamedEntity:
			if (ctx.isDataProperty(node)){
				throw UnsupportedConstruct(ctx.getNode(node), "", "data property used where an object property is required");
			}
			return objectProperty(ctx.getNode(node).value);
		case AnonymousNode:{
			PropertyExpressionPtr pe = translateAnonymous(node, Translation::PropertyCategory).property;
			if (!pe->isObjectPropertyExpression()){
				throw UnsupportedConstruct(ctx.getNode(node), "", "expected an object property expression");
			}
			return pe;
		}
		case LiteralValue:
			break;
	}
	throw UnsupportedConstruct(ctx.getNode(node), "", "a literal cannot denote a property");
}

PropertyExpressionPtr NodeResolver::resolveDataProperty(NodeID node){

	if (classify(node) != NamedEntity){
		throw UnsupportedConstruct(ctx.getNode(node), "", "data properties must be named");
	}
	if (ctx.isObjectProperty(node)){
		throw UnsupportedConstruct(ctx.getNode(node), "", "object property used where a data property is required");
	}
	return dataProperty(ctx.getNode(node).value);
}

PropertyExpressionPtr NodeResolver::resolvePropertyExpression(NodeID node){

	if (classify(node) == NamedEntity && ctx.isDataProperty(node)) return resolveDataProperty(node);
	return resolveObjectPropertyExpression(node);
}

DataRangePtr NodeResolver::resolveDataRange(NodeID node){

	switch (classify(node)){
		case NamedEntity:
			return datatype(ctx.getNode(node).value);
		case AnonymousNode:
			return translateAnonymous(node, Translation::DataRangeCategory).dataRange;
		case LiteralValue:
			break;
	}
	throw UnsupportedConstruct(ctx.getNode(node), "", "a literal cannot denote a data range");
}

IndividualPtr NodeResolver::resolveIndividual(NodeID node){

	const Node& n = ctx.getNode(node);
	switch (classify(node)){
		case NamedEntity:
			return namedIndividual(n.value);
		case AnonymousNode:{
			const TranslationContext::CacheEntry* entry = ctx.lookup(node);
			if (entry && entry->state == TranslationContext::CacheEntry::InProgress){
				throw CyclicConstruct(n, "node is reached again while its own translation is in progress");
			}
			if (!entry){
				if (selectTranslator(ctx, node)){
					throw UnsupportedConstruct(n, "", "anonymous expression is used as an individual");
				}
				ctx.beginNode(node);
				ctx.finishNode(node, Translation(anonymousIndividual(n.value)), std::vector<TripleID>());
				entry = ctx.lookup(node);
			}
			if (entry->state == TranslationContext::CacheEntry::Done && entry->translation.category == Translation::IndividualCategory){
				return entry->translation.individual;
			}
			throw UnsupportedConstruct(n, "", "anonymous node is used both as an expression and as an individual");
		}
		case LiteralValue:
			break;
	}
	throw UnsupportedConstruct(n, "", "a literal cannot denote an individual");
}

Literal NodeResolver::resolveLiteral(NodeID node){

	const Node& n = ctx.getNode(node);
	if (!n.isLiteral()){
		throw MalformedConstruct(n, "", "expected a literal");
	}
	return Literal(n.value, n.datatype, n.language);
}

Translation NodeResolver::resolveExpression(NodeID node){

	if (classify(node) != AnonymousNode){
		throw UnsupportedConstruct(ctx.getNode(node), "", "only anonymous nodes denote anonymous expressions");
	}
	return translateAnonymous(node, Translation::ClassExpressionCategory, true);
}

std::vector<NodeResolver::ListItem> NodeResolver::translateList(NodeID head){

	DBGLOG(DBG, "Translating list " << ctx.getNode(head));
	std::vector<ListItem> items;
	std::set<NodeID> visited;
	NodeID cell = head;
	while (true){
		const Node& n = ctx.getNode(cell);
		if (n.isNamed() && n.value == vocab::RDF_NIL) break;
		if (n.isLiteral()){
			throw MalformedConstruct(ctx.getNode(head), vocab::RDF_REST, "list ends in a literal");
		}
		if (!visited.insert(cell).second){
			throw MalformedConstruct(ctx.getNode(head), vocab::RDF_REST, "list is cyclic");
		}

		TripleID first = ctx.getStore().getSingleton(cell, vocab::RDF_FIRST);
		items.push_back(ListItem(ctx.getStore().getTriple(first).object, first));
		// a cell typed rdf:List carries no further information
		useType(cell, vocab::RDF_LIST);
		cell = useSingleton(cell, vocab::RDF_REST);
	}
	return items;
}

NodeID NodeResolver::useSingleton(NodeID node, const std::string& predicate){
	TripleID t = ctx.getStore().getSingleton(node, predicate);
	ctx.use(t);
	return ctx.getStore().getTriple(t).object;
}

void NodeResolver::useType(NodeID node, const char* typeIRI){
	const TripleStore& store = ctx.getStore();
	NodeID type = store.lookupIRI(typeIRI);
	if (type == NODE_FAIL) return;
	ctx.use(store.match(node, vocab::RDF_TYPE, type));
}

}

DLVHEX_NAMESPACE_END
