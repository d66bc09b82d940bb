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
 * @file 	TranslationContext.cpp
 *
 * @brief Memoization, triple usage frames, diagnostics and entity typing of one translation.
 */

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif // HAVE_CONFIG_H

#include "owlrdf/TranslationContext.h"
#include "owlrdf/Vocabulary.h"

#include "dlvhex2/Logger.h"

#include <cassert>

#include "boost/foreach.hpp"

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

const char* Translation::categoryName(Category category){
	switch (category){
		case ClassExpressionCategory: return "class expression";
		case DataRangeCategory: return "data range";
		case PropertyCategory: return "property expression";
		case IndividualCategory: return "individual";
	}
	return "?";
}

TranslationContext::TranslationContext(const TranslationConfig& config) : config(config){
}

// ---------- memoization and cycle guard ----------

const TranslationContext::CacheEntry* TranslationContext::lookup(NodeID node) const{
	std::map<NodeID, CacheEntry>::const_iterator it = cache.find(node);
	if (it == cache.end()) return 0;
	return &it->second;
}

void TranslationContext::beginNode(NodeID node){
	assert(cache.find(node) == cache.end() && "node entered twice");
	DBGLOG(DBG, "Entering " << getNode(node));
	cache[node] = CacheEntry();
}

void TranslationContext::finishNode(NodeID node, const Translation& translation, const std::vector<TripleID>& triples){
	std::map<NodeID, CacheEntry>::iterator it = cache.find(node);
	assert(it != cache.end() && it->second.state == CacheEntry::InProgress && "finishing a node which is not in progress");
	it->second.state = CacheEntry::Done;
	it->second.translation = translation;
	it->second.triples = triples;
	DBGLOG(DBG, "Translated " << getNode(node) << " to a " << Translation::categoryName(translation.category) << " using " << triples.size() << " triples");
}

void TranslationContext::failNode(NodeID node, const Diagnostic& failure){
	std::map<NodeID, CacheEntry>::iterator it = cache.find(node);
	assert(it != cache.end() && it->second.state == CacheEntry::InProgress && "failing a node which is not in progress");
	it->second.state = CacheEntry::Failed;
	it->second.failure = failure;
	DBGLOG(DBG, "Translation of " << getNode(node) << " failed: " << failure);
}

// ---------- triple usage ----------

void TranslationContext::pushFrame(){
	frames.push_back(std::vector<TripleID>());
}

std::vector<TripleID> TranslationContext::popFrame(){
	assert(!frames.empty() && "no usage frame open");
	std::vector<TripleID> result;
	result.swap(frames.back());
	frames.pop_back();
	return result;
}

void TranslationContext::use(TripleID triple){
	assert(!frames.empty() && "triple used outside of a usage frame");
	frames.back().push_back(triple);
}

void TranslationContext::use(const std::vector<TripleID>& triples){
	assert(!frames.empty() && "triples used outside of a usage frame");
	frames.back().insert(frames.back().end(), triples.begin(), triples.end());
}

void TranslationContext::commit(const std::vector<TripleID>& triples){
	BOOST_FOREACH (TripleID t, triples){
		store.consume(t);
	}
}

// ---------- diagnostics ----------

void TranslationContext::report(const Diagnostic& diagnostic){
	DBGLOG(WARNING, diagnostic);
	diagnostics.push_back(diagnostic);
}

// ---------- entity typing ----------

bool TranslationContext::hasType(NodeID node, const char* typeIRI) const{
	// an unknown type must not turn into a wildcard
	NodeID type = store.lookupIRI(typeIRI);
	if (type == NODE_FAIL) return false;
	return store.contains(node, vocab::RDF_TYPE, type);
}

bool TranslationContext::isObjectProperty(NodeID node) const{

	const Node& n = getNode(node);
	if (!n.isNamed()) return false;
	if (n.value == vocab::OWL_TOPOBJECTPROPERTY || n.value == vocab::OWL_BOTTOMOBJECTPROPERTY) return true;

	static const char* const objectTypes[] = {
		vocab::OWL_OBJECTPROPERTY,
		vocab::OWL_INVERSEFUNCTIONALPROPERTY,
		vocab::OWL_TRANSITIVEPROPERTY,
		vocab::OWL_SYMMETRICPROPERTY,
		vocab::OWL_ASYMMETRICPROPERTY,
		vocab::OWL_REFLEXIVEPROPERTY,
		vocab::OWL_IRREFLEXIVEPROPERTY
	};
	for (unsigned int i = 0; i < sizeof(objectTypes) / sizeof(objectTypes[0]); ++i){
		if (hasType(node, objectTypes[i])) return true;
	}

	// only object properties have inverses and chains
	if (store.contains(node, vocab::OWL_INVERSEOF)) return true;
	if (!store.match(ANY, vocab::OWL_INVERSEOF, node).empty()) return true;
	if (store.contains(node, vocab::OWL_PROPERTYCHAINAXIOM)) return true;
	return false;
}

bool TranslationContext::isDataProperty(NodeID node) const{

	const Node& n = getNode(node);
	if (!n.isNamed()) return false;
	if (n.value == vocab::OWL_TOPDATAPROPERTY || n.value == vocab::OWL_BOTTOMDATAPROPERTY) return true;
	return hasType(node, vocab::OWL_DATATYPEPROPERTY);
}

bool TranslationContext::isAnnotationProperty(NodeID node) const{

	const Node& n = getNode(node);
	if (!n.isNamed()) return false;
	if (isBuiltinAnnotationProperty(n.value)) return true;
	return hasType(node, vocab::OWL_ANNOTATIONPROPERTY);
}

bool TranslationContext::isDatatype(NodeID node) const{

	const Node& n = getNode(node);
	if (n.isLiteral()) return false;
	if (n.isNamed() && isBuiltinDatatype(n.value)) return true;
	if (hasType(node, vocab::RDFS_DATATYPE)) return true;
	if (n.isAnonymous()){
		if (store.contains(node, vocab::OWL_DATATYPECOMPLEMENTOF)) return true;
		if (store.contains(node, vocab::OWL_ONDATATYPE)) return true;

		// an enumeration of literals
		std::vector<TripleID> oneOf = store.match(node, vocab::OWL_ONEOF);
		if (oneOf.size() == 1){
			std::vector<TripleID> first = store.match(store.getTriple(oneOf[0]).object, vocab::RDF_FIRST);
			if (first.size() == 1 && getNode(store.getTriple(first[0]).object).isLiteral()) return true;
		}
	}
	return false;
}

// ---------- UsageScope ----------

UsageScope::UsageScope(TranslationContext& ctx) : ctx(ctx), closed(false){
	ctx.pushFrame();
}

UsageScope::~UsageScope(){
	if (!closed) ctx.popFrame();
}

std::vector<TripleID> UsageScope::close(){
	assert(!closed && "usage scope closed twice");
	closed = true;
	return ctx.popFrame();
}

}

DLVHEX_NAMESPACE_END
