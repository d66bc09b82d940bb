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
 * @file 	TripleStore.cpp
 *
 * @brief Triple storage with pattern lookup and consumption marking.
 */

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif // HAVE_CONFIG_H

#include "owlrdf/TripleStore.h"
#include "owlrdf/Error.h"

#include "dlvhex2/Logger.h"

#include "owlcpp/exception.hpp"
#include "owlcpp/rdf/print_node.hpp"
#include "owlcpp/rdf/node_blank.hpp"
#include "owlcpp/rdf/node_literal.hpp"
#include "owlcpp/terms/node_tags_system.hpp"

#include <algorithm>
#include <cassert>
#include <sstream>

#include "boost/foreach.hpp"
#include <boost/lexical_cast.hpp>

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

bool Statement::operator<(const Statement& other) const{
	if (subject != other.subject) return subject < other.subject;
	if (predicate != other.predicate) return predicate < other.predicate;
	return object < other.object;
}

std::ostream& operator<<(std::ostream& o, const Statement& s){
	return o << s.subject << " " << s.predicate << " " << s.object << " .";
}

struct TripleStore::CanonicalOrder{
	const TripleStore& store;
	CanonicalOrder(const TripleStore& store) : store(store) {}

	bool less(NodeID a, NodeID b) const{
		return a != b && store.getNode(a) < store.getNode(b);
	}

	bool operator()(TripleID a, TripleID b) const{
		const Triple& ta = store.triples[a];
		const Triple& tb = store.triples[b];
		if (ta.subject != tb.subject) return less(ta.subject, tb.subject);
		if (ta.predicate != tb.predicate) return less(ta.predicate, tb.predicate);
		if (ta.object != tb.object) return less(ta.object, tb.object);
		return false;
	}
};

TripleStore::TripleStore() : documents(0){
	doc = addDocument("urn:owlrdf:asserted");
}

TripleID TripleStore::assertTriple(NodeID subject, NodeID predicate, NodeID object){

	assert(getNode(predicate).isNamed() && "predicates must be named nodes");

	Triple t(subject, predicate, object);
	std::map<Triple, TripleID>::const_iterator it = tripleIDs.find(t);
	if (it != tripleIDs.end()){
		DBGLOG(DBG, "Triple " << statement(it->second) << " already present");
		return it->second;
	}

	store.insert_triple(owlcpp::Node_id(subject), owlcpp::Node_id(predicate), owlcpp::Node_id(object), doc);

	TripleID id = static_cast<TripleID>(triples.size());
	triples.push_back(t);
	consumed.push_back(false);
	tripleIDs[t] = id;
	return id;
}

TripleID TripleStore::assertTriple(const Node& subject, const std::string& predicate, const Node& object){
	NodeID s = storeNode(subject);
	NodeID p = storeNode(Node::named(predicate));
	NodeID o = storeNode(object);
	return assertTriple(s, p, o);
}

template<class Subject, class Predicate, class Object>
void TripleStore::collect(const Subject subject, const Predicate predicate, const Object object, std::vector<TripleID>& result) const{

	BOOST_FOREACH(owlcpp::Triple const& t, store.find_triple(subject, predicate, object, owlcpp::any())) {
		std::map<Triple, TripleID>::const_iterator it = tripleIDs.find(Triple(t.subj_(), t.pred_(), t.obj_()));
		assert(it != tripleIDs.end() && "owlcpp store holds a triple which was not asserted");
		result.push_back(it->second);
	}
}

std::vector<TripleID> TripleStore::match(NodeID subject, NodeID predicate, NodeID object) const{

	const owlcpp::Node_id s(subject == ANY ? 0 : subject);
	const owlcpp::Node_id p(predicate == ANY ? 0 : predicate);
	const owlcpp::Node_id o(object == ANY ? 0 : object);
	const owlcpp::any any = owlcpp::any();

	std::vector<TripleID> result;
	if (subject != ANY){
		if (predicate != ANY){
			if (object != ANY) collect(s, p, o, result);
			else collect(s, p, any, result);
		}else{
			if (object != ANY) collect(s, any, o, result);
			else collect(s, any, any, result);
		}
	}else{
		if (predicate != ANY){
			if (object != ANY) collect(any, p, o, result);
			else collect(any, p, any, result);
		}else{
			if (object != ANY) collect(any, any, o, result);
			else collect(any, any, any, result);
		}
	}
	std::sort(result.begin(), result.end(), CanonicalOrder(*this));
	return result;
}

std::vector<TripleID> TripleStore::match(NodeID subject, const std::string& predicate, NodeID object) const{
	NodeID p = lookupIRI(predicate);
	if (p == NODE_FAIL) return std::vector<TripleID>();
	return match(subject, p, object);
}

TripleID TripleStore::getSingleton(NodeID subject, const std::string& predicate) const{

	std::vector<TripleID> r = match(subject, predicate);
	if (r.size() != 1){
		std::stringstream ss;
		ss << "expected exactly one " << predicate << " triple, found " << r.size();
		throw MalformedConstruct(getNode(subject), predicate, ss.str());
	}
	return r[0];
}

bool TripleStore::contains(NodeID subject, const std::string& predicate, NodeID object) const{
	return !match(subject, predicate, object).empty();
}

void TripleStore::consume(TripleID id){
	assert(id < triples.size() && "triple id out of range");
	consumed[id] = true;
}

bool TripleStore::isConsumed(TripleID id) const{
	assert(id < triples.size() && "triple id out of range");
	return consumed[id];
}

std::vector<TripleID> TripleStore::unconsumed() const{
	std::vector<TripleID> result;
	for (TripleID id = 0; id < triples.size(); ++id){
		if (!consumed[id]) result.push_back(id);
	}
	std::sort(result.begin(), result.end(), CanonicalOrder(*this));
	return result;
}

const Triple& TripleStore::getTriple(TripleID id) const{
	assert(id < triples.size() && "triple id out of range");
	return triples[id];
}

Statement TripleStore::statement(TripleID id) const{
	const Triple& t = getTriple(id);
	return Statement(getNode(t.subject), getNode(t.predicate), getNode(t.object));
}

NodeID TripleStore::lookupIRI(const std::string& iri) const{
	owlcpp::Node_id const* id = store.find_node_iri(iri);
	return id ? (*id)() : NODE_FAIL;
}

NodeID TripleStore::storeNode(const Node& node){

	switch (node.kind){
		case Node::Named:
			return store.insert_node_iri(node.value)();
		case Node::Anonymous:{
			std::map<std::string, NodeID>::const_iterator it = blankIDs.find(node.value);
			if (it != blankIDs.end()) return it->second;
			return labelBlank(store.insert_blank(static_cast<unsigned int>(blankIDs.size()), doc)(), node.value);
		}
		case Node::Literal:{
			const owlcpp::Node_id datatype = node.datatype.empty() ? owlcpp::terms::empty_::id() : store.insert_node_iri(node.datatype);
			try{
				return store.insert_literal(node.value, datatype, node.language)();
			}catch(const owlcpp::base_exception&){
				throw MalformedConstruct(node, "", "literal is not valid for its datatype");
			}
		}
	}
	assert(false && "unknown node kind");
	return NODE_FAIL;
}

Node TripleStore::getNode(NodeID id) const{

	const owlcpp::Node_id nid(id);
	const owlcpp::Node& node = store[nid];

	if (dynamic_cast<const owlcpp::Node_blank*>(&node)){
		std::map<NodeID, std::string>::const_iterator it = blankLabels.find(id);
		assert(it != blankLabels.end() && "blank node was not stored through this store");
		return Node::anonymous(it->second);
	}

	if (const owlcpp::Node_literal* literal = dynamic_cast<const owlcpp::Node_literal*>(&node)){
		std::string datatype;
		if (literal->datatype() != owlcpp::terms::empty_::id()) datatype = owlcpp::to_string_full(literal->datatype(), store);
		std::string language;
		if (const owlcpp::Node_string* str = dynamic_cast<const owlcpp::Node_string*>(literal)){
			language = str->language();
		}
		return Node::literal(literal->value_str(), datatype, language);
	}

	return Node::named(owlcpp::to_string_full(nid, store));
}

owlcpp::Doc_id TripleStore::addDocument(const std::string& iri){
	// the counter keeps documents apart even if the same file is read twice
	const std::string name = iri + "#" + boost::lexical_cast<std::string>(documents++);
	return store.insert_doc(name).first;
}

NodeID TripleStore::storeBlank(unsigned int index, const owlcpp::Doc_id document){

	const NodeID id = store.insert_blank(index, document)();
	if (blankLabels.count(id)) return id;

	// labels of imported blank nodes are derived from their document and number
	std::string label = "d" + boost::lexical_cast<std::string>(document()) + "_" + boost::lexical_cast<std::string>(index);
	while (blankIDs.count(label)) label += "_";
	return labelBlank(id, label);
}

NodeID TripleStore::labelBlank(NodeID id, const std::string& label){
	blankIDs[label] = id;
	blankLabels[id] = label;
	return id;
}

}

DLVHEX_NAMESPACE_END
