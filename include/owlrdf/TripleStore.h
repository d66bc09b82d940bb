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
 * @file 	TripleStore.h
 *
 * @brief Holds the ingested triples, answers pattern lookups and tracks which triples were consumed.
 */

#ifndef OWLRDF_TRIPLESTORE__HPP_INCLUDED_
#define OWLRDF_TRIPLESTORE__HPP_INCLUDED_

#include "owlrdf/Node.h"

#include "dlvhex2/PlatformDefinitions.h"

#include "owlcpp/rdf/triple_store.hpp"

#include <map>
#include <string>
#include <vector>

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

typedef unsigned int TripleID;

// wildcard for TripleStore::match
const NodeID ANY = NODE_FAIL;

struct Triple{
	NodeID subject, predicate, object;

	Triple(NodeID subject, NodeID predicate, NodeID object) : subject(subject), predicate(predicate), object(object) {}

	bool operator==(const Triple& other) const{
		return subject == other.subject && predicate == other.predicate && object == other.object;
	}
	bool operator<(const Triple& other) const{
		if (subject != other.subject) return subject < other.subject;
		if (predicate != other.predicate) return predicate < other.predicate;
		return object < other.object;
	}
};

// a triple by value, independent of any store
struct Statement{
	Node subject, predicate, object;

	Statement() {}
	Statement(const Node& subject, const Node& predicate, const Node& object) : subject(subject), predicate(predicate), object(object) {}

	bool operator==(const Statement& other) const{
		return subject == other.subject && predicate == other.predicate && object == other.object;
	}
	bool operator<(const Statement& other) const;
};

std::ostream& operator<<(std::ostream& o, const Statement& s);

// the graph of one document; triples and nodes live in an owlcpp::Triple_store
class TripleStore{
private:
	owlcpp::Triple_store store;
	// document of the triples asserted directly
	owlcpp::Doc_id doc;
	unsigned int documents;

	// identifiers of the triples in assertion order, with their consumed flags
	std::vector<Triple> triples;
	std::vector<bool> consumed;
	std::map<Triple, TripleID> tripleIDs;

	// owlcpp numbers blank nodes per document; translation results refer to them by label
	std::map<std::string, NodeID> blankIDs;
	std::map<NodeID, std::string> blankLabels;

	// orders triple ids by the values of their nodes
	struct CanonicalOrder;

	template<class Subject, class Predicate, class Object>
	void collect(const Subject subject, const Predicate predicate, const Object object, std::vector<TripleID>& result) const;

	NodeID labelBlank(NodeID id, const std::string& label);
public:
	TripleStore();

	// inserts a fact; asserting an existing triple again returns the existing id
	TripleID assertTriple(NodeID subject, NodeID predicate, NodeID object);
	TripleID assertTriple(const Node& subject, const std::string& predicate, const Node& object);

	// all triples matching the pattern; ANY matches every node
	// the result is ordered by node values, never by insertion order
	std::vector<TripleID> match(NodeID subject, NodeID predicate, NodeID object) const;
	std::vector<TripleID> match(NodeID subject, const std::string& predicate, NodeID object = ANY) const;

	// the unique triple (subject, predicate, *); throws MalformedConstruct for zero or several matches
	TripleID getSingleton(NodeID subject, const std::string& predicate) const;

	bool contains(NodeID subject, const std::string& predicate, NodeID object = ANY) const;

	// marks a triple as used by the translation
	void consume(TripleID id);
	bool isConsumed(TripleID id) const;

	// all triples never consumed, in canonical order
	std::vector<TripleID> unconsumed() const;

	const Triple& getTriple(TripleID id) const;
	Statement statement(TripleID id) const;

	// id of a named node, NODE_FAIL if it was never stored
	NodeID lookupIRI(const std::string& iri) const;
	// stores a node by value; throws MalformedConstruct for a literal its datatype rejects
	NodeID storeNode(const Node& node);
	Node getNode(NodeID id) const;

	// registers a source document; blank nodes of different documents never coincide
	owlcpp::Doc_id addDocument(const std::string& iri);
	// the blank node numbered index within a document added by addDocument
	NodeID storeBlank(unsigned int index, const owlcpp::Doc_id document);

	inline const owlcpp::Triple_store& getOwlcppStore() const{ return store; }
	inline std::size_t size() const{ return triples.size(); }
};

}

DLVHEX_NAMESPACE_END

#endif
