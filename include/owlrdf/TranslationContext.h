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
 * @file 	TranslationContext.h
 *
 * @brief Per-document translation state: the triple store, the memoization cache which also
 *        guards against cycles, the frames recording which triples a translation used,
 *        and the collected diagnostics.
 */

#ifndef OWLRDF_TRANSLATIONCONTEXT__HPP_INCLUDED_
#define OWLRDF_TRANSLATIONCONTEXT__HPP_INCLUDED_

#include "owlrdf/Error.h"
#include "owlrdf/Model.h"
#include "owlrdf/TranslationConfig.h"
#include "owlrdf/TripleStore.h"

#include "dlvhex2/PlatformDefinitions.h"

#include <map>
#include <string>
#include <vector>

#include <boost/noncopyable.hpp>

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

// result of translating one anonymous node
struct Translation{
	enum Category{ ClassExpressionCategory, DataRangeCategory, PropertyCategory, IndividualCategory };

	Category category;
	ClassExpressionPtr classExpression;
	DataRangePtr dataRange;
	PropertyExpressionPtr property;
	IndividualPtr individual;

	Translation() : category(ClassExpressionCategory) {}
	Translation(ClassExpressionPtr ce) : category(ClassExpressionCategory), classExpression(ce) {}
	Translation(DataRangePtr dr) : category(DataRangeCategory), dataRange(dr) {}
	Translation(PropertyExpressionPtr pe) : category(PropertyCategory), property(pe) {}
	Translation(IndividualPtr ind) : category(IndividualCategory), individual(ind) {}

	static const char* categoryName(Category category);
};

class TranslationContext : private boost::noncopyable{
public:
	struct CacheEntry{
		enum State{ InProgress, Done, Failed };

		State state;
		Translation translation;	// Done only
		std::vector<TripleID> triples;	// Done only: triples used by the translation, nested ones included
		Diagnostic failure;		// Failed only

		CacheEntry() : state(InProgress) {}
	};

private:
	TranslationConfig config;
	TripleStore store;

	std::map<NodeID, CacheEntry> cache;
	std::vector<std::vector<TripleID> > frames;
	std::vector<Diagnostic> diagnostics;

	// true if the node has an rdf:type triple with the given (named) type
	bool hasType(NodeID node, const char* typeIRI) const;
public:
	TranslationContext(const TranslationConfig& config = TranslationConfig());

	inline TripleStore& getStore(){ return store; }
	inline const TripleStore& getStore() const{ return store; }
	inline const TranslationConfig& getConfig() const{ return config; }
	inline Node getNode(NodeID id) const{ return store.getNode(id); }

	// ---------- memoization and cycle guard ----------

	// the cache entry of a node, null if the node was never entered
	const CacheEntry* lookup(NodeID node) const;

	// marks a node as in progress; the node must not have been entered before
	void beginNode(NodeID node);

	// replaces the in-progress marker by the final translation
	void finishNode(NodeID node, const Translation& translation, const std::vector<TripleID>& triples);

	// replaces the in-progress marker by the failure
	void failNode(NodeID node, const Diagnostic& failure);

	// ---------- triple usage ----------

	// opens a frame collecting the triples used by a translation attempt
	void pushFrame();

	// closes the innermost frame and returns the triples it collected
	std::vector<TripleID> popFrame();

	// records that the innermost translation attempt read a triple
	void use(TripleID triple);
	void use(const std::vector<TripleID>& triples);

	inline bool inFrame() const{ return !frames.empty(); }

	// marks the triples as consumed in the store
	void commit(const std::vector<TripleID>& triples);

	// ---------- diagnostics ----------

	void report(const Diagnostic& diagnostic);
	inline const std::vector<Diagnostic>& getDiagnostics() const{ return diagnostics; }

	// ---------- entity typing ----------

	bool isObjectProperty(NodeID node) const;
	bool isDataProperty(NodeID node) const;
	bool isAnnotationProperty(NodeID node) const;

	// named datatypes and anonymous data ranges
	bool isDatatype(NodeID node) const;
};

// a triple usage frame which is dropped unless closed explicitly
class UsageScope : private boost::noncopyable{
private:
	TranslationContext& ctx;
	bool closed;
public:
	UsageScope(TranslationContext& ctx);
	~UsageScope();

	// closes the frame and returns the triples used within it
	std::vector<TripleID> close();
};

}

DLVHEX_NAMESPACE_END

#endif
