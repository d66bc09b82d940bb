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
 * @file 	TripleStoreTest.cpp
 *
 * @brief Tests of the triple store: pattern lookups, canonical order and consumption.
 */

#include "TestGraph.h"

#include "owlrdf/Error.h"
#include "owlrdf/TripleStore.h"
#include "owlrdf/Vocabulary.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <sstream>

using namespace owlrdftest;

namespace{

class TripleStoreTest : public ::testing::Test{
protected:
	TripleStore store;
	TripleID typeA, typeB, likes;

	virtual void SetUp(){
		typeA = store.assertTriple(ex("a"), vocab::RDF_TYPE, ex("A"));
		typeB = store.assertTriple(ex("b"), vocab::RDF_TYPE, ex("B"));
		likes = store.assertTriple(ex("a"), exIRI("likes"), ex("b"));
	}

	NodeID id(const Node& node){
		return store.storeNode(node);
	}
};

}

TEST_F(TripleStoreTest, AssertingAgainReturnsTheSameTriple){
	TripleID again = store.assertTriple(ex("a"), vocab::RDF_TYPE, ex("A"));
	EXPECT_EQ(typeA, again);
	EXPECT_EQ(3u, store.size());
}

TEST_F(TripleStoreTest, MatchesPatternsWithWildcards){
	EXPECT_EQ(2u, store.match(id(ex("a")), ANY, ANY).size());
	EXPECT_EQ(2u, store.match(ANY, vocab::RDF_TYPE).size());
	EXPECT_EQ(1u, store.match(ANY, ANY, id(ex("b"))).size());
	EXPECT_EQ(3u, store.match(ANY, ANY, ANY).size());

	std::vector<TripleID> exact = store.match(id(ex("b")), vocab::RDF_TYPE, id(ex("B")));
	ASSERT_EQ(1u, exact.size());
	EXPECT_EQ(typeB, exact[0]);
}

TEST_F(TripleStoreTest, UnknownPredicateMatchesNothing){
	EXPECT_EQ(NODE_FAIL, store.lookupIRI(exIRI("hates")));
	EXPECT_TRUE(store.match(ANY, exIRI("hates")).empty());
	// the OWL vocabulary is known to every store but matches only asserted triples
	EXPECT_TRUE(store.match(ANY, vocab::OWL_SOMEVALUESFROM).empty());
	EXPECT_FALSE(store.contains(id(ex("a")), vocab::OWL_SOMEVALUESFROM));
}

TEST_F(TripleStoreTest, SingletonRequiresExactlyOneTriple){
	TripleID t = store.getSingleton(id(ex("b")), vocab::RDF_TYPE);
	EXPECT_EQ(typeB, t);

	store.assertTriple(ex("a"), vocab::RDF_TYPE, ex("C"));
	EXPECT_THROW(store.getSingleton(id(ex("a")), vocab::RDF_TYPE), MalformedConstruct);
	EXPECT_THROW(store.getSingleton(id(ex("b")), exIRI("likes")), MalformedConstruct);
}

TEST_F(TripleStoreTest, ConsumedTriplesLeaveTheUnconsumedSet){
	EXPECT_EQ(3u, store.unconsumed().size());
	store.consume(likes);
	EXPECT_TRUE(store.isConsumed(likes));
	EXPECT_FALSE(store.isConsumed(typeA));

	std::vector<TripleID> rest = store.unconsumed();
	ASSERT_EQ(2u, rest.size());
	EXPECT_TRUE(std::find(rest.begin(), rest.end(), likes) == rest.end());

	// consumed triples still answer lookups
	EXPECT_TRUE(store.contains(id(ex("a")), exIRI("likes")));
}

TEST(TripleStoreOrderTest, MatchOrderDoesNotDependOnInsertionOrder){

	TestGraph graph;
	graph.add(blank("x"), vocab::RDF_TYPE, ex("C"))
	     .add(ex("z"), exIRI("p"), lit("1"))
	     .add(ex("a"), exIRI("p"), ex("b"))
	     .add(ex("a"), exIRI("p"), ex("c"))
	     .add(ex("a"), exIRI("q"), blank("x"));

	TripleStore forward, permuted;
	graph.fill(forward);
	graph.fillPermuted(permuted, 7);

	std::vector<TripleID> f = forward.match(ANY, ANY, ANY);
	std::vector<TripleID> p = permuted.match(ANY, ANY, ANY);
	ASSERT_EQ(f.size(), p.size());
	for (std::size_t i = 0; i < f.size(); ++i){
		EXPECT_EQ(forward.statement(f[i]), permuted.statement(p[i]));
	}

	// named subjects sort before anonymous ones
	EXPECT_EQ(ex("a"), forward.statement(f[0]).subject);
	EXPECT_EQ(blank("x"), forward.statement(f.back()).subject);
}

TEST(TripleStoreNodeTest, StoresNodesByValue){
	TripleStore store;
	NodeID a = store.storeNode(ex("a"));
	NodeID l1 = store.storeNode(lit("1"));
	NodeID l2 = store.storeNode(lit("1", OWLRDF_XSD_NS "integer"));
	NodeID b = store.storeNode(blank("a"));

	EXPECT_EQ(a, store.storeNode(ex("a")));
	EXPECT_EQ(a, store.lookupIRI(exIRI("a")));
	EXPECT_EQ(b, store.storeNode(blank("a")));
	EXPECT_NE(l1, l2);
	EXPECT_NE(a, b);
	EXPECT_EQ(NODE_FAIL, store.lookupIRI(exIRI("b")));

	EXPECT_EQ(ex("a"), store.getNode(a));
	EXPECT_EQ(blank("a"), store.getNode(b));
	EXPECT_EQ(lit("1", OWLRDF_XSD_NS "integer"), store.getNode(l2));
}

TEST(NodeTest, PrintsInNTriplesStyle){
	std::stringstream ss;
	ss << ex("A") << " " << blank("r") << " " << lit("x", "", "en") << " " << lit("1", vocab::XSD_BOOLEAN);
	EXPECT_EQ("<" OWLRDF_TEST_NS "A> _:r \"x\"@en \"1\"^^<" OWLRDF_XSD_NS "boolean>", ss.str());
}
