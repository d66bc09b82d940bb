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
 * @file 	TranslatorDispatcherTest.cpp
 *
 * @brief Tests of translator selection: precedence of overlapping patterns and unrecognized nodes.
 */

#include "TestGraph.h"

#include "owlrdf/Error.h"
#include "owlrdf/ExpressionTranslators.h"
#include "owlrdf/NodeResolver.h"
#include "owlrdf/TranslationContext.h"
#include "owlrdf/TranslatorDispatcher.h"
#include "owlrdf/Vocabulary.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <boost/scoped_ptr.hpp>

using namespace owlrdftest;

namespace{

class TranslatorDispatcherTest : public ::testing::Test{
protected:
	TestGraph graph;
	boost::scoped_ptr<TranslationContext> ctx;
	boost::scoped_ptr<NodeResolver> resolver;

	void load(){
		ctx.reset(new TranslationContext(quietConfig()));
		graph.fill(ctx->getStore());
		resolver.reset(new NodeResolver(*ctx));
	}

	NodeID id(const Node& node){
		return ctx->getStore().storeNode(node);
	}

	// name of the selected translator, empty if none applies
	std::string selected(const Node& node){
		const ExpressionTranslator* t = selectTranslator(*ctx, id(node));
		return t ? t->name : "";
	}
};

std::size_t position(const std::string& name){
	const std::vector<ExpressionTranslator>& translators = getExpressionTranslators();
	for (std::size_t i = 0; i < translators.size(); ++i){
		if (name == translators[i].name) return i;
	}
	ADD_FAILURE() << "no translator named " << name;
	return translators.size();
}

}

TEST(ExpressionTranslatorRegistryTest, MostSpecificPatternsComeFirst){
	const std::vector<ExpressionTranslator>& translators = getExpressionTranslators();
	ASSERT_EQ(21u, translators.size());
	EXPECT_STREQ("ObjectHasSelf", translators.front().name);
	EXPECT_STREQ("ObjectInverseOf", translators.back().name);

	// qualified cardinalities are checked before the unqualified ones, data ranges before class expressions
	EXPECT_LT(position("MinQualifiedCardinality"), position("MinCardinality"));
	EXPECT_LT(position("HasValue"), position("SomeValuesFrom"));
	EXPECT_LT(position("DataOneOf"), position("ObjectOneOf"));
	EXPECT_LT(position("DataUnionOf"), position("ObjectUnionOf"));
}

TEST_F(TranslatorDispatcherTest, HasValueWinsOverSomeValuesFrom){
	graph.restriction(blank("r"), ex("p"))
	     .add(blank("r"), vocab::OWL_HASVALUE, ex("a"))
	     .add(blank("r"), vocab::OWL_SOMEVALUESFROM, ex("C"));
	load();

	EXPECT_EQ("HasValue", selected(blank("r")));

	UsageScope scope(*ctx);
	Translation t = dispatch(*resolver, id(blank("r")));
	ASSERT_EQ(Translation::ClassExpressionCategory, t.category);
	EXPECT_EQ(ClassExpression::ObjectHasValue, t.classExpression->kind);

	// the competing triple is left over
	std::vector<TripleID> used = scope.close();
	EXPECT_EQ(3u, used.size());
}

TEST_F(TranslatorDispatcherTest, QualifiedCardinalityWinsOverUnqualified){
	graph.restriction(blank("r"), ex("p"))
	     .add(blank("r"), vocab::OWL_CARDINALITY, intLit(1))
	     .add(blank("r"), vocab::OWL_QUALIFIEDCARDINALITY, intLit(1))
	     .add(blank("r"), vocab::OWL_ONCLASS, ex("C"));
	load();

	EXPECT_EQ("ExactQualifiedCardinality", selected(blank("r")));
}

TEST_F(TranslatorDispatcherTest, DatatypeTypingSelectsDataRanges){
	graph.add(blank("d"), vocab::RDF_TYPE, iri(vocab::RDFS_DATATYPE));
	graph.add(blank("d"), vocab::OWL_INTERSECTIONOF, graph.list(iri(OWLRDF_XSD_NS "integer"), iri(OWLRDF_XSD_NS "decimal")));
	graph.add(blank("c"), vocab::OWL_INTERSECTIONOF, graph.list(ex("A"), ex("B")));
	graph.add(blank("lits"), vocab::OWL_ONEOF, graph.list(lit("x"), lit("y")));
	graph.add(blank("inds"), vocab::OWL_ONEOF, graph.list(ex("x"), ex("y")));
	load();

	EXPECT_EQ("DataIntersectionOf", selected(blank("d")));
	EXPECT_EQ("ObjectIntersectionOf", selected(blank("c")));
	EXPECT_EQ("DataOneOf", selected(blank("lits")));
	EXPECT_EQ("ObjectOneOf", selected(blank("inds")));
}

TEST_F(TranslatorDispatcherTest, RestrictionWithoutFillerIsRecognizedAsIncomplete){
	graph.add(blank("r"), vocab::OWL_ONPROPERTY, ex("p"));
	load();

	EXPECT_EQ("IncompleteRestriction", selected(blank("r")));

	UsageScope scope(*ctx);
	try{
		dispatch(*resolver, id(blank("r")));
		FAIL() << "expected a malformed restriction";
	}catch(const MalformedConstruct& e){
		EXPECT_EQ("_:r", e.diagnostic().node);
		EXPECT_EQ("restriction on a property has no filler", e.diagnostic().message);
	}
}

TEST_F(TranslatorDispatcherTest, TypedRestrictionWithoutPropertyFailsInItsTranslator){
	graph.add(blank("r"), vocab::RDF_TYPE, iri(vocab::OWL_RESTRICTION));
	graph.add(blank("r"), vocab::OWL_SOMEVALUESFROM, ex("C"));
	load();

	EXPECT_EQ("SomeValuesFrom", selected(blank("r")));

	UsageScope scope(*ctx);
	try{
		dispatch(*resolver, id(blank("r")));
		FAIL() << "expected a malformed restriction";
	}catch(const MalformedConstruct& e){
		EXPECT_EQ(vocab::OWL_ONPROPERTY, e.diagnostic().predicate);
	}
}

TEST_F(TranslatorDispatcherTest, UnrecognizedNodeIsUnsupported){
	graph.add(blank("x"), exIRI("p"), ex("y"));
	graph.add(blank("x"), vocab::RDF_TYPE, iri(vocab::OWL_CLASS));
	load();

	EXPECT_EQ("", selected(blank("x")));

	UsageScope scope(*ctx);
	EXPECT_THROW(dispatch(*resolver, id(blank("x"))), UnsupportedConstruct);
	EXPECT_TRUE(scope.close().empty());
	EXPECT_EQ(2u, ctx->getStore().unconsumed().size());
}
