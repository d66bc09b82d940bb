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
 * @file 	ExpressionTranslatorTest.cpp
 *
 * @brief Tests of the translators of anonymous class expressions, data ranges and property expressions.
 */

#include "TestGraph.h"

#include "owlrdf/Error.h"
#include "owlrdf/ModelPrinter.h"
#include "owlrdf/NodeResolver.h"
#include "owlrdf/TranslationContext.h"
#include "owlrdf/Vocabulary.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/scoped_ptr.hpp>

using namespace owlrdftest;

namespace{

class ExpressionTranslatorTest : public ::testing::Test{
protected:
	TestGraph graph;
	boost::scoped_ptr<TranslationContext> ctx;
	boost::scoped_ptr<NodeResolver> resolver;
	std::vector<TripleID> used;

	void load(){
		ctx.reset(new TranslationContext(quietConfig()));
		graph.fill(ctx->getStore());
		resolver.reset(new NodeResolver(*ctx));
	}

	NodeID id(const Node& node){
		return ctx->getStore().storeNode(node);
	}

	// translates the node and prints the result with short names
	std::string translate(const Node& node){
		UsageScope scope(*ctx);
		Translation t = resolver->resolveExpression(id(node));
		used = scope.close();
		return ModelPrinter::toString(t, FragmentShortFormProvider());
	}

	Diagnostic failure(const Node& node){
		UsageScope scope(*ctx);
		try{
			resolver->resolveExpression(id(node));
			ADD_FAILURE() << "translation of " << node << " succeeded";
		}catch(const TranslationError& e){
			return e.diagnostic();
		}
		return Diagnostic();
	}

	bool isUsed(const Node& s, const std::string& p, const Node& o){
		std::vector<TripleID> r = ctx->getStore().match(id(s), p, id(o));
		return !r.empty() && std::find(used.begin(), used.end(), r[0]) != used.end();
	}
};

}

// ============================== Quantifiers ==============================

TEST_F(ExpressionTranslatorTest, ObjectSomeValuesFrom){
	graph.restriction(blank("r"), ex("hasPart")).add(blank("r"), vocab::OWL_SOMEVALUESFROM, ex("Engine"));
	load();

	EXPECT_EQ("ObjectSomeValuesFrom(hasPart Engine)", translate(blank("r")));
	EXPECT_EQ(3u, used.size());
}

TEST_F(ExpressionTranslatorTest, ObjectAllValuesFromWithoutRestrictionType){
	graph.add(blank("r"), vocab::OWL_ONPROPERTY, ex("hasPart")).add(blank("r"), vocab::OWL_ALLVALUESFROM, ex("Engine"));
	load();

	EXPECT_EQ("ObjectAllValuesFrom(hasPart Engine)", translate(blank("r")));
	EXPECT_EQ(2u, used.size());
}

TEST_F(ExpressionTranslatorTest, DeclaredDataPropertyMakesADataRestriction){
	graph.add(ex("age"), vocab::RDF_TYPE, iri(vocab::OWL_DATATYPEPROPERTY));
	graph.restriction(blank("r"), ex("age")).add(blank("r"), vocab::OWL_SOMEVALUESFROM, iri(OWLRDF_XSD_NS "integer"));
	load();

	EXPECT_EQ("DataSomeValuesFrom(age integer)", translate(blank("r")));
	// declarations belong to their own axioms
	EXPECT_FALSE(isUsed(ex("age"), vocab::RDF_TYPE, iri(vocab::OWL_DATATYPEPROPERTY)));
}

TEST_F(ExpressionTranslatorTest, DatatypeFillerMakesADataRestriction){
	graph.restriction(blank("r"), ex("name")).add(blank("r"), vocab::OWL_ALLVALUESFROM, iri(OWLRDF_XSD_NS "string"));
	load();

	EXPECT_EQ("DataAllValuesFrom(name string)", translate(blank("r")));
}

TEST_F(ExpressionTranslatorTest, NestedRestrictions){
	graph.restriction(blank("outer"), ex("hasPart")).add(blank("outer"), vocab::OWL_SOMEVALUESFROM, blank("inner"));
	graph.restriction(blank("inner"), ex("madeOf")).add(blank("inner"), vocab::OWL_ALLVALUESFROM, ex("Steel"));
	load();

	EXPECT_EQ("ObjectSomeValuesFrom(hasPart ObjectAllValuesFrom(madeOf Steel))", translate(blank("outer")));
	EXPECT_EQ(6u, used.size());
}

TEST_F(ExpressionTranslatorTest, RestrictionWithoutFillerIsMalformed){
	graph.restriction(blank("r"), ex("hasPart"));
	load();

	Diagnostic d = failure(blank("r"));
	EXPECT_EQ(Diagnostic::MalformedConstruct, d.kind);
	EXPECT_EQ("_:r", d.node);
}

TEST_F(ExpressionTranslatorTest, RestrictionWithoutPropertyIsMalformed){
	graph.add(blank("r"), vocab::RDF_TYPE, iri(vocab::OWL_RESTRICTION));
	load();

	Diagnostic d = failure(blank("r"));
	EXPECT_EQ(Diagnostic::MalformedConstruct, d.kind);
	EXPECT_EQ(vocab::OWL_ONPROPERTY, d.predicate);
}

// ============================== Cardinalities ==============================

TEST_F(ExpressionTranslatorTest, UnqualifiedCardinality){
	graph.restriction(blank("r"), ex("hasPart")).add(blank("r"), vocab::OWL_MINCARDINALITY, intLit(2));
	load();

	EXPECT_EQ("ObjectMinCardinality(2 hasPart)", translate(blank("r")));
}

TEST_F(ExpressionTranslatorTest, QualifiedObjectCardinality){
	graph.restriction(blank("r"), ex("hasPart"))
	     .add(blank("r"), vocab::OWL_QUALIFIEDCARDINALITY, intLit(1))
	     .add(blank("r"), vocab::OWL_ONCLASS, ex("Engine"));
	load();

	EXPECT_EQ("ObjectExactCardinality(1 hasPart Engine)", translate(blank("r")));
	EXPECT_TRUE(isUsed(blank("r"), vocab::OWL_ONCLASS, ex("Engine")));
}

TEST_F(ExpressionTranslatorTest, QualifiedDataCardinality){
	graph.restriction(blank("r"), ex("name"))
	     .add(blank("r"), vocab::OWL_MAXQUALIFIEDCARDINALITY, intLit(3))
	     .add(blank("r"), vocab::OWL_ONDATARANGE, iri(OWLRDF_XSD_NS "string"));
	load();

	EXPECT_EQ("DataMaxCardinality(3 name string)", translate(blank("r")));
}

TEST_F(ExpressionTranslatorTest, DataPropertyCardinality){
	graph.add(ex("name"), vocab::RDF_TYPE, iri(vocab::OWL_DATATYPEPROPERTY));
	graph.restriction(blank("r"), ex("name")).add(blank("r"), vocab::OWL_CARDINALITY, intLit(1));
	load();

	EXPECT_EQ("DataExactCardinality(1 name)", translate(blank("r")));
}

TEST_F(ExpressionTranslatorTest, NonNumericCardinalityIsMalformed){
	graph.restriction(blank("r"), ex("hasPart")).add(blank("r"), vocab::OWL_MAXCARDINALITY, lit("two"));
	graph.restriction(blank("s"), ex("hasPart")).add(blank("s"), vocab::OWL_MAXCARDINALITY, lit("-1"));
	load();

	Diagnostic d = failure(blank("r"));
	EXPECT_EQ(Diagnostic::MalformedConstruct, d.kind);
	EXPECT_EQ(vocab::OWL_MAXCARDINALITY, d.predicate);
	EXPECT_EQ(Diagnostic::MalformedConstruct, failure(blank("s")).kind);
}

TEST_F(ExpressionTranslatorTest, QualifiedCardinalityWithoutQualifierIsMalformed){
	graph.restriction(blank("r"), ex("hasPart")).add(blank("r"), vocab::OWL_MINQUALIFIEDCARDINALITY, intLit(1));
	load();

	EXPECT_EQ(Diagnostic::MalformedConstruct, failure(blank("r")).kind);
}

// ============================== Values ==============================

TEST_F(ExpressionTranslatorTest, ObjectHasValue){
	graph.restriction(blank("r"), ex("hasPart")).add(blank("r"), vocab::OWL_HASVALUE, ex("engine1"));
	load();

	EXPECT_EQ("ObjectHasValue(hasPart engine1)", translate(blank("r")));
}

TEST_F(ExpressionTranslatorTest, DataHasValue){
	graph.restriction(blank("r"), ex("color")).add(blank("r"), vocab::OWL_HASVALUE, lit("red", "", "en"));
	load();

	EXPECT_EQ("DataHasValue(color \"red\"@en)", translate(blank("r")));
}

TEST_F(ExpressionTranslatorTest, HasSelf){
	graph.restriction(blank("r"), ex("loves")).add(blank("r"), vocab::OWL_HASSELF, lit("true", vocab::XSD_BOOLEAN));
	graph.restriction(blank("s"), ex("loves")).add(blank("s"), vocab::OWL_HASSELF, lit("false", vocab::XSD_BOOLEAN));
	load();

	EXPECT_EQ("ObjectHasSelf(loves)", translate(blank("r")));
	EXPECT_EQ(Diagnostic::MalformedConstruct, failure(blank("s")).kind);
}

TEST_F(ExpressionTranslatorTest, LiteralValueOfADeclaredObjectPropertyIsMalformed){
	graph.add(ex("owns"), vocab::RDF_TYPE, iri(vocab::OWL_OBJECTPROPERTY));
	graph.restriction(blank("r"), ex("owns")).add(blank("r"), vocab::OWL_HASVALUE, lit("5"));
	load();

	Diagnostic d = failure(blank("r"));
	EXPECT_EQ(Diagnostic::MalformedConstruct, d.kind);
	EXPECT_EQ(vocab::OWL_HASVALUE, d.predicate);
}

TEST_F(ExpressionTranslatorTest, DatatypeFillerOfADeclaredObjectPropertyIsUnsupported){
	graph.add(ex("owns"), vocab::RDF_TYPE, iri(vocab::OWL_OBJECTPROPERTY));
	graph.restriction(blank("r"), ex("owns")).add(blank("r"), vocab::OWL_SOMEVALUESFROM, iri(OWLRDF_XSD_NS "integer"));
	load();

	EXPECT_EQ(Diagnostic::UnsupportedConstruct, failure(blank("r")).kind);
}

TEST_F(ExpressionTranslatorTest, RestrictionWithItselfAsValueIsCyclic){
	graph.restriction(blank("r"), ex("p")).add(blank("r"), vocab::OWL_HASVALUE, blank("r"));
	load();

	EXPECT_EQ(Diagnostic::CyclicConstruct, failure(blank("r")).kind);
}

// ============================== Boolean constructors ==============================

TEST_F(ExpressionTranslatorTest, IntersectionAndUnion){
	graph.add(blank("i"), vocab::RDF_TYPE, iri(vocab::OWL_CLASS));
	graph.add(blank("i"), vocab::OWL_INTERSECTIONOF, graph.list(ex("A"), blank("u")));
	graph.add(blank("u"), vocab::OWL_UNIONOF, graph.list(ex("B"), ex("C")));
	load();

	EXPECT_EQ("ObjectIntersectionOf(A ObjectUnionOf(B C))", translate(blank("i")));
	EXPECT_TRUE(isUsed(blank("i"), vocab::RDF_TYPE, iri(vocab::OWL_CLASS)));
	// type, intersectionOf, two list cells, unionOf and two list cells
	EXPECT_EQ(11u, used.size());
}

TEST_F(ExpressionTranslatorTest, ComplementAndOneOf){
	graph.add(blank("c"), vocab::OWL_COMPLEMENTOF, blank("o"));
	graph.add(blank("o"), vocab::OWL_ONEOF, graph.list(ex("red"), ex("green")));
	load();

	EXPECT_EQ("ObjectComplementOf(ObjectOneOf(red green))", translate(blank("c")));
}

TEST_F(ExpressionTranslatorTest, UntranslatableOperandIsDropped){
	Node head = graph.list(ex("A"), blank("bad"), ex("B"));
	graph.add(blank("i"), vocab::OWL_INTERSECTIONOF, head);
	graph.add(blank("bad"), vocab::RDF_TYPE, iri(vocab::OWL_RESTRICTION));
	load();

	EXPECT_EQ("ObjectIntersectionOf(A B)", translate(blank("i")));

	ASSERT_EQ(1u, ctx->getDiagnostics().size());
	const Diagnostic& d = ctx->getDiagnostics()[0];
	EXPECT_EQ(Diagnostic::UnsupportedConstruct, d.kind);
	EXPECT_EQ("_:bad", d.node);
	EXPECT_EQ(vocab::OWL_INTERSECTIONOF, d.predicate);
	EXPECT_TRUE(boost::starts_with(d.message, "operand dropped"));

	// the cell holding the dropped operand stays for the residue
	EXPECT_FALSE(isUsed(blank("list0_1"), vocab::RDF_FIRST, blank("bad")));
	EXPECT_TRUE(isUsed(blank("list0_0"), vocab::RDF_FIRST, ex("A")));
	EXPECT_TRUE(isUsed(blank("list0_1"), vocab::RDF_REST, blank("list0_2")));
}

TEST_F(ExpressionTranslatorTest, SelfContainingOperandIsDroppedAsCyclic){
	graph.add(blank("i"), vocab::OWL_UNIONOF, graph.list(ex("A"), blank("i")));
	load();

	EXPECT_EQ("ObjectUnionOf(A)", translate(blank("i")));
	ASSERT_EQ(1u, ctx->getDiagnostics().size());
	EXPECT_EQ(Diagnostic::CyclicConstruct, ctx->getDiagnostics()[0].kind);
}

TEST_F(ExpressionTranslatorTest, EnumerationContainingItselfIsDroppedAsCyclic){
	graph.add(blank("x"), vocab::OWL_ONEOF, graph.list(ex("a"), blank("x")));
	load();

	EXPECT_EQ("ObjectOneOf(a)", translate(blank("x")));
	ASSERT_EQ(1u, ctx->getDiagnostics().size());
	EXPECT_EQ(Diagnostic::CyclicConstruct, ctx->getDiagnostics()[0].kind);
	EXPECT_EQ("_:x", ctx->getDiagnostics()[0].node);
}

TEST_F(ExpressionTranslatorTest, NoTranslatableOperandIsUnsupported){
	graph.add(blank("i"), vocab::OWL_UNIONOF, graph.list(blank("bad1"), blank("bad2")));
	graph.add(blank("bad1"), vocab::OWL_ONPROPERTY, ex("p"));
	graph.add(blank("bad2"), vocab::OWL_ONPROPERTY, ex("q"));
	load();

	Diagnostic d = failure(blank("i"));
	EXPECT_EQ(Diagnostic::UnsupportedConstruct, d.kind);
	EXPECT_EQ("_:i", d.node);
	EXPECT_EQ(2u, ctx->getDiagnostics().size());
}

// ============================== Data ranges ==============================

TEST_F(ExpressionTranslatorTest, DataUnionOf){
	graph.add(blank("d"), vocab::RDF_TYPE, iri(vocab::RDFS_DATATYPE));
	graph.add(blank("d"), vocab::OWL_UNIONOF, graph.list(iri(OWLRDF_XSD_NS "integer"), iri(OWLRDF_XSD_NS "string")));
	load();

	EXPECT_EQ("DataUnionOf(integer string)", translate(blank("d")));
}

TEST_F(ExpressionTranslatorTest, DataComplementOf){
	graph.add(blank("d"), vocab::OWL_DATATYPECOMPLEMENTOF, iri(OWLRDF_XSD_NS "integer"));
	load();

	EXPECT_EQ("DataComplementOf(integer)", translate(blank("d")));
}

TEST_F(ExpressionTranslatorTest, DataOneOf){
	graph.add(blank("d"), vocab::OWL_ONEOF, graph.list(lit("a"), lit("1", OWLRDF_XSD_NS "integer")));
	load();

	EXPECT_EQ("DataOneOf(\"a\" \"1\"^^integer)", translate(blank("d")));
}

TEST_F(ExpressionTranslatorTest, DataOneOfDropsMembersWhichAreNoLiterals){
	graph.add(blank("d"), vocab::RDF_TYPE, iri(vocab::RDFS_DATATYPE));
	graph.add(blank("d"), vocab::OWL_ONEOF, graph.list(lit("a"), ex("x"), lit("b")));
	load();

	EXPECT_EQ("DataOneOf(\"a\" \"b\")", translate(blank("d")));
	ASSERT_EQ(1u, ctx->getDiagnostics().size());
	const Diagnostic& d = ctx->getDiagnostics()[0];
	EXPECT_EQ(Diagnostic::UnsupportedConstruct, d.kind);
	EXPECT_EQ("<" OWLRDF_TEST_NS "x>", d.node);
	EXPECT_EQ(vocab::OWL_ONEOF, d.predicate);
	EXPECT_FALSE(isUsed(blank("list0_1"), vocab::RDF_FIRST, ex("x")));
}

TEST_F(ExpressionTranslatorTest, DataOneOfWithoutLiteralsIsUnsupported){
	graph.add(blank("d"), vocab::RDF_TYPE, iri(vocab::RDFS_DATATYPE));
	graph.add(blank("d"), vocab::OWL_ONEOF, graph.list(ex("x")));
	load();

	EXPECT_EQ(Diagnostic::UnsupportedConstruct, failure(blank("d")).kind);
	EXPECT_EQ(1u, ctx->getDiagnostics().size());
}

TEST_F(ExpressionTranslatorTest, DataRangeAsRestrictionFiller){
	graph.restriction(blank("r"), ex("size")).add(blank("r"), vocab::OWL_SOMEVALUESFROM, blank("d"));
	graph.add(blank("d"), vocab::OWL_ONEOF, graph.list(lit("S"), lit("M"), lit("L")));
	load();

	EXPECT_EQ("DataSomeValuesFrom(size DataOneOf(\"S\" \"M\" \"L\"))", translate(blank("r")));
}

TEST_F(ExpressionTranslatorTest, FacetRestrictionIsUnsupported){
	graph.add(blank("d"), vocab::RDF_TYPE, iri(vocab::RDFS_DATATYPE));
	graph.add(blank("d"), vocab::OWL_ONDATATYPE, iri(OWLRDF_XSD_NS "integer"));
	graph.add(blank("d"), vocab::OWL_WITHRESTRICTIONS, graph.list(blank("facet")));
	load();

	Diagnostic d = failure(blank("d"));
	EXPECT_EQ(Diagnostic::UnsupportedConstruct, d.kind);
	EXPECT_EQ(vocab::OWL_ONDATATYPE, d.predicate);
}

// ============================== Property expressions ==============================

TEST_F(ExpressionTranslatorTest, InversePropertyInRestriction){
	graph.restriction(blank("r"), blank("inv")).add(blank("r"), vocab::OWL_SOMEVALUESFROM, ex("Car"));
	graph.add(blank("inv"), vocab::OWL_INVERSEOF, ex("partOf"));
	load();

	EXPECT_EQ("ObjectSomeValuesFrom(ObjectInverseOf(partOf) Car)", translate(blank("r")));
	EXPECT_TRUE(isUsed(blank("inv"), vocab::OWL_INVERSEOF, ex("partOf")));
}

TEST_F(ExpressionTranslatorTest, InverseOfADataPropertyIsUnsupported){
	graph.add(ex("age"), vocab::RDF_TYPE, iri(vocab::OWL_DATATYPEPROPERTY));
	graph.add(blank("inv"), vocab::OWL_INVERSEOF, ex("age"));
	load();

	EXPECT_EQ(Diagnostic::UnsupportedConstruct, failure(blank("inv")).kind);
}
