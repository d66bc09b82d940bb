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
 * @file 	ModelPrinterTest.cpp
 *
 * @brief Tests of the functional-style rendering of model objects.
 */

#include "owlrdf/Model.h"
#include "owlrdf/ModelPrinter.h"
#include "owlrdf/Vocabulary.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace dlvhex::owlrdf;

namespace{

const std::string NS = "http://example.org/onto#";

}

TEST(ShortFormProviderTest, FragmentsAndFullIRIs){
	FullIRIShortFormProvider full;
	FragmentShortFormProvider fragment;

	EXPECT_EQ("<http://example.org/onto#A>", full.getShortForm("http://example.org/onto#A"));
	EXPECT_EQ("A", fragment.getShortForm("http://example.org/onto#A"));
	EXPECT_EQ("B", fragment.getShortForm("http://example.org/onto/B"));
	EXPECT_EQ("<http://example.org/onto/>", fragment.getShortForm("http://example.org/onto/"));
	EXPECT_EQ("<urn:x>", fragment.getShortForm("urn:x"));
}

TEST(ModelPrinterTest, ClassExpressions){
	ClassExpressionPtr restriction = objectQuantified(ClassExpression::ObjectSomeValuesFrom,
		inverseObjectProperty(objectProperty(NS + "partOf")), namedClass(NS + "Car"));
	EXPECT_EQ("ObjectSomeValuesFrom(ObjectInverseOf(<" + NS + "partOf>) <" + NS + "Car>)", ModelPrinter::toString(restriction));

	std::vector<ClassExpressionPtr> operands;
	operands.push_back(namedClass(NS + "A"));
	operands.push_back(objectCardinality(ClassExpression::ObjectMaxCardinality, 2, objectProperty(NS + "p"), ClassExpressionPtr()));
	EXPECT_EQ("ObjectUnionOf(A ObjectMaxCardinality(2 p))",
		ModelPrinter::toString(objectNary(ClassExpression::ObjectUnionOf, operands), FragmentShortFormProvider()));
}

TEST(ModelPrinterTest, DataRangesAndLiterals){
	std::vector<Literal> literals;
	literals.push_back(Literal("a"));
	literals.push_back(Literal("b", "", "de"));
	literals.push_back(Literal("1", vocab::XSD_BOOLEAN));
	FragmentShortFormProvider sfp;

	EXPECT_EQ("DataOneOf(\"a\" \"b\"@de \"1\"^^boolean)", ModelPrinter::toString(dataOneOf(literals), sfp));
	EXPECT_EQ("DataHasValue(p \"1\"^^boolean)", ModelPrinter::toString(dataHasValue(dataProperty(NS + "p"), literals[2]), sfp));
	EXPECT_EQ("DataComplementOf(boolean)", ModelPrinter::toString(dataComplementOf(datatype(vocab::XSD_BOOLEAN)), sfp));
}

TEST(ModelPrinterTest, Axioms){
	FragmentShortFormProvider sfp;

	MutableAxiomPtr declaration(new Axiom(Axiom::Declaration));
	declaration->entityType = Axiom::DataPropertyEntity;
	declaration->iri = NS + "age";
	EXPECT_EQ("Declaration(DataProperty(age))", ModelPrinter::toString(AxiomPtr(declaration), sfp));

	MutableAxiomPtr chain(new Axiom(Axiom::SubPropertyChainOf));
	chain->properties.push_back(objectProperty(NS + "parent"));
	chain->properties.push_back(objectProperty(NS + "brother"));
	chain->properties.push_back(objectProperty(NS + "uncle"));
	EXPECT_EQ("SubObjectPropertyOf(ObjectPropertyChain(parent brother) uncle)", ModelPrinter::toString(AxiomPtr(chain), sfp));

	MutableAxiomPtr key(new Axiom(Axiom::HasKey));
	key->classes.push_back(namedClass(NS + "Person"));
	key->properties.push_back(dataProperty(NS + "ssn"));
	key->properties.push_back(objectProperty(NS + "mother"));
	EXPECT_EQ("HasKey(Person (mother) (ssn))", ModelPrinter::toString(AxiomPtr(key), sfp));

	MutableAxiomPtr assertion(new Axiom(Axiom::DataPropertyAssertion));
	assertion->properties.push_back(dataProperty(NS + "age"));
	assertion->individuals.push_back(anonymousIndividual("b0"));
	assertion->hasLiteral = true;
	assertion->literal = Literal("42");
	EXPECT_EQ("DataPropertyAssertion(age _:b0 \"42\")", ModelPrinter::toString(AxiomPtr(assertion), sfp));
}

TEST(ModelPrinterTest, StructurallyEqualObjectsPrintAlike){
	ClassExpressionPtr a = objectHasValue(objectProperty(NS + "p"), namedIndividual(NS + "x"));
	ClassExpressionPtr b = objectHasValue(objectProperty(NS + "p"), namedIndividual(NS + "x"));
	EXPECT_NE(a.get(), b.get());
	EXPECT_TRUE(equals(a, b));
	EXPECT_EQ(ModelPrinter::toString(a), ModelPrinter::toString(b));

	ClassExpressionPtr c = objectHasValue(objectProperty(NS + "p"), namedIndividual(NS + "y"));
	EXPECT_FALSE(equals(a, c));
}
