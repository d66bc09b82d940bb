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
 * @file 	Model.h
 *
 * @brief The object model produced by the translator: individuals, property expressions,
 *        data ranges, class expressions and axioms.
 *
 * All model objects are immutable once built and are passed around as shared pointers to const.
 * Each kind of object is a tagged struct: the kind selects which of the members are meaningful.
 * Shared anonymous substructure in the graph is represented by sharing the same pointer.
 */

#ifndef OWLRDF_MODEL__HPP_INCLUDED_
#define OWLRDF_MODEL__HPP_INCLUDED_

#include "dlvhex2/PlatformDefinitions.h"

#include <string>
#include <vector>

#include <boost/shared_ptr.hpp>

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

struct Literal{
	std::string lexical, datatype, language;

	Literal() {}
	Literal(const std::string& lexical, const std::string& datatype = "", const std::string& language = "") :
		lexical(lexical), datatype(datatype), language(language) {}

	bool operator==(const Literal& other) const{
		return lexical == other.lexical && datatype == other.datatype && language == other.language;
	}
	bool operator!=(const Literal& other) const{ return !(*this == other); }
};

struct Individual{
	enum Kind{ Named, Anonymous };

	Kind kind;
	std::string name;	// IRI or graph-local label

	Individual(Kind kind, const std::string& name) : kind(kind), name(name) {}
};
typedef boost::shared_ptr<const Individual> IndividualPtr;

struct PropertyExpression;
typedef boost::shared_ptr<const PropertyExpression> PropertyExpressionPtr;

struct PropertyExpression{
	enum Kind{ ObjectProperty, InverseObjectProperty, DataProperty, AnnotationProperty };

	Kind kind;
	std::string iri;		// all but InverseObjectProperty
	PropertyExpressionPtr inverse;	// InverseObjectProperty only

	PropertyExpression(Kind kind) : kind(kind) {}

	inline bool isObjectPropertyExpression() const{ return kind == ObjectProperty || kind == InverseObjectProperty; }
};

struct DataRange;
typedef boost::shared_ptr<const DataRange> DataRangePtr;

struct DataRange{
	enum Kind{ Datatype, DataOneOf, DataComplementOf, DataIntersectionOf, DataUnionOf };

	Kind kind;
	std::string iri;			// Datatype
	std::vector<Literal> literals;		// DataOneOf
	std::vector<DataRangePtr> operands;	// DataComplementOf (one), DataIntersectionOf, DataUnionOf

	DataRange(Kind kind) : kind(kind) {}

	static const char* kindName(Kind kind);
};

struct ClassExpression;
typedef boost::shared_ptr<const ClassExpression> ClassExpressionPtr;

struct ClassExpression{
	enum Kind{
		Class,
		ObjectSomeValuesFrom,
		ObjectAllValuesFrom,
		ObjectHasValue,
		ObjectHasSelf,
		ObjectMinCardinality,
		ObjectMaxCardinality,
		ObjectExactCardinality,
		ObjectIntersectionOf,
		ObjectUnionOf,
		ObjectComplementOf,
		ObjectOneOf,
		DataSomeValuesFrom,
		DataAllValuesFrom,
		DataHasValue,
		DataMinCardinality,
		DataMaxCardinality,
		DataExactCardinality
	};

	Kind kind;
	std::string iri;				// Class
	PropertyExpressionPtr property;			// restrictions
	ClassExpressionPtr filler;			// object quantifiers; optional for object cardinalities
	DataRangePtr dataFiller;			// data quantifiers; optional for data cardinalities
	std::vector<ClassExpressionPtr> operands;	// ObjectIntersectionOf, ObjectUnionOf, ObjectComplementOf (one)
	std::vector<IndividualPtr> individuals;		// ObjectOneOf, ObjectHasValue (one)
	Literal value;					// DataHasValue
	unsigned int cardinality;			// cardinality restrictions

	ClassExpression(Kind kind) : kind(kind), cardinality(0) {}

	bool isRestriction() const;
	bool isDataRestriction() const;

	static const char* kindName(Kind kind);
};

struct Axiom;
typedef boost::shared_ptr<const Axiom> AxiomPtr;

struct Axiom{
	enum Kind{
		Declaration,
		SubClassOf,
		EquivalentClasses,
		DisjointClasses,
		DisjointUnion,
		HasKey,
		SubObjectPropertyOf,
		SubDataPropertyOf,
		SubPropertyChainOf,
		EquivalentObjectProperties,
		EquivalentDataProperties,
		DisjointObjectProperties,
		DisjointDataProperties,
		InverseObjectProperties,
		ObjectPropertyDomain,
		ObjectPropertyRange,
		DataPropertyDomain,
		DataPropertyRange,
		FunctionalObjectProperty,
		InverseFunctionalObjectProperty,
		ReflexiveObjectProperty,
		IrreflexiveObjectProperty,
		SymmetricObjectProperty,
		AsymmetricObjectProperty,
		TransitiveObjectProperty,
		FunctionalDataProperty,
		ClassAssertion,
		ObjectPropertyAssertion,
		DataPropertyAssertion,
		NegativeObjectPropertyAssertion,
		NegativeDataPropertyAssertion,
		SameIndividual,
		DifferentIndividuals,
		AnnotationAssertion
	};

	enum EntityType{ ClassEntity, ObjectPropertyEntity, DataPropertyEntity, AnnotationPropertyEntity, NamedIndividualEntity, DatatypeEntity };

	Kind kind;

	// Declaration
	EntityType entityType;
	std::string iri;

	// operands in the order of the functional-style syntax of the axiom kind, e.g.
	// SubClassOf: classes = (sub, super); SubPropertyChainOf: properties = (chain..., super);
	// ObjectPropertyAssertion: properties = (p), individuals = (source, target)
	std::vector<ClassExpressionPtr> classes;
	std::vector<PropertyExpressionPtr> properties;
	std::vector<IndividualPtr> individuals;
	DataRangePtr range;				// DataPropertyRange
	bool hasLiteral;
	Literal literal;				// data and annotation assertions with a literal value

	Axiom(Kind kind) : kind(kind), entityType(ClassEntity), hasLiteral(false) {}

	static const char* kindName(Kind kind);
	static const char* entityTypeName(EntityType type);
};
typedef boost::shared_ptr<Axiom> MutableAxiomPtr;

// ============================== Construction ==============================

IndividualPtr namedIndividual(const std::string& iri);
IndividualPtr anonymousIndividual(const std::string& label);

PropertyExpressionPtr objectProperty(const std::string& iri);
PropertyExpressionPtr inverseObjectProperty(PropertyExpressionPtr property);
PropertyExpressionPtr dataProperty(const std::string& iri);
PropertyExpressionPtr annotationProperty(const std::string& iri);

DataRangePtr datatype(const std::string& iri);
DataRangePtr dataOneOf(const std::vector<Literal>& literals);
DataRangePtr dataComplementOf(DataRangePtr operand);
DataRangePtr dataNaryRange(DataRange::Kind kind, const std::vector<DataRangePtr>& operands);

ClassExpressionPtr namedClass(const std::string& iri);
// ObjectSomeValuesFrom, ObjectAllValuesFrom
ClassExpressionPtr objectQuantified(ClassExpression::Kind kind, PropertyExpressionPtr property, ClassExpressionPtr filler);
// DataSomeValuesFrom, DataAllValuesFrom
ClassExpressionPtr dataQuantified(ClassExpression::Kind kind, PropertyExpressionPtr property, DataRangePtr filler);
ClassExpressionPtr objectHasValue(PropertyExpressionPtr property, IndividualPtr value);
ClassExpressionPtr dataHasValue(PropertyExpressionPtr property, const Literal& value);
ClassExpressionPtr objectHasSelf(PropertyExpressionPtr property);
// filler may be null for unqualified restrictions
ClassExpressionPtr objectCardinality(ClassExpression::Kind kind, unsigned int n, PropertyExpressionPtr property, ClassExpressionPtr filler);
ClassExpressionPtr dataCardinality(ClassExpression::Kind kind, unsigned int n, PropertyExpressionPtr property, DataRangePtr filler);
// ObjectIntersectionOf, ObjectUnionOf
ClassExpressionPtr objectNary(ClassExpression::Kind kind, const std::vector<ClassExpressionPtr>& operands);
ClassExpressionPtr objectComplementOf(ClassExpressionPtr operand);
ClassExpressionPtr objectOneOf(const std::vector<IndividualPtr>& individuals);

// ============================== Structural equality ==============================

bool operator==(const Individual& a, const Individual& b);
bool operator==(const PropertyExpression& a, const PropertyExpression& b);
bool operator==(const DataRange& a, const DataRange& b);
bool operator==(const ClassExpression& a, const ClassExpression& b);
bool operator==(const Axiom& a, const Axiom& b);

// null-safe structural comparison of shared objects
bool equals(IndividualPtr a, IndividualPtr b);
bool equals(PropertyExpressionPtr a, PropertyExpressionPtr b);
bool equals(DataRangePtr a, DataRangePtr b);
bool equals(ClassExpressionPtr a, ClassExpressionPtr b);
bool equals(AxiomPtr a, AxiomPtr b);

}

DLVHEX_NAMESPACE_END

#endif
