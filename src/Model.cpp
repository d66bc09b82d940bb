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
 * @file 	Model.cpp
 *
 * @brief Construction and structural equality of model objects.
 */

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif // HAVE_CONFIG_H

#include "owlrdf/Model.h"

#include <cassert>

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

// ============================== Names ==============================

const char* DataRange::kindName(Kind kind){
	switch (kind){
		case Datatype: return "Datatype";
		case DataOneOf: return "DataOneOf";
		case DataComplementOf: return "DataComplementOf";
		case DataIntersectionOf: return "DataIntersectionOf";
		case DataUnionOf: return "DataUnionOf";
	}
	return "?";
}

const char* ClassExpression::kindName(Kind kind){
	switch (kind){
		case Class: return "Class";
		case ObjectSomeValuesFrom: return "ObjectSomeValuesFrom";
		case ObjectAllValuesFrom: return "ObjectAllValuesFrom";
		case ObjectHasValue: return "ObjectHasValue";
		case ObjectHasSelf: return "ObjectHasSelf";
		case ObjectMinCardinality: return "ObjectMinCardinality";
		case ObjectMaxCardinality: return "ObjectMaxCardinality";
		case ObjectExactCardinality: return "ObjectExactCardinality";
		case ObjectIntersectionOf: return "ObjectIntersectionOf";
		case ObjectUnionOf: return "ObjectUnionOf";
		case ObjectComplementOf: return "ObjectComplementOf";
		case ObjectOneOf: return "ObjectOneOf";
		case DataSomeValuesFrom: return "DataSomeValuesFrom";
		case DataAllValuesFrom: return "DataAllValuesFrom";
		case DataHasValue: return "DataHasValue";
		case DataMinCardinality: return "DataMinCardinality";
		case DataMaxCardinality: return "DataMaxCardinality";
		case DataExactCardinality: return "DataExactCardinality";
	}
	return "?";
}

bool ClassExpression::isRestriction() const{
	return kind != Class && kind != ObjectIntersectionOf && kind != ObjectUnionOf
	    && kind != ObjectComplementOf && kind != ObjectOneOf;
}

bool ClassExpression::isDataRestriction() const{
	return kind == DataSomeValuesFrom || kind == DataAllValuesFrom || kind == DataHasValue
	    || kind == DataMinCardinality || kind == DataMaxCardinality || kind == DataExactCardinality;
}

const char* Axiom::kindName(Kind kind){
	switch (kind){
		case Declaration: return "Declaration";
		case SubClassOf: return "SubClassOf";
		case EquivalentClasses: return "EquivalentClasses";
		case DisjointClasses: return "DisjointClasses";
		case DisjointUnion: return "DisjointUnion";
		case HasKey: return "HasKey";
		case SubObjectPropertyOf: return "SubObjectPropertyOf";
		case SubDataPropertyOf: return "SubDataPropertyOf";
		case SubPropertyChainOf: return "SubPropertyChainOf";
		case EquivalentObjectProperties: return "EquivalentObjectProperties";
		case EquivalentDataProperties: return "EquivalentDataProperties";
		case DisjointObjectProperties: return "DisjointObjectProperties";
		case DisjointDataProperties: return "DisjointDataProperties";
		case InverseObjectProperties: return "InverseObjectProperties";
		case ObjectPropertyDomain: return "ObjectPropertyDomain";
		case ObjectPropertyRange: return "ObjectPropertyRange";
		case DataPropertyDomain: return "DataPropertyDomain";
		case DataPropertyRange: return "DataPropertyRange";
		case FunctionalObjectProperty: return "FunctionalObjectProperty";
		case InverseFunctionalObjectProperty: return "InverseFunctionalObjectProperty";
		case ReflexiveObjectProperty: return "ReflexiveObjectProperty";
		case IrreflexiveObjectProperty: return "IrreflexiveObjectProperty";
		case SymmetricObjectProperty: return "SymmetricObjectProperty";
		case AsymmetricObjectProperty: return "AsymmetricObjectProperty";
		case TransitiveObjectProperty: return "TransitiveObjectProperty";
		case FunctionalDataProperty: return "FunctionalDataProperty";
		case ClassAssertion: return "ClassAssertion";
		case ObjectPropertyAssertion: return "ObjectPropertyAssertion";
		case DataPropertyAssertion: return "DataPropertyAssertion";
		case NegativeObjectPropertyAssertion: return "NegativeObjectPropertyAssertion";
		case NegativeDataPropertyAssertion: return "NegativeDataPropertyAssertion";
		case SameIndividual: return "SameIndividual";
		case DifferentIndividuals: return "DifferentIndividuals";
		case AnnotationAssertion: return "AnnotationAssertion";
	}
	return "?";
}

const char* Axiom::entityTypeName(EntityType type){
	switch (type){
		case ClassEntity: return "Class";
		case ObjectPropertyEntity: return "ObjectProperty";
		case DataPropertyEntity: return "DataProperty";
		case AnnotationPropertyEntity: return "AnnotationProperty";
		case NamedIndividualEntity: return "NamedIndividual";
		case DatatypeEntity: return "Datatype";
	}
	return "?";
}

// ============================== Construction ==============================

IndividualPtr namedIndividual(const std::string& iri){
	return IndividualPtr(new Individual(Individual::Named, iri));
}

IndividualPtr anonymousIndividual(const std::string& label){
	return IndividualPtr(new Individual(Individual::Anonymous, label));
}

PropertyExpressionPtr objectProperty(const std::string& iri){
	PropertyExpression* pe = new PropertyExpression(PropertyExpression::ObjectProperty);
	pe->iri = iri;
	return PropertyExpressionPtr(pe);
}

PropertyExpressionPtr inverseObjectProperty(PropertyExpressionPtr property){
	assert(!!property && property->isObjectPropertyExpression() && "inverse of a non-object property");
	PropertyExpression* pe = new PropertyExpression(PropertyExpression::InverseObjectProperty);
	pe->inverse = property;
	return PropertyExpressionPtr(pe);
}

PropertyExpressionPtr dataProperty(const std::string& iri){
	PropertyExpression* pe = new PropertyExpression(PropertyExpression::DataProperty);
	pe->iri = iri;
	return PropertyExpressionPtr(pe);
}

PropertyExpressionPtr annotationProperty(const std::string& iri){
	PropertyExpression* pe = new PropertyExpression(PropertyExpression::AnnotationProperty);
	pe->iri = iri;
	return PropertyExpressionPtr(pe);
}

DataRangePtr datatype(const std::string& iri){
	DataRange* dr = new DataRange(DataRange::Datatype);
	dr->iri = iri;
	return DataRangePtr(dr);
}

DataRangePtr dataOneOf(const std::vector<Literal>& literals){
	DataRange* dr = new DataRange(DataRange::DataOneOf);
	dr->literals = literals;
	return DataRangePtr(dr);
}

DataRangePtr dataComplementOf(DataRangePtr operand){
	assert(!!operand && "complement of an unresolved data range");
	DataRange* dr = new DataRange(DataRange::DataComplementOf);
	dr->operands.push_back(operand);
	return DataRangePtr(dr);
}

DataRangePtr dataNaryRange(DataRange::Kind kind, const std::vector<DataRangePtr>& operands){
	assert((kind == DataRange::DataIntersectionOf || kind == DataRange::DataUnionOf) && "not an n-ary data range");
	DataRange* dr = new DataRange(kind);
	dr->operands = operands;
	return DataRangePtr(dr);
}

ClassExpressionPtr namedClass(const std::string& iri){
	ClassExpression* ce = new ClassExpression(ClassExpression::Class);
	ce->iri = iri;
	return ClassExpressionPtr(ce);
}

ClassExpressionPtr objectQuantified(ClassExpression::Kind kind, PropertyExpressionPtr property, ClassExpressionPtr filler){
	assert((kind == ClassExpression::ObjectSomeValuesFrom || kind == ClassExpression::ObjectAllValuesFrom) && "not an object quantifier");
	assert(!!property && !!filler && "quantified restriction with unresolved operands");
	ClassExpression* ce = new ClassExpression(kind);
	ce->property = property;
	ce->filler = filler;
	return ClassExpressionPtr(ce);
}

ClassExpressionPtr dataQuantified(ClassExpression::Kind kind, PropertyExpressionPtr property, DataRangePtr filler){
	assert((kind == ClassExpression::DataSomeValuesFrom || kind == ClassExpression::DataAllValuesFrom) && "not a data quantifier");
	assert(!!property && !!filler && "quantified restriction with unresolved operands");
	ClassExpression* ce = new ClassExpression(kind);
	ce->property = property;
	ce->dataFiller = filler;
	return ClassExpressionPtr(ce);
}

ClassExpressionPtr objectHasValue(PropertyExpressionPtr property, IndividualPtr value){
	assert(!!property && !!value && "has-value restriction with unresolved operands");
	ClassExpression* ce = new ClassExpression(ClassExpression::ObjectHasValue);
	ce->property = property;
	ce->individuals.push_back(value);
	return ClassExpressionPtr(ce);
}

ClassExpressionPtr dataHasValue(PropertyExpressionPtr property, const Literal& value){
	assert(!!property && "has-value restriction with unresolved property");
	ClassExpression* ce = new ClassExpression(ClassExpression::DataHasValue);
	ce->property = property;
	ce->value = value;
	return ClassExpressionPtr(ce);
}

ClassExpressionPtr objectHasSelf(PropertyExpressionPtr property){
	assert(!!property && "self restriction with unresolved property");
	ClassExpression* ce = new ClassExpression(ClassExpression::ObjectHasSelf);
	ce->property = property;
	return ClassExpressionPtr(ce);
}

ClassExpressionPtr objectCardinality(ClassExpression::Kind kind, unsigned int n, PropertyExpressionPtr property, ClassExpressionPtr filler){
	assert((kind == ClassExpression::ObjectMinCardinality || kind == ClassExpression::ObjectMaxCardinality || kind == ClassExpression::ObjectExactCardinality) && "not an object cardinality");
	assert(!!property && "cardinality restriction with unresolved property");
	ClassExpression* ce = new ClassExpression(kind);
	ce->cardinality = n;
	ce->property = property;
	ce->filler = filler;
	return ClassExpressionPtr(ce);
}

ClassExpressionPtr dataCardinality(ClassExpression::Kind kind, unsigned int n, PropertyExpressionPtr property, DataRangePtr filler){
	assert((kind == ClassExpression::DataMinCardinality || kind == ClassExpression::DataMaxCardinality || kind == ClassExpression::DataExactCardinality) && "not a data cardinality");
	assert(!!property && "cardinality restriction with unresolved property");
	ClassExpression* ce = new ClassExpression(kind);
	ce->cardinality = n;
	ce->property = property;
	ce->dataFiller = filler;
	return ClassExpressionPtr(ce);
}

ClassExpressionPtr objectNary(ClassExpression::Kind kind, const std::vector<ClassExpressionPtr>& operands){
	assert((kind == ClassExpression::ObjectIntersectionOf || kind == ClassExpression::ObjectUnionOf) && "not an n-ary class expression");
	ClassExpression* ce = new ClassExpression(kind);
	ce->operands = operands;
	return ClassExpressionPtr(ce);
}

ClassExpressionPtr objectComplementOf(ClassExpressionPtr operand){
	assert(!!operand && "complement of an unresolved class expression");
	ClassExpression* ce = new ClassExpression(ClassExpression::ObjectComplementOf);
	ce->operands.push_back(operand);
	return ClassExpressionPtr(ce);
}

ClassExpressionPtr objectOneOf(const std::vector<IndividualPtr>& individuals){
	ClassExpression* ce = new ClassExpression(ClassExpression::ObjectOneOf);
	ce->individuals = individuals;
	return ClassExpressionPtr(ce);
}

// ============================== Structural equality ==============================

namespace{

template<typename Ptr>
bool equalSequences(const std::vector<Ptr>& a, const std::vector<Ptr>& b){
	if (a.size() != b.size()) return false;
	for (std::size_t i = 0; i < a.size(); ++i){
		if (!equals(a[i], b[i])) return false;
	}
	return true;
}

}

bool operator==(const Individual& a, const Individual& b){
	return a.kind == b.kind && a.name == b.name;
}

bool operator==(const PropertyExpression& a, const PropertyExpression& b){
	return a.kind == b.kind && a.iri == b.iri && equals(a.inverse, b.inverse);
}

bool operator==(const DataRange& a, const DataRange& b){
	return a.kind == b.kind && a.iri == b.iri && a.literals == b.literals && equalSequences(a.operands, b.operands);
}

bool operator==(const ClassExpression& a, const ClassExpression& b){
	return a.kind == b.kind
	    && a.iri == b.iri
	    && a.cardinality == b.cardinality
	    && a.value == b.value
	    && equals(a.property, b.property)
	    && equals(a.filler, b.filler)
	    && equals(a.dataFiller, b.dataFiller)
	    && equalSequences(a.operands, b.operands)
	    && equalSequences(a.individuals, b.individuals);
}

bool operator==(const Axiom& a, const Axiom& b){
	if (a.kind != b.kind) return false;
	if (a.kind == Axiom::Declaration && a.entityType != b.entityType) return false;
	return a.iri == b.iri
	    && a.hasLiteral == b.hasLiteral
	    && a.literal == b.literal
	    && equals(a.range, b.range)
	    && equalSequences(a.classes, b.classes)
	    && equalSequences(a.properties, b.properties)
	    && equalSequences(a.individuals, b.individuals);
}

bool equals(IndividualPtr a, IndividualPtr b){
	if (a == b) return true;
	if (!a || !b) return false;
	return *a == *b;
}

bool equals(PropertyExpressionPtr a, PropertyExpressionPtr b){
	if (a == b) return true;
	if (!a || !b) return false;
	return *a == *b;
}

bool equals(DataRangePtr a, DataRangePtr b){
	if (a == b) return true;
	if (!a || !b) return false;
	return *a == *b;
}

bool equals(ClassExpressionPtr a, ClassExpressionPtr b){
	if (a == b) return true;
	if (!a || !b) return false;
	return *a == *b;
}

bool equals(AxiomPtr a, AxiomPtr b){
	if (a == b) return true;
	if (!a || !b) return false;
	return *a == *b;
}

}

DLVHEX_NAMESPACE_END
