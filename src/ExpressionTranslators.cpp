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
 * @file 	ExpressionTranslators.cpp
 *
 * @brief Guards and build steps of all expression translators, and their precedence.
 */

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif // HAVE_CONFIG_H

#include "owlrdf/ExpressionTranslators.h"
#include "owlrdf/Error.h"
#include "owlrdf/Vocabulary.h"

#include "dlvhex2/Logger.h"

#include <sstream>
#include <string>

#include "boost/foreach.hpp"
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

namespace{

// ============================== Helpers ==============================

bool hasType(const TranslationContext& ctx, NodeID node, const char* typeIRI){
	NodeID type = ctx.getStore().lookupIRI(typeIRI);
	if (type == NODE_FAIL) return false;
	return ctx.getStore().contains(node, vocab::RDF_TYPE, type);
}

bool isRestrictionNode(const TranslationContext& ctx, NodeID node){
	return hasType(ctx, node, vocab::OWL_RESTRICTION) || ctx.getStore().contains(node, vocab::OWL_ONPROPERTY);
}

std::string printNode(const TranslationContext& ctx, NodeID node){
	std::stringstream ss;
	ss << ctx.getNode(node);
	return ss.str();
}

// an operand of an n-ary construct could not be translated; its siblings are kept
void reportDroppedOperand(TranslationContext& ctx, NodeID operand, const ExpressionTranslator& self, const TranslationError& e){
	Diagnostic::Kind kind = (e.kind() == Diagnostic::CyclicConstruct ? Diagnostic::CyclicConstruct : Diagnostic::UnsupportedConstruct);
	ctx.report(Diagnostic(kind, printNode(ctx, operand), self.predicate, "operand dropped: " + e.diagnostic().message));
}

unsigned int parseCardinality(const TranslationContext& ctx, NodeID node, NodeID value, const char* predicate){

	const Node& v = ctx.getNode(value);
	if (!v.isLiteral() || v.value.empty() || !boost::all(v.value, boost::is_digit())){
		std::stringstream ss;
		ss << "cardinality " << v << " is not a non-negative integer";
		throw MalformedConstruct(ctx.getNode(node), predicate, ss.str());
	}
	try{
		return boost::lexical_cast<unsigned int>(v.value);
	}catch(const boost::bad_lexical_cast&){
		throw MalformedConstruct(ctx.getNode(node), predicate, "cardinality " + v.value + " is out of range");
	}
}

// ============================== Guards ==============================

// the distinguishing predicate on a restriction node
bool restrictionGuard(const TranslationContext& ctx, NodeID node, const ExpressionTranslator& self){
	return ctx.getStore().contains(node, self.predicate) && isRestrictionNode(ctx, node);
}

// a restriction no complete pattern matched
bool incompleteRestrictionGuard(const TranslationContext& ctx, NodeID node, const ExpressionTranslator&){
	return isRestrictionNode(ctx, node);
}

bool predicateGuard(const TranslationContext& ctx, NodeID node, const ExpressionTranslator& self){
	return ctx.getStore().contains(node, self.predicate);
}

bool typedDatatypeGuard(const TranslationContext& ctx, NodeID node, const ExpressionTranslator& self){
	return ctx.getStore().contains(node, self.predicate) && hasType(ctx, node, vocab::RDFS_DATATYPE);
}

bool dataOneOfGuard(const TranslationContext& ctx, NodeID node, const ExpressionTranslator& self){
	return ctx.getStore().contains(node, self.predicate) && ctx.isDatatype(node);
}

// ============================== Restrictions ==============================

Translation buildHasSelf(NodeResolver& resolver, NodeID node, const ExpressionTranslator& self){

	TranslationContext& ctx = resolver.getContext();
	resolver.useType(node, vocab::OWL_RESTRICTION);
	NodeID property = resolver.useSingleton(node, vocab::OWL_ONPROPERTY);
	NodeID value = resolver.useSingleton(node, self.predicate);

	const Node& v = ctx.getNode(value);
	if (!v.isLiteral() || (v.value != "true" && v.value != "1")){
		throw MalformedConstruct(ctx.getNode(node), self.predicate, "self restriction must have the value true");
	}
	return Translation(objectHasSelf(resolver.resolveObjectPropertyExpression(property)));
}

Translation buildCardinalityRestriction(NodeResolver& resolver, NodeID node, const ExpressionTranslator& self, bool qualified){

	TranslationContext& ctx = resolver.getContext();
	const TripleStore& store = ctx.getStore();
	resolver.useType(node, vocab::OWL_RESTRICTION);
	NodeID property = resolver.useSingleton(node, vocab::OWL_ONPROPERTY);
	NodeID value = resolver.useSingleton(node, self.predicate);
	unsigned int n = parseCardinality(ctx, node, value, self.predicate);

	bool onClass = store.contains(node, vocab::OWL_ONCLASS);
	bool onDataRange = store.contains(node, vocab::OWL_ONDATARANGE);
	if (qualified && !onClass && !onDataRange){
		throw MalformedConstruct(ctx.getNode(node), self.predicate, "qualified cardinality has neither onClass nor onDataRange");
	}

	bool data = ctx.isDataProperty(property) || (qualified && onDataRange && !onClass);
	DBGLOG(DBG, "Cardinality restriction " << ctx.getNode(node) << " is a " << (data ? "data" : "object") << " restriction");
	if (data){
		DataRangePtr filler;
		if (qualified) filler = resolver.resolveDataRange(resolver.useSingleton(node, vocab::OWL_ONDATARANGE));
		return Translation(dataCardinality(self.dataKind, n, resolver.resolveDataProperty(property), filler));
	}else{
		ClassExpressionPtr filler;
		if (qualified) filler = resolver.resolveClassExpression(resolver.useSingleton(node, vocab::OWL_ONCLASS));
		return Translation(objectCardinality(self.objectKind, n, resolver.resolveObjectPropertyExpression(property), filler));
	}
}

Translation buildQualifiedCardinality(NodeResolver& resolver, NodeID node, const ExpressionTranslator& self){
	return buildCardinalityRestriction(resolver, node, self, true);
}

Translation buildCardinality(NodeResolver& resolver, NodeID node, const ExpressionTranslator& self){
	return buildCardinalityRestriction(resolver, node, self, false);
}

Translation buildHasValue(NodeResolver& resolver, NodeID node, const ExpressionTranslator& self){

	TranslationContext& ctx = resolver.getContext();
	resolver.useType(node, vocab::OWL_RESTRICTION);
	NodeID property = resolver.useSingleton(node, vocab::OWL_ONPROPERTY);
	NodeID value = resolver.useSingleton(node, self.predicate);

	const bool literal = ctx.getNode(value).isLiteral();
	if (literal && ctx.isObjectProperty(property)){
		throw MalformedConstruct(ctx.getNode(node), self.predicate, "object property has a literal value");
	}
	if (ctx.isDataProperty(property) || literal){
		return Translation(dataHasValue(resolver.resolveDataProperty(property), resolver.resolveLiteral(value)));
	}else{
		return Translation(objectHasValue(resolver.resolveObjectPropertyExpression(property), resolver.resolveIndividual(value)));
	}
}

// someValuesFrom and allValuesFrom, object and data
Translation buildQuantified(NodeResolver& resolver, NodeID node, const ExpressionTranslator& self){

	TranslationContext& ctx = resolver.getContext();
	resolver.useType(node, vocab::OWL_RESTRICTION);
	NodeID property = resolver.useSingleton(node, vocab::OWL_ONPROPERTY);
	NodeID filler = resolver.useSingleton(node, self.predicate);

	if (ctx.isDataProperty(property) || ctx.isDatatype(filler)){
		DBGLOG(DBG, "--> data restriction");
		return Translation(dataQuantified(self.dataKind, resolver.resolveDataProperty(property), resolver.resolveDataRange(filler)));
	}else{
		DBGLOG(DBG, "--> object restriction");
		return Translation(objectQuantified(self.objectKind, resolver.resolveObjectPropertyExpression(property), resolver.resolveClassExpression(filler)));
	}
}

Translation buildIncompleteRestriction(NodeResolver& resolver, NodeID node, const ExpressionTranslator&){

	const TranslationContext& ctx = resolver.getContext();
	if (!ctx.getStore().contains(node, vocab::OWL_ONPROPERTY)){
		throw MalformedConstruct(ctx.getNode(node), vocab::OWL_ONPROPERTY, "restriction has no onProperty");
	}
	throw MalformedConstruct(ctx.getNode(node), "", "restriction on a property has no filler");
}

Translation buildDatatypeRestriction(NodeResolver& resolver, NodeID node, const ExpressionTranslator& self){
	throw UnsupportedConstruct(resolver.getContext().getNode(node), self.predicate, "datatype restrictions with facets are not supported");
}

// ============================== Data ranges ==============================

Translation buildDataNary(NodeResolver& resolver, NodeID node, const ExpressionTranslator& self){

	TranslationContext& ctx = resolver.getContext();
	resolver.useType(node, vocab::RDFS_DATATYPE);
	std::vector<NodeResolver::ListItem> items = resolver.translateList(resolver.useSingleton(node, self.predicate));

	std::vector<DataRangePtr> operands;
	BOOST_FOREACH (const NodeResolver::ListItem& item, items){
		try{
			operands.push_back(resolver.resolveDataRange(item.node));
			ctx.use(item.firstTriple);
		}catch(const TranslationError& e){
			reportDroppedOperand(ctx, item.node, self, e);
		}
	}
	if (operands.empty()){
		throw UnsupportedConstruct(ctx.getNode(node), self.predicate, "no operand could be translated");
	}
	return Translation(dataNaryRange(self.rangeKind, operands));
}

Translation buildDataComplement(NodeResolver& resolver, NodeID node, const ExpressionTranslator& self){
	resolver.useType(node, vocab::RDFS_DATATYPE);
	return Translation(dataComplementOf(resolver.resolveDataRange(resolver.useSingleton(node, self.predicate))));
}

Translation buildDataOneOf(NodeResolver& resolver, NodeID node, const ExpressionTranslator& self){

	TranslationContext& ctx = resolver.getContext();
	resolver.useType(node, vocab::RDFS_DATATYPE);
	std::vector<NodeResolver::ListItem> items = resolver.translateList(resolver.useSingleton(node, self.predicate));

	std::vector<Literal> literals;
	BOOST_FOREACH (const NodeResolver::ListItem& item, items){
		try{
			literals.push_back(resolver.resolveLiteral(item.node));
			ctx.use(item.firstTriple);
		}catch(const TranslationError& e){
			reportDroppedOperand(ctx, item.node, self, e);
		}
	}
	if (literals.empty()){
		throw UnsupportedConstruct(ctx.getNode(node), self.predicate, "no literal could be translated");
	}
	return Translation(dataOneOf(literals));
}

// ============================== Boolean class expressions ==============================

// intersectionOf and unionOf
Translation buildObjectNary(NodeResolver& resolver, NodeID node, const ExpressionTranslator& self){

	TranslationContext& ctx = resolver.getContext();
	resolver.useType(node, vocab::OWL_CLASS);
	std::vector<NodeResolver::ListItem> items = resolver.translateList(resolver.useSingleton(node, self.predicate));

	std::vector<ClassExpressionPtr> operands;
	BOOST_FOREACH (const NodeResolver::ListItem& item, items){
		try{
			operands.push_back(resolver.resolveClassExpression(item.node));
			ctx.use(item.firstTriple);
		}catch(const TranslationError& e){
			reportDroppedOperand(ctx, item.node, self, e);
		}
	}
	if (operands.empty()){
		throw UnsupportedConstruct(ctx.getNode(node), self.predicate, "no operand could be translated");
	}
	return Translation(objectNary(self.objectKind, operands));
}

Translation buildComplement(NodeResolver& resolver, NodeID node, const ExpressionTranslator& self){
	resolver.useType(node, vocab::OWL_CLASS);
	return Translation(objectComplementOf(resolver.resolveClassExpression(resolver.useSingleton(node, self.predicate))));
}

Translation buildOneOf(NodeResolver& resolver, NodeID node, const ExpressionTranslator& self){

	TranslationContext& ctx = resolver.getContext();
	resolver.useType(node, vocab::OWL_CLASS);
	std::vector<NodeResolver::ListItem> items = resolver.translateList(resolver.useSingleton(node, self.predicate));

	std::vector<IndividualPtr> individuals;
	BOOST_FOREACH (const NodeResolver::ListItem& item, items){
		try{
			individuals.push_back(resolver.resolveIndividual(item.node));
			ctx.use(item.firstTriple);
		}catch(const TranslationError& e){
			reportDroppedOperand(ctx, item.node, self, e);
		}
	}
	if (individuals.empty()){
		throw UnsupportedConstruct(ctx.getNode(node), self.predicate, "no individual could be translated");
	}
	return Translation(objectOneOf(individuals));
}

// ============================== Property expressions ==============================

Translation buildInverse(NodeResolver& resolver, NodeID node, const ExpressionTranslator& self){
	resolver.useType(node, vocab::OWL_OBJECTPROPERTY);
	return Translation(inverseObjectProperty(resolver.resolveObjectPropertyExpression(resolver.useSingleton(node, self.predicate))));
}

// ============================== Registry ==============================

typedef ClassExpression CE;
typedef DataRange DR;

// the order of this table is the dispatch precedence: most specific patterns first
const ExpressionTranslator TRANSLATORS[] = {
	{ "ObjectHasSelf", &restrictionGuard, &buildHasSelf, vocab::OWL_HASSELF, CE::ObjectHasSelf, CE::ObjectHasSelf, DR::Datatype },

	{ "ExactQualifiedCardinality", &restrictionGuard, &buildQualifiedCardinality, vocab::OWL_QUALIFIEDCARDINALITY, CE::ObjectExactCardinality, CE::DataExactCardinality, DR::Datatype },
	{ "MinQualifiedCardinality", &restrictionGuard, &buildQualifiedCardinality, vocab::OWL_MINQUALIFIEDCARDINALITY, CE::ObjectMinCardinality, CE::DataMinCardinality, DR::Datatype },
	{ "MaxQualifiedCardinality", &restrictionGuard, &buildQualifiedCardinality, vocab::OWL_MAXQUALIFIEDCARDINALITY, CE::ObjectMaxCardinality, CE::DataMaxCardinality, DR::Datatype },

	{ "ExactCardinality", &restrictionGuard, &buildCardinality, vocab::OWL_CARDINALITY, CE::ObjectExactCardinality, CE::DataExactCardinality, DR::Datatype },
	{ "MinCardinality", &restrictionGuard, &buildCardinality, vocab::OWL_MINCARDINALITY, CE::ObjectMinCardinality, CE::DataMinCardinality, DR::Datatype },
	{ "MaxCardinality", &restrictionGuard, &buildCardinality, vocab::OWL_MAXCARDINALITY, CE::ObjectMaxCardinality, CE::DataMaxCardinality, DR::Datatype },

	{ "HasValue", &restrictionGuard, &buildHasValue, vocab::OWL_HASVALUE, CE::ObjectHasValue, CE::DataHasValue, DR::Datatype },
	{ "SomeValuesFrom", &restrictionGuard, &buildQuantified, vocab::OWL_SOMEVALUESFROM, CE::ObjectSomeValuesFrom, CE::DataSomeValuesFrom, DR::Datatype },
	{ "AllValuesFrom", &restrictionGuard, &buildQuantified, vocab::OWL_ALLVALUESFROM, CE::ObjectAllValuesFrom, CE::DataAllValuesFrom, DR::Datatype },

	{ "IncompleteRestriction", &incompleteRestrictionGuard, &buildIncompleteRestriction, 0, CE::Class, CE::Class, DR::Datatype },

	{ "DatatypeRestriction", &predicateGuard, &buildDatatypeRestriction, vocab::OWL_ONDATATYPE, CE::Class, CE::Class, DR::Datatype },
	{ "DataIntersectionOf", &typedDatatypeGuard, &buildDataNary, vocab::OWL_INTERSECTIONOF, CE::Class, CE::Class, DR::DataIntersectionOf },
	{ "DataUnionOf", &typedDatatypeGuard, &buildDataNary, vocab::OWL_UNIONOF, CE::Class, CE::Class, DR::DataUnionOf },
	{ "DataComplementOf", &predicateGuard, &buildDataComplement, vocab::OWL_DATATYPECOMPLEMENTOF, CE::Class, CE::Class, DR::DataComplementOf },
	{ "DataOneOf", &dataOneOfGuard, &buildDataOneOf, vocab::OWL_ONEOF, CE::Class, CE::Class, DR::DataOneOf },

	{ "ObjectIntersectionOf", &predicateGuard, &buildObjectNary, vocab::OWL_INTERSECTIONOF, CE::ObjectIntersectionOf, CE::ObjectIntersectionOf, DR::Datatype },
	{ "ObjectUnionOf", &predicateGuard, &buildObjectNary, vocab::OWL_UNIONOF, CE::ObjectUnionOf, CE::ObjectUnionOf, DR::Datatype },
	{ "ObjectComplementOf", &predicateGuard, &buildComplement, vocab::OWL_COMPLEMENTOF, CE::ObjectComplementOf, CE::ObjectComplementOf, DR::Datatype },
	{ "ObjectOneOf", &predicateGuard, &buildOneOf, vocab::OWL_ONEOF, CE::ObjectOneOf, CE::ObjectOneOf, DR::Datatype },

	{ "ObjectInverseOf", &predicateGuard, &buildInverse, vocab::OWL_INVERSEOF, CE::Class, CE::Class, DR::Datatype }
};

}

const std::vector<ExpressionTranslator>& getExpressionTranslators(){
	static const std::vector<ExpressionTranslator> translators(TRANSLATORS, TRANSLATORS + sizeof(TRANSLATORS) / sizeof(TRANSLATORS[0]));
	return translators;
}

}

DLVHEX_NAMESPACE_END
