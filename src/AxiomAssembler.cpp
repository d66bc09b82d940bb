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
 * @file 	AxiomAssembler.cpp
 *
 * @brief Translation passes over a whole document.
 */

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif // HAVE_CONFIG_H

#include "owlrdf/AxiomAssembler.h"
#include "owlrdf/ModelPrinter.h"
#include "owlrdf/TranslatorDispatcher.h"
#include "owlrdf/Vocabulary.h"

#include "dlvhex2/Logger.h"

#include <algorithm>
#include <set>
#include <sstream>
#include <utility>

#include "boost/foreach.hpp"

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

namespace{

MutableAxiomPtr declaration(Axiom::EntityType type, const std::string& iri){
	MutableAxiomPtr axiom(new Axiom(Axiom::Declaration));
	axiom->entityType = type;
	axiom->iri = iri;
	return axiom;
}

MutableAxiomPtr characteristic(Axiom::Kind kind, PropertyExpressionPtr property){
	MutableAxiomPtr axiom(new Axiom(kind));
	axiom->properties.push_back(property);
	return axiom;
}

typedef std::pair<std::string, AxiomPtr> PrintedAxiom;

bool printedLess(const PrintedAxiom& a, const PrintedAxiom& b){
	return a.first < b.first;
}

}

bool TranslationResult::acceptable(const TranslationConfig& config) const{
	if (!config.strict) return true;
	return residue.empty() && diagnostics.empty();
}

AxiomAssembler::AxiomAssembler(TranslationContext& ctx) : ctx(ctx), resolver(ctx){
}

TranslationResult AxiomAssembler::translateDocument(){

	DBGLOG(DBG, "Translating document of " << ctx.getStore().size() << " triples");
	TranslationResult result;

	DBGLOG(DBG, "Pass 1: ontology header");
	translateHeader(result);
	DBGLOG(DBG, "Pass 2: declarations and property characteristics");
	translateDeclarations();
	DBGLOG(DBG, "Pass 3: class and property axioms");
	translatePredicateAxioms();
	DBGLOG(DBG, "Pass 4: typed axiom nodes");
	translateTypedAxioms();
	DBGLOG(DBG, "Pass 5: assertions");
	translateAssertions();
	DBGLOG(DBG, "Pass 6: dangling expressions");
	sweepDanglingExpressions(result);
	DBGLOG(DBG, "Pass 7: residue");
	collectResidue(result);

	// independent of the order in which the triples were asserted
	std::vector<PrintedAxiom> printed;
	BOOST_FOREACH (AxiomPtr axiom, axioms){
		printed.push_back(PrintedAxiom(ModelPrinter::toString(axiom), axiom));
	}
	std::stable_sort(printed.begin(), printed.end(), printedLess);
	BOOST_FOREACH (const PrintedAxiom& p, printed){
		result.axioms.push_back(p.second);
	}
	result.diagnostics = ctx.getDiagnostics();

	LOG(INFO, "Translated " << result.axioms.size() << " axioms and " << result.expressions.size() << " dangling expressions, "
		<< result.residue.size() << " triples left untranslated, " << result.diagnostics.size() << " diagnostics");
	return result;
}

void AxiomAssembler::attempt(TripleID triple, AxiomBuilder builder){

	if (ctx.getStore().isConsumed(triple)) return;
	DBGLOG(DBG, "Current triple: " << ctx.getStore().statement(triple));
	try{
		UsageScope scope(ctx);
		ctx.use(triple);
		MutableAxiomPtr axiom = (this->*builder)(triple);
		if (!axiom){
			DBGLOG(DBG, "No");
			return;
		}
		ctx.commit(scope.close());
#ifndef NDEBUG
		std::string axiomStr = ModelPrinter::toString(AxiomPtr(axiom));
		DBGLOG(DBG, "Found axiom: " << axiomStr);
#endif
		axioms.push_back(axiom);
	}catch(const TranslationError& e){
		ctx.report(e.diagnostic());
	}
}

std::vector<TripleID> AxiomAssembler::unconsumed(const char* predicate) const{
	std::vector<TripleID> result;
	BOOST_FOREACH (TripleID t, ctx.getStore().match(ANY, predicate)){
		if (!ctx.getStore().isConsumed(t)) result.push_back(t);
	}
	return result;
}

// ============================== Passes ==============================

void AxiomAssembler::translateHeader(TranslationResult& result){

	const TripleStore& store = ctx.getStore();
	NodeID ontologyType = store.lookupIRI(vocab::OWL_ONTOLOGY);
	if (ontologyType == NODE_FAIL) return;

	std::vector<TripleID> headers = store.match(ANY, vocab::RDF_TYPE, ontologyType);
	if (headers.empty()) return;
	if (headers.size() > 1){
		DBGLOG(WARNING, "Document declares " << headers.size() << " ontologies, only the first one is translated");
	}

	NodeID ontology = store.getTriple(headers[0]).subject;
	UsageScope scope(ctx);
	ctx.use(headers[0]);
	if (ctx.getNode(ontology).isNamed()) result.ontologyIRI = ctx.getNode(ontology).value;

	std::vector<TripleID> versions = store.match(ontology, vocab::OWL_VERSIONIRI);
	if (versions.size() == 1 && ctx.getNode(store.getTriple(versions[0]).object).isNamed()){
		result.versionIRI = ctx.getNode(store.getTriple(versions[0]).object).value;
		ctx.use(versions[0]);
	}

	BOOST_FOREACH (TripleID t, store.match(ontology, vocab::OWL_IMPORTS)){
		const Node& imported = ctx.getNode(store.getTriple(t).object);
		if (!imported.isNamed()) continue;
		result.imports.push_back(imported.value);
		ctx.use(t);
	}
	ctx.commit(scope.close());

	DBGLOG(DBG, "Ontology " << result.ontologyIRI << " (version " << result.versionIRI << ") with " << result.imports.size() << " imports");
}

void AxiomAssembler::translateDeclarations(){
	BOOST_FOREACH (TripleID t, unconsumed(vocab::RDF_TYPE)){
		DBGLOG(DBG, "Checking if this is a declaration or property characteristic");
		attempt(t, &AxiomAssembler::buildDeclaration);
	}
}

void AxiomAssembler::translatePredicateAxioms(){

	struct PredicateAxiom{
		const char* predicate;
		AxiomBuilder builder;
	};
	static const PredicateAxiom predicateAxioms[] = {
		{ vocab::RDFS_SUBCLASSOF, &AxiomAssembler::buildSubClassOf },
		{ vocab::OWL_EQUIVALENTCLASS, &AxiomAssembler::buildEquivalentClasses },
		{ vocab::OWL_DISJOINTWITH, &AxiomAssembler::buildDisjointClasses },
		{ vocab::OWL_DISJOINTUNIONOF, &AxiomAssembler::buildDisjointUnion },
		{ vocab::OWL_HASKEY, &AxiomAssembler::buildHasKey },
		{ vocab::RDFS_SUBPROPERTYOF, &AxiomAssembler::buildSubPropertyOf },
		{ vocab::OWL_PROPERTYCHAINAXIOM, &AxiomAssembler::buildPropertyChain },
		{ vocab::OWL_EQUIVALENTPROPERTY, &AxiomAssembler::buildEquivalentProperties },
		{ vocab::OWL_PROPERTYDISJOINTWITH, &AxiomAssembler::buildDisjointProperties },
		{ vocab::OWL_INVERSEOF, &AxiomAssembler::buildInverseProperties },
		{ vocab::RDFS_DOMAIN, &AxiomAssembler::buildDomain },
		{ vocab::RDFS_RANGE, &AxiomAssembler::buildRange },
		{ vocab::OWL_SAMEAS, &AxiomAssembler::buildSameIndividual },
		{ vocab::OWL_DIFFERENTFROM, &AxiomAssembler::buildDifferentIndividuals }
	};

	for (unsigned int i = 0; i < sizeof(predicateAxioms) / sizeof(predicateAxioms[0]); ++i){
		BOOST_FOREACH (TripleID t, unconsumed(predicateAxioms[i].predicate)){
			DBGLOG(DBG, "Checking if this is a " << getOwlType(predicateAxioms[i].predicate) << " axiom");
			attempt(t, predicateAxioms[i].builder);
		}
	}
}

void AxiomAssembler::translateTypedAxioms(){

	struct TypedAxiom{
		const char* type;
		AxiomBuilder builder;
	};
	static const TypedAxiom typedAxioms[] = {
		{ vocab::OWL_ALLDISJOINTCLASSES, &AxiomAssembler::buildAllDisjointClasses },
		{ vocab::OWL_ALLDISJOINTPROPERTIES, &AxiomAssembler::buildAllDisjointProperties },
		{ vocab::OWL_ALLDIFFERENT, &AxiomAssembler::buildAllDifferent },
		{ vocab::OWL_NEGATIVEPROPERTYASSERTION, &AxiomAssembler::buildNegativeAssertion }
	};

	const TripleStore& store = ctx.getStore();
	for (unsigned int i = 0; i < sizeof(typedAxioms) / sizeof(typedAxioms[0]); ++i){
		NodeID type = store.lookupIRI(typedAxioms[i].type);
		if (type == NODE_FAIL) continue;
		BOOST_FOREACH (TripleID t, store.match(ANY, vocab::RDF_TYPE, type)){
			DBGLOG(DBG, "Checking if this is a " << getOwlType(typedAxioms[i].type) << " axiom");
			attempt(t, typedAxioms[i].builder);
		}
	}
}

void AxiomAssembler::translateAssertions(){
	BOOST_FOREACH (TripleID t, ctx.getStore().unconsumed()){
		DBGLOG(DBG, "Checking if this is an assertion");
		attempt(t, &AxiomAssembler::buildAssertion);
	}
}

void AxiomAssembler::sweepDanglingExpressions(TranslationResult& result){

	const TripleStore& store = ctx.getStore();

	// anonymous nodes carrying a construct which no axiom consumed; roots go first so that
	// nested expressions end up inside their parents instead of standing alone
	std::vector<NodeID> roots, nested;
	std::set<NodeID> seen;
	BOOST_FOREACH (TripleID t, store.unconsumed()){
		NodeID node = store.getTriple(t).subject;
		if (!ctx.getNode(node).isAnonymous() || !seen.insert(node).second) continue;

		const TranslationContext::CacheEntry* entry = ctx.lookup(node);
		if (entry){
			// failures have been reported already
			if (entry->state != TranslationContext::CacheEntry::Done) continue;
			if (entry->translation.category == Translation::IndividualCategory) continue;
		}else if (!selectTranslator(ctx, node)){
			continue;
		}

		if (store.match(ANY, ANY, node).empty()) roots.push_back(node);
		else nested.push_back(node);
	}
	roots.insert(roots.end(), nested.begin(), nested.end());

	BOOST_FOREACH (NodeID node, roots){
		const TranslationContext::CacheEntry* entry = ctx.lookup(node);
		// failed as part of an earlier candidate and reported there
		if (entry && entry->state == TranslationContext::CacheEntry::Failed) continue;
		if (entry && entry->state == TranslationContext::CacheEntry::Done){
			bool consumed = true;
			BOOST_FOREACH (TripleID t, entry->triples){
				if (!store.isConsumed(t)){
					consumed = false;
					break;
				}
			}
			// part of an expression translated before
			if (consumed) continue;
		}

		DBGLOG(DBG, "Translating dangling expression " << ctx.getNode(node));
		try{
			UsageScope scope(ctx);
			Translation translation = resolver.resolveExpression(node);
			ctx.commit(scope.close());
			result.expressions.push_back(translation);
		}catch(const TranslationError& e){
			ctx.report(e.diagnostic());
		}
	}
}

void AxiomAssembler::collectResidue(TranslationResult& result){

	const TripleStore& store = ctx.getStore();
	BOOST_FOREACH (TripleID t, store.unconsumed()){
		Statement s = store.statement(t);
		result.residue.push_back(s);
		if (ctx.getConfig().residueDiagnostics){
			std::stringstream node, message;
			node << s.subject;
			message << "triple " << s << " was not translated";
			ctx.report(Diagnostic(Diagnostic::ResidueTriples, node.str(), s.predicate.value, message.str()));
		}
	}
}

// ============================== Declarations ==============================

MutableAxiomPtr AxiomAssembler::buildDeclaration(TripleID triple){

	Triple t = ctx.getStore().getTriple(triple);
	const Node& subject = ctx.getNode(t.subject);
	const Node& type = ctx.getNode(t.object);
	if (!subject.isNamed() || !type.isNamed()) return MutableAxiomPtr();

	const std::string& iri = subject.value;
	if (type.value == vocab::OWL_CLASS) return declaration(Axiom::ClassEntity, iri);
	if (type.value == vocab::OWL_OBJECTPROPERTY) return declaration(Axiom::ObjectPropertyEntity, iri);
	if (type.value == vocab::OWL_DATATYPEPROPERTY) return declaration(Axiom::DataPropertyEntity, iri);
	if (type.value == vocab::OWL_ANNOTATIONPROPERTY) return declaration(Axiom::AnnotationPropertyEntity, iri);
	if (type.value == vocab::OWL_NAMEDINDIVIDUAL) return declaration(Axiom::NamedIndividualEntity, iri);
	if (type.value == vocab::RDFS_DATATYPE) return declaration(Axiom::DatatypeEntity, iri);

	if (type.value == vocab::OWL_FUNCTIONALPROPERTY){
		if (ctx.isDataProperty(t.subject)) return characteristic(Axiom::FunctionalDataProperty, dataProperty(iri));
		return characteristic(Axiom::FunctionalObjectProperty, objectProperty(iri));
	}
	if (type.value == vocab::OWL_INVERSEFUNCTIONALPROPERTY) return characteristic(Axiom::InverseFunctionalObjectProperty, objectProperty(iri));
	if (type.value == vocab::OWL_TRANSITIVEPROPERTY) return characteristic(Axiom::TransitiveObjectProperty, objectProperty(iri));
	if (type.value == vocab::OWL_SYMMETRICPROPERTY) return characteristic(Axiom::SymmetricObjectProperty, objectProperty(iri));
	if (type.value == vocab::OWL_ASYMMETRICPROPERTY) return characteristic(Axiom::AsymmetricObjectProperty, objectProperty(iri));
	if (type.value == vocab::OWL_REFLEXIVEPROPERTY) return characteristic(Axiom::ReflexiveObjectProperty, objectProperty(iri));
	if (type.value == vocab::OWL_IRREFLEXIVEPROPERTY) return characteristic(Axiom::IrreflexiveObjectProperty, objectProperty(iri));

	return MutableAxiomPtr();
}

// ============================== Class axioms ==============================

MutableAxiomPtr AxiomAssembler::buildSubClassOf(TripleID triple){

	Triple t = ctx.getStore().getTriple(triple);
	MutableAxiomPtr axiom(new Axiom(Axiom::SubClassOf));
	axiom->classes.push_back(resolver.resolveClassExpression(t.subject));
	axiom->classes.push_back(resolver.resolveClassExpression(t.object));
	return axiom;
}

MutableAxiomPtr AxiomAssembler::buildEquivalentClasses(TripleID triple){

	Triple t = ctx.getStore().getTriple(triple);
	if (ctx.isDatatype(t.subject)){
		throw UnsupportedConstruct(ctx.getNode(t.subject), vocab::OWL_EQUIVALENTCLASS, "datatype definitions are not supported");
	}
	MutableAxiomPtr axiom(new Axiom(Axiom::EquivalentClasses));
	axiom->classes.push_back(resolver.resolveClassExpression(t.subject));
	axiom->classes.push_back(resolver.resolveClassExpression(t.object));
	return axiom;
}

MutableAxiomPtr AxiomAssembler::buildDisjointClasses(TripleID triple){

	Triple t = ctx.getStore().getTriple(triple);
	MutableAxiomPtr axiom(new Axiom(Axiom::DisjointClasses));
	axiom->classes.push_back(resolver.resolveClassExpression(t.subject));
	axiom->classes.push_back(resolver.resolveClassExpression(t.object));
	return axiom;
}

MutableAxiomPtr AxiomAssembler::buildDisjointUnion(TripleID triple){

	Triple t = ctx.getStore().getTriple(triple);
	if (!ctx.getNode(t.subject).isNamed()){
		throw MalformedConstruct(ctx.getNode(t.subject), vocab::OWL_DISJOINTUNIONOF, "disjoint union must define a named class");
	}
	MutableAxiomPtr axiom(new Axiom(Axiom::DisjointUnion));
	axiom->classes.push_back(namedClass(ctx.getNode(t.subject).value));
	std::vector<ClassExpressionPtr> operands = resolveClassList(t.object);
	axiom->classes.insert(axiom->classes.end(), operands.begin(), operands.end());
	return axiom;
}

MutableAxiomPtr AxiomAssembler::buildHasKey(TripleID triple){

	Triple t = ctx.getStore().getTriple(triple);
	MutableAxiomPtr axiom(new Axiom(Axiom::HasKey));
	axiom->classes.push_back(resolver.resolveClassExpression(t.subject));
	axiom->properties = resolvePropertyList(t.object);
	return axiom;
}

// ============================== Property axioms ==============================

MutableAxiomPtr AxiomAssembler::buildPropertyPair(TripleID triple, Axiom::Kind objectKind, Axiom::Kind dataKind){

	Triple t = ctx.getStore().getTriple(triple);
	if (ctx.isDataProperty(t.subject) || ctx.isDataProperty(t.object)){
		MutableAxiomPtr axiom(new Axiom(dataKind));
		axiom->properties.push_back(resolver.resolveDataProperty(t.subject));
		axiom->properties.push_back(resolver.resolveDataProperty(t.object));
		return axiom;
	}
	MutableAxiomPtr axiom(new Axiom(objectKind));
	axiom->properties.push_back(resolver.resolveObjectPropertyExpression(t.subject));
	axiom->properties.push_back(resolver.resolveObjectPropertyExpression(t.object));
	return axiom;
}

MutableAxiomPtr AxiomAssembler::buildSubPropertyOf(TripleID triple){

	Triple t = ctx.getStore().getTriple(triple);
	if (ctx.isAnnotationProperty(t.subject) && !ctx.isObjectProperty(t.subject) && !ctx.isDataProperty(t.subject)){
		throw UnsupportedConstruct(ctx.getNode(t.subject), vocab::RDFS_SUBPROPERTYOF, "annotation property hierarchies are not supported");
	}
	return buildPropertyPair(triple, Axiom::SubObjectPropertyOf, Axiom::SubDataPropertyOf);
}

MutableAxiomPtr AxiomAssembler::buildPropertyChain(TripleID triple){

	Triple t = ctx.getStore().getTriple(triple);
	MutableAxiomPtr axiom(new Axiom(Axiom::SubPropertyChainOf));
	BOOST_FOREACH (const NodeResolver::ListItem& item, resolver.translateList(t.object)){
		axiom->properties.push_back(resolver.resolveObjectPropertyExpression(item.node));
		ctx.use(item.firstTriple);
	}
	if (axiom->properties.empty()){
		throw MalformedConstruct(ctx.getNode(t.subject), vocab::OWL_PROPERTYCHAINAXIOM, "property chain is empty");
	}
	axiom->properties.push_back(resolver.resolveObjectPropertyExpression(t.subject));
	return axiom;
}

MutableAxiomPtr AxiomAssembler::buildEquivalentProperties(TripleID triple){
	return buildPropertyPair(triple, Axiom::EquivalentObjectProperties, Axiom::EquivalentDataProperties);
}

MutableAxiomPtr AxiomAssembler::buildDisjointProperties(TripleID triple){
	return buildPropertyPair(triple, Axiom::DisjointObjectProperties, Axiom::DisjointDataProperties);
}

MutableAxiomPtr AxiomAssembler::buildInverseProperties(TripleID triple){

	Triple t = ctx.getStore().getTriple(triple);
	// an anonymous subject is an inverse property expression, not an axiom
	if (!ctx.getNode(t.subject).isNamed()) return MutableAxiomPtr();

	MutableAxiomPtr axiom(new Axiom(Axiom::InverseObjectProperties));
	axiom->properties.push_back(resolver.resolveObjectPropertyExpression(t.subject));
	axiom->properties.push_back(resolver.resolveObjectPropertyExpression(t.object));
	return axiom;
}

MutableAxiomPtr AxiomAssembler::buildDomain(TripleID triple){

	Triple t = ctx.getStore().getTriple(triple);
	if (ctx.isDataProperty(t.subject)){
		MutableAxiomPtr axiom(new Axiom(Axiom::DataPropertyDomain));
		axiom->properties.push_back(resolver.resolveDataProperty(t.subject));
		axiom->classes.push_back(resolver.resolveClassExpression(t.object));
		return axiom;
	}
	if (ctx.isAnnotationProperty(t.subject) && !ctx.isObjectProperty(t.subject)){
		throw UnsupportedConstruct(ctx.getNode(t.subject), vocab::RDFS_DOMAIN, "domains of annotation properties are not supported");
	}
	MutableAxiomPtr axiom(new Axiom(Axiom::ObjectPropertyDomain));
	axiom->properties.push_back(resolver.resolveObjectPropertyExpression(t.subject));
	axiom->classes.push_back(resolver.resolveClassExpression(t.object));
	return axiom;
}

MutableAxiomPtr AxiomAssembler::buildRange(TripleID triple){

	Triple t = ctx.getStore().getTriple(triple);
	if (ctx.isAnnotationProperty(t.subject) && !ctx.isObjectProperty(t.subject) && !ctx.isDataProperty(t.subject)){
		throw UnsupportedConstruct(ctx.getNode(t.subject), vocab::RDFS_RANGE, "ranges of annotation properties are not supported");
	}
	if (ctx.isDataProperty(t.subject) || (ctx.isDatatype(t.object) && !ctx.isObjectProperty(t.subject))){
		MutableAxiomPtr axiom(new Axiom(Axiom::DataPropertyRange));
		axiom->properties.push_back(resolver.resolveDataProperty(t.subject));
		axiom->range = resolver.resolveDataRange(t.object);
		return axiom;
	}
	MutableAxiomPtr axiom(new Axiom(Axiom::ObjectPropertyRange));
	axiom->properties.push_back(resolver.resolveObjectPropertyExpression(t.subject));
	axiom->classes.push_back(resolver.resolveClassExpression(t.object));
	return axiom;
}

// ============================== Individual axioms ==============================

MutableAxiomPtr AxiomAssembler::buildSameIndividual(TripleID triple){

	Triple t = ctx.getStore().getTriple(triple);
	MutableAxiomPtr axiom(new Axiom(Axiom::SameIndividual));
	axiom->individuals.push_back(resolver.resolveIndividual(t.subject));
	axiom->individuals.push_back(resolver.resolveIndividual(t.object));
	return axiom;
}

MutableAxiomPtr AxiomAssembler::buildDifferentIndividuals(TripleID triple){

	Triple t = ctx.getStore().getTriple(triple);
	MutableAxiomPtr axiom(new Axiom(Axiom::DifferentIndividuals));
	axiom->individuals.push_back(resolver.resolveIndividual(t.subject));
	axiom->individuals.push_back(resolver.resolveIndividual(t.object));
	return axiom;
}

// ============================== Typed axiom nodes ==============================

MutableAxiomPtr AxiomAssembler::buildAllDisjointClasses(TripleID triple){

	NodeID node = ctx.getStore().getTriple(triple).subject;
	MutableAxiomPtr axiom(new Axiom(Axiom::DisjointClasses));
	axiom->classes = resolveClassList(resolver.useSingleton(node, vocab::OWL_MEMBERS));
	return axiom;
}

MutableAxiomPtr AxiomAssembler::buildAllDisjointProperties(TripleID triple){

	NodeID node = ctx.getStore().getTriple(triple).subject;
	std::vector<NodeResolver::ListItem> members = resolver.translateList(resolver.useSingleton(node, vocab::OWL_MEMBERS));

	bool data = false;
	BOOST_FOREACH (const NodeResolver::ListItem& item, members){
		if (ctx.isDataProperty(item.node)) data = true;
	}

	MutableAxiomPtr axiom(new Axiom(data ? Axiom::DisjointDataProperties : Axiom::DisjointObjectProperties));
	BOOST_FOREACH (const NodeResolver::ListItem& item, members){
		axiom->properties.push_back(data ? resolver.resolveDataProperty(item.node) : resolver.resolveObjectPropertyExpression(item.node));
		ctx.use(item.firstTriple);
	}
	return axiom;
}

MutableAxiomPtr AxiomAssembler::buildAllDifferent(TripleID triple){

	NodeID node = ctx.getStore().getTriple(triple).subject;
	// OWL 1 documents use distinctMembers
	const char* membersPredicate = vocab::OWL_MEMBERS;
	if (!ctx.getStore().contains(node, vocab::OWL_MEMBERS)) membersPredicate = vocab::OWL_DISTINCTMEMBERS;

	MutableAxiomPtr axiom(new Axiom(Axiom::DifferentIndividuals));
	axiom->individuals = resolveIndividualList(resolver.useSingleton(node, membersPredicate));
	return axiom;
}

MutableAxiomPtr AxiomAssembler::buildNegativeAssertion(TripleID triple){

	NodeID node = ctx.getStore().getTriple(triple).subject;
	NodeID source = resolver.useSingleton(node, vocab::OWL_SOURCEINDIVIDUAL);
	NodeID property = resolver.useSingleton(node, vocab::OWL_ASSERTIONPROPERTY);

	if (ctx.getStore().contains(node, vocab::OWL_TARGETVALUE)){
		MutableAxiomPtr axiom(new Axiom(Axiom::NegativeDataPropertyAssertion));
		axiom->properties.push_back(resolver.resolveDataProperty(property));
		axiom->individuals.push_back(resolver.resolveIndividual(source));
		axiom->hasLiteral = true;
		axiom->literal = resolver.resolveLiteral(resolver.useSingleton(node, vocab::OWL_TARGETVALUE));
		return axiom;
	}

	MutableAxiomPtr axiom(new Axiom(Axiom::NegativeObjectPropertyAssertion));
	axiom->properties.push_back(resolver.resolveObjectPropertyExpression(property));
	axiom->individuals.push_back(resolver.resolveIndividual(source));
	axiom->individuals.push_back(resolver.resolveIndividual(resolver.useSingleton(node, vocab::OWL_TARGETINDIVIDUAL)));
	return axiom;
}

// ============================== Assertions ==============================

MutableAxiomPtr AxiomAssembler::buildAssertion(TripleID triple){

	Triple t = ctx.getStore().getTriple(triple);
	const Node& subject = ctx.getNode(t.subject);
	const Node& predicate = ctx.getNode(t.predicate);
	const Node& object = ctx.getNode(t.object);
	if (subject.isLiteral()) return MutableAxiomPtr();

	// class assertion
	if (predicate.value == vocab::RDF_TYPE){
		if (object.isLiteral()) return MutableAxiomPtr();
		if (object.isNamed() && isBuiltinType(object.value)) return MutableAxiomPtr();
		MutableAxiomPtr axiom(new Axiom(Axiom::ClassAssertion));
		axiom->classes.push_back(resolver.resolveClassExpression(t.object));
		axiom->individuals.push_back(resolver.resolveIndividual(t.subject));
		return axiom;
	}

	// annotation assertion
	if (isBuiltinAnnotationProperty(predicate.value) ||
	    (ctx.isAnnotationProperty(t.predicate) && !ctx.isObjectProperty(t.predicate) && !ctx.isDataProperty(t.predicate))){
		MutableAxiomPtr axiom(new Axiom(Axiom::AnnotationAssertion));
		axiom->properties.push_back(annotationProperty(predicate.value));
		axiom->individuals.push_back(resolver.resolveIndividual(t.subject));
		if (object.isLiteral()){
			axiom->hasLiteral = true;
			axiom->literal = resolver.resolveLiteral(t.object);
		}else{
			axiom->individuals.push_back(resolver.resolveIndividual(t.object));
		}
		return axiom;
	}

	// everything else in the reserved vocabulary belongs to constructs
	if (isReservedVocabulary(predicate.value)) return MutableAxiomPtr();

	// data property assertion
	if (ctx.isDataProperty(t.predicate) || object.isLiteral()){
		if (ctx.isObjectProperty(t.predicate)){
			throw MalformedConstruct(subject, predicate.value, "object property has a literal value");
		}
		MutableAxiomPtr axiom(new Axiom(Axiom::DataPropertyAssertion));
		axiom->properties.push_back(dataProperty(predicate.value));
		axiom->individuals.push_back(resolver.resolveIndividual(t.subject));
		axiom->hasLiteral = true;
		axiom->literal = resolver.resolveLiteral(t.object);
		return axiom;
	}

	// object property assertion
	MutableAxiomPtr axiom(new Axiom(Axiom::ObjectPropertyAssertion));
	axiom->properties.push_back(objectProperty(predicate.value));
	axiom->individuals.push_back(resolver.resolveIndividual(t.subject));
	axiom->individuals.push_back(resolver.resolveIndividual(t.object));
	return axiom;
}

// ============================== Lists ==============================

std::vector<ClassExpressionPtr> AxiomAssembler::resolveClassList(NodeID head){
	std::vector<ClassExpressionPtr> result;
	BOOST_FOREACH (const NodeResolver::ListItem& item, resolver.translateList(head)){
		result.push_back(resolver.resolveClassExpression(item.node));
		ctx.use(item.firstTriple);
	}
	return result;
}

std::vector<PropertyExpressionPtr> AxiomAssembler::resolvePropertyList(NodeID head){
	std::vector<PropertyExpressionPtr> result;
	BOOST_FOREACH (const NodeResolver::ListItem& item, resolver.translateList(head)){
		result.push_back(resolver.resolvePropertyExpression(item.node));
		ctx.use(item.firstTriple);
	}
	return result;
}

std::vector<IndividualPtr> AxiomAssembler::resolveIndividualList(NodeID head){
	std::vector<IndividualPtr> result;
	BOOST_FOREACH (const NodeResolver::ListItem& item, resolver.translateList(head)){
		result.push_back(resolver.resolveIndividual(item.node));
		ctx.use(item.firstTriple);
	}
	return result;
}

}

DLVHEX_NAMESPACE_END
