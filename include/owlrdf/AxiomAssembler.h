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
 * @file 	AxiomAssembler.h
 *
 * @brief Drives the translation of a whole document: recognizes axiom-shaped triples, builds
 *        the axioms with the node resolver and collects the residue and diagnostics.
 */

#ifndef OWLRDF_AXIOMASSEMBLER__HPP_INCLUDED_
#define OWLRDF_AXIOMASSEMBLER__HPP_INCLUDED_

#include "owlrdf/Error.h"
#include "owlrdf/Model.h"
#include "owlrdf/NodeResolver.h"
#include "owlrdf/TranslationConfig.h"
#include "owlrdf/TranslationContext.h"

#include "dlvhex2/PlatformDefinitions.h"

#include <string>
#include <vector>

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

struct TranslationResult{
	std::string ontologyIRI;		// empty if the document has no named ontology header
	std::string versionIRI;
	std::vector<std::string> imports;
	std::vector<AxiomPtr> axioms;		// ordered by their printed form
	std::vector<Translation> expressions;	// anonymous expressions no axiom refers to
	std::vector<Statement> residue;		// triples no translation consumed, in canonical order
	std::vector<Diagnostic> diagnostics;

	// a strict configuration accepts only complete translations; otherwise partial results are fine
	bool acceptable(const TranslationConfig& config) const;
};

class AxiomAssembler{
private:
	TranslationContext& ctx;
	NodeResolver resolver;
	std::vector<AxiomPtr> axioms;

	// builds the axiom of one main triple; returns null if the triple is not the builder's business
	typedef MutableAxiomPtr (AxiomAssembler::*AxiomBuilder)(TripleID triple);

	// runs a builder in its own usage frame and consumes the used triples if an axiom was built
	void attempt(TripleID triple, AxiomBuilder builder);
	// all unconsumed triples with the predicate
	std::vector<TripleID> unconsumed(const char* predicate) const;

	// passes in the order they run
	void translateHeader(TranslationResult& result);
	void translateDeclarations();
	void translatePredicateAxioms();
	void translateTypedAxioms();
	void translateAssertions();
	void sweepDanglingExpressions(TranslationResult& result);
	void collectResidue(TranslationResult& result);

	// axiom builders
	MutableAxiomPtr buildDeclaration(TripleID triple);
	MutableAxiomPtr buildSubClassOf(TripleID triple);
	MutableAxiomPtr buildEquivalentClasses(TripleID triple);
	MutableAxiomPtr buildDisjointClasses(TripleID triple);
	MutableAxiomPtr buildDisjointUnion(TripleID triple);
	MutableAxiomPtr buildHasKey(TripleID triple);
	MutableAxiomPtr buildSubPropertyOf(TripleID triple);
	MutableAxiomPtr buildPropertyChain(TripleID triple);
	MutableAxiomPtr buildEquivalentProperties(TripleID triple);
	MutableAxiomPtr buildDisjointProperties(TripleID triple);
	MutableAxiomPtr buildInverseProperties(TripleID triple);
	MutableAxiomPtr buildDomain(TripleID triple);
	MutableAxiomPtr buildRange(TripleID triple);
	MutableAxiomPtr buildSameIndividual(TripleID triple);
	MutableAxiomPtr buildDifferentIndividuals(TripleID triple);
	MutableAxiomPtr buildAllDisjointClasses(TripleID triple);
	MutableAxiomPtr buildAllDisjointProperties(TripleID triple);
	MutableAxiomPtr buildAllDifferent(TripleID triple);
	MutableAxiomPtr buildNegativeAssertion(TripleID triple);
	MutableAxiomPtr buildAssertion(TripleID triple);

	// resolves the elements of an RDF list, all of them or fail
	std::vector<ClassExpressionPtr> resolveClassList(NodeID head);
	std::vector<PropertyExpressionPtr> resolvePropertyList(NodeID head);
	std::vector<IndividualPtr> resolveIndividualList(NodeID head);

	// binary axioms between two properties of the same sort
	MutableAxiomPtr buildPropertyPair(TripleID triple, Axiom::Kind objectKind, Axiom::Kind dataKind);
public:
	AxiomAssembler(TranslationContext& ctx);

	// translates the triples of the context; call once per context
	TranslationResult translateDocument();
};

}

DLVHEX_NAMESPACE_END

#endif
