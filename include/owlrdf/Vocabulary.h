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
 * @file 	Vocabulary.h
 *
 * @brief IRIs of the RDF, RDFS, OWL and XSD vocabularies used by the translator.
 */

#ifndef OWLRDF_VOCABULARY__HPP_INCLUDED_
#define OWLRDF_VOCABULARY__HPP_INCLUDED_

#include "dlvhex2/PlatformDefinitions.h"

#include <string>

#define OWLRDF_RDF_NS "http://www.w3.org/1999/02/22-rdf-syntax-ns#"
#define OWLRDF_RDFS_NS "http://www.w3.org/2000/01/rdf-schema#"
#define OWLRDF_OWL_NS "http://www.w3.org/2002/07/owl#"
#define OWLRDF_XSD_NS "http://www.w3.org/2001/XMLSchema#"

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

namespace vocab{

// rdf:
const char* const RDF_TYPE = OWLRDF_RDF_NS "type";
const char* const RDF_FIRST = OWLRDF_RDF_NS "first";
const char* const RDF_REST = OWLRDF_RDF_NS "rest";
const char* const RDF_NIL = OWLRDF_RDF_NS "nil";
const char* const RDF_LIST = OWLRDF_RDF_NS "List";
const char* const RDF_PLAIN_LITERAL = OWLRDF_RDF_NS "PlainLiteral";
const char* const RDF_XML_LITERAL = OWLRDF_RDF_NS "XMLLiteral";

// rdfs:
const char* const RDFS_SUBCLASSOF = OWLRDF_RDFS_NS "subClassOf";
const char* const RDFS_SUBPROPERTYOF = OWLRDF_RDFS_NS "subPropertyOf";
const char* const RDFS_DOMAIN = OWLRDF_RDFS_NS "domain";
const char* const RDFS_RANGE = OWLRDF_RDFS_NS "range";
const char* const RDFS_DATATYPE = OWLRDF_RDFS_NS "Datatype";
const char* const RDFS_LITERAL = OWLRDF_RDFS_NS "Literal";
const char* const RDFS_LABEL = OWLRDF_RDFS_NS "label";
const char* const RDFS_COMMENT = OWLRDF_RDFS_NS "comment";
const char* const RDFS_SEEALSO = OWLRDF_RDFS_NS "seeAlso";
const char* const RDFS_ISDEFINEDBY = OWLRDF_RDFS_NS "isDefinedBy";

// owl: entities and header
const char* const OWL_ONTOLOGY = OWLRDF_OWL_NS "Ontology";
const char* const OWL_IMPORTS = OWLRDF_OWL_NS "imports";
const char* const OWL_VERSIONIRI = OWLRDF_OWL_NS "versionIRI";
const char* const OWL_CLASS = OWLRDF_OWL_NS "Class";
const char* const OWL_THING = OWLRDF_OWL_NS "Thing";
const char* const OWL_NOTHING = OWLRDF_OWL_NS "Nothing";
const char* const OWL_OBJECTPROPERTY = OWLRDF_OWL_NS "ObjectProperty";
const char* const OWL_DATATYPEPROPERTY = OWLRDF_OWL_NS "DatatypeProperty";
const char* const OWL_ANNOTATIONPROPERTY = OWLRDF_OWL_NS "AnnotationProperty";
const char* const OWL_NAMEDINDIVIDUAL = OWLRDF_OWL_NS "NamedIndividual";
const char* const OWL_TOPOBJECTPROPERTY = OWLRDF_OWL_NS "topObjectProperty";
const char* const OWL_BOTTOMOBJECTPROPERTY = OWLRDF_OWL_NS "bottomObjectProperty";
const char* const OWL_TOPDATAPROPERTY = OWLRDF_OWL_NS "topDataProperty";
const char* const OWL_BOTTOMDATAPROPERTY = OWLRDF_OWL_NS "bottomDataProperty";
const char* const OWL_REAL = OWLRDF_OWL_NS "real";
const char* const OWL_RATIONAL = OWLRDF_OWL_NS "rational";

// owl: property characteristics
const char* const OWL_FUNCTIONALPROPERTY = OWLRDF_OWL_NS "FunctionalProperty";
const char* const OWL_INVERSEFUNCTIONALPROPERTY = OWLRDF_OWL_NS "InverseFunctionalProperty";
const char* const OWL_TRANSITIVEPROPERTY = OWLRDF_OWL_NS "TransitiveProperty";
const char* const OWL_SYMMETRICPROPERTY = OWLRDF_OWL_NS "SymmetricProperty";
const char* const OWL_ASYMMETRICPROPERTY = OWLRDF_OWL_NS "AsymmetricProperty";
const char* const OWL_REFLEXIVEPROPERTY = OWLRDF_OWL_NS "ReflexiveProperty";
const char* const OWL_IRREFLEXIVEPROPERTY = OWLRDF_OWL_NS "IrreflexiveProperty";

// owl: restrictions
const char* const OWL_RESTRICTION = OWLRDF_OWL_NS "Restriction";
const char* const OWL_ONPROPERTY = OWLRDF_OWL_NS "onProperty";
const char* const OWL_SOMEVALUESFROM = OWLRDF_OWL_NS "someValuesFrom";
const char* const OWL_ALLVALUESFROM = OWLRDF_OWL_NS "allValuesFrom";
const char* const OWL_HASVALUE = OWLRDF_OWL_NS "hasValue";
const char* const OWL_HASSELF = OWLRDF_OWL_NS "hasSelf";
const char* const OWL_CARDINALITY = OWLRDF_OWL_NS "cardinality";
const char* const OWL_MINCARDINALITY = OWLRDF_OWL_NS "minCardinality";
const char* const OWL_MAXCARDINALITY = OWLRDF_OWL_NS "maxCardinality";
const char* const OWL_QUALIFIEDCARDINALITY = OWLRDF_OWL_NS "qualifiedCardinality";
const char* const OWL_MINQUALIFIEDCARDINALITY = OWLRDF_OWL_NS "minQualifiedCardinality";
const char* const OWL_MAXQUALIFIEDCARDINALITY = OWLRDF_OWL_NS "maxQualifiedCardinality";
const char* const OWL_ONCLASS = OWLRDF_OWL_NS "onClass";
const char* const OWL_ONDATARANGE = OWLRDF_OWL_NS "onDataRange";

// owl: boolean and enumeration constructors
const char* const OWL_INTERSECTIONOF = OWLRDF_OWL_NS "intersectionOf";
const char* const OWL_UNIONOF = OWLRDF_OWL_NS "unionOf";
const char* const OWL_COMPLEMENTOF = OWLRDF_OWL_NS "complementOf";
const char* const OWL_ONEOF = OWLRDF_OWL_NS "oneOf";
const char* const OWL_DATATYPECOMPLEMENTOF = OWLRDF_OWL_NS "datatypeComplementOf";
const char* const OWL_ONDATATYPE = OWLRDF_OWL_NS "onDatatype";
const char* const OWL_WITHRESTRICTIONS = OWLRDF_OWL_NS "withRestrictions";
const char* const OWL_INVERSEOF = OWLRDF_OWL_NS "inverseOf";

// owl: axioms
const char* const OWL_EQUIVALENTCLASS = OWLRDF_OWL_NS "equivalentClass";
const char* const OWL_DISJOINTWITH = OWLRDF_OWL_NS "disjointWith";
const char* const OWL_DISJOINTUNIONOF = OWLRDF_OWL_NS "disjointUnionOf";
const char* const OWL_HASKEY = OWLRDF_OWL_NS "hasKey";
const char* const OWL_PROPERTYCHAINAXIOM = OWLRDF_OWL_NS "propertyChainAxiom";
const char* const OWL_EQUIVALENTPROPERTY = OWLRDF_OWL_NS "equivalentProperty";
const char* const OWL_PROPERTYDISJOINTWITH = OWLRDF_OWL_NS "propertyDisjointWith";
const char* const OWL_SAMEAS = OWLRDF_OWL_NS "sameAs";
const char* const OWL_DIFFERENTFROM = OWLRDF_OWL_NS "differentFrom";
const char* const OWL_ALLDISJOINTCLASSES = OWLRDF_OWL_NS "AllDisjointClasses";
const char* const OWL_ALLDISJOINTPROPERTIES = OWLRDF_OWL_NS "AllDisjointProperties";
const char* const OWL_ALLDIFFERENT = OWLRDF_OWL_NS "AllDifferent";
const char* const OWL_MEMBERS = OWLRDF_OWL_NS "members";
const char* const OWL_DISTINCTMEMBERS = OWLRDF_OWL_NS "distinctMembers";
const char* const OWL_NEGATIVEPROPERTYASSERTION = OWLRDF_OWL_NS "NegativePropertyAssertion";
const char* const OWL_SOURCEINDIVIDUAL = OWLRDF_OWL_NS "sourceIndividual";
const char* const OWL_ASSERTIONPROPERTY = OWLRDF_OWL_NS "assertionProperty";
const char* const OWL_TARGETINDIVIDUAL = OWLRDF_OWL_NS "targetIndividual";
const char* const OWL_TARGETVALUE = OWLRDF_OWL_NS "targetValue";

// owl: built-in annotation properties
const char* const OWL_VERSIONINFO = OWLRDF_OWL_NS "versionInfo";
const char* const OWL_DEPRECATED = OWLRDF_OWL_NS "deprecated";
const char* const OWL_PRIORVERSION = OWLRDF_OWL_NS "priorVersion";
const char* const OWL_BACKWARDCOMPATIBLEWITH = OWLRDF_OWL_NS "backwardCompatibleWith";
const char* const OWL_INCOMPATIBLEWITH = OWLRDF_OWL_NS "incompatibleWith";

// xsd:
const char* const XSD_BOOLEAN = OWLRDF_XSD_NS "boolean";
const char* const XSD_NONNEGATIVEINTEGER = OWLRDF_XSD_NS "nonNegativeInteger";

}

// true if the IRI lies in the rdf:, rdfs:, owl: or xsd: namespace
bool isReservedVocabulary(const std::string& iri);

// true for reserved IRIs that may occur as the object of rdf:type without denoting a class
// (owl:Thing and owl:Nothing are ordinary classes)
bool isBuiltinType(const std::string& iri);

// true for the annotation properties predefined by RDFS and OWL
bool isBuiltinAnnotationProperty(const std::string& iri);

// true for xsd: datatypes, rdfs:Literal, rdf:PlainLiteral, rdf:XMLLiteral, owl:real and owl:rational
bool isBuiltinDatatype(const std::string& iri);

// get the part of the IRI after the reserved namespace, e.g. "Restriction" for owl:Restriction
std::string getOwlType(const std::string& iri);

}

DLVHEX_NAMESPACE_END

#endif
