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
 * @file 	ModelPrinter.cpp
 *
 * @brief Functional-style rendering of model objects.
 */

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif // HAVE_CONFIG_H

#include "owlrdf/ModelPrinter.h"

#include "boost/foreach.hpp"

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

std::string FullIRIShortFormProvider::getShortForm(const std::string& iri) const{
	return "<" + iri + ">";
}

std::string FragmentShortFormProvider::getShortForm(const std::string& iri) const{

	std::string::size_type pos = iri.find('#');
	if (pos == std::string::npos) pos = iri.find_last_of('/');
	if (pos == std::string::npos || pos + 1 == iri.length()) return "<" + iri + ">";
	return iri.substr(pos + 1);
}

ModelPrinter::ModelPrinter(std::ostream& out, const ShortFormProvider& sfp) : out(out), sfp(sfp){
}

void ModelPrinter::separate(bool& first){
	if (!first) out << " ";
	first = false;
}

template<typename Ptr>
void ModelPrinter::printAll(const std::vector<Ptr>& objects, bool& first){
	BOOST_FOREACH (const Ptr& object, objects){
		separate(first);
		print(object);
	}
}

void ModelPrinter::print(const Literal& literal){
	out << "\"" << literal.lexical << "\"";
	if (!literal.language.empty()) out << "@" << literal.language;
	else if (!literal.datatype.empty()) out << "^^" << sfp.getShortForm(literal.datatype);
}

void ModelPrinter::print(IndividualPtr individual){
	if (individual->kind == Individual::Anonymous) out << "_:" << individual->name;
	else out << sfp.getShortForm(individual->name);
}

void ModelPrinter::print(PropertyExpressionPtr property){
	if (property->kind == PropertyExpression::InverseObjectProperty){
		out << "ObjectInverseOf(";
		print(property->inverse);
		out << ")";
	}else{
		out << sfp.getShortForm(property->iri);
	}
}

void ModelPrinter::print(DataRangePtr range){

	if (range->kind == DataRange::Datatype){
		out << sfp.getShortForm(range->iri);
		return;
	}

	bool first = true;
	out << DataRange::kindName(range->kind) << "(";
	BOOST_FOREACH (const Literal& literal, range->literals){
		separate(first);
		print(literal);
	}
	printAll(range->operands, first);
	out << ")";
}

void ModelPrinter::print(ClassExpressionPtr expression){

	if (expression->kind == ClassExpression::Class){
		out << sfp.getShortForm(expression->iri);
		return;
	}

	bool first = true;
	out << ClassExpression::kindName(expression->kind) << "(";
	switch (expression->kind){
		case ClassExpression::ObjectMinCardinality:
		case ClassExpression::ObjectMaxCardinality:
		case ClassExpression::ObjectExactCardinality:
		case ClassExpression::DataMinCardinality:
		case ClassExpression::DataMaxCardinality:
		case ClassExpression::DataExactCardinality:
			separate(first);
			out << expression->cardinality;
			break;
		default:
			break;
	}
	if (expression->property){
		separate(first);
		print(expression->property);
	}
	if (expression->filler){
		separate(first);
		print(expression->filler);
	}
	if (expression->dataFiller){
		separate(first);
		print(expression->dataFiller);
	}
	printAll(expression->operands, first);
	printAll(expression->individuals, first);
	if (expression->kind == ClassExpression::DataHasValue){
		separate(first);
		print(expression->value);
	}
	out << ")";
}

void ModelPrinter::print(AxiomPtr axiom){

	bool first = true;
	switch (axiom->kind){
		case Axiom::Declaration:
			out << "Declaration(" << Axiom::entityTypeName(axiom->entityType) << "(" << sfp.getShortForm(axiom->iri) << "))";
			return;

		case Axiom::SubPropertyChainOf:{
			// properties are the chain followed by the super property
			out << "SubObjectPropertyOf(ObjectPropertyChain(";
			std::vector<PropertyExpressionPtr> chain(axiom->properties.begin(), axiom->properties.end() - 1);
			printAll(chain, first);
			out << ") ";
			print(axiom->properties.back());
			out << ")";
			return;
		}

		case Axiom::HasKey:{
			out << "HasKey(";
			printAll(axiom->classes, first);
			out << " (";
			bool firstKey = true;
			BOOST_FOREACH (PropertyExpressionPtr p, axiom->properties){
				if (p->isObjectPropertyExpression()){
					separate(firstKey);
					print(p);
				}
			}
			out << ") (";
			firstKey = true;
			BOOST_FOREACH (PropertyExpressionPtr p, axiom->properties){
				if (!p->isObjectPropertyExpression()){
					separate(firstKey);
					print(p);
				}
			}
			out << "))";
			return;
		}

		default:
			break;
	}

	out << Axiom::kindName(axiom->kind) << "(";
	printAll(axiom->properties, first);
	printAll(axiom->classes, first);
	if (axiom->range){
		separate(first);
		print(axiom->range);
	}
	printAll(axiom->individuals, first);
	if (axiom->hasLiteral){
		separate(first);
		print(axiom->literal);
	}
	out << ")";
}

void ModelPrinter::print(const Translation& translation){
	switch (translation.category){
		case Translation::ClassExpressionCategory: print(translation.classExpression); break;
		case Translation::DataRangeCategory: print(translation.dataRange); break;
		case Translation::PropertyCategory: print(translation.property); break;
		case Translation::IndividualCategory: print(translation.individual); break;
	}
}

}

DLVHEX_NAMESPACE_END
