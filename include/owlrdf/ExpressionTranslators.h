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
 * @file 	ExpressionTranslators.h
 *
 * @brief The closed registry of expression translators.
 *
 * Each translator recognizes one kind of construct rooted at an anonymous main node (its guard)
 * and builds the corresponding model object (its build step). Translators of structurally equal
 * constructs share one guard and one build algorithm and differ only in the data they carry
 * (predicate and the kinds of the object to construct).
 */

#ifndef OWLRDF_EXPRESSIONTRANSLATORS__HPP_INCLUDED_
#define OWLRDF_EXPRESSIONTRANSLATORS__HPP_INCLUDED_

#include "owlrdf/Model.h"
#include "owlrdf/NodeResolver.h"
#include "owlrdf/TranslationContext.h"

#include "dlvhex2/PlatformDefinitions.h"

#include <vector>

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

struct ExpressionTranslator;

// true if all triples required by the translator are rooted at the node; pure read
typedef bool (*TranslatorGuard)(const TranslationContext& ctx, NodeID node, const ExpressionTranslator& self);

// builds the construct; used triples are recorded in the current usage frame
typedef Translation (*TranslatorBuild)(NodeResolver& resolver, NodeID node, const ExpressionTranslator& self);

struct ExpressionTranslator{
	const char* name;
	TranslatorGuard guard;
	TranslatorBuild build;
	const char* predicate;			// distinguishing predicate, 0 if none
	ClassExpression::Kind objectKind;	// constructed for object properties or class operands
	ClassExpression::Kind dataKind;		// constructed for data properties
	DataRange::Kind rangeKind;		// constructed by data range translators
};

// all translators in dispatch precedence order
const std::vector<ExpressionTranslator>& getExpressionTranslators();

}

DLVHEX_NAMESPACE_END

#endif
