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
 * @file 	TranslatorDispatcher.cpp
 *
 * @brief Dispatch of anonymous main nodes to expression translators.
 */

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif // HAVE_CONFIG_H

#include "owlrdf/TranslatorDispatcher.h"
#include "owlrdf/Error.h"

#include "dlvhex2/Logger.h"

#include <cassert>

#include "boost/foreach.hpp"

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

const ExpressionTranslator* selectTranslator(const TranslationContext& ctx, NodeID node){

	BOOST_FOREACH (const ExpressionTranslator& translator, getExpressionTranslators()){
		DBGLOG(DBG, "Checking if " << ctx.getNode(node) << " is a " << translator.name);
		if (translator.guard(ctx, node, translator)){
			DBGLOG(DBG, "--> yes");
			return &translator;
		}
	}
	return 0;
}

Translation dispatch(NodeResolver& resolver, NodeID node){

	const TranslationContext& ctx = resolver.getContext();
	assert(ctx.getNode(node).isAnonymous() && "only anonymous nodes are dispatched");

	const ExpressionTranslator* translator = selectTranslator(ctx, node);
	if (!translator){
		throw UnsupportedConstruct(ctx.getNode(node), "", "no construct is recognized at this node");
	}
	return translator->build(resolver, node, *translator);
}

}

DLVHEX_NAMESPACE_END
