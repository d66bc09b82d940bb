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
 * @file 	TranslationConfig.h
 *
 * @brief Options controlling a translation run and the policy applied to its outcome.
 */

#ifndef OWLRDF_TRANSLATIONCONFIG__HPP_INCLUDED_
#define OWLRDF_TRANSLATIONCONFIG__HPP_INCLUDED_

#include "dlvhex2/PlatformDefinitions.h"

#include <list>
#include <ostream>

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

struct TranslationConfig{
	bool strict;			// residue and diagnostics make the result unacceptable
	bool residueDiagnostics;	// report every unconsumed triple as a ResidueTriples diagnostic
	unsigned int maxNesting;	// deepest nesting of anonymous nodes translated before giving up

	TranslationConfig() : strict(false), residueDiagnostics(true), maxNesting(1000) {}

	// consumes the options understood here and removes them from the list, leaves all others
	void processOptions(std::list<const char*>& options);

	static void printUsage(std::ostream& o);
};

}

DLVHEX_NAMESPACE_END

#endif
