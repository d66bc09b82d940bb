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
 * @file 	TranslationConfig.cpp
 *
 * @brief Parsing of translation options.
 */

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif // HAVE_CONFIG_H

#include "owlrdf/TranslationConfig.h"
#include "owlrdf/Error.h"

#include "dlvhex2/Logger.h"

#include <string>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

void TranslationConfig::processOptions(std::list<const char*>& options){

	std::vector<std::list<const char*>::iterator> found;
	for(std::list<const char*>::iterator it = options.begin(); it != options.end(); it++){
		std::string option(*it);
		if (option == "--strict"){
			strict = true;
			found.push_back(it);
		}
		if (option == "--no-residue-diagnostics"){
			residueDiagnostics = false;
			found.push_back(it);
		}
		if (boost::starts_with(option, "--max-nesting=")){
			std::string value = option.substr(14);
			if (value.empty() || !boost::all(value, boost::is_digit())){
				throw ConfigError("--max-nesting expects a positive number, got \"" + value + "\"");
			}
			try{
				maxNesting = boost::lexical_cast<unsigned int>(value);
			}catch(const boost::bad_lexical_cast&){
				throw ConfigError("--max-nesting value \"" + value + "\" is out of range");
			}
			if (maxNesting == 0) throw ConfigError("--max-nesting must be at least 1");
			found.push_back(it);
		}
	}

	DBGLOG(DBG, "Translation options: strict=" << strict << ", residueDiagnostics=" << residueDiagnostics << ", maxNesting=" << maxNesting);

	for(std::vector<std::list<const char*>::iterator>::const_iterator it = found.begin(); it != found.end(); ++it){
		options.erase(*it);
	}
}

void TranslationConfig::printUsage(std::ostream& o){
	o << "     --strict                    Treat residue triples and diagnostics as failure" << std::endl;
	o << "     --no-residue-diagnostics    Do not report unconsumed triples as diagnostics" << std::endl;
	o << "     --max-nesting=N             Give up on anonymous expressions nested deeper than N" << std::endl
	  << "                                 (default: 1000)" << std::endl;
}

}

DLVHEX_NAMESPACE_END
