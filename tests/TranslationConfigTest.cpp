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
 * @file 	TranslationConfigTest.cpp
 *
 * @brief Tests of option processing.
 */

#include "owlrdf/Error.h"
#include "owlrdf/TranslationConfig.h"

#include <gtest/gtest.h>

#include <list>
#include <sstream>
#include <string>

using namespace dlvhex::owlrdf;

TEST(TranslationConfigTest, Defaults){
	TranslationConfig config;
	EXPECT_FALSE(config.strict);
	EXPECT_TRUE(config.residueDiagnostics);
	EXPECT_EQ(1000u, config.maxNesting);
}

TEST(TranslationConfigTest, KnownOptionsAreConsumed){
	std::list<const char*> options;
	options.push_back("--strict");
	options.push_back("--verbose");
	options.push_back("--max-nesting=12");
	options.push_back("--no-residue-diagnostics");

	TranslationConfig config;
	config.processOptions(options);
	EXPECT_TRUE(config.strict);
	EXPECT_FALSE(config.residueDiagnostics);
	EXPECT_EQ(12u, config.maxNesting);

	ASSERT_EQ(1u, options.size());
	EXPECT_EQ(std::string("--verbose"), options.front());
}

TEST(TranslationConfigTest, InvalidNestingLimitIsRejected){
	const char* invalid[] = { "--max-nesting=", "--max-nesting=abc", "--max-nesting=-3", "--max-nesting=0", "--max-nesting=99999999999999999999" };
	for (unsigned int i = 0; i < sizeof(invalid) / sizeof(invalid[0]); ++i){
		std::list<const char*> options;
		options.push_back(invalid[i]);
		TranslationConfig config;
		EXPECT_THROW(config.processOptions(options), ConfigError) << invalid[i];
	}
}

TEST(TranslationConfigTest, UsageListsAllOptions){
	std::stringstream ss;
	TranslationConfig::printUsage(ss);
	EXPECT_NE(std::string::npos, ss.str().find("--strict"));
	EXPECT_NE(std::string::npos, ss.str().find("--no-residue-diagnostics"));
	EXPECT_NE(std::string::npos, ss.str().find("--max-nesting=N"));
}
