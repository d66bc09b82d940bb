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
 * @file 	main.cpp
 *
 * @brief owlrdf-translate: translates RDF/XML ontologies and prints the resulting axioms.
 */

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif // HAVE_CONFIG_H

#include "owlrdf/AxiomAssembler.h"
#include "owlrdf/Error.h"
#include "owlrdf/ModelPrinter.h"
#include "owlrdf/OwlcppInput.h"
#include "owlrdf/TranslationConfig.h"
#include "owlrdf/TranslationContext.h"

#include "dlvhex2/Logger.h"

#include <iostream>
#include <list>
#include <string>
#include <vector>

#include "boost/foreach.hpp"
#include "boost/program_options.hpp"
#include <boost/filesystem.hpp>
#include <boost/scoped_ptr.hpp>

using namespace dlvhex;
using namespace dlvhex::owlrdf;

namespace po = boost::program_options;

namespace{

const int EXIT_ACCEPTED = 0;
const int EXIT_REJECTED = 1;
const int EXIT_USAGE = 2;

void printUsage(std::ostream& o, const po::options_description& desc){
	o << "Usage: " << PACKAGE_TARNAME << "-translate [options] FILE..." << std::endl
	  << std::endl
	  << "Translates the OWL ontology encoded by each of the given RDF/XML documents on its own" << std::endl
	  << "and prints its axioms, the expressions no axiom refers to and all diagnostics." << std::endl
	  << std::endl
	  << desc << std::endl
	  << "Translation options:" << std::endl;
	TranslationConfig::printUsage(o);
}

void printResult(std::ostream& o, const TranslationResult& result, const ShortFormProvider& sfp){

	if (!result.ontologyIRI.empty()) o << "Ontology(<" << result.ontologyIRI << ">";
	else o << "Ontology(";
	if (!result.versionIRI.empty()) o << " <" << result.versionIRI << ">";
	o << std::endl;
	BOOST_FOREACH (const std::string& import, result.imports){
		o << "Import(<" << import << ">)" << std::endl;
	}
	BOOST_FOREACH (AxiomPtr axiom, result.axioms){
		o << ModelPrinter::toString(axiom, sfp) << std::endl;
	}
	o << ")" << std::endl;

	BOOST_FOREACH (const Translation& expression, result.expressions){
		o << "# unreferenced: " << ModelPrinter::toString(expression, sfp) << std::endl;
	}
	BOOST_FOREACH (const Diagnostic& diagnostic, result.diagnostics){
		std::cerr << diagnostic << std::endl;
	}
}

}

int main(int argc, char** argv){

	po::options_description desc("Options");
	desc.add_options()
		("help,h", "Print this help")
		("version", "Print the version")
		("verbose,v", po::value<unsigned int>()->implicit_value(1), "Verbosity: 1 for progress, 2 for debug output")
		("short-names,s", "Print IRI fragments instead of full IRIs");

	po::options_description hidden;
	hidden.add_options()
		("input-file", po::value<std::vector<std::string> >(), "RDF/XML document");

	po::options_description all;
	all.add(desc).add(hidden);
	po::positional_options_description positional;
	positional.add("input-file", -1);

	po::variables_map vm;
	TranslationConfig config;
	std::vector<std::string> files;
	try{
		po::parsed_options parsed = po::command_line_parser(argc, argv).options(all).positional(positional).allow_unregistered().run();
		po::store(parsed, vm);
		po::notify(vm);

		// everything not known here is a translation option
		std::vector<std::string> unrecognized = po::collect_unrecognized(parsed.options, po::exclude_positional);
		std::list<const char*> options;
		BOOST_FOREACH (const std::string& option, unrecognized){
			options.push_back(option.c_str());
		}
		config.processOptions(options);
		if (!options.empty()){
			std::cerr << "Unknown option " << options.front() << std::endl;
			printUsage(std::cerr, desc);
			return EXIT_USAGE;
		}
	}catch(const po::error& e){
		std::cerr << e.what() << std::endl;
		printUsage(std::cerr, desc);
		return EXIT_USAGE;
	}catch(const ConfigError& e){
		std::cerr << e.what() << std::endl;
		return EXIT_USAGE;
	}

	if (vm.count("help")){
		printUsage(std::cout, desc);
		return EXIT_ACCEPTED;
	}
	if (vm.count("version")){
		std::cout << PACKAGE_TARNAME << "-translate " << OWLRDF_VERSION_MAJOR << "." << OWLRDF_VERSION_MINOR << "." << OWLRDF_VERSION_MICRO << std::endl;
		return EXIT_ACCEPTED;
	}
	if (vm.count("input-file")) files = vm["input-file"].as<std::vector<std::string> >();
	if (files.empty()){
		std::cerr << "No input file given" << std::endl;
		printUsage(std::cerr, desc);
		return EXIT_USAGE;
	}

	Logger::Levels levels = Logger::ERROR | Logger::WARNING;
	if (vm.count("verbose")){
		unsigned int verbose = vm["verbose"].as<unsigned int>();
		if (verbose >= 1) levels |= Logger::INFO;
		if (verbose >= 2) levels |= Logger::DBG;
	}
	Logger::Instance().setPrintLevels(levels);

	boost::scoped_ptr<ShortFormProvider> sfp;
	if (vm.count("short-names")) sfp.reset(new FragmentShortFormProvider());
	else sfp.reset(new FullIRIShortFormProvider());

	// blank node labels are local to a document, so every document gets its own context
	bool accepted = true;
	BOOST_FOREACH (const std::string& file, files){
		TranslationContext ctx(config);
		try{
			if (!boost::filesystem::exists(file)){
				throw InputError("file \"" + file + "\" does not exist");
			}
			loadOntologyFile(file, ctx.getStore());
		}catch(const InputError& e){
			std::cerr << e.what() << std::endl;
			return EXIT_USAGE;
		}

		AxiomAssembler assembler(ctx);
		TranslationResult result = assembler.translateDocument();
		if (files.size() > 1) std::cout << "# " << file << std::endl;
		printResult(std::cout, result, *sfp);
		if (!result.acceptable(config)) accepted = false;
	}

	return accepted ? EXIT_ACCEPTED : EXIT_REJECTED;
}
