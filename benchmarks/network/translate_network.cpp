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
 * @file 	translate_network.cpp
 *
 * @brief owlrdf-bench: times the translation of a transport network and of deeply nested restrictions.
 *
 * The network is read from a file with one edge per line in the form "edge(a,b)."; without a file
 * a ring with the given number of nodes is generated.
 */

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif // HAVE_CONFIG_H

#include "owlrdf/AxiomAssembler.h"
#include "owlrdf/TranslationContext.h"
#include "owlrdf/Vocabulary.h"

#include "dlvhex2/Logger.h"

#include <algorithm>
#include <iterator>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/lexical_cast.hpp>

using namespace dlvhex;
using namespace dlvhex::owlrdf;

namespace{

const std::string NS = "http://www.kr.tuwien.ac.at/owlrdf/network#";

std::string nodeName(int i){
	std::stringstream ss;
	ss << NS << "n" << i;
	return ss.str();
}

// index of the node, adding it if necessary
int nodeIndex(std::vector<std::string>& nodes, const std::string& node){
	std::vector<std::string>::iterator it = std::find(nodes.begin(), nodes.end(), node);
	if (it != nodes.end()) return static_cast<int>(std::distance(nodes.begin(), it));
	nodes.push_back(node);
	return static_cast<int>(nodes.size()) - 1;
}

void addEdge(TripleStore& store, int from, int to){
	store.assertTriple(Node::named(nodeName(from)), vocab::RDF_TYPE, Node::named(vocab::OWL_THING));
	store.assertTriple(Node::named(nodeName(from)), NS + "edge", Node::named(nodeName(to)));
}

int readNetwork(const std::string& path, TripleStore& store){

	std::ifstream input(path.c_str());
	if (!input){
		std::cerr << "Cannot read " << path << std::endl;
		return -1;
	}

	std::vector<std::string> nodes;
	int edges = 0;
	for (std::string line; getline(input, line); ){
		std::string::size_type p1 = line.find_first_of("(");
		std::string::size_type p2 = line.find_first_of(",");
		std::string::size_type p3 = line.find_first_of(")");
		if (p1 == std::string::npos || p2 == std::string::npos || p3 == std::string::npos) continue;

		int i = nodeIndex(nodes, line.substr(p1 + 1, p2 - p1 - 1));
		int j = nodeIndex(nodes, line.substr(p2 + 1, p3 - p2 - 1));
		addEdge(store, i, j);
		edges++;
	}
	std::cout << "number of nodes: " << nodes.size() << std::endl;
	return edges;
}

int generateRing(int size, TripleStore& store){
	for (int i = 0; i < size; ++i) addEdge(store, i, (i + 1) % size);
	std::cout << "number of nodes: " << size << std::endl;
	return size;
}

// Reachable == edge some (edge some (... Node))
void generateNesting(int depth, TripleStore& store){

	store.assertTriple(Node::named(NS + "edge"), vocab::RDF_TYPE, Node::named(vocab::OWL_OBJECTPROPERTY));
	store.assertTriple(Node::named(NS + "Reachable"), vocab::OWL_EQUIVALENTCLASS, Node::anonymous("r0"));
	for (int d = 0; d < depth; ++d){
		Node r = Node::anonymous("r" + boost::lexical_cast<std::string>(d));
		Node filler = (d + 1 < depth ? Node::anonymous("r" + boost::lexical_cast<std::string>(d + 1)) : Node::named(NS + "Node"));
		store.assertTriple(r, vocab::RDF_TYPE, Node::named(vocab::OWL_RESTRICTION));
		store.assertTriple(r, vocab::OWL_ONPROPERTY, Node::named(NS + "edge"));
		store.assertTriple(r, vocab::OWL_SOMEVALUESFROM, filler);
	}
}

}

int main(int argc, char** argv){

	if (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")){
		std::cout << "Usage: " << argv[0] << " [EDGEFILE | RINGSIZE] [DEPTH]" << std::endl;
		return 0;
	}

	Logger::Instance().setPrintLevels(Logger::ERROR);

	TranslationConfig config;
	config.residueDiagnostics = false;
	TranslationContext ctx(config);

	int edges;
	try{
		edges = generateRing(argc > 1 ? boost::lexical_cast<int>(argv[1]) : 1000, ctx.getStore());
	}catch(const boost::bad_lexical_cast&){
		edges = readNetwork(argv[1], ctx.getStore());
	}
	if (edges < 0) return 1;
	std::cout << "number of edges: " << edges << std::endl;

	int depth = 100;
	if (argc > 2){
		try{
			depth = boost::lexical_cast<int>(argv[2]);
		}catch(const boost::bad_lexical_cast&){
			std::cerr << "Depth must be a number" << std::endl;
			return 1;
		}
	}
	generateNesting(depth, ctx.getStore());
	std::cout << "nesting depth: " << depth << std::endl;
	std::cout << "number of triples: " << ctx.getStore().size() << std::endl;

	boost::posix_time::ptime start = boost::posix_time::microsec_clock::universal_time();
	AxiomAssembler assembler(ctx);
	TranslationResult result = assembler.translateDocument();
	boost::posix_time::time_duration elapsed = boost::posix_time::microsec_clock::universal_time() - start;

	std::cout << "axioms: " << result.axioms.size() << std::endl;
	std::cout << "residue: " << result.residue.size() << std::endl;
	std::cout << "diagnostics: " << result.diagnostics.size() << std::endl;
	std::cout << "translation time: " << elapsed.total_milliseconds() << " ms" << std::endl;
	return 0;
}
