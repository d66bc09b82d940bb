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
 * @file 	OwlcppInput.cpp
 *
 * @brief Conversion of owlcpp triples into translator triples.
 */

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif // HAVE_CONFIG_H

#include "owlrdf/OwlcppInput.h"
#include "owlrdf/Error.h"

#include "dlvhex2/Logger.h"

#include "owlcpp/rdf/triple_store.hpp"
#include "owlcpp/rdf/print_node.hpp"
#include "owlcpp/rdf/node_blank.hpp"
#include "owlcpp/rdf/node_literal.hpp"
#include "owlcpp/io/input.hpp"
#include "owlcpp/terms/node_tags_system.hpp"

#include "boost/foreach.hpp"

DLVHEX_NAMESPACE_BEGIN

namespace owlrdf{

namespace{

NodeID importNode(const owlcpp::Node_id id, const owlcpp::Triple_store& source, TripleStore& target, const owlcpp::Doc_id document){

	const owlcpp::Node& node = source[id];

	// blank node ids are unique within the source store
	if (dynamic_cast<const owlcpp::Node_blank*>(&node)){
		return target.storeBlank(id(), document);
	}

	if (const owlcpp::Node_literal* literal = dynamic_cast<const owlcpp::Node_literal*>(&node)){
		std::string datatype;
		if (literal->datatype() != owlcpp::terms::empty_::id()) datatype = owlcpp::to_string_full(literal->datatype(), source);
		std::string language;
		if (const owlcpp::Node_string* str = dynamic_cast<const owlcpp::Node_string*>(literal)){
			language = str->language();
		}
		return target.storeNode(Node::literal(literal->value_str(), datatype, language));
	}

	return target.storeNode(Node::named(owlcpp::to_string_full(id, source)));
}

}

std::size_t importTriples(const owlcpp::Triple_store& source, TripleStore& target, const std::string& documentIRI){

	const owlcpp::Doc_id document = target.addDocument(documentIRI);

	std::size_t count = 0;
	BOOST_FOREACH(owlcpp::Triple const& t, source.map_triple()) {
		NodeID subject = importNode(t.subj_, source, target, document);
		NodeID predicate = importNode(t.pred_, source, target, document);
		NodeID object = importNode(t.obj_, source, target, document);

		DBGLOG(DBG, "Current triple: " << target.getNode(subject) << " / " << target.getNode(predicate) << " / " << target.getNode(object));
		target.assertTriple(subject, predicate, object);
		++count;
	}
	return count;
}

std::size_t loadOntologyFile(const std::string& path, TripleStore& target){

	owlcpp::Triple_store store;
	try{
		DBGLOG(DBG, "Reading file " << path);
		owlcpp::load_file(path, store);
	}catch(const std::exception& e){
		throw InputError("failed to load file \"" + path + "\", ensure that it is a valid RDF/XML document: " + e.what());
	}

	std::size_t count = importTriples(store, target, path);
	LOG(INFO, "Read " << count << " triples from " << path);
	return count;
}

}

DLVHEX_NAMESPACE_END
