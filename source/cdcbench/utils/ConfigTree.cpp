/*  This file is part of CdcBench, a verification harness for clock domain crossing FIFOs.
	Copyright (C) 2021 Michael Offel, Andreas Ley

	CdcBench is free software; you can redistribute it and/or
	modify it under the terms of the GNU Lesser General Public
	License as published by the Free Software Foundation; either
	version 3 of the License, or (at your option) any later version.

	CdcBench is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
	Lesser General Public License for more details.

	You should have received a copy of the GNU Lesser General Public
	License along with this library; if not, write to the Free Software
	Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
*/
#include "cdcbench/pch.h"

#include "ConfigTree.h"

#include <boost/spirit/home/x3.hpp>
#include <cstdlib>


namespace cdcb::utils
{
	std::string replaceEnvVars(const std::string& src)
	{
		using namespace boost::spirit::x3;

		std::string ret;
		ret.reserve(src.size());

		auto append_var = [&](auto& ctx) {
			const std::string var_name = _attr(ctx);
			const char* var = std::getenv(var_name.c_str());
			if (!var)
				throw DesignError(__FILE__, __LINE__, "environment variable '" + var_name + "' not found.");
			ret += var;
		};
		auto append_char = [&](auto& ctx) {
			ret += _attr(ctx);
		};

		auto parser = *((lit('$') >> '(' >> (*(char_ - ')'))[append_var] >> ')') | char_[append_char]);
		bool valid = parse(src.cbegin(), src.cend(), parser);
		CDCB_ASSERT(valid);
		return ret;
	}

	ConfigTree::ConfigTree(YAML::Node node) :
		m_node(node)
	{
	}

	bool ConfigTree::isDefined() const
	{
		return m_node && m_node->IsDefined();
	}

	bool ConfigTree::isNull() const
	{
		return m_node && m_node->IsNull();
	}

	bool ConfigTree::isScalar() const
	{
		return m_node && m_node->IsScalar();
	}

	bool ConfigTree::isSequence() const
	{
		return m_node && m_node->IsSequence();
	}

	bool ConfigTree::isMap() const
	{
		return m_node && m_node->IsMap();
	}

	ConfigTree::iterator ConfigTree::begin() const
	{
		if (isSequence())
			return iterator{ m_node->begin() };
		return iterator{};
	}

	ConfigTree::iterator ConfigTree::end() const
	{
		if (isSequence())
			return iterator{ m_node->end() };
		return iterator{};
	}

	size_t ConfigTree::size() const
	{
		if (isSequence())
			return m_node->size();
		return 0;
	}

	ConfigTree ConfigTree::operator[](size_t index) const
	{
		if (isSequence() && index < m_node->size())
			return ConfigTree{ (*m_node)[index] };
		return ConfigTree();
	}

	ConfigTree ConfigTree::operator[](std::string_view path) const
	{
		if (!isMap())
			return ConfigTree();

		// yaml-cpp's operator[] on a const node does not insert, but returns a zombie node when the key is missing.
		YAML::Node current = *m_node;
		while (!path.empty()) {
			size_t split = path.find('/');
			std::string key{ path.substr(0, split) };
			path = split == std::string_view::npos ? std::string_view{} : path.substr(split + 1);

			if (!current.IsMap())
				return ConfigTree();

			const YAML::Node &constCurrent = current;
			YAML::Node child = constCurrent[key];
			if (!child)
				return ConfigTree();
			current.reset(child);
		}
		return ConfigTree{ current };
	}

	void ConfigTree::loadFromFile(const std::filesystem::path &filename)
	{
		YAML::Node root;
		try {
			root = YAML::LoadFile(filename.string());
		} catch (const YAML::Exception &e) {
			throw DesignError(__FILE__, __LINE__, "Could not load config file " + filename.string() + ": " + e.what());
		}
		CDCB_DESIGNCHECK_HINT(root.IsMap() || root.IsNull(), filename.string() + " is not a yaml map");
		m_node = root;
	}

	void ConfigTree::loadFromString(const std::string &yaml)
	{
		YAML::Node root;
		try {
			root = YAML::Load(yaml);
		} catch (const YAML::Exception &e) {
			throw DesignError(__FILE__, __LINE__, std::string("Could not parse config: ") + e.what());
		}
		CDCB_DESIGNCHECK_HINT(root.IsMap() || root.IsNull(), "config is not a yaml map");
		m_node = root;
	}
}
