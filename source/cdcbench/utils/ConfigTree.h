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
#pragma once

#include "Exceptions.h"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cdcb::utils
{
	/// Replaces all occurrences of $(NAME) by the value of the environment variable NAME.
	std::string replaceEnvVars(const std::string& src);

	/**
	 * @brief Read only view on a yaml configuration.
	 * @details Nested maps are addressed by '/' separated paths, e.g. config["clocks/write/period_ns"].
	 * Missing entries yield an undefined tree for which as(def) returns the default.
	 * Scalars starting with '$' are subject to environment variable substitution.
	 */
	class ConfigTree
	{
	public:
		struct iterator {
			YAML::Node::const_iterator it;

			void operator++() { ++it; }
			ConfigTree operator*() const { return ConfigTree(*it); }
			bool operator==(const iterator& rhs) const { return it == rhs.it; }
			bool operator!=(const iterator& rhs) const { return it != rhs.it; }
		};

	public:
		ConfigTree() = default;
		explicit ConfigTree(YAML::Node node);

		explicit operator bool() const { return isDefined(); }
		bool isDefined() const;
		bool isNull() const;
		bool isScalar() const;
		bool isSequence() const;
		bool isMap() const;

		iterator begin() const;
		iterator end() const;
		size_t size() const;
		ConfigTree operator[](size_t index) const;

		ConfigTree operator[](std::string_view path) const;
		template<typename T> T as(const T& def) const;
		template<typename T> T as() const;

		void loadFromFile(const std::filesystem::path &filename);
		void loadFromString(const std::string &yaml);

	protected:
		std::optional<YAML::Node> m_node;

		template<typename T> T convert() const;
	};

	template<typename T>
	inline T ConfigTree::convert() const
	{
		const YAML::Node &node = *m_node;
		if (node.IsScalar()) {
			const std::string &raw = node.Scalar();
			if (!raw.empty() && raw[0] == '$') {
				std::string str = replaceEnvVars(raw);
				// Substituted scalars go through the same yaml-cpp conversion as literal ones.
				try {
					return YAML::Node(str).as<T>();
				} catch (const YAML::Exception &e) {
					throw DesignError(__FILE__, __LINE__, "Invalid config value '" + str + "' substituted from '" + raw + "': " + e.what());
				}
			}
		}

		try {
			return node.as<T>();
		} catch (const YAML::Exception &e) {
			throw DesignError(__FILE__, __LINE__, std::string("Invalid config value: ") + e.what());
		}
	}

	template<typename T>
	inline T ConfigTree::as(const T& def) const
	{
		if (!isDefined() || isNull())
			return def;
		return convert<T>();
	}

	template<typename T>
	inline T ConfigTree::as() const
	{
		CDCB_DESIGNCHECK_HINT(isDefined(), "non optional config value not found");
		return convert<T>();
	}

	template<>
	inline std::string ConfigTree::as(const std::string& def) const
	{
		if (!isDefined() || isNull())
			return replaceEnvVars(def);
		return replaceEnvVars(m_node->as<std::string>());
	}

	template<>
	inline std::string ConfigTree::as() const
	{
		CDCB_DESIGNCHECK_HINT(isDefined(), "non optional config value not found");
		return replaceEnvVars(m_node->as<std::string>());
	}
}
