/**
 * \file dcs/hedonic/scenario.hpp
 *
 * \brief Reading of star hedonic games from scenario files.
 *
 * \author dcsxx-hedonic developers
 *
 * <hr/>
 *
 * Copyright (C) 2026       dcsxx-hedonic developers
 *
 * This file is part of dcsxx-hedonic (below referred to as "this program").
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef DCS_HEDONIC_SCENARIO_HPP
#define DCS_HEDONIC_SCENARIO_HPP


#include <boost/algorithm/string.hpp>
#include <cctype>
#include <cstddef>
#include <dcs/assert.hpp>
#include <dcs/debug.hpp>
#include <dcs/exception.hpp>
#include <dcs/hedonic/commons.hpp>
#include <dcs/hedonic/configuration.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>


namespace dcs { namespace hedonic {

namespace detail {

inline
::std::string line_info(::std::size_t lineno)
{
	::std::ostringstream oss;
	oss << " (at line " << lineno << ")";
	return oss.str();
}

/// Splits a comma-separated list of identifiers, trimming each one.
inline
::std::vector< ::std::string > split_identifiers(::std::string const& s)
{
	::std::vector< ::std::string > ids;

	if (::boost::trim_copy(s).empty())
	{
		return ids;
	}

	::boost::split(ids, s, ::boost::is_any_of(","));
	for (::std::size_t i = 0; i < ids.size(); ++i)
	{
		::boost::trim(ids[i]);
	}

	return ids;
}

/// Parses a strictly positive integer, or returns 0 if \a s is not one.
inline
::std::size_t parse_positive(::std::string const& s)
{
	if (s.empty())
	{
		return 0;
	}
	for (::std::size_t i = 0; i < s.length(); ++i)
	{
		if (!::std::isdigit(static_cast<unsigned char>(s[i])))
		{
			return 0;
		}
	}

	::std::istringstream iss(s);
	::std::size_t n(0);
	iss >> n;

	return iss.fail() ? 0 : n;
}

/// Parses "(act, size) > (act, size) > ...".
inline
preference_list parse_preferences(::std::string const& s, ::std::size_t lineno)
{
	preference_list prefs;

	if (::boost::trim_copy(s).empty())
	{
		return prefs;
	}

	::std::vector< ::std::string > items;
	::boost::split(items, s, ::boost::is_any_of(">"));
	for (::std::size_t i = 0; i < items.size(); ++i)
	{
		const ::std::string item = ::boost::trim_copy(items[i]);

		DCS_ASSERT(item.length() >= 2 && item[0] == '(' && item[item.length()-1] == ')',
				   DCS_EXCEPTION_THROW(configuration_error, "Malformed preference '" + item + "': parentheses are missing" + line_info(lineno)));

		const ::std::string body = item.substr(1, item.length()-2);
		::std::vector< ::std::string > fields;
		::boost::split(fields, body, ::boost::is_any_of(","));

		DCS_ASSERT(fields.size() == 2,
				   DCS_EXCEPTION_THROW(configuration_error, "Malformed preference '" + item + "': expected (activity, size)" + line_info(lineno)));

		const activity_type aid = ::boost::trim_copy(fields[0]);
		const ::std::string size_str = ::boost::trim_copy(fields[1]);
		const ::std::size_t size = parse_positive(size_str);

		DCS_ASSERT(size > 0,
				   DCS_EXCEPTION_THROW(configuration_error, "Group size '" + size_str + "' must be a positive integer" + line_info(lineno)));

		prefs.push_back(preference_entry(aid, size));
	}

	return prefs;
}

} // Namespace detail


/**
 * \brief Reads a star hedonic game.
 *
 * The expected format is line oriented; empty lines and lines starting with
 * '#' are skipped:
 * <pre>
 * central_player: C
 * leaf_players: L1, L2
 * activities:
 * A: 2
 * B: inf
 * </pre>
 * Activities can also be given on a single line (<tt>activities: A, B</tt>),
 * in which case they are unbounded.
 * A <tt>preferences:</tt> section, whose lines read
 * <tt>player: (activity, size) > (activity, size) > ...</tt>, makes the game
 * preference-style.
 */
inline
star_configuration make_scenario(::std::istream& is)
{
	enum section_category
	{
		no_section,
		activities_section,
		preferences_section
	};

	player_type central;
	bool has_central(false);
	::std::vector<player_type> leaves;
	::std::vector<activity_type> activities;
	star_configuration::capacity_map capacities;
	star_configuration::preference_map preferences;
	bool has_capacities(false);
	bool has_preferences(false);
	section_category section(no_section);

	::std::size_t lineno(0);
	for (::std::string line; ::std::getline(is, line); )
	{
		++lineno;

		::boost::trim(line);
		if (line.empty() || line.at(0) == '#')
		{
			// Skip either empty or comment lines
			continue;
		}

		const ::std::size_t colon_pos(line.find(':'));

		DCS_ASSERT(colon_pos != ::std::string::npos,
				   DCS_EXCEPTION_THROW(configuration_error, "Malformed scenario file (':' is missing" + detail::line_info(lineno) + ")"));

		const ::std::string key = ::boost::trim_copy(line.substr(0, colon_pos));
		const ::std::string value = ::boost::trim_copy(line.substr(colon_pos+1));

		if (::boost::iequals(key, "central_player"))
		{
			section = no_section;
			central = value;
			has_central = true;
		}
		else if (::boost::iequals(key, "leaf_players"))
		{
			section = no_section;
			leaves = detail::split_identifiers(value);
		}
		else if (::boost::iequals(key, "activities"))
		{
			if (value.empty())
			{
				section = activities_section;
			}
			else
			{
				section = no_section;
				const ::std::vector<activity_type> ids = detail::split_identifiers(value);
				activities.insert(activities.end(), ids.begin(), ids.end());
			}
		}
		else if (::boost::iequals(key, "preferences"))
		{
			DCS_ASSERT(value.empty(),
					   DCS_EXCEPTION_THROW(configuration_error, "Malformed scenario file (preferences must start on the next line" + detail::line_info(lineno) + ")"));

			section = preferences_section;
			has_preferences = true;
		}
		else if (section == activities_section)
		{
			activities.push_back(key);
			if (::boost::iequals(value, "inf"))
			{
				capacities[key] = star_configuration::capacity_type();
			}
			else
			{
				const ::std::size_t cap = detail::parse_positive(value);

				DCS_ASSERT(cap > 0,
						   DCS_EXCEPTION_THROW(configuration_error, "Capacity '" + value + "' of activity '" + key + "' must be a positive integer or 'inf'" + detail::line_info(lineno)));

				capacities[key] = cap;
			}
			has_capacities = true;
		}
		else if (section == preferences_section)
		{
			DCS_ASSERT(preferences.count(key) == 0,
					   DCS_EXCEPTION_THROW(configuration_error, "Duplicate preferences for player '" + key + "'" + detail::line_info(lineno)));

			preferences[key] = detail::parse_preferences(value, lineno);
		}
		else
		{
			DCS_EXCEPTION_THROW(configuration_error, "Unknown scenario section '" + key + "'" + detail::line_info(lineno));
		}
	}

	DCS_ASSERT(has_central,
			   DCS_EXCEPTION_THROW(configuration_error, "Malformed scenario file (central_player is missing)"));

	if (has_preferences)
	{
		DCS_ASSERT(!has_capacities,
				   DCS_EXCEPTION_THROW(configuration_error, "Capacities and preferences cannot be given together"));

		DCS_DEBUG_TRACE("Preference-style scenario with " << leaves.size() << " leaves and " << activities.size() << " activities");

		return star_configuration::make_preference_configuration(central, leaves, activities, preferences);
	}

	DCS_DEBUG_TRACE("Capacity-style scenario with " << leaves.size() << " leaves and " << activities.size() << " activities");

	return star_configuration::make_capacity_configuration(central, leaves, activities, capacities);
}

inline
star_configuration make_scenario(::std::string const& fname)
{
	DCS_ASSERT(!fname.empty(),
			   DCS_EXCEPTION_THROW(::std::invalid_argument, "Invalid scenario file name"));

	::std::ifstream ifs(fname.c_str());

	DCS_ASSERT(ifs,
			   DCS_EXCEPTION_THROW(::std::runtime_error, "Cannot open scenario file '" + fname + "'"));

	return make_scenario(ifs);
}

}} // Namespace dcs::hedonic


#endif // DCS_HEDONIC_SCENARIO_HPP
