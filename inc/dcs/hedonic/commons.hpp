/**
 * \file dcs/hedonic/commons.hpp
 *
 * \brief Common types for Nash-stable assignments in star hedonic games.
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

#ifndef DCS_HEDONIC_COMMONS_HPP
#define DCS_HEDONIC_COMMONS_HPP


#include <cstddef>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>


namespace dcs { namespace hedonic {

typedef ::std::string player_type;
typedef ::std::string activity_type;

/// The activity meaning "opt out of all activities"; always available, never bounded.
static const activity_type void_activity("void");

/// Number of colourings drawn by the bounded samplers for each activity subset.
static const ::std::size_t default_num_trials = 100;

enum constraint_category
{
	capacity_constraint_category,
	preference_constraint_category
};

enum colouring_category
{
	cyclic_colouring,
	uniform_random_colouring,
	preference_random_colouring,
	rank_weighted_colouring,
	exhaustive_colouring
};

/// Which activities the leaves may use in preference-style games.
enum activity_subset_policy
{
	center_preference_activity_subsets, ///< Only the activities of the central player's preference list
	all_activity_subsets ///< Every non-empty subset of the declared activities
};

/**
 * \brief An (activity, group size) pair.
 *
 * Used both as a guess on the outcome of the central player and as an entry
 * of a preference list.
 */
struct activity_group
{
	activity_group()
	: activity(),
	  group_size(0)
	{
	}

	activity_group(activity_type const& a, ::std::size_t k)
	: activity(a),
	  group_size(k)
	{
	}

	activity_type activity;
	::std::size_t group_size;
};

inline
bool operator==(activity_group const& lhs, activity_group const& rhs)
{
	return lhs.activity == rhs.activity && lhs.group_size == rhs.group_size;
}

inline
bool operator!=(activity_group const& lhs, activity_group const& rhs)
{
	return !(lhs == rhs);
}

template <typename CharT, typename CharTraitsT>
::std::basic_ostream<CharT,CharTraitsT>& operator<<(::std::basic_ostream<CharT,CharTraitsT>& os, activity_group const& g)
{
	return os << "(" << g.activity << ", " << g.group_size << ")";
}

typedef activity_group center_hypothesis;
typedef activity_group preference_entry;
typedef ::std::vector<preference_entry> preference_list;
typedef ::std::vector<activity_type> activity_subset;
typedef ::std::map<player_type,activity_type> leaf_assignment;
typedef ::std::map<activity_type,::std::size_t> occupancy_map;

/// A stable assignment together with the guesses that produced it.
struct stable_assignment
{
	::std::map<player_type,activity_type> activities; ///< Every player, central one included, mapped to its activity
	center_hypothesis hypothesis;
	activity_subset subset;
	occupancy_map occupancies; ///< Number of leaves per activity; the central player is not counted
};

struct search_statistics
{
	search_statistics()
	: num_hypotheses(0),
	  num_subsets(0),
	  num_colourings(0),
	  num_stable(0)
	{
	}

	::std::size_t num_hypotheses; ///< Center hypotheses selected
	::std::size_t num_subsets; ///< (hypothesis, subset) pairs selected
	::std::size_t num_colourings; ///< Candidate colourings verified
	::std::size_t num_stable; ///< Candidate colourings found stable
};

inline
::std::string to_string(activity_subset const& subset)
{
	::std::ostringstream oss;

	oss << "{";
	for (::std::size_t i = 0; i < subset.size(); ++i)
	{
		if (i > 0)
		{
			oss << ", ";
		}
		oss << subset[i];
	}
	oss << "}";

	return oss.str();
}

inline
::std::string to_string(::std::map<player_type,activity_type> const& assignment)
{
	::std::ostringstream oss;

	oss << "{";
	typedef ::std::map<player_type,activity_type>::const_iterator iterator;
	iterator end_it(assignment.end());
	for (iterator it = assignment.begin(); it != end_it; ++it)
	{
		if (it != assignment.begin())
		{
			oss << ", ";
		}
		oss << it->first << "=>" << it->second;
	}
	oss << "}";

	return oss.str();
}

template <typename CharT, typename CharTraitsT>
::std::basic_ostream<CharT,CharTraitsT>& operator<<(::std::basic_ostream<CharT,CharTraitsT>& os, stable_assignment const& s)
{
	return os << to_string(s.activities) << " [center: " << s.hypothesis << ", subset: " << to_string(s.subset) << "]";
}

}} // Namespace dcs::hedonic


#endif // DCS_HEDONIC_COMMONS_HPP
