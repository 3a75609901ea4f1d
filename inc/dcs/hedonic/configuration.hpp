/**
 * \file dcs/hedonic/configuration.hpp
 *
 * \brief Players, activities and constraints of a star hedonic game.
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

#ifndef DCS_HEDONIC_CONFIGURATION_HPP
#define DCS_HEDONIC_CONFIGURATION_HPP


#include <boost/optional.hpp>
#include <cstddef>
#include <dcs/assert.hpp>
#include <dcs/exception.hpp>
#include <dcs/hedonic/commons.hpp>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>


namespace dcs { namespace hedonic {

/// Malformed or inconsistent game description.
class configuration_error: public ::std::runtime_error
{
	public: explicit configuration_error(::std::string const& msg)
	: ::std::runtime_error(msg)
	{
	}
}; // configuration_error


/**
 * \brief Immutable description of a star hedonic game.
 *
 * A configuration is either capacity-style (every activity has a maximum
 * occupancy, possibly unbounded) or preference-style (every player lists the
 * (activity, group size) pairs it accepts, in order of preference).
 * Instances are built by the two factory functions, which validate the input
 * and throw a \c configuration_error on failure.
 */
class star_configuration
{
	public: typedef ::boost::optional< ::std::size_t > capacity_type;
	public: typedef ::std::map<activity_type,capacity_type> capacity_map;
	public: typedef ::std::map<player_type,preference_list> preference_map;


	/**
	 * \brief Build a capacity-style configuration.
	 *
	 * Activities missing from \a capacities, or mapped to an empty optional,
	 * are unbounded.
	 */
	public: static star_configuration make_capacity_configuration(player_type const& central_player,
																   ::std::vector<player_type> const& leaf_players,
																   ::std::vector<activity_type> const& activities,
																   capacity_map const& capacities)
	{
		star_configuration conf(capacity_constraint_category, central_player, leaf_players, activities);

		conf.check_players();
		conf.check_activities();

		typedef capacity_map::const_iterator capacity_iterator;
		capacity_iterator cap_end_it(capacities.end());
		for (capacity_iterator cap_it = capacities.begin(); cap_it != cap_end_it; ++cap_it)
		{
			DCS_ASSERT(conf.activity_set_.count(cap_it->first) > 0,
					   DCS_EXCEPTION_THROW(configuration_error, "Capacity given for undeclared activity '" + cap_it->first + "'"));
			DCS_ASSERT(!cap_it->second || *(cap_it->second) > 0,
					   DCS_EXCEPTION_THROW(configuration_error, "Capacity of activity '" + cap_it->first + "' must be positive"));
		}
		conf.capacities_ = capacities;

		return conf;
	}

	/**
	 * \brief Build a preference-style configuration.
	 *
	 * Every player, central one included, must have an entry in
	 * \a preferences (possibly an empty list).
	 * Entries may name the void activity.
	 */
	public: static star_configuration make_preference_configuration(player_type const& central_player,
																	 ::std::vector<player_type> const& leaf_players,
																	 ::std::vector<activity_type> const& activities,
																	 preference_map const& preferences)
	{
		star_configuration conf(preference_constraint_category, central_player, leaf_players, activities);

		conf.check_players();
		conf.check_activities();

		typedef preference_map::const_iterator preference_iterator;
		preference_iterator pref_end_it(preferences.end());
		for (preference_iterator pref_it = preferences.begin(); pref_it != pref_end_it; ++pref_it)
		{
			const player_type& pid = pref_it->first;

			DCS_ASSERT(pid == central_player || conf.leaf_set_.count(pid) > 0,
					   DCS_EXCEPTION_THROW(configuration_error, "Preferences given for unknown player '" + pid + "'"));

			for (::std::size_t i = 0; i < pref_it->second.size(); ++i)
			{
				const preference_entry& entry = pref_it->second[i];

				DCS_ASSERT(entry.activity == void_activity || conf.activity_set_.count(entry.activity) > 0,
						   DCS_EXCEPTION_THROW(configuration_error, "Preference of player '" + pid + "' references undeclared activity '" + entry.activity + "'"));
				DCS_ASSERT(entry.group_size > 0,
						   DCS_EXCEPTION_THROW(configuration_error, "Preference of player '" + pid + "' has a zero group size"));
			}
		}

		DCS_ASSERT(preferences.count(central_player) > 0,
				   DCS_EXCEPTION_THROW(configuration_error, "Central player '" + central_player + "' has no preference entry"));
		for (::std::size_t i = 0; i < leaf_players.size(); ++i)
		{
			DCS_ASSERT(preferences.count(leaf_players[i]) > 0,
					   DCS_EXCEPTION_THROW(configuration_error, "Leaf player '" + leaf_players[i] + "' has no preference entry"));
		}
		conf.preferences_ = preferences;

		return conf;
	}

	public: constraint_category category() const
	{
		return category_;
	}

	public: player_type const& central_player() const
	{
		return central_;
	}

	public: ::std::vector<player_type> const& leaf_players() const
	{
		return leaves_;
	}

	public: ::std::size_t num_leaves() const
	{
		return leaves_.size();
	}

	public: bool is_leaf(player_type const& pid) const
	{
		return leaf_set_.count(pid) > 0;
	}

	public: ::std::vector<activity_type> const& activities() const
	{
		return activities_;
	}

	public: bool has_activity(activity_type const& aid) const
	{
		return activity_set_.count(aid) > 0;
	}

	/// The capacity of the given activity; an empty optional means unbounded.
	public: capacity_type capacity(activity_type const& aid) const
	{
		DCS_ASSERT(category_ == capacity_constraint_category,
				   DCS_EXCEPTION_THROW(::std::logic_error, "Capacities are only defined for capacity-style configurations"));

		if (aid == void_activity)
		{
			return capacity_type();
		}

		DCS_ASSERT(activity_set_.count(aid) > 0,
				   DCS_EXCEPTION_THROW(::std::invalid_argument, "Unknown activity '" + aid + "'"));

		capacity_map::const_iterator it(capacities_.find(aid));
		if (it == capacities_.end())
		{
			return capacity_type();
		}
		return it->second;
	}

	public: preference_list const& preferences(player_type const& pid) const
	{
		DCS_ASSERT(category_ == preference_constraint_category,
				   DCS_EXCEPTION_THROW(::std::logic_error, "Preferences are only defined for preference-style configurations"));

		preference_map::const_iterator it(preferences_.find(pid));

		DCS_ASSERT(it != preferences_.end(),
				   DCS_EXCEPTION_THROW(::std::invalid_argument, "Unknown player '" + pid + "'"));

		return it->second;
	}

	/// Tells if \a pid listed the pair (\a aid, \a group_size).
	public: bool prefers(player_type const& pid, activity_type const& aid, ::std::size_t group_size) const
	{
		const preference_list& prefs = this->preferences(pid);

		for (::std::size_t i = 0; i < prefs.size(); ++i)
		{
			if (prefs[i].activity == aid && prefs[i].group_size == group_size)
			{
				return true;
			}
		}

		return false;
	}

	private: star_configuration(constraint_category category,
								player_type const& central_player,
								::std::vector<player_type> const& leaf_players,
								::std::vector<activity_type> const& activities)
	: category_(category),
	  central_(central_player),
	  leaves_(leaf_players),
	  leaf_set_(leaf_players.begin(), leaf_players.end()),
	  activities_(activities),
	  activity_set_(activities.begin(), activities.end())
	{
	}

	private: void check_players() const
	{
		DCS_ASSERT(!central_.empty(),
				   DCS_EXCEPTION_THROW(configuration_error, "Central player identifier is empty"));

		::std::set<player_type> seen;
		for (::std::size_t i = 0; i < leaves_.size(); ++i)
		{
			const player_type& pid = leaves_[i];

			DCS_ASSERT(!pid.empty(),
					   DCS_EXCEPTION_THROW(configuration_error, "Leaf player identifier is empty"));
			DCS_ASSERT(pid != central_,
					   DCS_EXCEPTION_THROW(configuration_error, "Central player '" + central_ + "' is also listed among the leaf players"));
			DCS_ASSERT(seen.insert(pid).second,
					   DCS_EXCEPTION_THROW(configuration_error, "Duplicate leaf player '" + pid + "'"));
		}
	}

	private: void check_activities() const
	{
		::std::set<activity_type> seen;
		for (::std::size_t i = 0; i < activities_.size(); ++i)
		{
			const activity_type& aid = activities_[i];

			DCS_ASSERT(!aid.empty(),
					   DCS_EXCEPTION_THROW(configuration_error, "Activity identifier is empty"));
			DCS_ASSERT(aid != void_activity,
					   DCS_EXCEPTION_THROW(configuration_error, "Activity name '" + void_activity + "' is reserved"));
			DCS_ASSERT(seen.insert(aid).second,
					   DCS_EXCEPTION_THROW(configuration_error, "Duplicate activity '" + aid + "'"));
		}
	}


	private: constraint_category category_;
	private: player_type central_;
	private: ::std::vector<player_type> leaves_;
	private: ::std::set<player_type> leaf_set_;
	private: ::std::vector<activity_type> activities_;
	private: ::std::set<activity_type> activity_set_;
	private: capacity_map capacities_;
	private: preference_map preferences_;
}; // star_configuration


template <typename CharT, typename CharTraitsT>
::std::basic_ostream<CharT,CharTraitsT>& operator<<(::std::basic_ostream<CharT,CharTraitsT>& os, star_configuration const& conf)
{
	os << "Central player: " << conf.central_player() << ::std::endl;

	os << "Leaf players: [";
	for (::std::size_t i = 0; i < conf.leaf_players().size(); ++i)
	{
		os << conf.leaf_players()[i] << ",";
	}
	os << "]" << ::std::endl;

	os << "Activities: [";
	for (::std::size_t i = 0; i < conf.activities().size(); ++i)
	{
		const activity_type& aid = conf.activities()[i];

		os << aid;
		if (conf.category() == capacity_constraint_category)
		{
			const star_configuration::capacity_type cap = conf.capacity(aid);
			if (cap)
			{
				os << ":" << *cap;
			}
			else
			{
				os << ":inf";
			}
		}
		os << ",";
	}
	os << "]";

	if (conf.category() == preference_constraint_category)
	{
		os << ::std::endl << "Preferences:";

		::std::vector<player_type> players(1, conf.central_player());
		players.insert(players.end(), conf.leaf_players().begin(), conf.leaf_players().end());
		for (::std::size_t p = 0; p < players.size(); ++p)
		{
			const preference_list& prefs = conf.preferences(players[p]);

			os << ::std::endl << "  " << players[p] << ": ";
			for (::std::size_t i = 0; i < prefs.size(); ++i)
			{
				if (i > 0)
				{
					os << " > ";
				}
				os << prefs[i];
			}
		}
	}

	return os;
}

}} // Namespace dcs::hedonic


#endif // DCS_HEDONIC_CONFIGURATION_HPP
