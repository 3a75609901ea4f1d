/**
 * \file dcs/hedonic/stability.hpp
 *
 * \brief Nash-stability check of a candidate assignment.
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

#ifndef DCS_HEDONIC_STABILITY_HPP
#define DCS_HEDONIC_STABILITY_HPP


#include <algorithm>
#include <cstddef>
#include <dcs/debug.hpp>
#include <dcs/hedonic/commons.hpp>
#include <dcs/hedonic/configuration.hpp>
#include <dcs/macro.hpp>
#include <vector>


namespace dcs { namespace hedonic {

/// A player accepts an activity as long as its capacity is not exceeded.
class capacity_constraint
{
	public: explicit capacity_constraint(star_configuration const& conf)
	: conf_(conf)
	{
	}

	public: bool accepts_center(center_hypothesis const& h) const
	{
		return this->accepts(conf_.central_player(), h.activity, h.group_size);
	}

	public: bool accepts(player_type const& pid, activity_type const& aid, ::std::size_t group_size) const
	{
		DCS_MACRO_SUPPRESS_UNUSED_VARIABLE_WARNING( pid );

		const star_configuration::capacity_type cap = conf_.capacity(aid);

		return !cap || group_size <= *cap;
	}


	private: star_configuration const& conf_;
}; // capacity_constraint


/// A player accepts an activity only at a group size it listed.
class preference_constraint
{
	public: explicit preference_constraint(star_configuration const& conf)
	: conf_(conf)
	{
	}

	public: bool accepts_center(center_hypothesis const& h) const
	{
		return this->accepts(conf_.central_player(), h.activity, h.group_size);
	}

	public: bool accepts(player_type const& pid, activity_type const& aid, ::std::size_t group_size) const
	{
		return conf_.prefers(pid, aid, group_size);
	}


	private: star_configuration const& conf_;
}; // preference_constraint


/**
 * \brief Stability predicate for a (hypothesis, subset, colouring) triple.
 *
 * The candidate is stable iff:
 * - the central player accepts the hypothesis (a*,k*);
 * - every leaf is coloured with an activity of the subset or with void;
 * - the occupancy of a* is exactly k*;
 * - every non-void leaf accepts its activity at the resulting occupancy;
 * - no void leaf would accept joining an activity of the subset (i.e., at
 *   its occupancy plus one).
 *
 * Occupancies count the leaves assigned to each activity; the central
 * player is excluded, so the occupancy of a* is k* leaves.
 * The predicate has no side effects other than filling the optional
 * occupancy output.
 */
template <typename ConstraintT>
class stability_verifier
{
	public: typedef ConstraintT constraint_type;


	public: stability_verifier(star_configuration const& conf, constraint_type const& constraint)
	: conf_(conf),
	  constraint_(constraint)
	{
	}

	public: bool operator()(center_hypothesis const& hypothesis,
							activity_subset const& subset,
							leaf_assignment const& colouring) const
	{
		occupancy_map occupancies;

		return this->operator()(hypothesis, subset, colouring, occupancies);
	}

	public: bool operator()(center_hypothesis const& hypothesis,
							activity_subset const& subset,
							leaf_assignment const& colouring,
							occupancy_map& occupancies) const
	{
		occupancies.clear();
		for (::std::size_t a = 0; a < subset.size(); ++a)
		{
			occupancies[subset[a]] = 0;
		}
		occupancies[hypothesis.activity] = 0;
		occupancies[void_activity] = 0;

		if (!constraint_.accepts_center(hypothesis))
		{
			DCS_DEBUG_TRACE("Center hypothesis " << hypothesis << " not acceptable");
			return false;
		}

		const ::std::vector<player_type>& leaves = conf_.leaf_players();

		if (colouring.size() != leaves.size())
		{
			return false;
		}

		// Count the participants of each activity
		for (::std::size_t i = 0; i < leaves.size(); ++i)
		{
			leaf_assignment::const_iterator it(colouring.find(leaves[i]));

			if (it == colouring.end())
			{
				return false;
			}

			const activity_type& aid = it->second;

			if (aid != void_activity && ::std::find(subset.begin(), subset.end(), aid) == subset.end())
			{
				return false;
			}

			++occupancies[aid];
		}

		if (occupancies.at(hypothesis.activity) != hypothesis.group_size)
		{
			return false;
		}

		for (::std::size_t i = 0; i < leaves.size(); ++i)
		{
			const player_type& pid = leaves[i];
			const activity_type& aid = colouring.at(pid);

			if (aid == void_activity)
			{
				// No accepted deviation may be available
				for (::std::size_t a = 0; a < subset.size(); ++a)
				{
					if (subset[a] != void_activity && constraint_.accepts(pid, subset[a], occupancies.at(subset[a])+1))
					{
						DCS_DEBUG_TRACE("Leaf " << pid << " would rather join " << subset[a]);
						return false;
					}
				}
			}
			else if (!constraint_.accepts(pid, aid, occupancies.at(aid)))
			{
				return false;
			}
		}

		return true;
	}


	private: star_configuration const& conf_;
	private: constraint_type constraint_;
}; // stability_verifier


inline
stability_verifier<capacity_constraint> make_capacity_verifier(star_configuration const& conf)
{
	return stability_verifier<capacity_constraint>(conf, capacity_constraint(conf));
}

inline
stability_verifier<preference_constraint> make_preference_verifier(star_configuration const& conf)
{
	return stability_verifier<preference_constraint>(conf, preference_constraint(conf));
}

/// Applies the verifier matching the constraint style of \a conf.
inline
bool is_stable(star_configuration const& conf,
			   center_hypothesis const& hypothesis,
			   activity_subset const& subset,
			   leaf_assignment const& colouring)
{
	switch (conf.category())
	{
		case capacity_constraint_category:
			return make_capacity_verifier(conf)(hypothesis, subset, colouring);
		case preference_constraint_category:
			return make_preference_verifier(conf)(hypothesis, subset, colouring);
	}

	return false;
}

/// The full assignment: the colouring of the leaves plus the central player's activity.
inline
stable_assignment make_stable_assignment(star_configuration const& conf,
										 center_hypothesis const& hypothesis,
										 activity_subset const& subset,
										 leaf_assignment const& colouring,
										 occupancy_map const& occupancies)
{
	stable_assignment res;

	res.activities = colouring;
	res.activities[conf.central_player()] = hypothesis.activity;
	res.hypothesis = hypothesis;
	res.subset = subset;
	res.occupancies = occupancies;

	return res;
}

}} // Namespace dcs::hedonic


#endif // DCS_HEDONIC_STABILITY_HPP
