/**
 * \file dcs/hedonic/hypotheses.hpp
 *
 * \brief Guesses on the central player outcome and on the activities in use.
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

#ifndef DCS_HEDONIC_HYPOTHESES_HPP
#define DCS_HEDONIC_HYPOTHESES_HPP


#include <algorithm>
#include <cstddef>
#include <dcs/algorithm/combinatorics.hpp>
#include <dcs/debug.hpp>
#include <dcs/hedonic/commons.hpp>
#include <dcs/hedonic/configuration.hpp>
#include <set>
#include <vector>


namespace dcs { namespace hedonic {

namespace detail {

/// Orders index subsets by size first, then lexicographically.
struct subset_size_less
{
	bool operator()(::std::vector< ::std::size_t > const& lhs, ::std::vector< ::std::size_t > const& rhs) const
	{
		if (lhs.size() != rhs.size())
		{
			return lhs.size() < rhs.size();
		}
		return ::std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
	}
}; // subset_size_less

} // Namespace detail


/**
 * \brief Candidate (activity, group size) outcomes for the central player.
 *
 * For capacity-style games, every declared activity is paired with every
 * group size from 1 up to its capacity, clipped to the total number of
 * players.
 * For preference-style games, the central player's own preference list.
 */
inline
::std::vector<center_hypothesis> make_center_hypotheses(star_configuration const& conf)
{
	::std::vector<center_hypothesis> hyps;

	switch (conf.category())
	{
		case capacity_constraint_category:
			{
				const ::std::size_t max_size(conf.num_leaves()+1);
				const ::std::vector<activity_type>& acts = conf.activities();
				for (::std::size_t a = 0; a < acts.size(); ++a)
				{
					const star_configuration::capacity_type cap = conf.capacity(acts[a]);
					const ::std::size_t kmax = cap ? ::std::min(*cap, max_size) : max_size;

					for (::std::size_t k = 1; k <= kmax; ++k)
					{
						hyps.push_back(center_hypothesis(acts[a], k));
					}
				}
			}
			break;
		case preference_constraint_category:
			{
				const preference_list& prefs = conf.preferences(conf.central_player());
				for (::std::size_t i = 0; i < prefs.size(); ++i)
				{
					if (prefs[i].activity != void_activity)
					{
						hyps.push_back(prefs[i]);
					}
				}
			}
			break;
	}

	return hyps;
}

/**
 * \brief Candidate sets of activities in use.
 *
 * The power set of the declared activities (empty set excluded), ordered by
 * increasing size and then by declaration order.
 * For preference-style games under the \c center_preference_activity_subsets
 * policy, a single subset made of the activities listed by the central
 * player.
 */
inline
::std::vector<activity_subset> make_activity_subsets(star_configuration const& conf,
													 activity_subset_policy policy = center_preference_activity_subsets)
{
	namespace alg = ::dcs::algorithm;

	const ::std::vector<activity_type>& acts = conf.activities();

	::std::vector<activity_subset> subsets;

	if (conf.category() == preference_constraint_category && policy == center_preference_activity_subsets)
	{
		const preference_list& prefs = conf.preferences(conf.central_player());

		::std::set<activity_type> listed;
		for (::std::size_t i = 0; i < prefs.size(); ++i)
		{
			listed.insert(prefs[i].activity);
		}

		activity_subset subset;
		for (::std::size_t a = 0; a < acts.size(); ++a)
		{
			if (listed.count(acts[a]) > 0)
			{
				subset.push_back(acts[a]);
			}
		}
		if (!subset.empty())
		{
			subsets.push_back(subset);
		}

		return subsets;
	}

	const ::std::size_t na(acts.size());

	if (na == 0)
	{
		return subsets;
	}

	::std::vector< ::std::size_t > idxs(na);
	for (::std::size_t a = 0; a < na; ++a)
	{
		idxs[a] = a;
	}

	::std::vector< ::std::vector< ::std::size_t > > idx_subsets;

	alg::lexicographic_subset subset(na, false);

	while (subset.has_next())
	{
		typedef alg::subset_traits< ::std::size_t >::element_container element_container;

		const element_container sub = alg::next_subset(idxs.begin(), idxs.end(), subset);

		if (sub.begin() == sub.end())
		{
			continue;
		}

		::std::vector< ::std::size_t > sub_idxs(sub.begin(), sub.end());
		::std::sort(sub_idxs.begin(), sub_idxs.end());
		idx_subsets.push_back(sub_idxs);
	}

	::std::sort(idx_subsets.begin(), idx_subsets.end(), detail::subset_size_less());

	for (::std::size_t s = 0; s < idx_subsets.size(); ++s)
	{
		activity_subset act_sub;
		for (::std::size_t i = 0; i < idx_subsets[s].size(); ++i)
		{
			act_sub.push_back(acts[idx_subsets[s][i]]);
		}

		DCS_DEBUG_TRACE("Activity subset #" << s << ": " << to_string(act_sub));

		subsets.push_back(act_sub);
	}

	return subsets;
}

}} // Namespace dcs::hedonic


#endif // DCS_HEDONIC_HYPOTHESES_HPP
