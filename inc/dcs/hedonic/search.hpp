/**
 * \file dcs/hedonic/search.hpp
 *
 * \brief Guess-and-check search of Nash-stable assignments.
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

#ifndef DCS_HEDONIC_SEARCH_HPP
#define DCS_HEDONIC_SEARCH_HPP


#include <boost/optional.hpp>
#include <cstddef>
#include <dcs/debug.hpp>
#include <dcs/hedonic/colouring.hpp>
#include <dcs/hedonic/commons.hpp>
#include <dcs/hedonic/configuration.hpp>
#include <dcs/hedonic/hypotheses.hpp>
#include <dcs/hedonic/stability.hpp>
#include <vector>


namespace dcs { namespace hedonic {

/**
 * \brief Search of Nash-stable assignments of a star hedonic game.
 *
 * The search iterates over the center hypotheses (outer loop), then over the
 * activity subsets, then over the colourings produced by a sampler, and
 * feeds every triple to the stability verifier matching the configuration
 * style.
 *
 * Unless the exhaustive sampler is used, an empty result only means that no
 * stable assignment was met among the sampled colourings.
 */
class nash_stable_search
{
	public: explicit nash_stable_search(star_configuration const& conf,
										activity_subset_policy subset_policy = center_preference_activity_subsets)
	: conf_(conf),
	  subset_policy_(subset_policy)
	{
	}

	/// Returns the first stable assignment met, or an empty optional.
	public: ::boost::optional<stable_assignment> find_one(base_colouring_sampler const& sampler)
	{
		::std::vector<stable_assignment> found;

		this->search(sampler, true, found);

		if (found.empty())
		{
			return ::boost::optional<stable_assignment>();
		}

		return found.front();
	}

	/// Returns every stable assignment, using the exhaustive sampler.
	public: ::std::vector<stable_assignment> find_all()
	{
		exhaustive_colouring_sampler sampler(conf_);

		::std::vector<stable_assignment> found;

		this->search(sampler, false, found);

		return found;
	}

	/// Counters of the last search.
	public: search_statistics const& statistics() const
	{
		return stats_;
	}

	private: void search(base_colouring_sampler const& sampler, bool stop_at_first, ::std::vector<stable_assignment>& found)
	{
		switch (conf_.category())
		{
			case capacity_constraint_category:
				this->search(make_capacity_verifier(conf_), sampler, stop_at_first, found);
				break;
			case preference_constraint_category:
				this->search(make_preference_verifier(conf_), sampler, stop_at_first, found);
				break;
		}
	}

	private: template <typename VerifierT>
			 void search(VerifierT const& verifier, base_colouring_sampler const& sampler, bool stop_at_first, ::std::vector<stable_assignment>& found)
	{
		stats_ = search_statistics();

		const ::std::vector<center_hypothesis> hypotheses = make_center_hypotheses(conf_);
		const ::std::vector<activity_subset> subsets = make_activity_subsets(conf_, subset_policy_);

		DCS_DEBUG_TRACE("Searching over " << hypotheses.size() << " center hypotheses and " << subsets.size() << " activity subsets");

		for (::std::size_t h = 0; h < hypotheses.size(); ++h)
		{
			const center_hypothesis& hypothesis = hypotheses[h];

			++stats_.num_hypotheses;

			DCS_DEBUG_TRACE("SELECT_CENTER: " << hypothesis);

			for (::std::size_t s = 0; s < subsets.size(); ++s)
			{
				const activity_subset& subset = subsets[s];

				++stats_.num_subsets;

				DCS_DEBUG_TRACE("SELECT_SUBSET: " << to_string(subset));

				const base_colouring_sampler::colouring_container colourings = sampler(subset);

				DCS_DEBUG_TRACE("SAMPLE: " << colourings.size() << " colourings");

				for (::std::size_t c = 0; c < colourings.size(); ++c)
				{
					occupancy_map occupancies;

					++stats_.num_colourings;

					if (verifier(hypothesis, subset, colourings[c], occupancies))
					{
						++stats_.num_stable;

						found.push_back(make_stable_assignment(conf_, hypothesis, subset, colourings[c], occupancies));

						DCS_DEBUG_TRACE("FOUND: " << found.back());

						if (stop_at_first)
						{
							return;
						}
					}
				}
			}
		}

		DCS_DEBUG_TRACE("EXHAUSTED: " << found.size() << " stable assignments");
	}


	private: star_configuration const& conf_;
	private: activity_subset_policy subset_policy_;
	private: search_statistics stats_;
}; // nash_stable_search

}} // Namespace dcs::hedonic


#endif // DCS_HEDONIC_SEARCH_HPP
