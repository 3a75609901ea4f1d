/**
 * \file dcs/hedonic/colouring.hpp
 *
 * \brief Strategies producing candidate assignments of leaves to activities.
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

#ifndef DCS_HEDONIC_COLOURING_HPP
#define DCS_HEDONIC_COLOURING_HPP


#include <boost/random/discrete_distribution.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <boost/smart_ptr.hpp>
#include <cstddef>
#include <dcs/assert.hpp>
#include <dcs/debug.hpp>
#include <dcs/exception.hpp>
#include <dcs/hedonic/commons.hpp>
#include <dcs/hedonic/configuration.hpp>
#include <set>
#include <stdexcept>
#include <vector>


namespace dcs { namespace hedonic {

/**
 * \brief Colours a leaf may take inside the given activity subset.
 *
 * The subset activities (in subset order) followed by the void activity.
 * In preference-style games only the activities the leaf listed are kept.
 * The result is never empty.
 */
inline
::std::vector<activity_type> acceptable_colours(star_configuration const& conf,
												player_type const& leaf,
												activity_subset const& subset)
{
	::std::vector<activity_type> colours;

	if (conf.category() == preference_constraint_category)
	{
		const preference_list& prefs = conf.preferences(leaf);

		::std::set<activity_type> listed;
		for (::std::size_t i = 0; i < prefs.size(); ++i)
		{
			listed.insert(prefs[i].activity);
		}

		for (::std::size_t a = 0; a < subset.size(); ++a)
		{
			if (listed.count(subset[a]) > 0)
			{
				colours.push_back(subset[a]);
			}
		}
	}
	else
	{
		colours.assign(subset.begin(), subset.end());
	}

	colours.push_back(void_activity);

	return colours;
}

/**
 * \brief Sampling weight of each colour in \a colours for the given leaf.
 *
 * A listed activity weighs (list length - rank of its first entry), so that
 * earlier preferences are drawn more often; void weighs 1.
 * In capacity-style games every colour weighs 1.
 */
inline
::std::vector<double> rank_weights(star_configuration const& conf,
								   player_type const& leaf,
								   ::std::vector<activity_type> const& colours)
{
	::std::vector<double> weights(colours.size(), 1);

	if (conf.category() != preference_constraint_category)
	{
		return weights;
	}

	const preference_list& prefs = conf.preferences(leaf);
	const ::std::size_t n(prefs.size());

	for (::std::size_t c = 0; c < colours.size(); ++c)
	{
		if (colours[c] == void_activity)
		{
			continue;
		}

		for (::std::size_t r = 0; r < n; ++r)
		{
			if (prefs[r].activity == colours[c])
			{
				weights[c] = static_cast<double>(n-r);
				break;
			}
		}
	}

	return weights;
}


/**
 * \brief Base class of the colouring strategies.
 *
 * A colouring is a complete map from every leaf player to an activity of the
 * given subset or to the void activity.
 */
class base_colouring_sampler
{
	public: typedef ::std::vector<leaf_assignment> colouring_container;


	public: explicit base_colouring_sampler(star_configuration const& conf)
	: conf_(conf)
	{
	}

	public: virtual ~base_colouring_sampler()
	{
	}

	public: colouring_container operator()(activity_subset const& subset) const
	{
		return this->do_sample(subset);
	}

	protected: star_configuration const& configuration() const
	{
		return conf_;
	}

	private: virtual colouring_container do_sample(activity_subset const& subset) const = 0;


	private: star_configuration const& conf_;
}; // base_colouring_sampler


/**
 * \brief Round-robin assignment of the subset colours (void last).
 *
 * Leaf \c i takes colour <tt>i mod (|subset|+1)</tt>. Every trial yields the
 * same colouring.
 */
class cyclic_colouring_sampler: public base_colouring_sampler
{
	public: explicit cyclic_colouring_sampler(star_configuration const& conf, ::std::size_t num_trials = default_num_trials)
	: base_colouring_sampler(conf),
	  num_trials_(num_trials)
	{
	}

	private: colouring_container do_sample(activity_subset const& subset) const
	{
		const ::std::vector<player_type>& leaves = this->configuration().leaf_players();

		::std::vector<activity_type> colours(subset.begin(), subset.end());
		colours.push_back(void_activity);

		const ::std::size_t nc(colours.size());

		colouring_container colourings;
		for (::std::size_t t = 0; t < num_trials_; ++t)
		{
			leaf_assignment colouring;
			for (::std::size_t i = 0; i < leaves.size(); ++i)
			{
				colouring[leaves[i]] = colours[i % nc];
			}
			colourings.push_back(colouring);
		}

		return colourings;
	}


	private: ::std::size_t num_trials_;
}; // cyclic_colouring_sampler


/// Every leaf independently drawn uniformly from the subset colours and void.
template <typename URNGT>
class uniform_random_colouring_sampler: public base_colouring_sampler
{
	public: uniform_random_colouring_sampler(star_configuration const& conf, URNGT& rng, ::std::size_t num_trials = default_num_trials)
	: base_colouring_sampler(conf),
	  rng_(rng),
	  num_trials_(num_trials)
	{
	}

	private: colouring_container do_sample(activity_subset const& subset) const
	{
		const ::std::vector<player_type>& leaves = this->configuration().leaf_players();

		::std::vector<activity_type> colours(subset.begin(), subset.end());
		colours.push_back(void_activity);

		::boost::random::uniform_int_distribution< ::std::size_t > pick(0, colours.size()-1);

		colouring_container colourings;
		for (::std::size_t t = 0; t < num_trials_; ++t)
		{
			leaf_assignment colouring;
			for (::std::size_t i = 0; i < leaves.size(); ++i)
			{
				colouring[leaves[i]] = colours[pick(rng_)];
			}
			colourings.push_back(colouring);
		}

		return colourings;
	}


	private: URNGT& rng_;
	private: ::std::size_t num_trials_;
}; // uniform_random_colouring_sampler


/// Every leaf drawn uniformly among its acceptable colours.
template <typename URNGT>
class preference_random_colouring_sampler: public base_colouring_sampler
{
	public: preference_random_colouring_sampler(star_configuration const& conf, URNGT& rng, ::std::size_t num_trials = default_num_trials)
	: base_colouring_sampler(conf),
	  rng_(rng),
	  num_trials_(num_trials)
	{
	}

	private: colouring_container do_sample(activity_subset const& subset) const
	{
		const ::std::vector<player_type>& leaves = this->configuration().leaf_players();
		const ::std::size_t nl(leaves.size());

		::std::vector< ::std::vector<activity_type> > colours(nl);
		for (::std::size_t i = 0; i < nl; ++i)
		{
			colours[i] = acceptable_colours(this->configuration(), leaves[i], subset);
		}

		colouring_container colourings;
		for (::std::size_t t = 0; t < num_trials_; ++t)
		{
			leaf_assignment colouring;
			for (::std::size_t i = 0; i < nl; ++i)
			{
				::boost::random::uniform_int_distribution< ::std::size_t > pick(0, colours[i].size()-1);

				colouring[leaves[i]] = colours[i][pick(rng_)];
			}
			colourings.push_back(colouring);
		}

		return colourings;
	}


	private: URNGT& rng_;
	private: ::std::size_t num_trials_;
}; // preference_random_colouring_sampler


/// Every leaf drawn among its acceptable colours with probability proportional to the rank weight.
template <typename URNGT>
class rank_weighted_colouring_sampler: public base_colouring_sampler
{
	public: rank_weighted_colouring_sampler(star_configuration const& conf, URNGT& rng, ::std::size_t num_trials = default_num_trials)
	: base_colouring_sampler(conf),
	  rng_(rng),
	  num_trials_(num_trials)
	{
	}

	private: colouring_container do_sample(activity_subset const& subset) const
	{
		typedef ::boost::random::discrete_distribution< ::std::size_t, double > distribution_type;

		const ::std::vector<player_type>& leaves = this->configuration().leaf_players();
		const ::std::size_t nl(leaves.size());

		::std::vector< ::std::vector<activity_type> > colours(nl);
		::std::vector<distribution_type> picks;
		for (::std::size_t i = 0; i < nl; ++i)
		{
			colours[i] = acceptable_colours(this->configuration(), leaves[i], subset);

			const ::std::vector<double> weights = rank_weights(this->configuration(), leaves[i], colours[i]);
			picks.push_back(distribution_type(weights.begin(), weights.end()));
		}

		colouring_container colourings;
		for (::std::size_t t = 0; t < num_trials_; ++t)
		{
			leaf_assignment colouring;
			for (::std::size_t i = 0; i < nl; ++i)
			{
				colouring[leaves[i]] = colours[i][picks[i](rng_)];
			}
			colourings.push_back(colouring);
		}

		return colourings;
	}


	private: URNGT& rng_;
	private: ::std::size_t num_trials_;
}; // rank_weighted_colouring_sampler


/**
 * \brief Every combination of acceptable colours.
 *
 * Leaves are taken in declaration order, the last one varying fastest.
 * The number of colourings is exponential in the number of leaves.
 */
class exhaustive_colouring_sampler: public base_colouring_sampler
{
	public: explicit exhaustive_colouring_sampler(star_configuration const& conf)
	: base_colouring_sampler(conf)
	{
	}

	private: colouring_container do_sample(activity_subset const& subset) const
	{
		const ::std::vector<player_type>& leaves = this->configuration().leaf_players();
		const ::std::size_t nl(leaves.size());

		::std::vector< ::std::vector<activity_type> > colours(nl);
		for (::std::size_t i = 0; i < nl; ++i)
		{
			colours[i] = acceptable_colours(this->configuration(), leaves[i], subset);
		}

		colouring_container colourings;

		// Odometer over the per-leaf colour indices
		::std::vector< ::std::size_t > digits(nl, 0);
		bool done(false);
		while (!done)
		{
			leaf_assignment colouring;
			for (::std::size_t i = 0; i < nl; ++i)
			{
				colouring[leaves[i]] = colours[i][digits[i]];
			}
			colourings.push_back(colouring);

			done = true;
			for (::std::size_t i = nl; i > 0; --i)
			{
				if (++digits[i-1] < colours[i-1].size())
				{
					done = false;
					break;
				}
				digits[i-1] = 0;
			}
		}

		DCS_DEBUG_TRACE("Subset " << to_string(subset) << ": " << colourings.size() << " colourings");

		return colourings;
	}
}; // exhaustive_colouring_sampler


template <typename URNGT>
::boost::shared_ptr<base_colouring_sampler> make_colouring_sampler(colouring_category category,
																   star_configuration const& conf,
																   URNGT& rng,
																   ::std::size_t num_trials = default_num_trials)
{
	::boost::shared_ptr<base_colouring_sampler> p_sampler;

	switch (category)
	{
		case cyclic_colouring:
			p_sampler = ::boost::make_shared<cyclic_colouring_sampler>(conf, num_trials);
			break;
		case uniform_random_colouring:
			p_sampler = ::boost::make_shared< uniform_random_colouring_sampler<URNGT> >(conf, rng, num_trials);
			break;
		case preference_random_colouring:
			p_sampler = ::boost::make_shared< preference_random_colouring_sampler<URNGT> >(conf, rng, num_trials);
			break;
		case rank_weighted_colouring:
			p_sampler = ::boost::make_shared< rank_weighted_colouring_sampler<URNGT> >(conf, rng, num_trials);
			break;
		case exhaustive_colouring:
			p_sampler = ::boost::make_shared<exhaustive_colouring_sampler>(conf);
			break;
		default:
			DCS_EXCEPTION_THROW(::std::invalid_argument, "Unknown colouring category");
	}

	return p_sampler;
}

}} // Namespace dcs::hedonic


#endif // DCS_HEDONIC_COLOURING_HPP
