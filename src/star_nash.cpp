/**
 * \file src/star_nash.cpp
 *
 * \brief Search a Nash-stable assignment of a star hedonic game.
 *
 * \author dcsxx-hedonic developers
 *
 * <hr/>
 *
 * Copyright 2026 dcsxx-hedonic developers
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */


#include <boost/optional.hpp>
#include <boost/random.hpp>
#include <boost/smart_ptr.hpp>
#include <boost/timer.hpp>
#include <cstddef>
#include <dcs/cli.hpp>
#include <dcs/debug.hpp>
#include <dcs/hedonic.hpp>
#include <dcs/logging.hpp>
#include <exception>
#include <iostream>
#include <string>
#include <vector>


namespace cli = dcs::cli;
namespace hedonic = dcs::hedonic;


static const short VERBOSITY_NONE = 0;
static const short VERBOSITY_LOW = 1;
static const short VERBOSITY_MEDIUM = 5;
static const short VERBOSITY_HIGH = 9;


namespace /*<unnamed>*/ { namespace detail {

struct options
{
	options()
	: colouring(hedonic::cyclic_colouring),
	  subset_policy(hedonic::center_preference_activity_subsets),
	  num_trials(hedonic::default_num_trials),
	  find_all(false),
	  rng_seed(5489),
	  verbosity(VERBOSITY_NONE)
	{
	}

	hedonic::colouring_category colouring; ///< The strategy used to sample leaf colourings
	hedonic::activity_subset_policy subset_policy; ///< The activities leaves may use in preference-style games
	std::size_t num_trials; ///< Number of colourings drawn by bounded samplers per activity subset
	bool find_all; ///< A \c true value means that all stable assignments are computed
	unsigned long rng_seed; ///< The seed used for random number generation
	short verbosity; ///< The verbosity level: 0 for 'minimum' and 9 for 'maximum' verbosity level
}; // options

void report(hedonic::star_configuration const& conf, hedonic::stable_assignment const& res, short verbosity)
{
	std::cout << " * Central player " << conf.central_player() << " => " << res.hypothesis.activity << std::endl;
	for (std::size_t i = 0; i < conf.leaf_players().size(); ++i)
	{
		const hedonic::player_type& pid = conf.leaf_players()[i];

		std::cout << "   Leaf " << pid << " => " << res.activities.at(pid) << std::endl;
	}
	if (verbosity >= VERBOSITY_LOW)
	{
		std::cout << "   Center hypothesis: " << res.hypothesis << " - Activity subset: " << hedonic::to_string(res.subset) << std::endl;
	}
	if (verbosity >= VERBOSITY_MEDIUM)
	{
		std::cout << "   Leaf occupancies (central player excluded):";
		typedef hedonic::occupancy_map::const_iterator occupancy_iterator;
		occupancy_iterator occ_end_it(res.occupancies.end());
		for (occupancy_iterator occ_it = res.occupancies.begin(); occ_it != occ_end_it; ++occ_it)
		{
			std::cout << " " << occ_it->first << "=" << occ_it->second;
		}
		std::cout << std::endl;
	}
}

template <typename URNGT>
void run(hedonic::star_configuration const& conf, options const& opts, URNGT& rng)
{
	if (opts.verbosity >= VERBOSITY_LOW)
	{
		std::cout << "-- CONFIGURATION:" << std::endl << conf << std::endl;
	}

	hedonic::nash_stable_search search(conf, opts.subset_policy);

	boost::timer timer;

	if (opts.find_all)
	{
		const std::vector<hedonic::stable_assignment> found = search.find_all();

		std::cout << "-- STABLE ASSIGNMENTS: " << found.size() << std::endl;
		for (std::size_t i = 0; i < found.size(); ++i)
		{
			std::cout << "- Assignment #" << (i+1) << std::endl;
			report(conf, found[i], opts.verbosity);
		}
	}
	else
	{
		boost::shared_ptr<hedonic::base_colouring_sampler> p_sampler;
		p_sampler = hedonic::make_colouring_sampler(opts.colouring, conf, rng, opts.num_trials);

		const boost::optional<hedonic::stable_assignment> found = search.find_one(*p_sampler);

		if (found)
		{
			std::cout << "-- STABLE ASSIGNMENT:" << std::endl;
			report(conf, *found, opts.verbosity);
		}
		else
		{
			std::cout << "-- No stable assignment found" << std::endl;
			if (opts.colouring != hedonic::exhaustive_colouring)
			{
				dcs::log_warn(DCS_LOGGING_AT, "The colourings were sampled: a stable assignment may still exist.");
			}
		}
	}

	const hedonic::search_statistics& stats = search.statistics();

	std::cout << "-- STATISTICS:" << std::endl
			  << " * Center hypotheses: " << stats.num_hypotheses << std::endl
			  << " * (Hypothesis, subset) pairs: " << stats.num_subsets << std::endl
			  << " * Verified colourings: " << stats.num_colourings << std::endl
			  << " * Stable colourings: " << stats.num_stable << std::endl;
	std::cout << "**** ELAPSED TIME: " << timer.elapsed() << std::endl;
}

void usage(char const* progname)
{
	std::cerr << "Usage: " << progname << " [options]" << std::endl
			  << "Options:" << std::endl
			  << "--help" << std::endl
			  << "  Show this message." << std::endl
			  << "--find-all" << std::endl
			  << "  Enumerate all colourings and report every stable assignment." << std::endl
			  << "--rng-seed <num>" << std::endl
			  << "  Set the seed to use for random number generation." << std::endl
			  << "--sampler {'cyclic'|'uniform'|'preference'|'rank'|'exhaustive'}" << std::endl
			  << "  The strategy used to colour the leaf players, where:" << std::endl
			  << "  * 'cyclic' assigns the activities round-robin;" << std::endl
			  << "  * 'uniform' draws every activity with the same probability;" << std::endl
			  << "  * 'preference' draws uniformly among the activities a leaf listed;" << std::endl
			  << "  * 'rank' draws the activities a leaf listed, favouring the top ranked;" << std::endl
			  << "  * 'exhaustive' enumerates every colouring." << std::endl
			  << "  Defaults to 'cyclic' for capacity-style and 'preference' for preference-style scenarios." << std::endl
			  << "--scenario <file>" << std::endl
			  << "  The path to the file describing the game." << std::endl
			  << "--subsets {'center'|'all'}" << std::endl
			  << "  The activities leaves may use in preference-style scenarios:" << std::endl
			  << "  * 'center': only the activities listed by the central player;" << std::endl
			  << "  * 'all': every non-empty subset of the declared activities." << std::endl
			  << "--trials <num>" << std::endl
			  << "  Number of colourings drawn per activity subset by non-exhaustive samplers." << std::endl
			  << "--verbosity <num>" << std::endl
			  << "  An integer number in [0,9] representing the verbosity level (0 for 'minimum verbosity' and 9 for 'maximum verbosity)." << std::endl
			  << std::endl;
}

}} // Namespace <unnamed>::detail


int main(int argc, char* argv[])
{
	bool opt_help;
	bool opt_find_all;
	unsigned long opt_rng_seed;
	std::string opt_sampler;
	std::string opt_scenario_file;
	std::string opt_subsets;
	long opt_trials;
	short opt_verbosity;

	// Parse CLI options
	DCS_DEBUG_TRACE("Parse CLI options...");
	opt_help = cli::simple::get_option(argv, argv+argc, "--help");
	if (opt_help)
	{
		detail::usage(argv[0]);
		return 0;
	}
	opt_find_all = cli::simple::get_option(argv, argv+argc, "--find-all");
	opt_rng_seed = cli::simple::get_option<unsigned long>(argv, argv+argc, "--rng-seed", 5489);
	opt_sampler = cli::simple::get_option<std::string>(argv, argv+argc, "--sampler", "");
	opt_scenario_file = cli::simple::get_option<std::string>(argv, argv+argc, "--scenario");
	opt_subsets = cli::simple::get_option<std::string>(argv, argv+argc, "--subsets", "center");
	opt_trials = cli::simple::get_option<long>(argv, argv+argc, "--trials", static_cast<long>(hedonic::default_num_trials));
	opt_verbosity = cli::simple::get_option<short>(argv, argv+argc, "--verbosity", VERBOSITY_NONE);
	if (opt_verbosity < 0)
	{
		opt_verbosity = 0;
	}
	else if (opt_verbosity > VERBOSITY_HIGH)
	{
		opt_verbosity = VERBOSITY_HIGH;
	}

	// Check CLI options
	if (opt_scenario_file.empty())
	{
		dcs::log_error(DCS_LOGGING_AT, "Scenario file not specified.");
		detail::usage(argv[0]);
		return 1;
	}
	if (opt_trials <= 0)
	{
		dcs::log_error(DCS_LOGGING_AT, "The number of trials must be a positive number.");
		detail::usage(argv[0]);
		return 1;
	}

	detail::options options;
	options.find_all = opt_find_all;
	options.num_trials = static_cast<std::size_t>(opt_trials);
	options.rng_seed = opt_rng_seed;
	options.verbosity = opt_verbosity;
	if (opt_subsets == "center")
	{
		options.subset_policy = hedonic::center_preference_activity_subsets;
	}
	else if (opt_subsets == "all")
	{
		options.subset_policy = hedonic::all_activity_subsets;
	}
	else
	{
		dcs::log_error(DCS_LOGGING_AT, "Unknown activity subset policy.");
		detail::usage(argv[0]);
		return 1;
	}

	// Prepare the game
	DCS_DEBUG_TRACE("Reading the scenario...");
	boost::optional<hedonic::star_configuration> conf;
	try
	{
		conf = hedonic::make_scenario(opt_scenario_file);
	}
	catch (std::exception const& e)
	{
		dcs::log_error(DCS_LOGGING_AT, std::string("Invalid scenario: ") + e.what());
		return 1;
	}

	if (opt_sampler.empty())
	{
		options.colouring = (conf->category() == hedonic::preference_constraint_category)
							? hedonic::preference_random_colouring
							: hedonic::cyclic_colouring;
	}
	else if (opt_sampler == "cyclic")
	{
		options.colouring = hedonic::cyclic_colouring;
	}
	else if (opt_sampler == "uniform")
	{
		options.colouring = hedonic::uniform_random_colouring;
	}
	else if (opt_sampler == "preference")
	{
		options.colouring = hedonic::preference_random_colouring;
	}
	else if (opt_sampler == "rank")
	{
		options.colouring = hedonic::rank_weighted_colouring;
	}
	else if (opt_sampler == "exhaustive")
	{
		options.colouring = hedonic::exhaustive_colouring;
	}
	else
	{
		dcs::log_error(DCS_LOGGING_AT, "Unknown colouring sampler.");
		detail::usage(argv[0]);
		return 1;
	}

	boost::random::mt19937 rng(options.rng_seed);

	// Run the search
	DCS_DEBUG_TRACE("Run the search...");
	detail::run(*conf, options, rng);
}
