#include "fixtures.hpp"

#include <dcs/hedonic/colouring.hpp>

#include <boost/random/mersenne_twister.hpp>
#include <boost/smart_ptr.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <vector>

namespace dcs { namespace hedonic { namespace gtest {

typedef base_colouring_sampler::colouring_container colouring_container;

//! Every colouring covers exactly the leaves, with colours taken from the subset or void.
void expectWellFormed(const star_configuration& conf, const activity_subset& subset, const colouring_container& colourings) {
	for (std::size_t c = 0; c < colourings.size(); ++c) {
		ASSERT_EQ(colourings[c].size(), conf.num_leaves());
		for (std::size_t i = 0; i < conf.num_leaves(); ++i) {
			const leaf_assignment::const_iterator it = colourings[c].find(conf.leaf_players()[i]);
			ASSERT_TRUE(it != colourings[c].end());
			EXPECT_TRUE(it->second == void_activity || std::find(subset.begin(), subset.end(), it->second) != subset.end());
		}
	}
}

TEST(AcceptableColours, CapacityStyleTakesWholeSubset) {
	const star_configuration conf = capacityScenario();

	const std::vector<activity_type> colours = acceptable_colours(conf, "L1", ids("A", "B"));

	ASSERT_EQ(colours.size(), 3u);
	EXPECT_EQ(colours[0], "A");
	EXPECT_EQ(colours[1], "B");
	EXPECT_EQ(colours[2], void_activity);
}

TEST(AcceptableColours, PreferenceStyleKeepsListedActivities) {
	const star_configuration conf = preferenceScenario();

	const std::vector<activity_type> wide = acceptable_colours(conf, "L2", ids("A", "B"));
	ASSERT_EQ(wide.size(), 2u);
	EXPECT_EQ(wide[0], "B");
	EXPECT_EQ(wide[1], void_activity);

	// Nothing listed in the subset: void only
	const std::vector<activity_type> narrow = acceptable_colours(conf, "L2", ids("A"));
	ASSERT_EQ(narrow.size(), 1u);
	EXPECT_EQ(narrow[0], void_activity);
}

TEST(RankWeights, EarlierPreferencesWeighMore) {
	star_configuration::preference_map p;
	p["C"] = prefs("A", 1);
	p["L1"] = prefs("B", 1, "A", 2);
	const star_configuration conf = star_configuration::make_preference_configuration("C", ids("L1"), ids("A", "B"), p);

	const std::vector<double> weights = rank_weights(conf, "L1", acceptable_colours(conf, "L1", ids("A", "B")));

	ASSERT_EQ(weights.size(), 3u);
	EXPECT_DOUBLE_EQ(weights[0], 1);
	EXPECT_DOUBLE_EQ(weights[1], 2);
	EXPECT_DOUBLE_EQ(weights[2], 1);
}

TEST(CyclicSampler, RepeatsSameRoundRobinColouring) {
	const star_configuration conf = capacityScenario();
	const cyclic_colouring_sampler sampler(conf, 3);

	const colouring_container colourings = sampler(ids("A", "B"));

	ASSERT_EQ(colourings.size(), 3u);
	for (std::size_t t = 0; t < colourings.size(); ++t) {
		EXPECT_EQ(colourings[t], colouring("L1", "A", "L2", "B"));
	}
	EXPECT_EQ(std::set<leaf_assignment>(colourings.begin(), colourings.end()).size(), 1u);
}

TEST(CyclicSampler, WrapsAroundToVoid) {
	const star_configuration conf = capacityScenario();

	const colouring_container colourings = cyclic_colouring_sampler(conf)(ids("B"));

	ASSERT_EQ(colourings.size(), default_num_trials);
	EXPECT_EQ(colourings.front(), colouring("L1", "B", "L2", "void"));
	EXPECT_EQ(colourings.back(), colourings.front());
}

TEST(ExhaustiveSampler, CartesianProductLastLeafFastest) {
	const star_configuration conf = capacityScenario();
	const exhaustive_colouring_sampler sampler(conf);

	const colouring_container colourings = sampler(ids("A", "B"));

	ASSERT_EQ(colourings.size(), 9u);
	EXPECT_EQ(colourings[0], colouring("L1", "A", "L2", "A"));
	EXPECT_EQ(colourings[1], colouring("L1", "A", "L2", "B"));
	EXPECT_EQ(colourings[8], colouring("L1", "void", "L2", "void"));
	EXPECT_EQ(std::set<leaf_assignment>(colourings.begin(), colourings.end()).size(), 9u);
}

TEST(ExhaustiveSampler, PreferenceStyleFiltersColours) {
	const star_configuration conf = preferenceScenario();
	const exhaustive_colouring_sampler sampler(conf);

	const colouring_container colourings = sampler(ids("A"));

	ASSERT_EQ(colourings.size(), 2u);
	EXPECT_EQ(colourings[0], colouring("L1", "A", "L2", "void"));
	EXPECT_EQ(colourings[1], colouring("L1", "void", "L2", "void"));
}

TEST(Samplers, AllStrategiesProduceCompleteColourings) {
	const star_configuration capConf = capacityScenario();
	const star_configuration prefConf = preferenceScenario();
	const colouring_category categories[] = {cyclic_colouring, uniform_random_colouring, preference_random_colouring, rank_weighted_colouring, exhaustive_colouring};
	const activity_subset subset = ids("A", "B");

	boost::random::mt19937 rng(5489);
	for (std::size_t k = 0; k < sizeof(categories)/sizeof(categories[0]); ++k) {
		const boost::shared_ptr<base_colouring_sampler> capSampler = make_colouring_sampler(categories[k], capConf, rng, 20);
		const colouring_container capColourings = (*capSampler)(subset);
		EXPECT_FALSE(capColourings.empty());
		expectWellFormed(capConf, subset, capColourings);

		const boost::shared_ptr<base_colouring_sampler> prefSampler = make_colouring_sampler(categories[k], prefConf, rng, 20);
		const colouring_container prefColourings = (*prefSampler)(subset);
		EXPECT_FALSE(prefColourings.empty());
		expectWellFormed(prefConf, subset, prefColourings);
	}
}

TEST(Samplers, BoundedSamplersDrawTrialCount) {
	const star_configuration conf = capacityScenario();
	boost::random::mt19937 rng(1);

	EXPECT_EQ((*make_colouring_sampler(uniform_random_colouring, conf, rng, 7))(ids("A")).size(), 7u);
	EXPECT_EQ((*make_colouring_sampler(cyclic_colouring, conf, rng))(ids("A")).size(), default_num_trials);
}

TEST(Samplers, RandomDrawsAreCoveredByExhaustive) {
	const star_configuration conf = outsiderScenario();
	const activity_subset subset = ids("A", "B");

	const colouring_container all = exhaustive_colouring_sampler(conf)(subset);
	const std::set<leaf_assignment> universe(all.begin(), all.end());

	boost::random::mt19937 rng(42);
	const preference_random_colouring_sampler<boost::random::mt19937> uniform(conf, rng, 50);
	const rank_weighted_colouring_sampler<boost::random::mt19937> ranked(conf, rng, 50);

	const colouring_container drawn = uniform(subset);
	const colouring_container weighted = ranked(subset);
	for (std::size_t c = 0; c < drawn.size(); ++c) {
		EXPECT_EQ(universe.count(drawn[c]), 1u);
	}
	for (std::size_t c = 0; c < weighted.size(); ++c) {
		EXPECT_EQ(universe.count(weighted[c]), 1u);
	}
}

TEST(Samplers, SameSeedSameDraws) {
	const star_configuration conf = capacityScenario();

	boost::random::mt19937 rng1(7);
	boost::random::mt19937 rng2(7);
	const uniform_random_colouring_sampler<boost::random::mt19937> s1(conf, rng1, 10);
	const uniform_random_colouring_sampler<boost::random::mt19937> s2(conf, rng2, 10);

	EXPECT_EQ(s1(ids("A", "B")), s2(ids("A", "B")));
}

}}} // Namespace dcs::hedonic::gtest
