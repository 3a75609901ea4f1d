#include "fixtures.hpp"

#include <dcs/hedonic/hypotheses.hpp>

#include <gtest/gtest.h>

#include <vector>

namespace dcs { namespace hedonic { namespace gtest {

TEST(CenterHypotheses, CapacityStyleIsActivityMajor) {
	const star_configuration conf = capacityScenario();

	const std::vector<center_hypothesis> hyps = make_center_hypotheses(conf);

	ASSERT_EQ(hyps.size(), 3u);
	EXPECT_EQ(hyps[0], center_hypothesis("A", 1));
	EXPECT_EQ(hyps[1], center_hypothesis("A", 2));
	EXPECT_EQ(hyps[2], center_hypothesis("B", 1));
}

TEST(CenterHypotheses, UnboundedIsClippedToPopulation) {
	const star_configuration::capacity_map caps;
	const star_configuration conf = star_configuration::make_capacity_configuration("C", ids("L1", "L2"), ids("A"), caps);

	const std::vector<center_hypothesis> hyps = make_center_hypotheses(conf);

	ASSERT_EQ(hyps.size(), 3u);
	EXPECT_EQ(hyps.back(), center_hypothesis("A", 3));
}

TEST(CenterHypotheses, LargeCapacityIsClippedToPopulation) {
	star_configuration::capacity_map caps;
	caps["A"] = std::size_t(10);
	const star_configuration conf = star_configuration::make_capacity_configuration("C", ids("L1"), ids("A"), caps);

	EXPECT_EQ(make_center_hypotheses(conf).size(), 2u);
}

TEST(CenterHypotheses, PreferenceStyleFollowsCenterList) {
	star_configuration::preference_map p;
	p["C"] = prefs("B", 1, "A", 2);
	p["C"].push_back(preference_entry(void_activity, 1));
	p["L1"] = prefs("A", 2);
	const star_configuration conf = star_configuration::make_preference_configuration("C", ids("L1"), ids("A", "B"), p);

	const std::vector<center_hypothesis> hyps = make_center_hypotheses(conf);

	ASSERT_EQ(hyps.size(), 2u);
	EXPECT_EQ(hyps[0], center_hypothesis("B", 1));
	EXPECT_EQ(hyps[1], center_hypothesis("A", 2));
}

TEST(ActivitySubsets, PowerSetBySizeThenDeclarationOrder) {
	const star_configuration::capacity_map caps;
	const star_configuration conf = star_configuration::make_capacity_configuration("C", ids("L1"), ids("A", "B", "D"), caps);

	const std::vector<activity_subset> subsets = make_activity_subsets(conf);

	ASSERT_EQ(subsets.size(), 7u);
	EXPECT_EQ(to_string(subsets[0]), "{A}");
	EXPECT_EQ(to_string(subsets[1]), "{B}");
	EXPECT_EQ(to_string(subsets[2]), "{D}");
	EXPECT_EQ(to_string(subsets[3]), "{A, B}");
	EXPECT_EQ(to_string(subsets[4]), "{A, D}");
	EXPECT_EQ(to_string(subsets[5]), "{B, D}");
	EXPECT_EQ(to_string(subsets[6]), "{A, B, D}");
}

TEST(ActivitySubsets, NoActivities) {
	const star_configuration::capacity_map caps;
	const star_configuration conf = star_configuration::make_capacity_configuration("C", ids("L1"), std::vector<activity_type>(), caps);

	EXPECT_TRUE(make_activity_subsets(conf).empty());
	EXPECT_TRUE(make_center_hypotheses(conf).empty());
}

TEST(ActivitySubsets, PreferenceStyleUsesCenterActivities) {
	const star_configuration conf = preferenceScenario();

	const std::vector<activity_subset> subsets = make_activity_subsets(conf);

	ASSERT_EQ(subsets.size(), 1u);
	EXPECT_EQ(to_string(subsets.front()), "{A}");
}

TEST(ActivitySubsets, PreferenceStyleCanBeWidened) {
	const star_configuration conf = preferenceScenario();

	const std::vector<activity_subset> subsets = make_activity_subsets(conf, all_activity_subsets);

	ASSERT_EQ(subsets.size(), 3u);
	EXPECT_EQ(to_string(subsets.back()), "{A, B}");
}

}}} // Namespace dcs::hedonic::gtest
