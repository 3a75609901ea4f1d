#include <dcs/hedonic/configuration.hpp>
#include <dcs/hedonic/scenario.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

namespace dcs { namespace hedonic { namespace gtest {

star_configuration parse(const std::string& text) {
	std::istringstream iss(text);
	return make_scenario(iss);
}

TEST(Scenario, CapacitySections) {
	const star_configuration conf = parse(
		"# Two leaves, two activities\n"
		"central_player: C\n"
		"leaf_players: L1, L2\n"
		"\n"
		"activities:\n"
		"A: 2\n"
		"B: inf\n");

	EXPECT_EQ(conf.category(), capacity_constraint_category);
	EXPECT_EQ(conf.central_player(), "C");
	ASSERT_EQ(conf.num_leaves(), 2u);
	EXPECT_EQ(conf.leaf_players()[1], "L2");
	ASSERT_EQ(conf.activities().size(), 2u);
	ASSERT_TRUE(conf.capacity("A"));
	EXPECT_EQ(*conf.capacity("A"), 2u);
	EXPECT_FALSE(conf.capacity("B"));
}

TEST(Scenario, InlineActivitiesAreUnbounded) {
	const star_configuration conf = parse(
		"Central_Player: C\n"
		"leaf_players: L1\n"
		"activities: A, B\n");

	EXPECT_EQ(conf.category(), capacity_constraint_category);
	EXPECT_EQ(conf.activities().size(), 2u);
	EXPECT_FALSE(conf.capacity("A"));
}

TEST(Scenario, PreferenceSection) {
	const star_configuration conf = parse(
		"central_player: C\n"
		"leaf_players: L1, L2\n"
		"activities: A, B\n"
		"preferences:\n"
		"C: (A, 2)\n"
		"L1: (A, 2) > (B,1)\n"
		"L2:\n");

	EXPECT_EQ(conf.category(), preference_constraint_category);
	ASSERT_EQ(conf.preferences("L1").size(), 2u);
	EXPECT_EQ(conf.preferences("L1")[1], preference_entry("B", 1));
	EXPECT_TRUE(conf.preferences("L2").empty());
}

TEST(Scenario, MalformedInput) {
	EXPECT_THROW(parse("leaf_players: L1\nactivities: A\n"), configuration_error);
	EXPECT_THROW(parse("central_player C\n"), configuration_error);
	EXPECT_THROW(parse("central_player: C\nleaf_players: L1\nactivities:\nA: 0\n"), configuration_error);
	EXPECT_THROW(parse("central_player: C\nleaf_players: L1\nactivities:\nA: -1\n"), configuration_error);
	EXPECT_THROW(parse("central_player: C\nleaf_players: L1\nactivities:\nA: two\n"), configuration_error);
	EXPECT_THROW(parse("central_player: C\nleaf_players: L1\nwhatever: A\n"), configuration_error);
	EXPECT_THROW(parse("central_player: C\nleaf_players: C\nactivities: A\n"), configuration_error);
}

TEST(Scenario, MalformedPreferences) {
	const std::string head("central_player: C\nleaf_players: L1\nactivities: A\npreferences:\n");

	EXPECT_THROW(parse(head + "C: (A, 1)\nL1: A, 1\n"), configuration_error);
	EXPECT_THROW(parse(head + "C: (A, 1)\nL1: (A)\n"), configuration_error);
	EXPECT_THROW(parse(head + "C: (A, 1)\nL1: (A, 0)\n"), configuration_error);
	EXPECT_THROW(parse(head + "C: (A, 1)\nL1: (A, 1)\nL1: (A, 1)\n"), configuration_error);
	EXPECT_THROW(parse(head + "C: (A, 1)\nL1: (Z, 1)\n"), configuration_error);
	EXPECT_THROW(parse(head + "C: (A, 1)\n"), configuration_error);
}

TEST(Scenario, CapacitiesAndPreferencesAreExclusive) {
	EXPECT_THROW(parse(
		"central_player: C\n"
		"leaf_players: L1\n"
		"activities:\n"
		"A: 1\n"
		"preferences:\n"
		"C: (A, 1)\n"
		"L1: (A, 1)\n"), configuration_error);
}

TEST(Scenario, ShippedScenarios) {
	const std::string dir(DCS_HEDONIC_SCENARIO_DIR);

	EXPECT_EQ(make_scenario(dir + "/capacity.scenario").category(), capacity_constraint_category);
	EXPECT_EQ(make_scenario(dir + "/preference.scenario").category(), preference_constraint_category);
	EXPECT_EQ(make_scenario(dir + "/boundary.scenario").num_leaves(), 1u);
	EXPECT_FALSE(make_scenario(dir + "/unbounded.scenario").capacity("Walk"));
}

TEST(Scenario, Files) {
	EXPECT_THROW(make_scenario(std::string()), std::invalid_argument);
	EXPECT_THROW(make_scenario(std::string("/nonexistent/star.scenario")), std::runtime_error);
}

}}} // Namespace dcs::hedonic::gtest
