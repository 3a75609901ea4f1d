#ifndef DCS_HEDONIC_TEST_FIXTURES_HPP
#define DCS_HEDONIC_TEST_FIXTURES_HPP

#include <dcs/hedonic/commons.hpp>
#include <dcs/hedonic/configuration.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace dcs { namespace hedonic { namespace gtest {

inline std::vector<std::string> ids(const char* a) {
	return std::vector<std::string>(1, a);
}

inline std::vector<std::string> ids(const char* a, const char* b) {
	std::vector<std::string> v;
	v.push_back(a);
	v.push_back(b);
	return v;
}

inline std::vector<std::string> ids(const char* a, const char* b, const char* c) {
	std::vector<std::string> v = ids(a, b);
	v.push_back(c);
	return v;
}

inline preference_list prefs(const char* a, std::size_t k) {
	return preference_list(1, preference_entry(a, k));
}

inline preference_list prefs(const char* a, std::size_t k, const char* b, std::size_t h) {
	preference_list p = prefs(a, k);
	p.push_back(preference_entry(b, h));
	return p;
}

//! C, leaves {L1, L2}, activities {A: 2, B: 1}.
inline star_configuration capacityScenario() {
	star_configuration::capacity_map caps;
	caps["A"] = std::size_t(2);
	caps["B"] = std::size_t(1);
	return star_configuration::make_capacity_configuration("C", ids("L1", "L2"), ids("A", "B"), caps);
}

//! C: (A,2); L1: (A,2); L2: (B,1).
inline star_configuration preferenceScenario() {
	star_configuration::preference_map p;
	p["C"] = prefs("A", 2);
	p["L1"] = prefs("A", 2);
	p["L2"] = prefs("B", 1);
	return star_configuration::make_preference_configuration("C", ids("L1", "L2"), ids("A", "B"), p);
}

//! C: (A,1); L1: (A,1); L2: (B,1). L2 can only be stable on B when B is in use.
inline star_configuration outsiderScenario() {
	star_configuration::preference_map p;
	p["C"] = prefs("A", 1);
	p["L1"] = prefs("A", 1);
	p["L2"] = prefs("B", 1);
	return star_configuration::make_preference_configuration("C", ids("L1", "L2"), ids("A", "B"), p);
}

//! C, single leaf L1, one activity A with capacity 1.
inline star_configuration boundaryScenario() {
	star_configuration::capacity_map caps;
	caps["A"] = std::size_t(1);
	return star_configuration::make_capacity_configuration("C", ids("L1"), ids("A"), caps);
}

inline leaf_assignment colouring(const char* l1, const char* a1) {
	leaf_assignment L;
	L[l1] = a1;
	return L;
}

inline leaf_assignment colouring(const char* l1, const char* a1, const char* l2, const char* a2) {
	leaf_assignment L = colouring(l1, a1);
	L[l2] = a2;
	return L;
}

}}} // Namespace dcs::hedonic::gtest

#endif // DCS_HEDONIC_TEST_FIXTURES_HPP
