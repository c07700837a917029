#ifndef MPLSQ_SCENARIOS_H
#define MPLSQ_SCENARIOS_H

#include <vector>
#include <string>
#include <iostream>
#include <atomic>
#include <cstdint>

#include "network.h"

namespace mplsq {

// A set of failed links. Never mutates the network it refers to.
class Scenario
{
	public:
		uint64_t index;
		std::vector<int> failed;
		std::vector<char> mask;

		Scenario() : index(0) {}

		bool is_failed(int link) const { return link >= 0 && link < (int)mask.size() && mask[link]; }
		size_t size() const { return failed.size(); }

		std::string describe(const Network& network) const;
};

// Lazy enumeration of every subset of size 0..k of the failable links,
// smallest sets first, lexicographic (by link id) within a size. Scenario
// number i is unranked from i directly, so nothing is materialised and
// next() can be shared by several threads.
class ScenarioEnumerator
{
	public:
		ScenarioEnumerator(const Network& network_i, int k_i);
		ScenarioEnumerator(const Network& network_i, const std::vector<int>& candidates_i, int k_i);

		uint64_t size() const { return total; }
		bool saturated() const { return overflow; }
		bool exceeds(uint64_t limit) const { return overflow || total > limit; }

		int bound() const { return k; }
		const std::vector<int>& candidates() const { return links; }

		// hands out each scenario exactly once; false when exhausted
		bool next(Scenario& scenario);
		void reset();

		Scenario at(uint64_t index) const;
		uint64_t index_of(const std::vector<int>& failed) const;

	private:
		const Network& network;
		std::vector<int> links;
		int k;

		std::vector<std::vector<uint64_t>> binomial;
		std::vector<uint64_t> size_offset;
		uint64_t total;
		bool overflow;

		std::atomic<uint64_t> cursor;

		void prepare();
		uint64_t choose(int n, int r) const;
};

uint64_t saturating_add(uint64_t a, uint64_t b);

}

#endif
