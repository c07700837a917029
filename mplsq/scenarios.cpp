#include "scenarios.h"

#include <algorithm>
#include <limits>

#include "errors.h"
#include "utils.h"

using namespace std;

namespace mplsq {

uint64_t saturating_add(uint64_t a, uint64_t b)
{
	if (a > numeric_limits<uint64_t>::max() - b)
		return numeric_limits<uint64_t>::max();
	return a + b;
}

string Scenario::describe(const Network& network) const
{
	string result = "{";
	for (size_t i = 0; i < failed.size(); i++)
	{
		result += (i == 0 ? " " : ", ") + network.link_name(failed[i]);
	}
	return result + (failed.empty() ? "}" : " }");
}

ScenarioEnumerator::ScenarioEnumerator(const Network& network_i, int k_i)
	: network(network_i), k(k_i), total(0), overflow(false), cursor(0)
{
	for (auto& link : network.links)
		links.push_back(link.id);
	prepare();
}

ScenarioEnumerator::ScenarioEnumerator(const Network& network_i, const vector<int>& candidates_i, int k_i)
	: network(network_i), links(candidates_i), k(k_i), total(0), overflow(false), cursor(0)
{
	for (auto link : links)
	{
		if (link < 0 || link >= (int)network.links.size())
			throw UsageError("failable link id " + to_string(link) + " out of range");
	}
	sort(links.begin(), links.end());
	links.erase(unique(links.begin(), links.end()), links.end());
	prepare();
}

void ScenarioEnumerator::prepare()
{
	if (k < 0)
		throw UsageError("failure bound k must not be negative, got " + to_string(k));
	if (k > (int)links.size())
		k = links.size();

	int n = links.size();
	const uint64_t top = numeric_limits<uint64_t>::max();

	binomial.assign(n + 1, vector<uint64_t>(k + 1, 0));
	for (int i = 0; i <= n; i++)
	{
		binomial[i][0] = 1;
		for (int j = 1; j <= k && j <= i; j++)
		{
			binomial[i][j] = saturating_add(binomial[i - 1][j - 1], binomial[i - 1][j]);
		}
	}

	size_offset.assign(k + 1, 0);
	total = 0;
	for (int s = 0; s <= k; s++)
	{
		size_offset[s] = total;
		total = saturating_add(total, binomial[n][s]);
	}
	overflow = (total == top);

	MPLSQ_LOG(3) << "scenarios over " << n << " links, k=" << k << ": " << total
	             << (overflow ? " (saturated)" : "") << endl;
}

uint64_t ScenarioEnumerator::choose(int n, int r) const
{
	if (r < 0 || n < 0 || r > n)
		return 0;
	return binomial[n][r];
}

bool ScenarioEnumerator::next(Scenario& scenario)
{
	uint64_t index = cursor.fetch_add(1);
	if (index >= total)
		return false;
	scenario = at(index);
	return true;
}

void ScenarioEnumerator::reset()
{
	cursor.store(0);
}

Scenario ScenarioEnumerator::at(uint64_t index) const
{
	if (index >= total)
		throw UsageError("scenario index " + to_string(index) + " out of range");

	int s = k;
	while (s > 0 && size_offset[s] > index)
		s--;
	uint64_t rank = index - size_offset[s];

	Scenario scenario;
	scenario.index = index;
	scenario.mask.assign(network.links.size(), 0);

	int n = links.size();
	int c = 0;
	for (int p = 0; p < s; p++)
	{
		while (true)
		{
			uint64_t count = choose(n - c - 1, s - p - 1);
			if (rank < count)
				break;
			rank -= count;
			c++;
		}
		scenario.failed.push_back(links[c]);
		scenario.mask[links[c]] = 1;
		c++;
	}
	return scenario;
}

// inverse of at(); failed must be a subset of the candidates, at most k long
uint64_t ScenarioEnumerator::index_of(const vector<int>& failed) const
{
	vector<int> positions;
	for (auto link : failed)
	{
		auto it = lower_bound(links.begin(), links.end(), link);
		if (it == links.end() || *it != link)
			throw UsageError("link id " + to_string(link) + " is not failable");
		positions.push_back(it - links.begin());
	}
	sort(positions.begin(), positions.end());
	positions.erase(unique(positions.begin(), positions.end()), positions.end());

	int s = positions.size();
	if (s > k)
		throw UsageError("scenario of " + to_string(s) + " links exceeds k=" + to_string(k));

	int n = links.size();
	uint64_t rank = 0;
	int c = 0;
	for (int p = 0; p < s; p++)
	{
		for (; c < positions[p]; c++)
			rank = saturating_add(rank, choose(n - c - 1, s - p - 1));
		c++;
	}
	return saturating_add(size_offset[s], rank);
}

}
