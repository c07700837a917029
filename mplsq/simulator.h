#ifndef MPLSQ_SIMULATOR_H
#define MPLSQ_SIMULATOR_H

#include <vector>
#include <string>
#include <iostream>
#include <set>
#include <atomic>
#include <cstdint>

#include "network.h"
#include "scenarios.h"
#include "config.h"

namespace mplsq {

enum Outcome { DELIVERED, DROPPED, MALFORMED, UNREACHABLE, LOOP, CANCELLED };

std::string outcome_name(Outcome outcome);

class Trace
{
	public:
		std::vector<std::string> routers;
		std::vector<int> links;
		LabelStack stack;
		Outcome outcome;
		int hops;

		Trace() : outcome(DROPPED), hops(0) {}
};

class Ingress
{
	public:
		int router;
		int interface;
};

// Cancelled once the shared bound drops below the worker's own position.
class CancelToken
{
	public:
		const std::atomic<uint64_t>* bound;
		uint64_t position;

		CancelToken() : bound(0), position(0) {}
		CancelToken(const std::atomic<uint64_t>* bound_i, uint64_t position_i) : bound(bound_i), position(position_i) {}

		bool cancelled() const { return bound != 0 && bound->load() < position; }
};

// Link state as seen by the simulator. Scenario based probing answers from
// the scenario mask; the symbolic engine substitutes its own oracle.
class LinkOracle
{
	public:
		virtual ~LinkOracle() {}
		virtual bool failed(int link) = 0;
};

class ScenarioOracle : public LinkOracle
{
	public:
		explicit ScenarioOracle(const Scenario& scenario_i) : scenario(scenario_i) {}
		bool failed(int link) { return scenario.is_failed(link); }

	private:
		const Scenario& scenario;
};

class Simulator
{
	public:
		Simulator(const Network& network_i, int max_hops_i = MPLSQ_DEFAULT_MAX_HOPS)
			: network(network_i), max_hops(max_hops_i) {}

		void set_egress(const std::set<int>& egress_i) { egress = egress_i; }

		Trace run(const Scenario& scenario, const Ingress& ingress, const LabelStack& initial,
		          const CancelToken& cancel = CancelToken()) const;

		Trace run(LinkOracle& oracle, const Ingress& ingress, const LabelStack& initial,
		          const CancelToken& cancel = CancelToken()) const;

	private:
		const Network& network;
		int max_hops;
		std::set<int> egress;
};

// false when the action list cannot be applied to the stack
bool apply_actions(const std::vector<Action>& actions, LabelStack& stack);

}

#endif
