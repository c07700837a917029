#include "simulator.h"

using namespace std;

namespace mplsq {

string outcome_name(Outcome outcome)
{
	switch (outcome)
	{
		case DELIVERED:
			return "Delivered";
		case DROPPED:
			return "Dropped";
		case MALFORMED:
			return "Malformed";
		case UNREACHABLE:
			return "Unreachable";
		case LOOP:
			return "Loop";
		case CANCELLED:
			return "Cancelled";
	}
	return "Unknown";
}

bool apply_actions(const vector<Action>& actions, LabelStack& stack)
{
	for (auto& action : actions)
	{
		switch (action.type)
		{
			case PUSH:
				stack.insert(stack.begin(), action.label);
				break;
			case SWAP:
				if (stack.empty())
					return false;
				stack.front() = action.label;
				break;
			case POP:
				if (stack.empty())
					return false;
				stack.erase(stack.begin());
				break;
		}
	}
	return true;
}

Trace Simulator::run(const Scenario& scenario, const Ingress& ingress, const LabelStack& initial,
                     const CancelToken& cancel) const
{
	ScenarioOracle oracle(scenario);
	return run(oracle, ingress, initial, cancel);
}

Trace Simulator::run(LinkOracle& oracle, const Ingress& ingress, const LabelStack& initial,
                     const CancelToken& cancel) const
{
	Trace trace;
	trace.routers.push_back(network.routers[ingress.router].name);
	trace.stack = initial;

	if (egress.count(ingress.router))
	{
		trace.outcome = DELIVERED;
		return trace;
	}

	// every (incoming interface, stack) pair met so far
	set<pair<int, LabelStack>> seen;
	int in = ingress.interface;

	while (true)
	{
		if (cancel.cancelled())
		{
			trace.outcome = CANCELLED;
			break;
		}
		if (!seen.insert(make_pair(in, trace.stack)).second || trace.hops >= max_hops)
		{
			trace.outcome = LOOP;
			break;
		}

		const string& top = trace.stack.empty() ? NO_LABEL : trace.stack.front();
		const Rule* rule = network.find_rule(in, top);
		if (rule == 0)
		{
			trace.outcome = DROPPED;
			break;
		}

		const Route* route = 0;
		for (auto& candidate : rule->routes)
		{
			if (!oracle.failed(network.interfaces[candidate.out].link))
			{
				route = &candidate;
				break;
			}
		}
		bool blocked = (route == 0);
		if (blocked)
			route = &rule->routes.front();

		LabelStack next = trace.stack;
		if (!apply_actions(route->actions, next))
		{
			trace.outcome = MALFORMED;
			break;
		}
		if (blocked)
		{
			trace.outcome = UNREACHABLE;
			break;
		}

		int link = network.interfaces[route->out].link;
		in = network.partner(route->out);
		int router = network.interfaces[in].router;

		trace.stack = next;
		trace.links.push_back(link);
		trace.routers.push_back(network.routers[router].name);
		trace.hops++;

		if (egress.count(router))
		{
			trace.outcome = DELIVERED;
			break;
		}
	}

	return trace;
}

}
