#include "evaluator.h"

#include <thread>
#include <functional>
#include <limits>
#include <algorithm>

#include <boost/algorithm/string/join.hpp>

#include "errors.h"
#include "symbolic.h"
#include "utils.h"

using namespace std;

namespace mplsq {

Evaluator::Evaluator(const Network& network_i, const Query& query_i, const EvaluationOptions& options_i)
	: network(network_i), query(query_i), options(options_i), sim(network_i, options_i.max_hops),
	  k(0), best(numeric_limits<uint64_t>::max()), examined(0)
{
	resolve();
}

void Evaluator::resolve()
{
	if (options.max_hops <= 0)
		throw UsageError("hop bound must be positive, got " + to_string(options.max_hops));
	if (options.threads <= 0 || options.threads > MPLSQ_MAX_THREADS)
		throw UsageError("thread count must be in 1.." + to_string(MPLSQ_MAX_THREADS) + ", got " + to_string(options.threads));

	if (options.k != NONE)
		k = options.k;
	else if (query.k != NONE)
		k = query.k;
	else
		k = 0;
	if (k < 0)
		throw UsageError("failure bound k must not be negative, got " + to_string(k));

	set<int> egress;
	for (auto& name : options.egress)
	{
		int router = network.find_router(name);
		if (router == NONE)
			throw UsageError("unknown egress router '" + name + "'");
		egress.insert(router);
	}
	sim.set_egress(egress);

	for (auto& name : options.failable)
	{
		int link = network.find_link(name);
		if (link == NONE)
			throw UsageError("unknown or ambiguous link '" + name + "'");
		failable.push_back(link);
	}
	if (options.failable.empty())
	{
		for (auto& link : network.links)
			failable.push_back(link.id);
	}
	sort(failable.begin(), failable.end());
	failable.erase(unique(failable.begin(), failable.end()), failable.end());

	const string& top = query.initial_stack.empty() ? NO_LABEL : query.initial_stack.front();
	if (!options.ingress.empty())
	{
		int iface = network.find_interface(options.ingress);
		if (iface == NONE)
			throw UsageError("unknown ingress interface '" + options.ingress + "'");
		Ingress point;
		point.router = network.interfaces[iface].router;
		point.interface = iface;
		ingress.push_back(point);
	}
	else
	{
		for (auto& router : network.routers)
		{
			for (auto iface : router.interfaces)
			{
				if (network.find_rule(iface, top) == 0)
					continue;
				Ingress point;
				point.router = router.id;
				point.interface = iface;
				ingress.push_back(point);
			}
		}
		if (ingress.empty())
			MPLSQ_LOG(5) << "warning: no interface has a rule for label '" << (top == NO_LABEL ? "-" : top)
			             << "', query holds vacuously" << endl;
	}

	MPLSQ_LOG(3) << "k=" << k << " ingress points:" << ingress.size() << " failable links:" << failable.size() << endl;
}

bool Evaluator::check(const Scenario& scenario, const CancelToken& cancel, Violation& violation) const
{
	for (auto& point : ingress)
	{
		Trace trace = sim.run(scenario, point, query.initial_stack, cancel);
		if (trace.outcome == CANCELLED)
			return false;
		if (!query.accepts(trace.routers, trace.stack))
		{
			violation.scenario = scenario;
			violation.ingress = point;
			violation.trace = trace;
			return true;
		}
	}
	return false;
}

void Evaluator::fill_nominal(Verdict& verdict) const
{
	verdict.ingress_points = ingress.size();
	if (ingress.empty())
		return;
	Scenario nothing;
	nothing.mask.assign(network.links.size(), 0);
	verdict.nominal = sim.run(nothing, ingress.front(), query.initial_stack);
	query.path.match(verdict.nominal.routers, verdict.captures);
}

Verdict Evaluator::evaluate()
{
	ScenarioEnumerator scenarios(network, failable, k);
	if (scenarios.exceeds(options.scenario_limit))
	{
		if (options.on_overflow == ABORT)
			throw EnumerationOverflow(scenarios.size(), options.scenario_limit, scenarios.saturated());
		MPLSQ_LOG(5) << "warning: " << (scenarios.saturated() ? string("more than 2^64") : to_string(scenarios.size()))
		             << " scenarios exceed the limit of " << options.scenario_limit << ", proceeding" << endl;
	}

	MPLSQ_LOG(4) << "evaluating " << scenarios.size() << " scenarios on " << options.threads << " thread(s)" << endl;

	Verdict verdict = options.threads > 1 ? evaluate_threaded(scenarios) : evaluate_sequential(scenarios);
	verdict.engine = ENUMERATE;
	verdict.k = scenarios.bound();
	verdict.total = scenarios.size();
	fill_nominal(verdict);
	return verdict;
}

Verdict Evaluator::evaluate_sequential(ScenarioEnumerator& scenarios)
{
	Verdict verdict;
	Scenario scenario;
	while (scenarios.next(scenario))
	{
		verdict.examined++;
		Violation violation;
		if (check(scenario, CancelToken(), violation))
		{
			verdict.satisfied = false;
			verdict.counterexample = violation;
			break;
		}
	}
	return verdict;
}

void Evaluator::solver_thread(int id, ScenarioEnumerator& scenarios)
{
	Scenario scenario;
	uint64_t done = 0;
	while (scenarios.next(scenario))
	{
		// indices are handed out in increasing order
		if (scenario.index > best.load())
			break;

		Violation violation;
		CancelToken token(&best, scenario.index);
		bool violated = check(scenario, token, violation);
		examined++;
		done++;

		if (violated)
		{
			std::lock_guard<std::mutex> guard(results_lock);
			if (scenario.index < best.load())
			{
				best.store(scenario.index);
				best_violation = violation;
				MPLSQ_LOG(3) << "thread " << id << " violation at scenario " << scenario.index << endl;
			}
		}
	}

	std::lock_guard<std::mutex> guard(results_lock);
	MPLSQ_LOG(2) << "thread " << id << " done after " << done << " scenarios" << endl;
}

Verdict Evaluator::evaluate_threaded(ScenarioEnumerator& scenarios)
{
	best.store(numeric_limits<uint64_t>::max());
	examined.store(0);

	vector<std::thread> threads;
	for (int i = 0; i < options.threads; i++)
	{
		threads.push_back(std::thread(&Evaluator::solver_thread, this, i, std::ref(scenarios)));
	}
	for (auto& thread : threads)
	{
		thread.join();
	}

	Verdict verdict;
	verdict.examined = examined.load();
	if (best.load() != numeric_limits<uint64_t>::max())
	{
		verdict.satisfied = false;
		verdict.counterexample = best_violation;
	}
	return verdict;
}

void describe(const Network& network, const Query& query, const Verdict& verdict, ostream& stream)
{
	stream << "query: " << query.text << endl;
	stream << "k: " << verdict.k << ", ingress points: " << verdict.ingress_points;
	if (verdict.engine == SYMBOLIC)
		stream << ", behaviours: " << verdict.examined << ", scenarios: " << verdict.total << endl;
	else
		stream << ", scenarios: " << verdict.examined << "/" << verdict.total << endl;

	if (verdict.satisfied)
	{
		stream << "verdict: Satisfied" << endl;
		if (verdict.ingress_points > 0)
		{
			stream << "nominal trace: " << boost::algorithm::join(verdict.nominal.routers, " ")
			       << " (" << outcome_name(verdict.nominal.outcome) << ")" << endl;
			for (size_t g = 0; g < verdict.captures.captures.size(); g++)
			{
				const Capture& capture = verdict.captures.captures[g];
				stream << "  group " << g << (capture.name.empty() ? string() : " " + capture.name)
				       << ": " << capture.items << endl;
			}
		}
		return;
	}

	const Violation& violation = verdict.counterexample;
	stream << "verdict: Violated" << endl;
	stream << "failed links: " << violation.scenario.describe(network) << endl;
	stream << "ingress: " << network.interface_name(violation.ingress.interface) << endl;
	stream << "trace: " << boost::algorithm::join(violation.trace.routers, " ")
	       << " (" << outcome_name(violation.trace.outcome) << ")" << endl;
	stream << "final stack: " << violation.trace.stack << endl;
}

Verdict verify(const Network& network, const Query& query, const EvaluationOptions& options)
{
	Evaluator evaluator(network, query, options);
	if (options.engine == SYMBOLIC)
	{
		SymbolicSolver solver(evaluator);
		return solver.solve();
	}
	return evaluator.evaluate();
}

}
