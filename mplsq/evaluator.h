#ifndef MPLSQ_EVALUATOR_H
#define MPLSQ_EVALUATOR_H

#include <vector>
#include <string>
#include <iostream>
#include <set>
#include <mutex>
#include <atomic>
#include <cstdint>

#include "network.h"
#include "query.h"
#include "scenarios.h"
#include "simulator.h"
#include "config.h"

namespace mplsq {

enum OverflowPolicy { ABORT, PROCEED };
enum Engine { ENUMERATE = MPLSQ_ENUMERATIVE, SYMBOLIC = MPLSQ_SYMBOLIC };

class EvaluationOptions
{
	public:
		// NONE: take k from the query, or 0
		int k;
		// "R.i"; empty: every interface with a rule for the initial top label
		std::string ingress;
		std::vector<std::string> egress;
		// link names; empty: every link may fail
		std::vector<std::string> failable;
		int max_hops;
		uint64_t scenario_limit;
		OverflowPolicy on_overflow;
		int threads;
		Engine engine;

		EvaluationOptions()
			: k(NONE), max_hops(MPLSQ_DEFAULT_MAX_HOPS), scenario_limit(MPLSQ_DEFAULT_SCENARIO_LIMIT),
			  on_overflow(ABORT), threads(MPLSQ_DEFAULT_THREADS), engine((Engine)MPLSQ_ENGINE) {}
};

class Violation
{
	public:
		Scenario scenario;
		Ingress ingress;
		Trace trace;
};

class Verdict
{
	public:
		bool satisfied;
		Violation counterexample;

		// failure free trace of the first ingress and its captures
		Trace nominal;
		Match captures;

		Engine engine;
		// failure bound after clamping to the failable link count
		int k;
		// scenarios checked, or explored behaviours for SYMBOLIC
		uint64_t examined;
		uint64_t total;
		size_t ingress_points;

		Verdict() : satisfied(true), engine(ENUMERATE), k(0), examined(0), total(0), ingress_points(0) {}
};

// Checks a query against every failure scenario of size 0..k. The network
// and query are only read, so one Evaluator serves all worker threads.
class Evaluator
{
	public:
		Evaluator(const Network& network_i, const Query& query_i, const EvaluationOptions& options_i);

		Verdict evaluate();

		int bound() const { return k; }
		const std::vector<Ingress>& ingress_points() const { return ingress; }
		const std::vector<int>& failable_links() const { return failable; }
		const LabelStack& initial_stack() const { return query.initial_stack; }
		const Simulator& simulator() const { return sim; }
		const Network& model() const { return network; }
		const Query& compiled_query() const { return query; }
		const EvaluationOptions& settings() const { return options; }

		// true and fills violation when some ingress yields a rejected trace
		bool check(const Scenario& scenario, const CancelToken& cancel, Violation& violation) const;

	private:
		const Network& network;
		const Query& query;
		EvaluationOptions options;
		Simulator sim;

		int k;
		std::vector<Ingress> ingress;
		std::vector<int> failable;

		std::mutex results_lock;
		std::atomic<uint64_t> best;
		std::atomic<uint64_t> examined;
		Violation best_violation;

		void resolve();
		void fill_nominal(Verdict& verdict) const;
		Verdict evaluate_sequential(ScenarioEnumerator& scenarios);
		Verdict evaluate_threaded(ScenarioEnumerator& scenarios);
		void solver_thread(int id, ScenarioEnumerator& scenarios);
};

// runs the engine named in the options
Verdict verify(const Network& network, const Query& query, const EvaluationOptions& options);

void describe(const Network& network, const Query& query, const Verdict& verdict, std::ostream& stream);

}

#endif
