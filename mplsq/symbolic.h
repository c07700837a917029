#ifndef MPLSQ_SYMBOLIC_H
#define MPLSQ_SYMBOLIC_H

#include <vector>
#include <string>
#include <map>

#include "z3++.h"

#include "evaluator.h"

namespace mplsq {

// One failure dependent behaviour: the link states the packet observed
// (true = failed) and the trace they lead to.
class Leaf
{
	public:
		std::map<int,bool> literals;
		Ingress ingress;
		Trace trace;
		bool rejected;
};

// "some rejecting behaviour is reached with at most k failures" as a
// formula over one Boolean per failable link
class FailureEncoding
{
	public:
		z3::context& ctx;
		const std::vector<int>& links;
		int k;

		z3::expr_vector f;
		z3::expr query;
		z3::check_result status;

		FailureEncoding(z3::context& ctx_i, const std::vector<int>& links_i, int k_i)
			: ctx(ctx_i), links(links_i), k(k_i), f(ctx_i), query(ctx_i), status(z3::unknown)
		{
			query = ctx.bool_val(true);
		}

		void define_failure_vars(const Network& network);
		void bound_failures();
		void reach_rejecting(const std::vector<Leaf>& leaves);

		bool solve_z3(std::vector<int>& failed);

	private:
		std::map<int,unsigned> position;
};

class SymbolicSolver
{
	public:
		explicit SymbolicSolver(const Evaluator& evaluator_i) : evaluator(evaluator_i) {}

		Verdict solve();

		// every behaviour of every ingress point with at most k failures
		std::vector<Leaf> explore() const;

	private:
		const Evaluator& evaluator;

		void explore(const Ingress& point, std::vector<Leaf>& leaves) const;
};

}

#endif
