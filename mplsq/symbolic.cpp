#include "symbolic.h"

#include <list>
#include <ctime>

#include "errors.h"
#include "utils.h"

using namespace std;
using namespace z3;

namespace mplsq {

namespace {

// Links not yet decided are reported alive and remembered in probe order,
// so the caller can branch on each of them afterwards.
class ProbeOracle : public LinkOracle
{
	public:
		map<int,bool> assignment;
		vector<int> assumed;

		ProbeOracle(const map<int,bool>& assignment_i, const vector<char>& failable_i)
			: assignment(assignment_i), failable(failable_i) {}

		bool failed(int link)
		{
			auto it = assignment.find(link);
			if (it != assignment.end())
				return it->second;
			if (!failable[link])
				return false;
			assignment[link] = false;
			assumed.push_back(link);
			return false;
		}

	private:
		const vector<char>& failable;
};

int count_failed(const map<int,bool>& assignment)
{
	int count = 0;
	for (auto& literal : assignment)
	{
		if (literal.second)
			count++;
	}
	return count;
}

}

void FailureEncoding::define_failure_vars(const Network& network)
{
	for (unsigned index = 0; index < links.size(); index++)
	{
		string name = "f_" + network.link_name(links[index]);
		f.push_back(ctx.bool_const(name.c_str()));
		position[links[index]] = index;
	}
}

void FailureEncoding::bound_failures()
{
	if (f.size() == 0)
		return;
	query = query && atmost(f, k);
}

void FailureEncoding::reach_rejecting(const vector<Leaf>& leaves)
{
	expr_vector cases(ctx);
	for (auto& leaf : leaves)
	{
		if (!leaf.rejected)
			continue;
		expr_vector literals(ctx);
		for (auto& literal : leaf.literals)
		{
			expr var = f[position.at(literal.first)];
			literals.push_back(literal.second ? var : !var);
		}
		cases.push_back(literals.size() == 0 ? ctx.bool_val(true) : mk_and(literals));
	}
	query = query && (cases.size() == 0 ? ctx.bool_val(false) : mk_or(cases));
}

bool FailureEncoding::solve_z3(vector<int>& failed)
{
	solver s(ctx);
	s.add(query);

	switch (s.check())
	{
		case sat:
		{
			status = sat;
			model m = s.get_model();
			for (unsigned index = 0; index < f.size(); index++)
			{
				if (m.eval(f[index], true).is_true())
					failed.push_back(links[index]);
			}
			return true;
		}
		case unsat:
			status = unsat;
			return false;
		case unknown:
			status = unknown;
			return false;
	}
	return false;
}

void SymbolicSolver::explore(const Ingress& point, vector<Leaf>& leaves) const
{
	const Network& network = evaluator.model();
	const Query& query = evaluator.compiled_query();
	const EvaluationOptions& options = evaluator.settings();
	int k = evaluator.bound();

	vector<char> failable(network.links.size(), 0);
	for (auto link : evaluator.failable_links())
		failable[link] = 1;

	list<map<int,bool>> worklist;
	worklist.push_back(map<int,bool>());

	while (!worklist.empty())
	{
		map<int,bool> assignment = worklist.back();
		worklist.pop_back();

		ProbeOracle oracle(assignment, failable);
		Trace trace = evaluator.simulator().run(oracle, point, evaluator.initial_stack());

		int failures = count_failed(assignment);
		map<int,bool> prefix = assignment;
		for (auto link : oracle.assumed)
		{
			if (failures < k)
			{
				map<int,bool> branch = prefix;
				branch[link] = true;
				worklist.push_back(branch);
			}
			prefix[link] = false;
		}

		Leaf leaf;
		leaf.literals = prefix;
		leaf.ingress = point;
		leaf.trace = trace;
		leaf.rejected = !query.accepts(trace.routers, trace.stack);
		leaves.push_back(leaf);

		if (leaves.size() > options.scenario_limit && options.on_overflow == ABORT)
			throw EnumerationOverflow(leaves.size(), options.scenario_limit, false);
	}
}

vector<Leaf> SymbolicSolver::explore() const
{
	vector<Leaf> leaves;
	for (auto& point : evaluator.ingress_points())
		explore(point, leaves);
	return leaves;
}

Verdict SymbolicSolver::solve()
{
	const Network& network = evaluator.model();
	ScenarioEnumerator scenarios(network, evaluator.failable_links(), evaluator.bound());

	Verdict verdict;
	verdict.engine = SYMBOLIC;
	verdict.k = scenarios.bound();
	verdict.total = scenarios.size();
	verdict.ingress_points = evaluator.ingress_points().size();

	clock_t begin = clock();
	vector<Leaf> leaves = explore();
	verdict.examined = leaves.size();

	size_t rejecting = 0;
	for (auto& leaf : leaves)
	{
		if (leaf.rejected)
			rejecting++;
	}
	MPLSQ_LOG(4) << "explored " << leaves.size() << " behaviours, " << rejecting << " rejecting, in "
	             << double(clock() - begin) / (CLOCKS_PER_SEC / 1000) << " ms" << endl;

	if (rejecting > 0)
	{
		for (int k = 0; k <= scenarios.bound(); k++)
		{
			MPLSQ_LOG(3) << "Starting phase: " << k << endl;
			vector<int> failed;
			bool found = false;
			try
			{
				context ctx;
				FailureEncoding encoding(ctx, evaluator.failable_links(), k);
				encoding.define_failure_vars(network);
				encoding.bound_failures();
				encoding.reach_rejecting(leaves);

				begin = clock();
				found = encoding.solve_z3(failed);
				MPLSQ_LOG(3) << "z3 solve " << double(clock() - begin) / (CLOCKS_PER_SEC / 1000) << " ms" << endl;

				if (!found && encoding.status == unknown)
					throw SolverError("z3 returned unknown in phase " + to_string(k));
			}
			catch (const z3::exception& e)
			{
				throw SolverError(string("z3: ") + e.msg());
			}

			if (!found)
				continue;

			Scenario scenario = scenarios.at(scenarios.index_of(failed));
			Violation violation;
			if (!evaluator.check(scenario, CancelToken(), violation))
				throw SolverError("failure set " + scenario.describe(network) + " does not reproduce a violation");

			verdict.satisfied = false;
			verdict.counterexample = violation;
			break;
		}
	}

	if (verdict.ingress_points > 0)
	{
		Scenario nothing = scenarios.at(0);
		verdict.nominal = evaluator.simulator().run(nothing, evaluator.ingress_points().front(), evaluator.initial_stack());
		evaluator.compiled_query().path.match(verdict.nominal.routers, verdict.captures);
	}
	return verdict;
}

}
