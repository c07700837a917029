#include "cli.h"

#include <string>
#include <vector>
#include <fstream>
#include <new>

#include <boost/program_options.hpp>
#include <boost/algorithm/string.hpp>

#include "errors.h"
#include "network.h"
#include "reader.h"
#include "query.h"
#include "evaluator.h"
#include "graph.h"
#include "utils.h"

using namespace std;
namespace po = boost::program_options;

namespace mplsq {

int report_error(ostream& err)
{
	try
	{
		throw;
	}
	catch (const UsageError& e)
	{
		err << "error: " << e.what() << endl;
		return EXIT_USAGE;
	}
	catch (const ParseError& e)
	{
		err << "parse error: " << e.what() << endl;
		return EXIT_PARSE;
	}
	catch (const InvalidPatternError& e)
	{
		err << "invalid pattern: " << e.what() << endl;
		return EXIT_PATTERN;
	}
	catch (const EnumerationOverflow& e)
	{
		err << "resource limit: " << e.what() << endl;
		return EXIT_OVERFLOW;
	}
	catch (const bad_alloc& e)
	{
		err << "resource limit: out of memory (" << e.what() << ")" << endl;
		return EXIT_OVERFLOW;
	}
	catch (const SolverError& e)
	{
		err << "solver error: " << e.what() << endl;
		return EXIT_SOLVER;
	}
	catch (const exception& e)
	{
		err << "internal error: " << e.what() << endl;
		return EXIT_INTERNAL;
	}
}

int run(int argc, const char* const argv[], ostream& out, ostream& err)
{
	string topology_file, routing_file, query_text, graph_file, engine, on_overflow;
	int k = NONE;
	EvaluationOptions options;

	po::options_description visible("Usage: mplsq_verify TOPOLOGY ROUTING QUERY [K] [options]");
	visible.add_options()
		("help,h", "show this message")
		("ingress", po::value<string>(&options.ingress), "ingress interface R.i (default: every interface with a rule for the initial label)")
		("egress", po::value<vector<string>>(&options.egress), "egress router, repeatable")
		("fail", po::value<vector<string>>(&options.failable), "link allowed to fail (R.i--S.j or R--S), repeatable (default: every link)")
		("max-hops", po::value<int>(&options.max_hops)->default_value(MPLSQ_DEFAULT_MAX_HOPS), "hop bound per simulated packet")
		("limit", po::value<uint64_t>(&options.scenario_limit)->default_value(MPLSQ_DEFAULT_SCENARIO_LIMIT), "scenario count limit")
		("on-overflow", po::value<string>(&on_overflow)->default_value("abort"), "abort|proceed when the limit is exceeded")
		("threads", po::value<int>(&options.threads)->default_value(MPLSQ_DEFAULT_THREADS), "worker threads")
		("engine", po::value<string>(&engine)->default_value(MPLSQ_ENGINE == MPLSQ_SYMBOLIC ? "symbolic" : "enumerate"), "enumerate|symbolic")
		("graph", po::value<string>(&graph_file), "write the graph encoding to this file")
		("verbosity,v", po::value<int>(&log_threshold)->default_value(MPLSQ_LOG_THRESHOLD), "log threshold, lower is chattier");

	po::options_description hidden;
	hidden.add_options()
		("topology", po::value<string>(&topology_file))
		("routing", po::value<string>(&routing_file))
		("query", po::value<string>(&query_text))
		("k", po::value<int>(&k));

	po::options_description all;
	all.add(visible).add(hidden);

	po::positional_options_description positional;
	positional.add("topology", 1).add("routing", 1).add("query", 1).add("k", 1);

	try
	{
		po::variables_map vm;
		po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
		po::notify(vm);

		if (vm.count("help"))
		{
			out << visible << endl;
			return EXIT_SATISFIED;
		}
		if (!vm.count("topology") || !vm.count("routing") || !vm.count("query"))
			throw UsageError("TOPOLOGY, ROUTING and QUERY are required");

		boost::algorithm::to_lower(engine);
		if (engine == "symbolic")
			options.engine = SYMBOLIC;
		else if (engine == "enumerate")
			options.engine = ENUMERATE;
		else
			throw UsageError("unknown engine '" + engine + "'");

		boost::algorithm::to_lower(on_overflow);
		if (on_overflow == "abort")
			options.on_overflow = ABORT;
		else if (on_overflow == "proceed")
			options.on_overflow = PROCEED;
		else
			throw UsageError("unknown overflow policy '" + on_overflow + "'");

		options.k = k;

		Network network = read_network_files(topology_file, routing_file);
		network.display(MPLSQ_LOG(2));

		Query query = parse_query(query_text);

		if (!graph_file.empty())
		{
			int bound = k != NONE ? k : (query.k != NONE ? query.k : 0);
			std::ofstream graph_out(graph_file);
			if (!graph_out)
				throw UsageError("cannot write " + graph_file);
			encode_graph(network, query, bound).write(graph_out);
			MPLSQ_LOG(4) << "graph written to " << graph_file << endl;
		}

		Verdict verdict = verify(network, query, options);
		describe(network, query, verdict, out);

		return verdict.satisfied ? EXIT_SATISFIED : EXIT_VIOLATED;
	}
	catch (const po::error& e)
	{
		err << "error: " << e.what() << endl << visible << endl;
		return EXIT_USAGE;
	}
	catch (const exception&)
	{
		return report_error(err);
	}
}

}
