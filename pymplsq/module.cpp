#include <boost/python.hpp>
#include <string>
#include <sstream>
#include <vector>
#include <tuple>
#include <ctime>

#include "mplsq/errors.h"
#include "mplsq/network.h"
#include "mplsq/reader.h"
#include "mplsq/query.h"
#include "mplsq/evaluator.h"
#include "mplsq/graph.h"
#include "mplsq/utils.h"

using namespace std;
namespace py = boost::python;
using namespace mplsq;


// -----------------------------------------------------------------------------
// PYTHON TYPES CONVERSION
// -----------------------------------------------------------------------------
template <typename T>
std::vector<T> pylist_to_vector(const py::object& obj)
{
    std::vector<T> vect(len(obj));
    for (unsigned long i = 0; i < vect.size(); i++)
    {
        vect[i] = py::extract<T>(obj[i])();
    }

    return vect;
}

template <typename T>
py::list vector_to_pylist(const std::vector<T>& vect)
{
    py::list ret;
    for (auto& item: vect)
    {
        ret.append(item);
    }

    return ret;
}

py::object trace_to_pytuple(const Network& network, const Trace& trace)
{
    py::list links;
    for (auto link: trace.links)
    {
        links.append(network.link_name(link));
    }

    return py::make_tuple(outcome_name(trace.outcome),
                          vector_to_pylist(trace.routers),
                          links,
                          vector_to_pylist(trace.stack),
                          trace.hops);
}


// -----------------------------------------------------------------------------
// ERRORS
// -----------------------------------------------------------------------------
template <typename E>
void translate(PyObject* type, const E& e)
{
    PyErr_SetString(type, e.what());
}

void translate_parse(const ParseError& e) { translate(PyExc_ValueError, e); }
void translate_pattern(const InvalidPatternError& e) { translate(PyExc_ValueError, e); }
void translate_usage(const UsageError& e) { translate(PyExc_ValueError, e); }
void translate_overflow(const EnumerationOverflow& e) { translate(PyExc_OverflowError, e); }
void translate_solver(const SolverError& e) { translate(PyExc_RuntimeError, e); }


// -----------------------------------------------------------------------------
// VERIFIER
// -----------------------------------------------------------------------------
// A parsed network kept alive across queries. Every call compiles its query
// afresh, so one Verifier answers any number of them.
class Verifier
{
public:
    Verifier(std::string topology, std::string routing);

    static Verifier from_files(std::string topology_file, std::string routing_file);

    py::tuple check(std::string line, int k, py::dict options);
    py::tuple encode(std::string line, int k);
    py::list get_routers();
    py::list get_links();
    py::list get_perf_counters();

private:
    explicit Verifier(const Network& _network) : network(_network) {}

    Network network;
    std::vector<std::tuple<std::string, double>> perfCounters;

    EvaluationOptions read_options(int k, py::dict options);
};

Verifier::Verifier(std::string topology, std::string routing)
{
    istringstream topology_stream(topology);
    istringstream routing_stream(routing);
    network = read_network(topology_stream, routing_stream);
}

Verifier Verifier::from_files(std::string topology_file, std::string routing_file)
{
    return Verifier(read_network_files(topology_file, routing_file));
}

EvaluationOptions Verifier::read_options(int k, py::dict options)
{
    EvaluationOptions result;
    result.k = k;

    if (options.has_key("ingress"))
        result.ingress = py::extract<std::string>(options["ingress"])();
    if (options.has_key("egress"))
        result.egress = pylist_to_vector<std::string>(options["egress"]);
    if (options.has_key("fail"))
        result.failable = pylist_to_vector<std::string>(options["fail"]);
    if (options.has_key("max_hops"))
        result.max_hops = py::extract<int>(options["max_hops"])();
    if (options.has_key("limit"))
        result.scenario_limit = py::extract<unsigned long long>(options["limit"])();
    if (options.has_key("threads"))
        result.threads = py::extract<int>(options["threads"])();
    if (options.has_key("proceed"))
        result.on_overflow = py::extract<bool>(options["proceed"])() ? PROCEED : ABORT;
    if (options.has_key("engine"))
    {
        std::string engine = py::extract<std::string>(options["engine"])();
        if (engine == "symbolic")
            result.engine = SYMBOLIC;
        else if (engine == "enumerate")
            result.engine = ENUMERATE;
        else
            throw UsageError("unknown engine '" + engine + "'");
    }

    return result;
}

// (satisfied, failed links, counterexample trace, nominal trace, captures, examined, total)
py::tuple Verifier::check(std::string line, int k, py::dict options)
{
    Query query = parse_query(line);
    EvaluationOptions settings = read_options(k, options);

    clock_t begin = clock();
    Verdict verdict = verify(network, query, settings);
    perfCounters.push_back(make_tuple(line, double(clock() - begin) / (CLOCKS_PER_SEC / 1000)));

    py::list failed;
    py::object counterexample;
    if (!verdict.satisfied)
    {
        for (auto link: verdict.counterexample.scenario.failed)
        {
            failed.append(network.link_name(link));
        }
        counterexample = trace_to_pytuple(network, verdict.counterexample.trace);
    }

    py::dict captures;
    for (auto& capture: verdict.captures.captures)
    {
        if (!capture.name.empty())
            captures[capture.name] = vector_to_pylist(capture.items);
    }

    return py::make_tuple(verdict.satisfied,
                          failed,
                          counterexample,
                          trace_to_pytuple(network, verdict.nominal),
                          captures,
                          verdict.examined,
                          verdict.total);
}

// ([(type, name, features)], [(source, target, type, features)], query node)
py::tuple Verifier::encode(std::string line, int k)
{
    Query query = parse_query(line);
    EncodedGraph graph = encode_graph(network, query, k);

    py::list nodes;
    for (auto& node: graph.nodes)
    {
        nodes.append(py::make_tuple(node_type_name(node.type),
                                    node.name,
                                    vector_to_pylist(node.features())));
    }

    py::list edges;
    for (auto& edge: graph.edges)
    {
        edges.append(py::make_tuple(edge.source,
                                    edge.target,
                                    edge_type_name(edge.type),
                                    vector_to_pylist(edge.features())));
    }

    return py::make_tuple(nodes, edges, graph.query_node);
}

py::list Verifier::get_routers()
{
    py::list ret;
    for (auto& router: network.routers)
    {
        ret.append(router.name);
    }

    return ret;
}

py::list Verifier::get_links()
{
    py::list ret;
    for (auto& link: network.links)
    {
        ret.append(network.link_name(link.id));
    }

    return ret;
}

py::list Verifier::get_perf_counters()
{
    py::list ret;

    for (auto counter: perfCounters)
    {
        ret.append(py::make_tuple(get<0>(counter),
                                  get<1>(counter)));
    }

    return ret;
}

bool valid_query(std::string line)
{
    try
    {
        parse_query(line);
    }
    catch (const InvalidPatternError&)
    {
        return false;
    }
    return true;
}

void set_log_threshold(int threshold)
{
    log_threshold = threshold;
}

BOOST_PYTHON_MODULE(pymplsq)
{
    py::register_exception_translator<ParseError>(&translate_parse);
    py::register_exception_translator<InvalidPatternError>(&translate_pattern);
    py::register_exception_translator<UsageError>(&translate_usage);
    py::register_exception_translator<EnumerationOverflow>(&translate_overflow);
    py::register_exception_translator<SolverError>(&translate_solver);

    py::class_<Verifier>("Verifier",
                         py::init<std::string, std::string>())
    .def("from_files", &Verifier::from_files)
    .staticmethod("from_files")
    .def("check", &Verifier::check)
    .def("encode", &Verifier::encode)
    .def("routers", &Verifier::get_routers)
    .def("links", &Verifier::get_links)
    .def("get_perf_counters", &Verifier::get_perf_counters);

    py::def("valid_query", &valid_query);
    py::def("set_log_threshold", &set_log_threshold);
}
