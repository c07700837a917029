#include "reader.h"

#include <fstream>
#include <vector>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <boost/algorithm/string.hpp>

#include "errors.h"
#include "utils.h"

using namespace std;
namespace pt = boost::property_tree;

namespace mplsq {

namespace {

const string TOPOLOGY = "topology";
const string ROUTING = "routing";

pt::ptree parse_xml(istream& input, const string& document)
{
	pt::ptree tree;
	try
	{
		pt::read_xml(input, tree);
	}
	catch (const pt::xml_parser_error& e)
	{
		throw MalformedInputError(document, "line " + to_string(e.line()) + ": " + e.message());
	}
	return tree;
}

const pt::ptree& child(const pt::ptree& node, const string& path, const string& document, const string& where)
{
	auto found = node.get_child_optional(path);
	if (!found)
		throw MalformedInputError(document, where + ": missing <" + path + ">");
	return *found;
}

string attribute(const pt::ptree& node, const string& name, const string& document, const string& where)
{
	auto value = node.get_optional<string>("<xmlattr>." + name);
	if (!value)
		throw MalformedInputError(document, where + ": missing attribute '" + name + "'");
	string result = boost::algorithm::trim_copy(*value);
	if (result.empty())
		throw MalformedInputError(document, where + ": empty attribute '" + name + "'");
	return result;
}

// children with the given tag, in document order
vector<const pt::ptree*> elements(const pt::ptree& node, const string& tag)
{
	vector<const pt::ptree*> result;
	for (auto& entry : node)
	{
		if (entry.first == tag)
			result.push_back(&entry.second);
	}
	return result;
}

ActionType action_type(const string& name, const string& where)
{
	string lowered = boost::algorithm::to_lower_copy(name);
	if (lowered == "push")
		return PUSH;
	if (lowered == "swap")
		return SWAP;
	if (lowered == "pop")
		return POP;
	throw MalformedInputError(ROUTING, where + ": unknown action type '" + name + "'");
}

}

Network NetworkReader::read(istream& topology, istream& routing)
{
	network = Network();
	read_topology(topology);
	read_routing(routing);
	MPLSQ_LOG(3) << "read " << network.routers.size() << " routers, " << network.links.size()
	             << " links, " << network.rules.size() << " rules" << endl;
	return network;
}

Network NetworkReader::read_files(const string& topology_file, const string& routing_file)
{
	std::ifstream topology(topology_file);
	if (!topology)
		throw MalformedInputError(TOPOLOGY, "cannot open " + topology_file);
	std::ifstream routing(routing_file);
	if (!routing)
		throw MalformedInputError(ROUTING, "cannot open " + routing_file);
	return read(topology, routing);
}

void NetworkReader::read_topology(istream& input)
{
	pt::ptree tree = parse_xml(input, TOPOLOGY);
	const pt::ptree& root = child(tree, "network", TOPOLOGY, "document");
	const pt::ptree& routers = child(root, "routers", TOPOLOGY, "<network>");

	for (auto router_node : elements(routers, "router"))
	{
		string name = attribute(*router_node, "name", TOPOLOGY, "<router>");
		string where = "router '" + name + "'";
		if (network.find_router(name) != NONE)
			throw MalformedInputError(TOPOLOGY, where + ": duplicate router");

		int router = network.add_router(name);

		auto interfaces = router_node->get_child_optional("interfaces");
		if (!interfaces)
			continue;
		for (auto iface_node : elements(*interfaces, "interface"))
		{
			string iface = attribute(*iface_node, "name", TOPOLOGY, where + " <interface>");
			if (network.find_interface(router, iface) != NONE)
				throw MalformedInputError(TOPOLOGY, where + ": duplicate interface '" + iface + "'");
			network.add_interface(router, iface);
		}
	}

	auto links = root.get_child_optional("links");
	if (links)
	{
		int count = 0;
		for (auto link_node : elements(*links, "link"))
		{
			string where = "link #" + to_string(count++);
			const pt::ptree& sides = child(*link_node, "sides", TOPOLOGY, where);
			vector<const pt::ptree*> shared = elements(sides, "shared_interface");
			if (shared.size() != 2)
				throw MalformedInputError(TOPOLOGY, where + ": expected 2 sides, found " + to_string(shared.size()));

			int ends[2];
			for (int i = 0; i < 2; i++)
			{
				string router_name = attribute(*shared[i], "router", TOPOLOGY, where + " <shared_interface>");
				string iface_name = attribute(*shared[i], "interface", TOPOLOGY, where + " <shared_interface>");
				int router = network.find_router(router_name);
				if (router == NONE)
					throw UnknownReferenceError(TOPOLOGY, where + ": unknown router '" + router_name + "'");
				ends[i] = network.find_interface(router, iface_name);
				if (ends[i] == NONE)
					throw UnknownReferenceError(TOPOLOGY, where + ": unknown interface '" + router_name + "." + iface_name + "'");
				if (network.interfaces[ends[i]].link != NONE)
					throw MalformedInputError(TOPOLOGY, where + ": interface '" + network.interface_name(ends[i]) + "' already linked");
			}

			if (network.interfaces[ends[0]].router == network.interfaces[ends[1]].router)
				throw MalformedInputError(TOPOLOGY, where + ": both sides on router '"
				                          + network.routers[network.interfaces[ends[0]].router].name + "'");

			network.add_link(ends[0], ends[1]);
		}
	}

	for (auto& iface : network.interfaces)
	{
		if (iface.link == NONE)
			throw DanglingInterfaceError(TOPOLOGY, "interface '" + network.interface_name(iface.id) + "' has no link");
	}
}

void NetworkReader::read_routing(istream& input)
{
	pt::ptree tree = parse_xml(input, ROUTING);
	const pt::ptree& root = child(tree, "routes", ROUTING, "document");
	const pt::ptree& routings = child(root, "routings", ROUTING, "<routes>");

	for (auto routing_node : elements(routings, "routing"))
	{
		string router_name = attribute(*routing_node, "for", ROUTING, "<routing>");
		int router = network.find_router(router_name);
		if (router == NONE)
			throw UnknownReferenceError(ROUTING, "routing for unknown router '" + router_name + "'");

		auto destinations = routing_node->get_child_optional("destinations");
		if (!destinations)
			continue;

		for (auto dest_node : elements(*destinations, "destination"))
		{
			string from = attribute(*dest_node, "from", ROUTING, "router '" + router_name + "' <destination>");
			int in = network.find_interface(router, from);
			if (in == NONE)
				throw UnknownReferenceError(ROUTING, "router '" + router_name + "': unknown interface '" + from + "'");

			string label = NO_LABEL;
			auto label_attr = dest_node->get_optional<string>("<xmlattr>.label");
			if (label_attr)
				label = boost::algorithm::trim_copy(*label_attr);

			string where = "rule " + network.interface_name(in) + " [" + (label == NO_LABEL ? "-" : label) + "]";
			if (network.find_rule(in, label) != 0)
				throw MalformedInputError(ROUTING, where + ": duplicate rule");

			vector<Route> routes;
			const pt::ptree& groups = child(*dest_node, "te-groups", ROUTING, where);
			for (auto group_node : elements(groups, "te-group"))
			{
				const pt::ptree& group_routes = child(*group_node, "routes", ROUTING, where + " <te-group>");
				vector<const pt::ptree*> candidates = elements(group_routes, "route");
				if (candidates.empty())
					continue;
				if (candidates.size() > 1)
					MPLSQ_LOG(5) << "warning: " << where << ": using first of " << candidates.size()
					             << " routes in te-group, dropping " << candidates.size() - 1 << endl;

				const pt::ptree& route_node = *candidates.front();
				Route route;
				string to = attribute(route_node, "to", ROUTING, where + " <route>");
				route.out = network.find_interface(router, to);
				if (route.out == NONE)
					throw UnknownReferenceError(ROUTING, where + ": unknown out interface '" + router_name + "." + to + "'");

				auto actions = route_node.get_child_optional("actions");
				if (actions)
				{
					for (auto action_node : elements(*actions, "action"))
					{
						Action action;
						action.type = action_type(attribute(*action_node, "type", ROUTING, where + " <action>"), where);
						if (action.type != POP)
							action.label = attribute(*action_node, "arg", ROUTING, where + " <action>");
						route.actions.push_back(action);
					}
				}
				routes.push_back(route);
			}

			if (routes.empty())
				throw MalformedInputError(ROUTING, where + ": no routes");

			network.add_rule(in, label, routes);
		}
	}
}

Network read_network(istream& topology, istream& routing)
{
	NetworkReader reader;
	return reader.read(topology, routing);
}

Network read_network_files(const string& topology_file, const string& routing_file)
{
	NetworkReader reader;
	return reader.read_files(topology_file, routing_file);
}

}
