#include "network.h"

#include "utils.h"

using namespace std;

namespace mplsq {

int Network::add_router(const string& name)
{
	Router router;
	router.id = routers.size();
	router.name = name;
	routers.push_back(router);
	router_map[name] = router.id;
	return router.id;
}

int Network::add_interface(int router, const string& name)
{
	Interface iface;
	iface.id = interfaces.size();
	iface.name = name;
	iface.router = router;
	iface.link = NONE;
	interfaces.push_back(iface);
	routers[router].interfaces.push_back(iface.id);
	routers[router].interface_map[name] = iface.id;
	return iface.id;
}

int Network::add_link(int from, int to)
{
	Link link;
	link.id = links.size();
	link.from = from;
	link.to = to;
	links.push_back(link);
	interfaces[from].link = link.id;
	interfaces[to].link = link.id;
	return link.id;
}

int Network::add_rule(int in, const string& label, const vector<Route>& routes)
{
	Rule rule;
	rule.id = rules.size();
	rule.router = interfaces[in].router;
	rule.in = in;
	rule.label = label;
	rule.routes = routes;
	rules.push_back(rule);
	rule_map[make_pair(in, label)] = rule.id;
	return rule.id;
}

int Network::find_router(const string& name) const
{
	auto it = router_map.find(name);
	if (it == router_map.end())
		return NONE;
	return it->second;
}

int Network::find_interface(int router, const string& name) const
{
	if (router < 0 || router >= (int)routers.size())
		return NONE;
	auto it = routers[router].interface_map.find(name);
	if (it == routers[router].interface_map.end())
		return NONE;
	return it->second;
}

// "R.i"; router names may contain dots themselves, so every split is tried
int Network::find_interface(const string& qualified) const
{
	for (size_t dot = qualified.find('.'); dot != string::npos; dot = qualified.find('.', dot + 1))
	{
		int router = find_router(qualified.substr(0, dot));
		if (router == NONE)
			continue;
		int iface = find_interface(router, qualified.substr(dot + 1));
		if (iface != NONE)
			return iface;
	}
	return NONE;
}

// "R0.i0--R1.i1", or "R0--R1" when only one link joins the two routers
int Network::find_link(const string& name) const
{
	size_t sep = name.find("--");
	if (sep == string::npos)
		return NONE;
	string lhs = name.substr(0, sep);
	string rhs = name.substr(sep + 2);

	int a = find_interface(lhs);
	int b = find_interface(rhs);
	if (a != NONE && b != NONE)
	{
		int link = interfaces[a].link;
		if (link != NONE && partner(a) == b)
			return link;
		return NONE;
	}

	int ra = find_router(lhs);
	int rb = find_router(rhs);
	if (ra == NONE || rb == NONE)
		return NONE;

	int found = NONE;
	for (auto iface : routers[ra].interfaces)
	{
		int other = partner(iface);
		if (other == NONE || interfaces[other].router != rb)
			continue;
		if (found != NONE)
			return NONE;
		found = interfaces[iface].link;
	}
	return found;
}

const Rule* Network::find_rule(int in, const string& label) const
{
	auto it = rule_map.find(make_pair(in, label));
	if (it == rule_map.end())
		return 0;
	return &rules[it->second];
}

int Network::partner(int interface) const
{
	int link = interfaces[interface].link;
	if (link == NONE)
		return NONE;
	return links[link].from == interface ? links[link].to : links[link].from;
}

string Network::interface_name(int interface) const
{
	const Interface& iface = interfaces[interface];
	return routers[iface.router].name + "." + iface.name;
}

string Network::link_name(int link) const
{
	return interface_name(links[link].from) + "--" + interface_name(links[link].to);
}

set<string> Network::labels() const
{
	set<string> result;
	for (auto& rule : rules)
	{
		if (rule.label != NO_LABEL)
			result.insert(rule.label);
		for (auto& route : rule.routes)
		{
			for (auto& action : route.actions)
			{
				if (action.type != POP)
					result.insert(action.label);
			}
		}
	}
	return result;
}

void Network::display(ostream& stream) const
{
	stream << "***ROUTERS***" << endl;
	for (auto& router : routers)
	{
		vector<string> names;
		for (auto iface : router.interfaces)
			names.push_back(interfaces[iface].name);
		stream << router.name << " " << names << endl;
	}

	stream << "***LINKS***" << endl;
	for (auto& link : links)
		stream << link.id << " " << link_name(link.id) << endl;

	stream << "***RULES***" << endl;
	for (auto& rule : rules)
	{
		stream << interface_name(rule.in) << " [" << (rule.label == NO_LABEL ? "-" : rule.label) << "]";
		for (auto& route : rule.routes)
		{
			stream << " -> " << interface_name(route.out);
			for (auto& action : route.actions)
			{
				stream << " " << action_name(action.type);
				if (action.type != POP)
					stream << "(" << action.label << ")";
			}
			stream << ";";
		}
		stream << endl;
	}
}

string action_name(ActionType type)
{
	switch (type)
	{
		case PUSH:
			return "push";
		case SWAP:
			return "swap";
		case POP:
			return "pop";
	}
	return "unknown";
}

}
