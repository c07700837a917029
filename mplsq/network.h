#ifndef MPLSQ_NETWORK_H
#define MPLSQ_NETWORK_H

#include <vector>
#include <string>
#include <iostream>
#include <set>
#include <map>

namespace mplsq {

const int NONE = -1;

// outermost label first
typedef std::vector<std::string> LabelStack;

// rule key of packets carrying no label
const std::string NO_LABEL = "";

class Interface
{
	public:
		int id;
		std::string name;
		int router;
		int link;
};

class Router
{
	public:
		int id;
		std::string name;
		std::vector<int> interfaces;
		std::map<std::string,int> interface_map;
};

// undirected, between interfaces of two distinct routers
class Link
{
	public:
		int id;
		int from;
		int to;
};

enum ActionType { PUSH, SWAP, POP };

class Action
{
	public:
		ActionType type;
		std::string label;
};

class Route
{
	public:
		int out;
		std::vector<Action> actions;
};

// routes are in priority order, the first one is the primary
class Rule
{
	public:
		int id;
		int router;
		int in;
		std::string label;
		std::vector<Route> routes;
};

class Network
{
	public:
		std::vector<Router> routers;
		std::vector<Interface> interfaces;
		std::vector<Link> links;
		std::vector<Rule> rules;

		std::map<std::string,int> router_map;
		std::map<std::pair<int,std::string>,int> rule_map;

		int add_router(const std::string& name);
		int add_interface(int router, const std::string& name);
		int add_link(int from, int to);
		int add_rule(int in, const std::string& label, const std::vector<Route>& routes);

		int find_router(const std::string& name) const;
		int find_interface(int router, const std::string& name) const;
		int find_interface(const std::string& qualified) const;
		int find_link(const std::string& name) const;
		const Rule* find_rule(int in, const std::string& label) const;

		int partner(int interface) const;

		std::string interface_name(int interface) const;
		std::string link_name(int link) const;

		std::set<std::string> labels() const;

		void display(std::ostream& stream) const;
};

std::string action_name(ActionType type);

}

#endif
