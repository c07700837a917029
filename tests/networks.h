#ifndef MPLSQ_TESTS_NETWORKS_H
#define MPLSQ_TESTS_NETWORKS_H

#include <string>
#include <vector>
#include <sstream>

#include "mplsq/network.h"
#include "mplsq/reader.h"

// Writes topology and routing documents in the P-Rex format, so the tests
// go through the same reader as the command line.
class XmlNetwork
{
	public:
		class RouteSpec
		{
			public:
				std::string to;
				// "push:L", "swap:L" or "pop"
				std::vector<std::string> actions;
		};

		void router(const std::string& name, const std::vector<std::string>& interfaces)
		{
			topology_routers += "<router name=\"" + name + "\"><interfaces>";
			for (auto& iface : interfaces)
				topology_routers += "<interface name=\"" + iface + "\"/>";
			topology_routers += "</interfaces></router>";
		}

		void link(const std::string& r1, const std::string& i1, const std::string& r2, const std::string& i2)
		{
			topology_links += "<link><sides>"
				"<shared_interface router=\"" + r1 + "\" interface=\"" + i1 + "\"/>"
				"<shared_interface router=\"" + r2 + "\" interface=\"" + i2 + "\"/>"
				"</sides></link>";
		}

		// one te-group per route, in priority order
		void rule(const std::string& router, const std::string& from, const std::string& label,
		          const std::vector<RouteSpec>& routes)
		{
			std::string text = "<routing for=\"" + router + "\"><destinations><destination from=\"" + from + "\"";
			if (!label.empty())
				text += " label=\"" + label + "\"";
			text += "><te-groups>";
			for (auto& route : routes)
			{
				text += "<te-group><routes><route to=\"" + route.to + "\"><actions>";
				for (auto& action : route.actions)
				{
					size_t colon = action.find(':');
					if (colon == std::string::npos)
						text += "<action type=\"" + action + "\"/>";
					else
						text += "<action type=\"" + action.substr(0, colon) + "\" arg=\"" + action.substr(colon + 1) + "\"/>";
				}
				text += "</actions></route></routes></te-group>";
			}
			text += "</te-groups></destination></destinations></routing>";
			routing_entries += text;
		}

		std::string topology() const
		{
			return "<network><routers>" + topology_routers + "</routers><links>" + topology_links + "</links></network>";
		}

		std::string routing() const
		{
			return "<routes><routings>" + routing_entries + "</routings></routes>";
		}

		mplsq::Network build() const
		{
			return load(topology(), routing());
		}

		static mplsq::Network load(const std::string& topology, const std::string& routing)
		{
			std::istringstream t(topology);
			std::istringstream r(routing);
			return mplsq::read_network(t, r);
		}

	private:
		std::string topology_routers;
		std::string topology_links;
		std::string routing_entries;
};

inline XmlNetwork::RouteSpec route(const std::string& to, const std::vector<std::string>& actions)
{
	XmlNetwork::RouteSpec result;
	result.to = to;
	result.actions = actions;
	return result;
}

// S1.a--S2.a, S2.b--S3.a. Label 10 enters at S1.a and is swapped along the
// chain; S3 has no rule and drops the packet.
inline XmlNetwork chain()
{
	XmlNetwork xml;
	xml.router("S1", {"a"});
	xml.router("S2", {"a", "b"});
	xml.router("S3", {"a"});
	xml.link("S1", "a", "S2", "a");
	xml.link("S2", "b", "S3", "a");
	xml.rule("S1", "a", "10", {route("a", {"swap:11"})});
	xml.rule("S2", "a", "11", {route("b", {"swap:12"})});
	return xml;
}

// chain() plus a detour S1.c--S4.a, S4.b--S3.b taken when S1--S2 is down.
inline XmlNetwork detour()
{
	XmlNetwork xml;
	xml.router("S1", {"a", "c"});
	xml.router("S2", {"a", "b"});
	xml.router("S3", {"a", "b"});
	xml.router("S4", {"a", "b"});
	xml.link("S1", "a", "S2", "a");
	xml.link("S2", "b", "S3", "a");
	xml.link("S1", "c", "S4", "a");
	xml.link("S4", "b", "S3", "b");
	xml.rule("S1", "a", "10", {route("a", {"swap:11"}), route("c", {"swap:21"})});
	xml.rule("S2", "a", "11", {route("b", {"swap:12"})});
	xml.rule("S4", "a", "21", {route("b", {"swap:12"})});
	return xml;
}

#endif
