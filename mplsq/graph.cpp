#include "graph.h"

#include <set>

#include "utils.h"

using namespace std;

namespace mplsq {

string node_type_name(NodeType type)
{
	switch (type)
	{
		case ROUTER_NODE: return "Router";
		case INTERFACE_NODE: return "Interface";
		case LABEL_NODE: return "Label";
		case RULE_NODE: return "Rule";
		case PUSH_NODE: return "PushAction";
		case SWAP_NODE: return "SwapAction";
		case POP_NODE: return "PopAction";
		case QUERY_NODE: return "Query";
		case ATOM_NODE: return "QueryAtom";
		case ANY_NODE: return "Any";
		case ONE_OR_MORE_NODE: return "OneOrMore";
		case ZERO_OR_MORE_NODE: return "ZeroOrMore";
		default: break;
	}
	return "Unknown";
}

string edge_type_name(EdgeType type)
{
	switch (type)
	{
		case ATTACH_EDGE: return "Attach";
		case LINK_EDGE: return "Link";
		case RULE_IN_EDGE: return "RuleIn";
		case RULE_LABEL_EDGE: return "RuleLabel";
		case ACTION_CHAIN_EDGE: return "ActionChain";
		case ACTION_LABEL_EDGE: return "ActionLabel";
		case RULE_OUT_EDGE: return "RuleOut";
		case RULE_BACKUP_EDGE: return "RuleBackup";
		case QUERY_SEQ_EDGE: return "QuerySeq";
		case QUERY_REF_EDGE: return "QueryRef";
		default: break;
	}
	return "Unknown";
}

vector<int> GraphNode::features() const
{
	vector<int> result(NODE_FEATURES, 0);
	result[type] = 1;
	result[NODE_TYPES] = query_literal ? 1 : 0;
	result[NODE_TYPES + 1] = query_capture ? 1 : 0;
	result[NODE_TYPES + 2] = k;
	return result;
}

vector<int> GraphEdge::features() const
{
	vector<int> result(EDGE_FEATURES, 0);
	result[type] = 1;
	result[EDGE_TYPES] = query_literal ? 1 : 0;
	result[EDGE_TYPES + 1] = query_capture ? 1 : 0;
	return result;
}

void EncodedGraph::write(ostream& stream) const
{
	stream << "mplsq-graph 1" << endl;
	stream << "nodes " << nodes.size() << " " << NODE_FEATURES << endl;
	stream << "edges " << edges.size() << " " << EDGE_FEATURES << endl;
	stream << "query " << query_node << endl;
	for (auto& node : nodes)
	{
		stream << "node " << node.id << " " << node_type_name(node.type);
		for (auto value : node.features())
			stream << " " << value;
		stream << " " << node.name << endl;
	}
	for (auto& edge : edges)
	{
		stream << "edge " << edge.source << " " << edge.target << " " << edge_type_name(edge.type);
		for (auto value : edge.features())
			stream << " " << value;
		stream << endl;
	}
}

int GraphEncoder::add_node(NodeType type, const string& name)
{
	GraphNode node;
	node.id = graph.nodes.size();
	node.type = type;
	node.name = name;
	node.query_literal = false;
	node.query_capture = (type == ZERO_OR_MORE_NODE || type == ONE_OR_MORE_NODE);
	node.k = 0;
	graph.nodes.push_back(node);
	return node.id;
}

void GraphEncoder::add_edge(int source, int target, EdgeType type)
{
	GraphEdge edge;
	edge.source = source;
	edge.target = target;
	edge.type = type;
	edge.query_literal = (type == QUERY_REF_EDGE) || (type == QUERY_SEQ_EDGE && graph.nodes[target].query_literal);
	edge.query_capture = (type == QUERY_SEQ_EDGE && graph.nodes[target].query_capture);
	graph.edges.push_back(edge);
}

int GraphEncoder::label(const string& name)
{
	return label_node.at(name);
}

void GraphEncoder::encode_topology()
{
	for (auto& entry : network.router_map)
	{
		const Router& router = network.routers[entry.second];
		int rnode = add_node(ROUTER_NODE, "router:" + router.name);
		router_node[router.id] = rnode;
		for (auto& iface : router.interface_map)
		{
			int inode = add_node(INTERFACE_NODE, "intf:" + router.name + ":" + iface.first);
			interface_node[iface.second] = inode;
			add_edge(rnode, inode, ATTACH_EDGE);
		}
	}

	// one edge per direction, in interface node order
	for (auto& entry : network.router_map)
	{
		for (auto& iface : network.routers[entry.second].interface_map)
		{
			int other = network.partner(iface.second);
			if (other != NONE)
				add_edge(interface_node[iface.second], interface_node[other], LINK_EDGE);
		}
	}
}

void GraphEncoder::encode_labels()
{
	set<string> labels = network.labels();
	labels.insert(query.initial_stack.begin(), query.initial_stack.end());
	if (query.has_final_stack)
	{
		vector<string> literals = query.final_stack.literals();
		labels.insert(literals.begin(), literals.end());
	}

	label_node[NO_LABEL] = add_node(LABEL_NODE, "label:none");
	for (auto& name : labels)
		label_node[name] = add_node(LABEL_NODE, "label:" + name);
}

void GraphEncoder::encode_rules()
{
	map<int, map<string,int>> by_interface;
	for (auto& rule : network.rules)
		by_interface[rule.in][rule.label] = rule.id;

	for (auto& entry : network.router_map)
	{
		const Router& router = network.routers[entry.second];
		int count = 0;
		for (auto& iface : router.interface_map)
		{
			auto found = by_interface.find(iface.second);
			if (found == by_interface.end())
				continue;

			for (auto& keyed : found->second)
			{
				const Rule& rule = network.rules[keyed.second];
				string prefix = router.name + ":rule" + to_string(count++);

				int rnode = add_node(RULE_NODE, prefix);
				add_edge(interface_node[rule.in], rnode, RULE_IN_EDGE);
				if (rule.label != NO_LABEL)
					add_edge(rnode, label(rule.label), RULE_LABEL_EDGE);

				const Route& primary = rule.routes.front();
				int last = rnode;
				for (size_t j = 0; j < primary.actions.size(); j++)
				{
					const Action& action = primary.actions[j];
					NodeType type = action.type == PUSH ? PUSH_NODE : (action.type == SWAP ? SWAP_NODE : POP_NODE);
					string upper = action.type == PUSH ? "PUSH" : (action.type == SWAP ? "SWAP" : "POP");
					int anode = add_node(type, prefix + ":action" + to_string(j) + ":" + upper);
					add_edge(last, anode, ACTION_CHAIN_EDGE);
					if (action.type != POP)
						add_edge(anode, label(action.label), ACTION_LABEL_EDGE);
					last = anode;
				}
				add_edge(last, interface_node[primary.out], RULE_OUT_EDGE);

				for (size_t r = 1; r < rule.routes.size(); r++)
					add_edge(rnode, interface_node[rule.routes[r].out], RULE_BACKUP_EDGE);
			}
		}
	}
}

int GraphEncoder::encode_pattern(const PathPattern& pattern, bool labels, int last)
{
	string kind = labels ? "label" : "router";

	if (pattern.segments.empty())
	{
		add_edge(last, label(NO_LABEL), QUERY_SEQ_EDGE);
		return label(NO_LABEL);
	}

	for (size_t i = 0; i < pattern.segments.size(); i++)
	{
		const Segment& segment = pattern.segments[i];
		int node = NONE;

		if (segment.kind == LITERAL)
		{
			node = add_node(ATOM_NODE, "atom:" + kind + ":" + segment.text);
			graph.nodes[node].query_literal = true;
			add_edge(last, node, QUERY_SEQ_EDGE);

			int target = NONE;
			if (labels)
			{
				target = label(segment.text);
			}
			else
			{
				int router = network.find_router(segment.text);
				if (router != NONE)
				{
					target = router_node[router];
				}
				else
				{
					auto found = foreign_router_node.find(segment.text);
					if (found == foreign_router_node.end())
					{
						target = add_node(ROUTER_NODE, "router:" + segment.text);
						foreign_router_node[segment.text] = target;
					}
					else
					{
						target = found->second;
					}
				}
				graph.nodes[target].query_literal = true;
			}
			add_edge(node, target, QUERY_REF_EDGE);
		}
		else if (segment.kind == ANY && segment.group != NONE
		         && i + 1 < pattern.segments.size() && pattern.segments[i + 1].group == segment.group)
		{
			// ".+" compiles to ANY followed by CAPTURE of one group
			node = add_node(ONE_OR_MORE_NODE, "atom:" + kind + ":.+");
			add_edge(last, node, QUERY_SEQ_EDGE);
			i++;
		}
		else if (segment.kind == ANY)
		{
			node = add_node(ANY_NODE, kind + ":.");
			add_edge(last, node, QUERY_SEQ_EDGE);
		}
		else
		{
			const string& name = pattern.group_names[segment.group];
			node = add_node(ZERO_OR_MORE_NODE, "atom:" + kind + ":" + (name.empty() ? string(".*") : "[" + name + "]"));
			add_edge(last, node, QUERY_SEQ_EDGE);
		}
		last = node;
	}
	return last;
}

void GraphEncoder::encode_query()
{
	int qnode = add_node(QUERY_NODE, "query");
	graph.nodes[qnode].k = k;
	graph.query_node = qnode;

	int last = qnode;
	if (query.initial_stack.empty())
	{
		add_edge(last, label(NO_LABEL), QUERY_SEQ_EDGE);
		last = label(NO_LABEL);
	}
	for (auto& name : query.initial_stack)
	{
		int node = add_node(ATOM_NODE, "atom:label:" + name);
		graph.nodes[node].query_literal = true;
		add_edge(last, node, QUERY_SEQ_EDGE);
		add_edge(node, label(name), QUERY_REF_EDGE);
		last = node;
	}

	last = encode_pattern(query.path, false, last);

	if (query.has_final_stack)
		encode_pattern(query.final_stack, true, last);
}

EncodedGraph GraphEncoder::encode()
{
	graph = EncodedGraph();
	router_node.clear();
	interface_node.clear();
	label_node.clear();
	foreign_router_node.clear();

	encode_topology();
	encode_labels();
	encode_rules();
	encode_query();

	MPLSQ_LOG(3) << "graph: " << graph.nodes.size() << " nodes, " << graph.edges.size() << " edges" << endl;
	return graph;
}

EncodedGraph encode_graph(const Network& network, const Query& query, int k)
{
	GraphEncoder encoder(network, query, k);
	return encoder.encode();
}

}
