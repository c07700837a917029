#ifndef MPLSQ_GRAPH_H
#define MPLSQ_GRAPH_H

#include <vector>
#include <string>
#include <iostream>
#include <map>

#include "network.h"
#include "query.h"

namespace mplsq {

// Order and meaning of both enums are part of the feature layout handed
// to the learner. Append only.
enum NodeType
{
	ROUTER_NODE,
	INTERFACE_NODE,
	LABEL_NODE,
	RULE_NODE,
	PUSH_NODE,
	SWAP_NODE,
	POP_NODE,
	QUERY_NODE,
	ATOM_NODE,
	ANY_NODE,
	ONE_OR_MORE_NODE,
	ZERO_OR_MORE_NODE,
	NODE_TYPES
};

enum EdgeType
{
	ATTACH_EDGE,
	LINK_EDGE,
	RULE_IN_EDGE,
	RULE_LABEL_EDGE,
	ACTION_CHAIN_EDGE,
	ACTION_LABEL_EDGE,
	RULE_OUT_EDGE,
	RULE_BACKUP_EDGE,
	QUERY_SEQ_EDGE,
	QUERY_REF_EDGE,
	EDGE_TYPES
};

const int NODE_FEATURES = NODE_TYPES + 3;
const int EDGE_FEATURES = EDGE_TYPES + 2;

std::string node_type_name(NodeType type);
std::string edge_type_name(EdgeType type);

class GraphNode
{
	public:
		int id;
		NodeType type;
		std::string name;
		bool query_literal;
		bool query_capture;
		int k;

		// one-hot type, literal flag, capture flag, k
		std::vector<int> features() const;
};

class GraphEdge
{
	public:
		int source;
		int target;
		EdgeType type;
		bool query_literal;
		bool query_capture;

		// one-hot type, literal flag, capture flag
		std::vector<int> features() const;
};

class EncodedGraph
{
	public:
		std::vector<GraphNode> nodes;
		std::vector<GraphEdge> edges;
		int query_node;

		EncodedGraph() : query_node(NONE) {}

		void write(std::ostream& stream) const;
};

// Directed graph of the network and the query for the external learner.
// The same network and query always give the same node and edge order.
class GraphEncoder
{
	public:
		GraphEncoder(const Network& network_i, const Query& query_i, int k_i)
			: network(network_i), query(query_i), k(k_i) {}

		EncodedGraph encode();

	private:
		const Network& network;
		const Query& query;
		int k;

		EncodedGraph graph;
		std::map<int,int> router_node;
		std::map<int,int> interface_node;
		std::map<std::string,int> label_node;
		std::map<std::string,int> foreign_router_node;

		int add_node(NodeType type, const std::string& name);
		void add_edge(int source, int target, EdgeType type);

		void encode_topology();
		void encode_labels();
		void encode_rules();
		void encode_query();
		int encode_pattern(const PathPattern& pattern, bool labels, int last);
		int label(const std::string& name);
};

EncodedGraph encode_graph(const Network& network, const Query& query, int k);

}

#endif
