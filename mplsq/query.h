#ifndef MPLSQ_QUERY_H
#define MPLSQ_QUERY_H

#include <vector>
#include <string>
#include <iostream>
#include <set>

#include "network.h"

namespace mplsq {

enum SegmentKind { LITERAL, ANY, CAPTURE };

// One position of the compiled pattern. A CAPTURE segment loops on any
// name and has an epsilon exit to the next position; ".+" compiles to an
// ANY followed by a CAPTURE of the same group.
class Segment
{
	public:
		SegmentKind kind;
		std::string text;
		int group;
		size_t column;
};

class Capture
{
	public:
		std::string name;
		size_t begin;
		size_t end;
		std::vector<std::string> items;
};

class Match
{
	public:
		std::vector<Capture> captures;

		const Capture* find(const std::string& name) const;
};

// Matcher over sequences of names (routers on a trace, or labels on a
// stack). Immutable once compiled; safe to share between threads.
class PathPattern
{
	public:
		std::string source;
		std::vector<Segment> segments;
		std::vector<std::string> group_names;

		bool accepts(const std::vector<std::string>& word) const;

		// leftmost-lazy: each capture takes the shortest run that still
		// lets the rest of the pattern match
		bool match(const std::vector<std::string>& word, Match& result) const;

		bool literal_only() const;
		std::vector<std::string> literals() const;

		friend std::ostream &operator<<(std::ostream &stream, const PathPattern &pattern);
};

PathPattern compile_pattern(const std::string& text);


// "<initial labels> path <final labels> k", everything but the path optional
class Query
{
	public:
		std::string text;

		bool has_initial_stack;
		LabelStack initial_stack;

		PathPattern path;

		bool has_final_stack;
		PathPattern final_stack;

		int k;

		Query() : has_initial_stack(false), has_final_stack(false), k(NONE) {}

		bool accepts(const std::vector<std::string>& routers, const LabelStack& stack) const;
};

Query parse_query(const std::string& line);

}

#endif
