#include "query.h"

#include <cctype>

#include "boost/regex.hpp"
#include <boost/algorithm/string.hpp>

#include "errors.h"
#include "utils.h"

using namespace std;

namespace mplsq {

namespace {

const boost::regex capture_name("[A-Za-z_][A-Za-z0-9_\\-]*");
const boost::regex literal_name("[^\\s,\\[\\]<>*]+");
const boost::regex stack_bound("[0-9]+");

class Token
{
	public:
		string text;
		size_t column;
		bool bracket;
};

bool is_separator(char c)
{
	return c == ',' || isspace((unsigned char)c);
}

// Splits line[begin, end) into tokens. Columns are relative to the whole line.
vector<Token> tokenize(const string& line, size_t begin, size_t end)
{
	vector<Token> tokens;
	bool pending_comma = false;
	size_t last_comma = begin;
	size_t i = begin;

	while (true)
	{
		while (i < end && isspace((unsigned char)line[i]))
			i++;
		if (i == end)
		{
			if (pending_comma)
				throw InvalidPatternError(line, last_comma, "empty token after ','");
			break;
		}

		char c = line[i];
		if (c == ',')
		{
			if (tokens.empty() || pending_comma)
				throw InvalidPatternError(line, i, "empty token before ','");
			pending_comma = true;
			last_comma = i;
			i++;
			continue;
		}
		if (c == ']')
			throw InvalidPatternError(line, i, "unbalanced ']'");

		Token token;
		token.column = i;
		if (c == '[')
		{
			size_t close = line.find(']', i + 1);
			if (close == string::npos || close >= end)
				throw InvalidPatternError(line, i, "unbalanced '['");
			size_t nested = line.find('[', i + 1);
			if (nested < close)
				throw InvalidPatternError(line, nested, "nested '['");
			token.text = boost::algorithm::trim_copy(line.substr(i + 1, close - i - 1));
			token.bracket = true;
			i = close + 1;
			if (i < end && !is_separator(line[i]))
				throw InvalidPatternError(line, i, "expected separator after ']'");
		}
		else
		{
			size_t stop = i;
			while (stop < end && !is_separator(line[stop]) && line[stop] != '[' && line[stop] != ']')
				stop++;
			if (stop < end && (line[stop] == '[' || line[stop] == ']'))
				throw InvalidPatternError(line, stop, "bracket inside literal");
			token.text = line.substr(i, stop - i);
			token.bracket = false;
			i = stop;
		}
		tokens.push_back(token);
		pending_comma = false;
	}
	return tokens;
}

PathPattern compile_range(const string& line, size_t begin, size_t end, bool allow_empty)
{
	PathPattern pattern;
	pattern.source = boost::algorithm::trim_copy(line.substr(begin, end - begin));

	vector<Token> tokens = tokenize(line, begin, end);
	if (tokens.empty() && !allow_empty)
		throw InvalidPatternError(line, begin, "empty pattern");

	set<string> names;
	for (auto& token : tokens)
	{
		Segment segment;
		segment.column = token.column;
		segment.group = NONE;

		if (token.bracket)
		{
			if (!token.text.empty())
			{
				if (!boost::regex_match(token.text, capture_name))
					throw InvalidPatternError(line, token.column, "invalid capture name '" + token.text + "'");
				if (!names.insert(token.text).second)
					throw InvalidPatternError(line, token.column, "duplicate capture name '" + token.text + "'");
			}
			segment.kind = CAPTURE;
			segment.group = pattern.group_names.size();
			pattern.group_names.push_back(token.text);
			pattern.segments.push_back(segment);
		}
		else if (token.text == "*" || token.text == ".*")
		{
			segment.kind = CAPTURE;
			segment.group = pattern.group_names.size();
			pattern.group_names.push_back("");
			pattern.segments.push_back(segment);
		}
		else if (token.text == ".+")
		{
			segment.kind = ANY;
			segment.group = pattern.group_names.size();
			pattern.group_names.push_back("");
			pattern.segments.push_back(segment);
			segment.kind = CAPTURE;
			pattern.segments.push_back(segment);
		}
		else if (token.text == ".")
		{
			segment.kind = ANY;
			pattern.segments.push_back(segment);
		}
		else
		{
			if (token.text.find('*') != string::npos)
				throw InvalidPatternError(line, token.column, "wildcard inside literal '" + token.text + "'");
			if (!boost::regex_match(token.text, literal_name))
				throw InvalidPatternError(line, token.column, "invalid literal '" + token.text + "'");
			segment.kind = LITERAL;
			segment.text = token.text;
			pattern.segments.push_back(segment);
		}
	}

	MPLSQ_LOG(2) << "compiled " << pattern << endl;
	return pattern;
}

}

const Capture* Match::find(const string& name) const
{
	for (auto& capture : captures)
	{
		if (capture.name == name)
			return &capture;
	}
	return 0;
}

bool PathPattern::accepts(const vector<string>& word) const
{
	size_t n = segments.size();
	vector<char> current(n + 1, 0), next(n + 1, 0);

	current[0] = 1;
	for (size_t i = 0; i < n; i++)
	{
		if (current[i] && segments[i].kind == CAPTURE)
			current[i + 1] = 1;
	}

	for (auto& symbol : word)
	{
		std::fill(next.begin(), next.end(), 0);
		bool alive = false;
		for (size_t i = 0; i < n; i++)
		{
			if (!current[i])
				continue;
			switch (segments[i].kind)
			{
				case LITERAL:
					if (segments[i].text == symbol)
						next[i + 1] = 1;
					break;
				case ANY:
					next[i + 1] = 1;
					break;
				case CAPTURE:
					next[i] = 1;
					break;
			}
		}
		// epsilon exits of captures, in increasing order
		for (size_t i = 0; i < n; i++)
		{
			if (next[i] && segments[i].kind == CAPTURE)
				next[i + 1] = 1;
		}
		for (size_t i = 0; i <= n; i++)
			alive = alive || next[i];
		if (!alive)
			return false;
		current.swap(next);
	}
	return current[n] != 0;
}

bool PathPattern::match(const vector<string>& word, Match& result) const
{
	size_t n = segments.size();
	size_t m = word.size();

	// can[i][j]: segments i.. accept word j..
	vector<vector<char>> can(n + 1, vector<char>(m + 1, 0));
	can[n][m] = 1;
	for (size_t ii = n; ii-- > 0; )
	{
		for (size_t jj = m + 1; jj-- > 0; )
		{
			const Segment& segment = segments[ii];
			char value = 0;
			switch (segment.kind)
			{
				case LITERAL:
					value = jj < m && word[jj] == segment.text && can[ii + 1][jj + 1];
					break;
				case ANY:
					value = jj < m && can[ii + 1][jj + 1];
					break;
				case CAPTURE:
					value = can[ii + 1][jj] || (jj < m && can[ii][jj + 1]);
					break;
			}
			can[ii][jj] = value;
		}
	}

	result.captures.clear();
	if (!can[0][0])
		return false;

	vector<size_t> begins(group_names.size(), 0), ends(group_names.size(), 0);
	vector<char> started(group_names.size(), 0);

	size_t j = 0;
	for (size_t i = 0; i < n; i++)
	{
		const Segment& segment = segments[i];
		if (segment.group != NONE && !started[segment.group])
		{
			started[segment.group] = 1;
			begins[segment.group] = j;
		}
		if (segment.kind == CAPTURE)
		{
			while (!can[i + 1][j])
				j++;
		}
		else
		{
			j++;
		}
		if (segment.group != NONE)
			ends[segment.group] = j;
	}

	for (size_t g = 0; g < group_names.size(); g++)
	{
		Capture capture;
		capture.name = group_names[g];
		capture.begin = begins[g];
		capture.end = ends[g];
		capture.items.assign(word.begin() + begins[g], word.begin() + ends[g]);
		result.captures.push_back(capture);
	}
	return true;
}

bool PathPattern::literal_only() const
{
	for (auto& segment : segments)
	{
		if (segment.kind != LITERAL)
			return false;
	}
	return true;
}

vector<string> PathPattern::literals() const
{
	vector<string> result;
	for (auto& segment : segments)
	{
		if (segment.kind == LITERAL)
			result.push_back(segment.text);
	}
	return result;
}

ostream &operator<<(ostream &stream, const PathPattern &pattern)
{
	stream << "pattern '" << pattern.source << "' states:" << pattern.segments.size() + 1 << " [";
	for (size_t i = 0; i < pattern.segments.size(); i++)
	{
		const Segment& segment = pattern.segments[i];
		switch (segment.kind)
		{
			case LITERAL:
				stream << " " << i << "-" << segment.text << "->" << i + 1;
				break;
			case ANY:
				stream << " " << i << "-.->" << i + 1;
				break;
			case CAPTURE:
				stream << " " << i << "-.->" << i << " " << i << "-e->" << i + 1;
				break;
		}
		if (segment.group != NONE)
			stream << "(g" << segment.group << ")";
	}
	stream << " ] final:" << pattern.segments.size();
	return stream;
}

PathPattern compile_pattern(const string& text)
{
	if (text.find_first_of("<>") != string::npos)
		throw InvalidPatternError(text, text.find_first_of("<>"), "unexpected label bracket");
	return compile_range(text, 0, text.size(), false);
}

bool Query::accepts(const vector<string>& routers, const LabelStack& stack) const
{
	if (!path.accepts(routers))
		return false;
	return !has_final_stack || final_stack.accepts(stack);
}

Query parse_query(const string& line)
{
	Query query;
	query.text = boost::algorithm::trim_copy(line);

	size_t begin = line.find_first_not_of(" \t\r\n");
	if (begin == string::npos)
		throw InvalidPatternError(line, 0, "empty pattern");

	size_t path_begin = begin;
	if (line[begin] == '<')
	{
		size_t close = line.find('>', begin + 1);
		if (close == string::npos)
			throw InvalidPatternError(line, begin, "unterminated '<'");
		if (line.find('<', begin + 1) < close)
			throw InvalidPatternError(line, line.find('<', begin + 1), "nested '<'");

		PathPattern initial = compile_range(line, begin + 1, close, true);
		if (!initial.literal_only())
			throw InvalidPatternError(line, begin, "initial label stack must list literal labels");
		query.has_initial_stack = true;
		query.initial_stack = initial.literals();
		path_begin = close + 1;
	}

	size_t path_end = line.find_first_of("<>", path_begin);
	if (path_end != string::npos && line[path_end] == '>')
		throw InvalidPatternError(line, path_end, "unbalanced '>'");
	if (path_end == string::npos)
		path_end = line.size();

	query.path = compile_range(line, path_begin, path_end, false);

	if (path_end < line.size())
	{
		size_t close = line.find('>', path_end + 1);
		if (close == string::npos)
			throw InvalidPatternError(line, path_end, "unterminated '<'");
		if (line.find('<', path_end + 1) < close)
			throw InvalidPatternError(line, line.find('<', path_end + 1), "nested '<'");

		query.final_stack = compile_range(line, path_end + 1, close, true);
		query.has_final_stack = true;

		string rest = boost::algorithm::trim_copy(line.substr(close + 1));
		if (!rest.empty())
		{
			if (!boost::regex_match(rest, stack_bound))
				throw InvalidPatternError(line, line.find(rest, close + 1), "expected failure bound, found '" + rest + "'");
			try
			{
				query.k = std::stoi(rest);
			}
			catch (const std::out_of_range&)
			{
				throw InvalidPatternError(line, line.find(rest, close + 1), "failure bound out of range");
			}
		}
	}

	MPLSQ_LOG(3) << "query '" << query.text << "' initial:" << query.initial_stack << " k:" << query.k << endl;
	return query;
}

}
