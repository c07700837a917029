#ifndef MPLSQ_ERRORS_H
#define MPLSQ_ERRORS_H

#include <stdexcept>
#include <string>

namespace mplsq {

class Error : public std::runtime_error
{
	public:
		explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// parse time: no partial network is ever returned

class ParseError : public Error
{
	public:
		std::string document;
		ParseError(const std::string& document_i, const std::string& what)
			: Error(document_i + ": " + what), document(document_i) {}
};

class MalformedInputError : public ParseError
{
	public:
		MalformedInputError(const std::string& document, const std::string& what)
			: ParseError(document, what) {}
};

class DanglingInterfaceError : public ParseError
{
	public:
		DanglingInterfaceError(const std::string& document, const std::string& what)
			: ParseError(document, what) {}
};

class UnknownReferenceError : public ParseError
{
	public:
		UnknownReferenceError(const std::string& document, const std::string& what)
			: ParseError(document, what) {}
};

class InvalidPatternError : public Error
{
	public:
		std::string pattern;
		size_t position;
		InvalidPatternError(const std::string& pattern_i, size_t position_i, const std::string& what)
			: Error("query: " + what + " at column " + std::to_string(position_i + 1) + " in '" + pattern_i + "'"),
			  pattern(pattern_i), position(position_i) {}
};

class EnumerationOverflow : public Error
{
	public:
		unsigned long long count;
		unsigned long long limit;
		bool saturated;
		EnumerationOverflow(unsigned long long count_i, unsigned long long limit_i, bool saturated_i)
			: Error(saturated_i
			        ? "scenario count does not fit in 64 bits"
			        : "scenario count " + std::to_string(count_i) + " exceeds limit " + std::to_string(limit_i)),
			  count(count_i), limit(limit_i), saturated(saturated_i) {}
};

class UsageError : public Error
{
	public:
		explicit UsageError(const std::string& what) : Error(what) {}
};

class SolverError : public Error
{
	public:
		explicit SolverError(const std::string& what) : Error(what) {}
};

}

#endif
