#ifndef MPLSQ_CLI_H
#define MPLSQ_CLI_H

#include <iostream>

namespace mplsq {

enum ExitCode
{
	EXIT_SATISFIED = 0,
	EXIT_VIOLATED = 1,
	EXIT_USAGE = 2,
	EXIT_PARSE = 3,
	EXIT_PATTERN = 4,
	EXIT_OVERFLOW = 5,
	EXIT_SOLVER = 6,
	EXIT_INTERNAL = 7
};

// mplsq_verify TOPOLOGY ROUTING QUERY [K] [options]; returns the exit code
int run(int argc, const char* const argv[], std::ostream& out, std::ostream& err);

// Must be called from inside a catch block. Prints the exception being
// handled and returns its exit code; anything not derived from
// std::exception is rethrown.
int report_error(std::ostream& err);

}

#endif
