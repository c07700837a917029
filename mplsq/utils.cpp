#include "utils.h"

#include <streambuf>

namespace mplsq {

int log_threshold = MPLSQ_LOG_THRESHOLD;

namespace {

class nullstreambuf: public std::streambuf
{
	protected:
		int overflow(int c) { return traits_type::not_eof(c); }
};

nullstreambuf nostreambuf;
std::ostream nocout(&nostreambuf);

}

std::ostream& log_stream(int level)
{
	return (level >= log_threshold) ? std::cout : nocout;
}

}
