#ifndef MPLSQ_UTILS_H
#define MPLSQ_UTILS_H

#include <vector>
#include <string>
#include <iostream>
#include <tuple>
#include <set>
#include <map>

#include "config.h"

namespace mplsq {

// messages below the threshold go to a null stream
extern int log_threshold;
std::ostream& log_stream(int level);

}

#define MPLSQ_LOG(x) ::mplsq::log_stream(x)


namespace mplsq {

template<typename T1, typename T2>
std::ostream &operator<<(std::ostream &stream, const std::pair<T1,T2> & p)
{
	stream<<"("<<p.first<<","<<p.second<<")";
	return stream;
}

template<typename T1, typename T2>
std::ostream &operator<<(std::ostream &stream, const std::map<T1, T2>& map)
{
	stream<<"[";
	for (typename std::map<T1, T2>::const_iterator it = map.begin();
			 it != map.end();
			 ++it)
		{
			stream << " " << (*it).first << " --> " << (*it).second;
		}
		stream<<" ] size:"<<map.size();
	return stream;
}

template<typename T>
std::ostream &operator<<(std::ostream &stream, const std::vector<T> & v)
{
	stream<<"[";
	for (typename std::vector<T> ::const_iterator it = v.begin();
			 it != v.end();
			 ++it)
		{
			if (it != v.begin())
				stream << ",";
			stream << " " << (*it);
		}
		stream<<" ]";
	return stream;
}

template<typename T>
std::ostream &operator<<(std::ostream &stream, const std::set<T> & v)
{
	stream<<"{";
	for (typename std::set<T> ::const_iterator it = v.begin();
			 it != v.end();
			 ++it)
		{
			if (it != v.begin())
				stream << ",";
			stream << " " << (*it);
		}
		stream<<" }";
	return stream;
}

}

#endif
