#ifndef MPLSQ_READER_H
#define MPLSQ_READER_H

#include <string>
#include <iostream>

#include "network.h"

namespace mplsq {

// Builds a Network from a topology and a routing document in the P-Rex
// XML format. Throws MalformedInputError, DanglingInterfaceError or
// UnknownReferenceError; nothing is returned on failure.
class NetworkReader
{
	public:
		NetworkReader() {}

		Network read(std::istream& topology, std::istream& routing);
		Network read_files(const std::string& topology_file, const std::string& routing_file);

	private:
		Network network;

		void read_topology(std::istream& input);
		void read_routing(std::istream& input);
};

Network read_network(std::istream& topology, std::istream& routing);
Network read_network_files(const std::string& topology_file, const std::string& routing_file);

}

#endif
