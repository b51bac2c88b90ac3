//
//  LoadZone.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef LoadZone_hpp
#define LoadZone_hpp

#include <string>
#include <vector>

using namespace std;

class LoadZone {

public:
	LoadZone () : id(-1) {}

	// zone identifiers
	int id;
	string name;

	vector<double>	load;					// MW, one entry per timepoint
	vector<int>		connectedGenerators;	// generator ids
	vector<int>		outgoingLines;			// line ids with this zone as origin
	vector<int>		incomingLines;			// line ids with this zone as destination
};

#endif /* LoadZone_hpp */
