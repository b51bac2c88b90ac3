//
//  Line.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef Line_hpp
#define Line_hpp

#include <string>

using namespace std;

class Line {

public:
	Line () : id(-1), origId(-1), destId(-1), capacity(0.0), lossFactor(0.0), bidirectional(true) {}

	// line identifiers
	string name;
	int id;

	string origName;	// origin zone
	string destName;	// destination zone
	int origId;
	int destId;

	// line characteristics
	double capacity;	// MW, in each direction
	double lossFactor;	// share of the sent power lost on the way
	bool   bidirectional;
};

#endif /* Line_hpp */
