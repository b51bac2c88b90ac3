//
//  Policies.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef Policies_hpp
#define Policies_hpp

#include <math.h>
#include <string>
#include <vector>

using namespace std;

struct CarbonPolicy {
	CarbonPolicy () : periodId(-1), hasCap(false), cap(0.0), carbonCost(0.0) {}

	string	periodName;
	int		periodId;
	bool	hasCap;
	double	cap;			// t per investment period
	double	carbonCost;		// $ / t
};

struct HydrogenDemand {
	HydrogenDemand () : zoneId(-1), seriesId(-1), demandKg(0.0) {}

	string	zoneName;
	string	seriesName;
	int		zoneId;
	int		seriesId;
	double	demandKg;		// kg to deliver over the series
};

struct HydrogenStorage {
	HydrogenStorage () : zoneId(-1), capacityKg(0.0), costPerKg(0.0) {}

	string	zoneName;
	int		zoneId;
	double	capacityKg;		// kg stored or withdrawn per series
	double	costPerKg;		// $ / kg stored
};

class DemandResponseProgram {

public:
	DemandResponseProgram () : id(-1), zoneId(-1), defaultShiftUp(0.0), defaultShiftDown(0.0), activationGap(0),
		responseHours(0.0), recoveryHours(0.0), seriesShiftUpLimit(HUGE_VAL), seriesShiftDownLimit(HUGE_VAL) {}

	bool recovers () const			{ return recoveryHours > 0; }
	bool limitsSeriesShift () const	{ return seriesShiftUpLimit < HUGE_VAL || seriesShiftDownLimit < HUGE_VAL; }

	string	name;
	int		id;
	string	zoneName;
	int		zoneId;

	double	defaultShiftUp;		// MW of load that may be added in a timepoint
	double	defaultShiftDown;	// MW of load that may be removed in a timepoint
	int		activationGap;		// at most one activation per this many consecutive timepoints, 0 = no activation logic
	double	responseHours;		// no activation within this many hours of the start of a series
	double	recoveryHours;		// shifted load returns linearly over this many hours, 0 = no recovery

	// MW summed over the timepoints of a series
	double	seriesShiftUpLimit;
	double	seriesShiftDownLimit;

	vector<double> shiftUp;		// per timepoint, filled by the catalog
	vector<double> shiftDown;
};

struct RetrofitOption {
	RetrofitOption () : generatorId(-1), cost(0.0), firstPeriodId(-1) {}

	string	generatorName;
	int		generatorId;
	double	cost;				// $, one-time
	string	firstPeriodName;	// earliest investment period for the retrofit, empty = first period
	int		firstPeriodId;
};

#endif /* Policies_hpp */
