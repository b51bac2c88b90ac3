//
//  Generator.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef Generator_hpp
#define Generator_hpp

#include <stdio.h>
#include <string>

using namespace std;

class Generator {

public:
	Generator ();

	bool setType (string typeName);	// sets generator type given its name, false if unknown
	string typeName () const;

	bool isStorage () const		{ return type == STORAGE; }
	bool isElectrolyzer () const	{ return type == ELECTROLYZER; }
	bool isThermal () const		{ return type == THERMAL; }
	bool isBuildable () const	{ return maxBuildCapacity > 0; }
	bool dispatches () const	{ return type != ELECTROLYZER; }		// produces electricity
	bool emitsCarbon () const	{ return dispatches() && (emissionRate > 0 || retrofitEligible); }
	double maxCapacity () const	{ return existingCapacity + maxBuildCapacity; }	// MW, may be infinite

	// generator identifiers
	string name;	// provided by the data
	int id;			// assigned by the catalog

	enum GeneratorType {
		THERMAL,
		WIND,
		SOLAR,
		HYDRO,
		STORAGE,
		ELECTROLYZER,
		OTHER
	};
	GeneratorType type;

	string	zoneName;	// name of the load zone this unit is connected to
	int		zoneId;

	// capacity
	double existingCapacity;	// MW
	double maxBuildCapacity;	// MW, candidate build limit over the horizon
	bool   integerBuild;		// build decisions in whole MW

	// costs
	double variableCost;		// $ / MWh
	double fixedCost;			// $ / MW installed per investment period
	double capitalCost;			// $ / MW built

	// emissions
	double emissionRate;				// t / MWh
	bool   retrofitEligible;
	double postRetrofitEmissionRate;	// t / MWh after a retrofit

	// storage
	double storageHours;		// energy capacity per MW of power capacity
	double chargeEfficiency;	// share of charged energy that is stored

	// electrolyzer
	double conversionEfficiency;	// kg hydrogen / MWh
};

#endif /* Generator_hpp */
