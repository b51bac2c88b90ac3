//
//  TimePeriod.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef TimePeriod_hpp
#define TimePeriod_hpp

#include <string>
#include <vector>

using namespace std;

/* Investment period: build decisions are made once per period. */
struct InvestmentPeriod {
	InvestmentPeriod () : id(-1), ordinal(0), durationHours(0.0) {}

	string	name;
	int		id;
	int		ordinal;		// chronological position
	double	durationHours;	// modeled duration, equals the sum of its timepoint weights

	vector<int> timeseries;
	vector<int> timepoints;
};

/* A representative sequence of timepoints (e.g., a day). Storage wraps,
 * demand-response shifts net out and hydrogen is balanced over a series. */
struct Timeseries {
	Timeseries () : id(-1), periodId(-1), tpDurationHours(1.0), scale(1.0) {}

	string	name;
	int		id;
	string	periodName;
	int		periodId;
	double	tpDurationHours;	// length of each timepoint of the series
	double	scale;				// number of times the series repeats in its period

	vector<int> timepoints;		// in chronological order
};

/* Dispatch timepoint. Power decisions are scaled to energy by its weight. */
struct Timepoint {
	Timepoint () : id(-1), seriesId(-1), periodId(-1), ordinal(0), weight(0.0) {}

	string	name;
	int		id;
	string	seriesName;
	int		seriesId;
	int		periodId;
	int		ordinal;	// position within the series
	double	weight;		// hours of the investment period represented
};

#endif /* TimePeriod_hpp */
