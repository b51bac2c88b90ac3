//
//  Solution.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef Solution_hpp
#define Solution_hpp

#include <stdio.h>
#include <string>
#include <vector>

#include "misc.hpp"
#include "catalog/EntityCatalog.hpp"
#include "solverUtilities/SolverInterface.hpp"

struct Solution {

	Solution () : status(SolverError), hasValues(false), hasDuals(false), objective(0.0) {}

	void allocateMem (const EntityCatalog &catalog) {
		int numGen = catalog.numGen(), numTp = catalog.numTimepoints(), numPeriods = catalog.numPeriods();
		int numSeries = (int) catalog.timeseries().size(), numPrograms = (int) catalog.drPrograms().size();

		resize_matrix(dispatch, numGen, numTp);
		resize_matrix(charge, numGen, numTp);
		resize_matrix(stateOfCharge, numGen, numTp);
		resize_matrix(emissions, numGen, numTp);
		resize_matrix(retrofitDispatch, numGen, numTp);
		resize_matrix(h2Consume, numGen, numTp);
		resize_matrix(h2Produce, numGen, numTp);
		resize_matrix(build, numGen, numPeriods);
		resize_matrix(retrofitSelect, numGen, numPeriods);
		resize_matrix(flow, catalog.numLines(), numTp);
		resize_matrix(flowReverse, catalog.numLines(), numTp);
		resize_matrix(shift, numPrograms, numTp);
		resize_matrix(recovery, numPrograms, numTp);
		resize_matrix(drActive, numPrograms, numTp);
		resize_matrix(h2Store, catalog.numZones(), numSeries);
		resize_matrix(h2Withdraw, catalog.numZones(), numSeries);
		resize_matrix(energyBalanceDual, catalog.numZones(), numTp);
		resize_matrix(capacityDual, numGen, numTp);
		periodEmissions.assign(numPeriods, 0.0);
	}

	SolveStatus	status;
	string		message;
	bool		hasValues;
	bool		hasDuals;
	double		objective;

	vector< pair<string, double> > costComponents;	// name, $

	vector< vector<double> > dispatch, charge, stateOfCharge, emissions, retrofitDispatch, h2Consume, h2Produce;	// [generator][timepoint]
	vector< vector<double> > build, retrofitSelect;			// [generator][investment period]
	vector< vector<double> > flow, flowReverse;				// [line][timepoint]
	vector< vector<double> > shift, recovery, drActive;		// [program][timepoint]
	vector< vector<double> > h2Store, h2Withdraw;			// [zone][timeseries]
	vector<double>			 periodEmissions;				// t per investment period

	vector< vector<double> > energyBalanceDual;				// [zone][timepoint]
	vector< vector<double> > capacityDual;					// [generator][timepoint]
};

/* Maps the raw solver output back onto the catalog entities. Handles every
 * status; matrices stay zero when the result carries no values. */
Solution projectSolution (const LinearProgram &program, const SolveResult &result, const EntityCatalog &catalog);

/* Writes the solution as CSV tables into outputDir. */
bool writeSolution (const Solution &solution, const EntityCatalog &catalog, string outputDir);

#endif /* Solution_hpp */
