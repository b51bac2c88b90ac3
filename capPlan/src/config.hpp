//
//  config.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef config_h
#define config_h

#include <iosfwd>
#include <set>
#include <string>
#include <vector>

// MACROS
#define BOOST_PARALLEL_LIBS		// Parallel programming libraries of boost is being used

enum PolicyModuleId {
	CARBON_MODULE,
	HYDROGEN_MODULE,
	DEMAND_RESPONSE_MODULE,
	RETROFIT_MODULE
};

enum StorageBoundary {
	WrapAround,		// state-of-charge before the first timepoint of a series is the state at its last timepoint
	ResetEmpty		// every series starts with empty storage
};

struct SolverOptions {
	SolverOptions ();

	std::string backend;	// solver backend name, e.g. "cplex"
	double	timeLimit;		// seconds, <= 0 means no limit
	double	mipGap;			// relative MIP gap
	int		threads;		// solver threads, 0 lets the solver decide
	bool	verbose;		// solver log to the scenario log stream
	bool	retrieveDuals;	// duals of balance and capacity rows
	bool	traceback;		// full diagnostics (model export) on failure
	std::string traceFile;	// where the model is exported with traceback
};

struct RunParameters {
	RunParameters ();

	std::set<PolicyModuleId> modules;	// enabled policy modules
	bool	modulesSpecified;			// false: every module with input data is enabled
	StorageBoundary storageBoundary;
	SolverOptions solver;
	int		batchThreads;				// worker threads for multi-scenario runs
};

bool readRunfile (std::string inputDir, RunParameters &runParam);
bool parseModuleName (const std::string &name, PolicyModuleId &id);
std::string moduleName (PolicyModuleId id);
void printRunParameters (const RunParameters &runParam, std::ostream &out);

const double EPSzero = 1e-8;
const double weightTolerance = 1e-6;	// relative tolerance on period-weight sums

const char delimiter = ',';

#endif /* config_h */
