//
//  SolverInterface.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef SolverInterface_hpp
#define SolverInterface_hpp

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "../config.hpp"
#include "../model/LinearProgram.hpp"

using namespace std;

enum SolveStatus {
	Optimal,
	Infeasible,
	Unbounded,
	TimedOut,
	SolverError
};

string statusName (SolveStatus status);

struct SolveResult {
	SolveResult () : status(SolverError), hasValues(false), hasDuals(false), objective(0.0) {}

	SolveStatus		status;
	bool			hasValues;		// values are set (optimal, or best found before a time limit)
	bool			hasDuals;		// duals are set (optimal and requested)
	vector<double>	values;			// per program column
	vector<double>	duals;			// per program row
	double			objective;
	string			message;		// solver message, verbatim
};

/****************************************************************************
 * SolverBackend
 * - Solves a composed program; every outcome is reported as a status,
 * never as an exception.
 * - cancel() may be called from another thread. It aborts an in-flight
 * solve and every later one; their results are to be discarded.
 ****************************************************************************/
class SolverBackend {

public:
	virtual ~SolverBackend () {}

	virtual string name () const = 0;
	virtual SolveResult solve (const LinearProgram &program, const SolverOptions &options) = 0;
	virtual void cancel () = 0;
};

typedef std::shared_ptr<SolverBackend> SolverBackendPtr;

/* throws ConfigurationError for an unknown backend name */
SolverBackendPtr createSolverBackend (const string &name, ostream &log);

#endif /* SolverInterface_hpp */
