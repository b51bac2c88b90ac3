//
//  SolverInterface.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include "SolverInterface.hpp"
#include "CplexSolver.hpp"
#include "../errors.hpp"
#include "../misc.hpp"

string statusName (SolveStatus status) {
	switch (status) {
		case Optimal:		return "Optimal";
		case Infeasible:	return "Infeasible";
		case Unbounded:		return "Unbounded";
		case TimedOut:		return "TimedOut";
		case SolverError:	return "SolverError";
	}
	return "Unknown";
}

SolverBackendPtr createSolverBackend (const string &name, ostream &log) {
	if (toLower(name) == "cplex") {
		return SolverBackendPtr(new CplexSolver(log));
	}
	throw ConfigurationError("unknown solver backend '" + name + "'");
}
