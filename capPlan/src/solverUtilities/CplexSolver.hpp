//
//  CplexSolver.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef CplexSolver_hpp
#define CplexSolver_hpp

#include <ilcplex/ilocplex.h>
#include <boost/thread/mutex.hpp>

#include "SolverInterface.hpp"

/****************************************************************************
 * CplexSolver
 * - Translates the composed program into a Concert model and solves it
 * with CPLEX. Every solve uses its own environment, released before the
 * call returns.
 * - An infeasible-or-unbounded answer is resolved by solving again with
 * the presolve turned off, then if needed by a feasibility solve with a
 * zero objective.
 * - Duals of a MIP are taken from the LP obtained by fixing the integer
 * variables at their optimal values.
 ****************************************************************************/
class CplexSolver : public SolverBackend {

public:
	explicit CplexSolver (ostream &log);

	string name () const { return "cplex"; }
	SolveResult solve (const LinearProgram &program, const SolverOptions &options);
	void cancel ();

private:
	ostream &log;

	boost::mutex		cancelMutex;	// guards cancelled and aborter
	bool				cancelled;
	IloCplex::Aborter	aborter;		// of the in-flight solve, empty otherwise

	void setParameters (IloEnv &env, IloCplex &cplex, const SolverOptions &options);
	SolveStatus translateStatus (IloCplex &cplex, bool solved, string &message);
	SolveStatus separateInfeasibleFromUnbounded (IloEnv &env, IloModel &model, IloCplex &cplex,
												 IloObjective &objective, string &message);
	bool retrieveDuals (IloEnv &env, IloModel &model, IloCplex &cplex, const LinearProgram &program,
						IloNumVarArray &vars, IloRangeArray &rows, SolveResult &result);
};

#endif /* CplexSolver_hpp */
