//
//  CplexSolver.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include "CplexSolver.hpp"
#include "../misc.hpp"

namespace {

	double cplexBound (double value) {
		if (value >= IloInfinity)	return IloInfinity;
		if (value <= -IloInfinity)	return -IloInfinity;
		return value;
	}

	IloNumVar::Type cplexType (VarType type) {
		switch (type) {
			case INTEGER:	return ILOINT;
			case BINARY:	return ILOBOOL;
			default:		return ILOFLOAT;
		}
	}
}

CplexSolver::CplexSolver (ostream &log) : log(log), cancelled(false) {}

void CplexSolver::cancel () {
	boost::mutex::scoped_lock lock (cancelMutex);
	cancelled = true;
	if (aborter.getImpl() != 0) {
		aborter.abort();
	}
}

void CplexSolver::setParameters (IloEnv &env, IloCplex &cplex, const SolverOptions &options) {
	if (options.verbose) {
		cplex.setOut(log);
		cplex.setWarning(log);
	}
	else {
		cplex.setOut(env.getNullStream());
		cplex.setWarning(env.getNullStream());
	}

	cplex.setParam(IloCplex::EpGap, options.mipGap);
	if (options.timeLimit > 0) {
		cplex.setParam(IloCplex::TiLim, options.timeLimit);
	}
	if (options.threads > 0) {
		cplex.setParam(IloCplex::Threads, options.threads);
	}
}

/****************************************************************************
 * translateStatus
 * - Maps the CPLEX outcome onto a SolveStatus. A limit other than time,
 * a user abort and anything unexpected are solver errors.
 ****************************************************************************/
SolveStatus CplexSolver::translateStatus (IloCplex &cplex, bool solved, string &message) {
	IloAlgorithm::Status status = cplex.getStatus();
	IloCplex::CplexStatus cplexStatus = cplex.getCplexStatus();

	ostringstream ss;
	ss << cplexStatus;
	message = ss.str();

	if (cplexStatus == IloCplex::AbortTimeLim || cplexStatus == IloCplex::AbortDetTimeLim) {
		return TimedOut;
	}
	if (cplexStatus == IloCplex::AbortUser) {
		message = "solve cancelled";
		return SolverError;
	}

	switch (status) {
		case IloAlgorithm::Optimal:
			return Optimal;
		case IloAlgorithm::Infeasible:
			return Infeasible;
		case IloAlgorithm::Unbounded:
			return Unbounded;
		case IloAlgorithm::InfeasibleOrUnbounded:
			// only reached with a zero objective, which cannot be unbounded
			message = "infeasible (" + message + ")";
			return Infeasible;
		default:
			break;
	}
	if (!solved && message.empty()) {
		message = "no solution";
	}
	return SolverError;
}

/****************************************************************************
 * separateInfeasibleFromUnbounded
 * - Solves the model once more with a zero objective. A feasible point
 * means the original objective is unbounded, otherwise the model is
 * infeasible. The original objective is put back afterwards.
 ****************************************************************************/
SolveStatus CplexSolver::separateInfeasibleFromUnbounded (IloEnv &env, IloModel &model, IloCplex &cplex,
														  IloObjective &objective, string &message) {
	log << "Still infeasible or unbounded, solving for feasibility with a zero objective." << endl;

	IloObjective zero = IloMinimize(env);
	model.remove(objective);
	model.add(zero);

	SolveStatus status;
	bool feasible = cplex.solve();
	if (feasible && cplex.isPrimalFeasible()) {
		message = "feasible with a zero objective, the objective is unbounded";
		status = Unbounded;
	}
	else {
		status = translateStatus(cplex, feasible, message);
	}

	model.remove(zero);
	zero.end();
	model.add(objective);

	return status;
}

/****************************************************************************
 * retrieveDuals
 * - LP: duals of the solved model.
 * - MIP: the integer variables are fixed at their rounded values, the model
 * is converted to an LP and solved again; the duals of that LP are
 * returned. The primal values of the MIP are kept.
 ****************************************************************************/
bool CplexSolver::retrieveDuals (IloEnv &env, IloModel &model, IloCplex &cplex, const LinearProgram &program,
								 IloNumVarArray &vars, IloRangeArray &rows, SolveResult &result) {
	if (program.isMip()) {
		IloNumVarArray integers (env);
		for (int j=0; j<program.numCols(); j++) {
			if (program.columns[j].type == CONTINUOUS) continue;
			double fixed = round(result.values[j]);
			vars[j].setBounds(fixed, fixed);
			integers.add(vars[j]);
		}
		IloConversion convertToLP (env, integers, ILOFLOAT);
		model.add(convertToLP);

		if (!cplex.solve() || cplex.getStatus() != IloAlgorithm::Optimal) {
			log << "Warning:: the LP with fixed integer variables did not solve, duals are not available." << endl;
			return false;
		}
	}

	IloNumArray duals (env);
	cplex.getDuals(duals, rows);
	result.duals.resize(program.numRows());
	for (int i=0; i<program.numRows(); i++) {
		result.duals[i] = duals[i];
	}
	return true;
}

/****************************************************************************
 * solve
 * - Builds the Concert model column by column and row by row in program
 * order, so values and duals line up with the program indices.
 * - Concert exceptions are reported verbatim as SolverError.
 ****************************************************************************/
SolveResult CplexSolver::solve (const LinearProgram &program, const SolverOptions &options) {
	SolveResult result;
	IloEnv env;

	try {
		IloModel model (env);

		IloNumVarArray vars (env);
		for (int j=0; j<program.numCols(); j++) {
			const ProgramColumn &col = program.columns[j];
			vars.add(IloNumVar(env, cplexBound(col.lb), cplexBound(col.ub), cplexType(col.type), lpName(col.name).c_str()));
		}

		IloRangeArray rows (env);
		for (int i=0; i<program.numRows(); i++) {
			const ProgramRow &row = program.rows[i];

			IloExpr expr (env);
			for (int k=0; k<(int) row.terms.size(); k++) {
				expr += row.terms[k].coef * vars[ row.terms[k].var ];
			}
			double lb = (row.sense == LessEqual) ? -IloInfinity : row.rhs;
			double ub = (row.sense == GreaterEqual) ? IloInfinity : row.rhs;
			rows.add(IloRange(env, lb, expr, ub, lpName(row.name).c_str()));
			expr.end();
		}
		model.add(vars);
		model.add(rows);

		IloExpr obj (env);
		for (int k=0; k<(int) program.objective.size(); k++) {
			obj += program.objective[k].coef * vars[ program.objective[k].var ];
		}
		obj += program.objectiveConstant;
		IloObjective objective = IloMinimize(env, obj);
		model.add(objective);
		obj.end();

		IloCplex cplex (model);
		setParameters(env, cplex, options);

		{
			boost::mutex::scoped_lock lock (cancelMutex);
			if (cancelled) {
				result.message = "solve cancelled";
				env.end();
				return result;
			}
			aborter = IloCplex::Aborter(env);
			cplex.use(aborter);
		}

		bool solved = cplex.solve();
		if (cplex.getStatus() == IloAlgorithm::InfeasibleOrUnbounded) {
			log << "Infeasible or unbounded, solving again without presolve." << endl;
			cplex.setParam(IloCplex::PreInd, IloFalse);
			solved = cplex.solve();
		}

		if (cplex.getStatus() == IloAlgorithm::InfeasibleOrUnbounded) {
			result.status = separateInfeasibleFromUnbounded(env, model, cplex, objective, result.message);
			solved = false;
		}
		else {
			result.status = translateStatus(cplex, solved, result.message);
		}

		if ((result.status == Optimal || result.status == TimedOut) && solved && cplex.isPrimalFeasible()) {
			IloNumArray values (env);
			cplex.getValues(values, vars);
			result.values.resize(program.numCols());
			for (int j=0; j<program.numCols(); j++) {
				result.values[j] = values[j];
			}
			result.objective = cplex.getObjValue();
			result.hasValues = true;
		}

		if (result.status == Optimal && options.retrieveDuals) {
			result.hasDuals = retrieveDuals(env, model, cplex, program, vars, rows, result);
		}

		if (result.status != Optimal && options.traceback) {
			log << "Solve ended with status " << statusName(result.status) << " (" << result.message << "), "
				<< "exporting the model to " << options.traceFile << endl;
			cplex.exportModel(options.traceFile.c_str());
		}
	}
	catch (IloException &e) {
		result.status = SolverError;
		result.hasValues = false;
		result.hasDuals = false;
		result.message = e.getMessage();
		log << "Concert exception: " << e << endl;
	}

	{
		boost::mutex::scoped_lock lock (cancelMutex);
		aborter = IloCplex::Aborter();
	}
	env.end();

	return result;
}
