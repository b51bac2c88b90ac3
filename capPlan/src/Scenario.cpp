//
//  Scenario.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include "Scenario.hpp"
#include "errors.hpp"

Scenario::Scenario (const string &name, const EntityCatalog &catalog, const RunParameters &runParam) :
	name(name), catalog(catalog), runParam(runParam) {

	this->catalog.finalize();

	// kept until the log file of a run is open
	ostringstream warnings;
	modules = createPolicyModules(runParam, this->catalog, warnings);
	setupWarnings = warnings.str();
}

LinearProgram Scenario::buildModel () const {
	ModelBuilder builder (catalog, runParam.storageBoundary);
	for (int m=0; m<(int) modules.size(); m++) {
		builder.addModule(modules[m]);
	}
	return builder.build();
}

bool Scenario::prepareOutput (const string &outputDir) {
	if (!make_dir(outputDir)) return false;
	return openLogFile(outputDir + "/capPlan.log");
}

SolveResult Scenario::solve (SolverBackend &backend, const LinearProgram &program, const string &outputDir) {
	SolverOptions options = runParam.solver;
	options.traceFile = outputDir + "/failed_model.lp";

	out() << "Solving with " << backend.name() << " (" << program.numCols() << " columns, " << program.numRows() << " rows"
		  << (program.isMip() ? ", MIP" : "") << ")" << endl;

	double begin_t = get_wall_time();
	SolveResult result = backend.solve(program, options);
	out() << "Solve completed with status " << statusName(result.status) << " in " << get_wall_time() - begin_t << " s." << endl;
	if (!result.message.empty()) out() << "Solver message: " << result.message << endl;

	return result;
}

/****************************************************************************
 * report
 * - Projects the result onto the catalog and writes it. With traceback
 * a non-optimal run also leaves the composed model behind as an LP file.
 ****************************************************************************/
RunOutcome Scenario::report (const LinearProgram &program, const SolveResult &result, const string &outputDir) {
	Solution solution = projectSolution(program, result, catalog);

	if (!writeSolution(solution, catalog, outputDir)) {
		out() << "Failed to write the results to " << outputDir << endl;
	}

	if (result.status != Optimal && runParam.solver.traceback) {
		ofstream lp;
		if (open_file(lp, outputDir + "/model.lp")) {
			program.writeLP(lp);
			lp.close();
		}
	}

	if (result.status == Optimal) {
		printf("%-30s: Success (Obj= %.2f).\n", name.c_str(), solution.objective);
		for (int i=0; i<(int) solution.costComponents.size(); i++) {
			out() << setw(25) << left << solution.costComponents[i].first << " = " << solution.costComponents[i].second << endl;
		}
		return RunOptimal;
	}

	printf("%-30s: %s (%s).\n", name.c_str(), statusName(result.status).c_str(), result.message.c_str());
	return RunNotOptimal;
}

RunOutcome Scenario::run (SolverBackend &backend, const string &outputDir) {
	if (!prepareOutput(outputDir)) {
		printf("%-30s: Failed to prepare the output directory.\n", name.c_str());
		return RunFailed;
	}

	out() << "------------------------------------------------------------------" << endl;
	out() << "Scenario " << name << " (" << getCurrentDateTime() << ")" << endl;
	catalog.summary(out());
	out() << setupWarnings;

	RunOutcome outcome;
	try {
		LinearProgram program = buildModel();
		SolveResult result = solve(backend, program, outputDir);
		outcome = report(program, result, outputDir);
	}
	catch (CapPlanError &e) {
		out() << e.what() << endl;
		printf("%-30s: Failed (%s).\n", name.c_str(), e.what());
		outcome = RunFailed;
	}

	closeLogFile();
	return outcome;
}

/****************************************************************************
 * openLogFile
 * opens a log file with the input name.
 * the solver output of the scenario is written here.
 ****************************************************************************/
bool Scenario::openLogFile (string filename) {
	bool status = open_file(log_stream, filename);
	if (status) {
		log_stream_name = filename;
	}
	return status;
}

void Scenario::closeLogFile () {
	log_stream.close();
}

ofstream& Scenario::out () {
	return log_stream;
}

SolveResult buildAndSolve (const EntityCatalog &catalog, const vector<PolicyModulePtr> &enabledModules,
						   const SolverOptions &options, SolverBackend &backend, StorageBoundary storageBoundary) {
	ModelBuilder builder (catalog, storageBoundary);
	for (int m=0; m<(int) enabledModules.size(); m++) {
		builder.addModule(enabledModules[m]);
	}

	LinearProgram program = builder.build();
	return backend.solve(program, options);
}

SolveResult buildAndSolve (const EntityCatalog &catalog, const vector<PolicyModulePtr> &enabledModules, const SolverOptions &options) {
	SolverBackendPtr backend = createSolverBackend(options.backend, cout);
	return buildAndSolve(catalog, enabledModules, options, *backend);
}
