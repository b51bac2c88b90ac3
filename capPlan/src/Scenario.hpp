//
//  Scenario.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef Scenario_hpp
#define Scenario_hpp

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "config.hpp"
#include "misc.hpp"
#include "Solution.hpp"
#include "catalog/EntityCatalog.hpp"
#include "model/ModelBuilder.hpp"
#include "policies/PolicyModule.hpp"
#include "solverUtilities/SolverInterface.hpp"

using namespace std;

enum RunOutcome {
	RunOptimal,			// solved to optimality, results written
	RunNotOptimal,		// infeasible, unbounded, timed out or solver error; summary written
	RunFailed,			// data or composition error, nothing solved
	RunCancelled		// skipped or aborted, results discarded
};

/****************************************************************************
 * Scenario
 * - The immutable bundle {catalog, enabled modules, run parameters} of one
 * run. The catalog is copied and finalized on construction; the enabled
 * modules follow from the run parameters and the tables present.
 * - Only the log stream changes after construction.
 ****************************************************************************/
class Scenario {

public:
	Scenario (const string &name, const EntityCatalog &catalog, const RunParameters &runParam);

	const string&					getName () const			{ return name; }
	const EntityCatalog&			getCatalog () const			{ return catalog; }
	const RunParameters&			getRunParameters () const	{ return runParam; }
	const vector<PolicyModulePtr>&	getModules () const			{ return modules; }

	LinearProgram buildModel () const;		// throws CapPlanError

	bool		prepareOutput (const string &outputDir);	// creates the directory and opens the log file
	SolveResult	solve (SolverBackend &backend, const LinearProgram &program, const string &outputDir);
	RunOutcome	report (const LinearProgram &program, const SolveResult &result, const string &outputDir);
	RunOutcome	run (SolverBackend &backend, const string &outputDir);

	/* log keeping */
	ofstream&	out ();
	bool		openLogFile (string filename);
	void		closeLogFile ();

private:
	string					name;
	EntityCatalog			catalog;
	RunParameters			runParam;
	vector<PolicyModulePtr>	modules;
	string					setupWarnings;	// module selection warnings, copied to every run log

	ofstream	log_stream;
	string		log_stream_name;
};

/* Composes the catalog and the enabled modules and solves the program.
 * Data and composition errors are thrown before the solver is called;
 * solve outcomes come back as statuses. */
SolveResult buildAndSolve (const EntityCatalog &catalog, const vector<PolicyModulePtr> &enabledModules,
						   const SolverOptions &options, SolverBackend &backend, StorageBoundary storageBoundary = WrapAround);
SolveResult buildAndSolve (const EntityCatalog &catalog, const vector<PolicyModulePtr> &enabledModules, const SolverOptions &options);

#endif /* Scenario_hpp */
