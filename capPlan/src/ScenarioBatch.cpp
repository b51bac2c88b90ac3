//
//  ScenarioBatch.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include "ScenarioBatch.hpp"
#include "errors.hpp"

ScenarioBatch::ScenarioBatch (int numThreads, BackendFactory factory) :
	numThreads(max(1, numThreads)), factory(factory), cancelled(false) {}

void ScenarioBatch::add (std::shared_ptr<Scenario> scenario, const string &outputDir) {
	scenarios.push_back(scenario);
	outputDirs.push_back(outputDir);
	outcomes.push_back(RunCancelled);
}

void ScenarioBatch::cancel () {
	boost::mutex::scoped_lock lock (batchMutex);
	cancelled = true;
	for (map<int, SolverBackendPtr>::iterator it = inFlight.begin(); it != inFlight.end(); ++it) {
		it->second->cancel();
	}
}

bool ScenarioBatch::isCancelled () {
	boost::mutex::scoped_lock lock (batchMutex);
	return cancelled;
}

int ScenarioBatch::numFailed () const {
	int count = 0;
	for (int s=0; s<(int) outcomes.size(); s++) {
		if (outcomes[s] != RunOptimal) count++;
	}
	return count;
}

bool ScenarioBatch::registerSolve (int s, SolverBackendPtr backend) {
	boost::mutex::scoped_lock lock (batchMutex);
	if (cancelled) return false;
	inFlight[s] = backend;
	return true;
}

bool ScenarioBatch::releaseSolve (int s) {
	boost::mutex::scoped_lock lock (batchMutex);
	inFlight.erase(s);
	return !cancelled;
}

/****************************************************************************
 * runOneScenario
 * - Build, solve and report one scenario. The cancellation state is
 * checked before the scenario starts, before the solve and after it.
 ****************************************************************************/
void ScenarioBatch::runOneScenario (int s) {
	if (isCancelled()) {
		outcomes[s] = RunCancelled;
		return;
	}

	Scenario &scenario = *scenarios[s];
	const string &outputDir = outputDirs[s];

	if (!scenario.prepareOutput(outputDir)) {
		outcomes[s] = RunFailed;
		return;
	}
	scenario.out() << "Scenario " << scenario.getName() << " (" << getCurrentDateTime() << ")" << endl;
	scenario.getCatalog().summary(scenario.out());

	try {
		LinearProgram program = scenario.buildModel();
		SolverBackendPtr backend = factory(scenario.getRunParameters().solver.backend, scenario.out());

		if (!registerSolve(s, backend)) {
			scenario.out() << "Batch cancelled, scenario skipped." << endl;
			outcomes[s] = RunCancelled;
		}
		else {
			SolveResult result = scenario.solve(*backend, program, outputDir);
			if (!releaseSolve(s)) {
				scenario.out() << "Batch cancelled, result discarded." << endl;
				outcomes[s] = RunCancelled;
			}
			else {
				outcomes[s] = scenario.report(program, result, outputDir);
			}
		}
	}
	catch (CapPlanError &e) {
		releaseSolve(s);
		scenario.out() << e.what() << endl;
		printf("%-30s: Failed (%s).\n", scenario.getName().c_str(), e.what());
		outcomes[s] = RunFailed;
	}

	scenario.closeLogFile();
}

/****************************************************************************
 * run
 * - Solves the scenarios, in parallel if BOOST_PARALLEL_LIBS is defined.
 ****************************************************************************/
#ifdef BOOST_PARALLEL_LIBS
void ScenarioBatch::run () {

	/***** Parallel programming stuff (START) *****/
	boost::asio::io_service io_service;				// create an io_service
	boost::scoped_ptr<boost::asio::io_service::work> work (new boost::asio::io_service::work(io_service));	// keeps run() from exiting while scenarios are posted
	boost::thread_group threads;					// start some worker threads

	typedef std::size_t (boost::asio::io_service::*RunFunction) ();	// run() is overloaded
	int poolSize = min(numThreads, max(1, size()));
	for (int k=0; k<poolSize; k++) {
		try {
			threads.create_thread(boost::bind(static_cast<RunFunction>(&boost::asio::io_service::run), &io_service));
		}
		catch (boost::thread_resource_error &e) {
			printf("Warning:: started %d of %d worker threads (%s).\n", k, poolSize, e.what());
			break;
		}
	}
	/***** Parallel programming stuff (END)   *****/

	for (int s=0; s<size(); s++) {
		io_service.post( boost::bind(&ScenarioBatch::runOneScenario, this, s) );
	}

	/***** Parallel programming stuff (START) *****/
	work.reset();		// let the io_service shutdown once the posted scenarios are done
	if (threads.size() == 0) {
		io_service.run();
	}
	threads.join_all();
	/***** Parallel programming stuff (END)   *****/
}
#else
void ScenarioBatch::run () {
	for (int s=0; s<size(); s++) {
		runOneScenario(s);
	}
}
#endif
