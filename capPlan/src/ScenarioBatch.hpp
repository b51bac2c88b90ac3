//
//  ScenarioBatch.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef ScenarioBatch_hpp
#define ScenarioBatch_hpp

#include "config.hpp"		// must have this before defining boost libraries

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/function.hpp>
#include <boost/thread/mutex.hpp>
#ifdef BOOST_PARALLEL_LIBS	// the boost library is added for multi-threading
#include <boost/thread/thread.hpp>
#include <boost/bind.hpp>
#include <boost/asio.hpp>
#include <boost/scoped_ptr.hpp>
#endif

#include "Scenario.hpp"

typedef boost::function<SolverBackendPtr (const string &, ostream &)> BackendFactory;

/****************************************************************************
 * ScenarioBatch
 * - Runs mutually independent scenarios on a pool of worker threads. Each
 * scenario owns its catalog, program, solver backend and log file; the
 * batch shares nothing but the cancellation state between them.
 * - cancel() is all-or-nothing: scenarios not started are skipped, the
 * in-flight solves are aborted and their results discarded. Scenarios
 * finished before the call keep their results.
 ****************************************************************************/
class ScenarioBatch {

public:
	explicit ScenarioBatch (int numThreads, BackendFactory factory = createSolverBackend);

	void add (std::shared_ptr<Scenario> scenario, const string &outputDir);
	int  size () const { return (int) scenarios.size(); }

	void run ();		// blocks until every scenario is finished or skipped
	void cancel ();		// may be called from any thread
	bool isCancelled ();

	const vector<RunOutcome>& getOutcomes () const { return outcomes; }
	int numFailed () const;		// scenarios without an optimal result

private:
	int				numThreads;
	BackendFactory	factory;

	vector< std::shared_ptr<Scenario> >	scenarios;
	vector<string>						outputDirs;
	vector<RunOutcome>					outcomes;

	boost::mutex					batchMutex;		// guards cancelled and inFlight
	bool							cancelled;
	map<int, SolverBackendPtr>		inFlight;

	void runOneScenario (int s);
	bool registerSolve (int s, SolverBackendPtr backend);		// false if the batch is cancelled
	bool releaseSolve (int s);									// false if the batch was cancelled meanwhile
};

#endif /* ScenarioBatch_hpp */
