//
//  ScenarioBatchTest.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include <gtest/gtest.h>
#include <boost/bind.hpp>

#include "TestScenarios.hpp"
#include "errors.hpp"
#include "ScenarioBatch.hpp"

namespace {

	/* hands out scripted backends and remembers them */
	struct BackendPool {
		BackendPool () : status(Optimal), batch(NULL), cancelOnCall(-1) {}

		SolverBackendPtr make (const string &name, ostream &log) {
			std::shared_ptr<ScriptedBackend> backend (new ScriptedBackend(status));
			backend->setValue(DISPATCH, "thermal", "t1", 60.0);
			backend->setValue(DISPATCH, "wind", "t1", 20.0);
			if (batch != NULL && (int) made.size() == cancelOnCall) {
				backend->onSolve = boost::bind(&ScenarioBatch::cancel, batch);
			}
			made.push_back(backend);
			return backend;
		}

		SolveStatus status;
		ScenarioBatch *batch;
		int cancelOnCall;		// index of the backend whose solve cancels the batch
		vector< std::shared_ptr<ScriptedBackend> > made;
	};
}

class ScenarioBatchTest : public ::testing::Test {

protected:
	void SetUp () {
		dir = makeTempDir();
	}

	std::shared_ptr<Scenario> scenario (const string &name, RunParameters runParam = RunParameters()) {
		return std::shared_ptr<Scenario>(new Scenario(name, twoUnitCatalog(), runParam));
	}

	void addScenarios (ScenarioBatch &batch, int count) {
		for (int s=0; s<count; s++) {
			string name = "s" + numToStr(s);
			batch.add(scenario(name), dir + "/" + name);
		}
	}

	string dir;
	BackendPool pool;
};

TEST_F(ScenarioBatchTest, RunsEveryScenario) {
	ScenarioBatch batch (2, boost::bind(&BackendPool::make, &pool, _1, _2));
	addScenarios(batch, 3);
	batch.run();

	ASSERT_EQ(3u, batch.getOutcomes().size());
	for (int s=0; s<3; s++) {
		EXPECT_EQ(RunOptimal, batch.getOutcomes()[s]);
		EXPECT_NE(string::npos, readFile(dir + "/s" + numToStr(s) + "/summary.csv").find("objective,600"));
	}
	EXPECT_EQ(0, batch.numFailed());
	EXPECT_EQ(3u, pool.made.size());
}

TEST_F(ScenarioBatchTest, NonOptimalScenariosAreCounted) {
	pool.status = Infeasible;
	ScenarioBatch batch (1, boost::bind(&BackendPool::make, &pool, _1, _2));
	addScenarios(batch, 2);
	batch.run();

	EXPECT_EQ(RunNotOptimal, batch.getOutcomes()[0]);
	EXPECT_EQ(RunNotOptimal, batch.getOutcomes()[1]);
	EXPECT_EQ(2, batch.numFailed());
	EXPECT_NE(string::npos, readFile(dir + "/s0/summary.csv").find("status,Infeasible"));
}

TEST_F(ScenarioBatchTest, UnknownBackendFailsScenario) {
	RunParameters runParam;
	runParam.solver.backend = "simplex9000";

	ScenarioBatch batch (1);
	batch.add(scenario("unknown", runParam), dir + "/unknown");
	batch.run();

	EXPECT_EQ(RunFailed, batch.getOutcomes()[0]);
	EXPECT_NE(string::npos, readFile(dir + "/unknown/capPlan.log").find("simplex9000"));
}

TEST_F(ScenarioBatchTest, CancelBeforeRunSkipsEverything) {
	ScenarioBatch batch (2, boost::bind(&BackendPool::make, &pool, _1, _2));
	addScenarios(batch, 3);
	batch.cancel();
	batch.run();

	EXPECT_TRUE(batch.isCancelled());
	for (int s=0; s<3; s++) {
		EXPECT_EQ(RunCancelled, batch.getOutcomes()[s]);
	}
	EXPECT_TRUE(pool.made.empty());
	EXPECT_FALSE(file_exists(dir + "/s0/summary.csv"));
}

TEST_F(ScenarioBatchTest, CancelDuringSolveDiscardsResult) {
	ScenarioBatch batch (1, boost::bind(&BackendPool::make, &pool, _1, _2));
	pool.batch = &batch;
	pool.cancelOnCall = 0;
	addScenarios(batch, 3);
	batch.run();

	ASSERT_EQ(1u, pool.made.size());
	EXPECT_TRUE(pool.made[0]->cancelled);
	for (int s=0; s<3; s++) {
		EXPECT_EQ(RunCancelled, batch.getOutcomes()[s]);
	}
	EXPECT_FALSE(file_exists(dir + "/s0/summary.csv"));
	EXPECT_NE(string::npos, readFile(dir + "/s0/capPlan.log").find("result discarded"));
}

TEST_F(ScenarioBatchTest, FinishedScenariosKeepTheirResults) {
	ScenarioBatch batch (1, boost::bind(&BackendPool::make, &pool, _1, _2));
	pool.batch = &batch;
	pool.cancelOnCall = 1;
	addScenarios(batch, 3);
	batch.run();

	EXPECT_EQ(RunOptimal, batch.getOutcomes()[0]);
	EXPECT_EQ(RunCancelled, batch.getOutcomes()[1]);
	EXPECT_EQ(RunCancelled, batch.getOutcomes()[2]);
	EXPECT_FALSE(pool.made[0]->cancelled);
	EXPECT_TRUE(file_exists(dir + "/s0/summary.csv"));
	EXPECT_EQ(3, batch.numFailed());
}

TEST_F(ScenarioBatchTest, ScenarioRunsOnItsOwn) {
	std::shared_ptr<Scenario> single = scenario("single");
	EXPECT_TRUE(single->getModules().empty());

	ScriptedBackend backend (Optimal);
	backend.setValue(DISPATCH, "thermal", "t1", 60.0);
	backend.setValue(DISPATCH, "wind", "t1", 20.0);

	EXPECT_EQ(RunOptimal, single->run(backend, dir + "/single"));
	EXPECT_EQ(1, backend.numCalls);
	EXPECT_TRUE(file_exists(dir + "/single/dispatch.csv"));
	EXPECT_NE(string::npos, readFile(dir + "/single/capPlan.log").find("Scenario single"));
}

TEST_F(ScenarioBatchTest, InvalidCatalogIsRejectedOnConstruction) {
	EntityCatalog broken = twoUnitCatalog();
	broken.addGenerator(makeGenerator("orphan", "thermal", "nowhere", 10.0, 1.0, 1.0));

	EXPECT_THROW(Scenario("broken", broken, RunParameters()), DataError);
}

TEST_F(ScenarioBatchTest, ModuleWarningsGoToScenarioLog) {
	RunParameters runParam;
	runParam.modulesSpecified = true;
	runParam.modules.insert(HYDROGEN_MODULE);

	testing::internal::CaptureStdout();
	std::shared_ptr<Scenario> single = scenario("nohydrogen", runParam);
	string printed = testing::internal::GetCapturedStdout();
	EXPECT_TRUE(single->getModules().empty());
	EXPECT_EQ(string::npos, printed.find("Warning"));

	ScriptedBackend backend (Optimal);
	single->run(backend, dir + "/nohydrogen");
	EXPECT_NE(string::npos, readFile(dir + "/nohydrogen/capPlan.log").find("Warning:: module hydrogen"));
}
