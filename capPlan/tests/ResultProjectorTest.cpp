//
//  ResultProjectorTest.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include <gtest/gtest.h>

#include "TestScenarios.hpp"
#include "Solution.hpp"
#include "model/ModelBuilder.hpp"

class ResultProjectorTest : public ::testing::Test {

protected:
	ResultProjectorTest () : catalog(twoUnitCatalog()) {
		catalog.finalize();
		ModelBuilder builder (catalog, WrapAround);
		program = builder.build();
	}

	SolveResult optimal (bool duals) {
		ScriptedBackend backend (Optimal);
		backend.setValue(DISPATCH, "thermal", "t1", 60.0);
		backend.setValue(DISPATCH, "wind", "t1", 20.0);
		backend.setValue(EMISSIONS, "thermal", "t1", 60.0);

		SolverOptions options;
		options.retrieveDuals = duals;
		return backend.solve(program, options);
	}

	EntityCatalog catalog;
	LinearProgram program;
};

TEST_F(ResultProjectorTest, OptimalValuesLandOnEntities) {
	Solution solution = projectSolution(program, optimal(false), catalog);

	EXPECT_EQ(Optimal, solution.status);
	ASSERT_TRUE(solution.hasValues);
	EXPECT_FALSE(solution.hasDuals);
	EXPECT_DOUBLE_EQ(600.0, solution.objective);

	int thermal = catalog.findGenerator("thermal");
	int wind = catalog.findGenerator("wind");
	EXPECT_DOUBLE_EQ(60.0, solution.dispatch[thermal][0]);
	EXPECT_DOUBLE_EQ(20.0, solution.dispatch[wind][0]);
	EXPECT_DOUBLE_EQ(60.0, solution.emissions[thermal][0]);
	EXPECT_DOUBLE_EQ(60.0, solution.periodEmissions[0]);

	double total = 0.0;
	bool variable = false;
	for (int i=0; i<(int) solution.costComponents.size(); i++) {
		total += solution.costComponents[i].second;
		if (solution.costComponents[i].first == "variable_cost") {
			EXPECT_DOUBLE_EQ(600.0, solution.costComponents[i].second);
			variable = true;
		}
	}
	EXPECT_TRUE(variable);
	EXPECT_DOUBLE_EQ(solution.objective, total);
}

TEST_F(ResultProjectorTest, DualsOfBalanceAndCapacityRows) {
	Solution solution = projectSolution(program, optimal(true), catalog);

	ASSERT_TRUE(solution.hasDuals);
	int balance = program.findRow("EnergyBalance(z1,t1)");
	int capacity = program.findRow("Capacity(thermal,t1)");
	ASSERT_GE(balance, 0);
	ASSERT_GE(capacity, 0);
	EXPECT_DOUBLE_EQ(1.0 + balance, solution.energyBalanceDual[0][0]);
	EXPECT_DOUBLE_EQ(1.0 + capacity, solution.capacityDual[ catalog.findGenerator("thermal") ][0]);
}

TEST_F(ResultProjectorTest, EveryStatusIsProjected) {
	const SolveStatus statuses[] = {Infeasible, Unbounded, TimedOut, SolverError};

	for (int i=0; i<4; i++) {
		ScriptedBackend backend (statuses[i], "scripted " + statusName(statuses[i]));
		Solution solution = projectSolution(program, backend.solve(program, SolverOptions()), catalog);

		EXPECT_EQ(statuses[i], solution.status);
		EXPECT_FALSE(solution.hasValues);
		EXPECT_EQ("scripted " + statusName(statuses[i]), solution.message);
		EXPECT_DOUBLE_EQ(0.0, solution.dispatch[0][0]);
		EXPECT_TRUE(solution.costComponents.empty());
	}
}

TEST_F(ResultProjectorTest, TimedOutKeepsBestSolution) {
	SolveResult result;
	result.status = TimedOut;
	result.hasValues = true;
	result.values.assign(program.numCols(), 0.0);
	result.values[ program.findColumn(VariableKey(DISPATCH, "wind", "t1")) ] = 20.0;
	result.objective = 0.0;

	Solution solution = projectSolution(program, result, catalog);
	EXPECT_EQ(TimedOut, solution.status);
	EXPECT_TRUE(solution.hasValues);
	EXPECT_DOUBLE_EQ(20.0, solution.dispatch[ catalog.findGenerator("wind") ][0]);
}

TEST_F(ResultProjectorTest, MismatchedResultIsIgnored) {
	SolveResult result;
	result.status = Optimal;
	result.hasValues = true;
	result.values.assign(program.numCols() + 1, 5.0);

	Solution solution = projectSolution(program, result, catalog);
	EXPECT_FALSE(solution.hasValues);
	EXPECT_NE(string::npos, solution.message.find("do not match"));
	EXPECT_DOUBLE_EQ(0.0, solution.dispatch[0][0]);
}

TEST_F(ResultProjectorTest, WritesResultTables) {
	string dir = makeTempDir() + "/results";
	Solution solution = projectSolution(program, optimal(true), catalog);

	ASSERT_TRUE(writeSolution(solution, catalog, dir));

	string summary = readFile(dir + "/summary.csv");
	EXPECT_NE(string::npos, summary.find("status,Optimal"));
	EXPECT_NE(string::npos, summary.find("objective,600"));
	EXPECT_NE(string::npos, summary.find("variable_cost,600"));

	string dispatch = readFile(dir + "/dispatch.csv");
	EXPECT_NE(string::npos, dispatch.find("thermal,t1,60,"));
	EXPECT_NE(string::npos, dispatch.find("wind,t1,20,"));

	EXPECT_NE(string::npos, readFile(dir + "/emissions.csv").find("p1,60"));
	EXPECT_TRUE(file_exists(dir + "/duals_energy_balance.csv"));
	EXPECT_FALSE(file_exists(dir + "/retrofit.csv"));
}

TEST_F(ResultProjectorTest, FailedRunWritesOnlySummary) {
	string dir = makeTempDir() + "/results";
	ScriptedBackend backend (Infeasible, "no feasible dispatch");
	Solution solution = projectSolution(program, backend.solve(program, SolverOptions()), catalog);

	ASSERT_TRUE(writeSolution(solution, catalog, dir));

	string summary = readFile(dir + "/summary.csv");
	EXPECT_NE(string::npos, summary.find("status,Infeasible"));
	EXPECT_NE(string::npos, summary.find("no feasible dispatch"));
	EXPECT_EQ(string::npos, summary.find("objective"));
	EXPECT_FALSE(file_exists(dir + "/dispatch.csv"));
}

TEST_F(ResultProjectorTest, SolverMessageQuotesAreEscaped) {
	string dir = makeTempDir() + "/results";
	ScriptedBackend backend (SolverError, "bad parameter \"EpGap\"");
	Solution solution = projectSolution(program, backend.solve(program, SolverOptions()), catalog);

	ASSERT_TRUE(writeSolution(solution, catalog, dir));
	EXPECT_NE(string::npos, readFile(dir + "/summary.csv").find("message,\"bad parameter \"\"EpGap\"\"\"\n"));
}
