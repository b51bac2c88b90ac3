//
//  CplexScenarioTest.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include <cmath>
#include <sstream>
#include <gtest/gtest.h>

#include "TestScenarios.hpp"
#include "Scenario.hpp"
#include "model/ModelBuilder.hpp"
#include "policies/CarbonPolicyModule.hpp"
#include "solverUtilities/CplexSolver.hpp"

namespace {

	const double tolerance = 1e-5;

	vector<PolicyModulePtr> carbonOnly () {
		vector<PolicyModulePtr> modules;
		modules.push_back(PolicyModulePtr(new CarbonPolicyModule()));
		return modules;
	}

	/* adds a unit whose every MW built earns money, without a build limit */
	void addUnlimitedBuild (EntityCatalog &catalog) {
		Generator spare = makeGenerator("spare", "thermal", "z1", 0.0, 10.0, 1.0);
		spare.maxBuildCapacity = HUGE_VAL;
		spare.integerBuild = true;
		spare.capitalCost = -1.0;
		catalog.addGenerator(spare);
	}

	double valueOf (const LinearProgram &program, const SolveResult &result, VariableKind kind, const string &entity, const string &period) {
		int col = program.findColumn(VariableKey(kind, entity, period));
		return (col < 0) ? 0.0 : result.values[col];
	}
}

TEST(CplexScenarioTest, CheapestUnitsServeLoad) {
	EntityCatalog catalog = twoUnitCatalog();
	catalog.finalize();

	SolveResult result = buildAndSolve(catalog, vector<PolicyModulePtr>(), SolverOptions());
	ASSERT_EQ(Optimal, result.status);
	EXPECT_NEAR(600.0, result.objective, tolerance);
}

TEST(CplexScenarioTest, ValuesAndDualsOfTwoUnitDispatch) {
	EntityCatalog catalog = twoUnitCatalog();
	catalog.finalize();
	ModelBuilder builder (catalog, WrapAround);
	LinearProgram program = builder.build();

	ostringstream log;
	CplexSolver solver (log);
	SolverOptions options;
	options.retrieveDuals = true;
	SolveResult result = solver.solve(program, options);

	ASSERT_EQ(Optimal, result.status);
	ASSERT_TRUE(result.hasValues);
	EXPECT_NEAR(60.0, valueOf(program, result, DISPATCH, "thermal", "t1"), tolerance);
	EXPECT_NEAR(20.0, valueOf(program, result, DISPATCH, "wind", "t1"), tolerance);
	EXPECT_NEAR(60.0, valueOf(program, result, EMISSIONS, "thermal", "t1"), tolerance);

	ASSERT_TRUE(result.hasDuals);
	EXPECT_NEAR(10.0, result.duals[ program.findRow("EnergyBalance(z1,t1)") ], tolerance);
}

TEST(CplexScenarioTest, BindingCarbonCapIsInfeasible) {
	EntityCatalog catalog = twoUnitCatalog();
	catalog.addCarbonPolicy("p1", true, 50.0, 0.0);
	catalog.finalize();

	SolveResult result = buildAndSolve(catalog, carbonOnly(), SolverOptions());
	EXPECT_EQ(Infeasible, result.status);
	EXPECT_FALSE(result.hasValues);
}

TEST(CplexScenarioTest, UnlimitedProfitableBuildIsUnbounded) {
	EntityCatalog catalog = twoUnitCatalog();
	addUnlimitedBuild(catalog);
	catalog.finalize();

	SolveResult result = buildAndSolve(catalog, vector<PolicyModulePtr>(), SolverOptions());
	EXPECT_EQ(Unbounded, result.status) << result.message;
	EXPECT_FALSE(result.hasValues);
}

TEST(CplexScenarioTest, InfeasibleModelWithUnboundedBuildIsInfeasible) {
	EntityCatalog catalog = twoUnitCatalog();
	addUnlimitedBuild(catalog);
	catalog.addCarbonPolicy("p1", true, 0.0, 0.0);
	catalog.finalize();

	SolveResult result = buildAndSolve(catalog, carbonOnly(), SolverOptions());
	EXPECT_EQ(Infeasible, result.status) << result.message;
	EXPECT_FALSE(result.hasValues);
}

TEST(CplexScenarioTest, SlackCarbonCapLeavesDispatchUnchanged) {
	EntityCatalog catalog = twoUnitCatalog();
	catalog.addCarbonPolicy("p1", true, 70.0, 0.0);
	catalog.finalize();

	SolveResult result = buildAndSolve(catalog, carbonOnly(), SolverOptions());
	ASSERT_EQ(Optimal, result.status);
	EXPECT_NEAR(600.0, result.objective, tolerance);
}

TEST(CplexScenarioTest, CarbonCostIsAddedToObjective) {
	EntityCatalog catalog = twoUnitCatalog();
	catalog.addCarbonPolicy("p1", false, 0.0, 5.0);
	catalog.finalize();

	SolveResult result = buildAndSolve(catalog, carbonOnly(), SolverOptions());
	ASSERT_EQ(Optimal, result.status);
	EXPECT_NEAR(900.0, result.objective, tolerance);
}

/****************************************************************************
 * Full composition: every balance row holds, load shifts cancel out
 * within each series, retrofits never unwind and no cap is exceeded.
 ****************************************************************************/
TEST(CplexScenarioTest, ComposedModelRespectsEveryPolicy) {
	EntityCatalog catalog = richCatalog();
	catalog.finalize();

	ModelBuilder builder (catalog, WrapAround);
	vector<PolicyModulePtr> modules = allModules();
	for (int m=0; m<(int) modules.size(); m++) builder.addModule(modules[m]);
	LinearProgram program = builder.build();
	ASSERT_TRUE(program.isMip());

	ostringstream log;
	CplexSolver solver (log);
	SolveResult result = solver.solve(program, SolverOptions());
	ASSERT_EQ(Optimal, result.status) << result.message;
	ASSERT_TRUE(result.hasValues);

	for (int i=0; i<program.numRows(); i++) {
		const ProgramRow &row = program.rows[i];
		if (row.family != "EnergyBalance" && row.family != "HydrogenBalance") continue;
		EXPECT_NEAR(row.rhs, program.rowActivity(i, result.values), 1e-4) << row.name;
	}

	for (int s=0; s<(int) catalog.timeseries().size(); s++) {
		const Timeseries &series = catalog.timeseries()[s];
		double net = 0.0;
		for (int k=0; k<(int) series.timepoints.size(); k++) {
			net += valueOf(program, result, DEMAND_SHIFT, "smelter", catalog.timepoints()[ series.timepoints[k] ].name);
		}
		EXPECT_NEAR(0.0, net, 1e-4) << series.name;
	}

	double early = valueOf(program, result, RETROFIT_SELECT, "coal", "p2020");
	double late = valueOf(program, result, RETROFIT_SELECT, "coal", "p2030");
	EXPECT_NEAR(0.0, early, tolerance);
	EXPECT_GE(late + tolerance, early);

	const double caps[] = {5000.0, 3000.0};
	for (int p=0; p<catalog.numPeriods(); p++) {
		const InvestmentPeriod &period = catalog.periods()[p];
		double emitted = 0.0;
		for (int k=0; k<(int) period.timepoints.size(); k++) {
			const Timepoint &tp = catalog.timepoints()[ period.timepoints[k] ];
			for (int g=0; g<catalog.numGen(); g++) {
				emitted += tp.weight * valueOf(program, result, EMISSIONS, catalog.generators()[g].name, tp.name);
			}
		}
		EXPECT_LE(emitted, caps[p] + 1e-3) << period.name;
	}
}

TEST(CplexScenarioTest, ScenarioWritesResults) {
	RunParameters runParam;
	runParam.solver.retrieveDuals = true;
	Scenario scenario ("rich", richCatalog(), runParam);
	EXPECT_EQ(4u, scenario.getModules().size());

	ostringstream log;
	CplexSolver solver (log);
	string dir = makeTempDir() + "/rich";
	ASSERT_EQ(RunOptimal, scenario.run(solver, dir));

	EXPECT_NE(string::npos, readFile(dir + "/summary.csv").find("status,Optimal"));
	EXPECT_TRUE(file_exists(dir + "/retrofit.csv"));
	EXPECT_TRUE(file_exists(dir + "/demand_response.csv"));
	EXPECT_TRUE(file_exists(dir + "/demand_recovery.csv"));
	EXPECT_TRUE(file_exists(dir + "/hydrogen_production.csv"));
	EXPECT_TRUE(file_exists(dir + "/duals_energy_balance.csv"));
}
