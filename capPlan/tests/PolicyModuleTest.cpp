//
//  PolicyModuleTest.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include <sstream>
#include <gtest/gtest.h>

#include "TestScenarios.hpp"
#include "errors.hpp"
#include "model/ModelBuilder.hpp"
#include "policies/CarbonPolicyModule.hpp"
#include "policies/HydrogenSupplyModule.hpp"
#include "policies/DemandResponseModule.hpp"
#include "policies/RetrofitModule.hpp"

class PolicyModuleTest : public ::testing::Test {

protected:
	PolicyModuleTest () : catalog(richCatalog()) {
		catalog.finalize();
	}

	LinearProgram build (PolicyModule *module) {
		ModelBuilder builder (catalog, WrapAround);
		if (module != NULL) builder.addModule(PolicyModulePtr(module));
		return builder.build();
	}

	LinearProgram buildAll () {
		ModelBuilder builder (catalog, WrapAround);
		vector<PolicyModulePtr> modules = allModules();
		for (int m=0; m<(int) modules.size(); m++) builder.addModule(modules[m]);
		return builder.build();
	}

	const CostComponent* component (const LinearProgram &program, const string &name) {
		for (int c=0; c<(int) program.costComponents.size(); c++) {
			if (program.costComponents[c].name == name) return &program.costComponents[c];
		}
		return NULL;
	}

	EntityCatalog catalog;
};

/****************************************************************************
 * carbon
 ****************************************************************************/
TEST_F(PolicyModuleTest, CarbonCapSumsWeightedEmissions) {
	LinearProgram program = build(new CarbonPolicyModule());

	const ProgramRow *cap = findRow(program, "CarbonCap(p2020)");
	ASSERT_TRUE(cap != NULL);
	EXPECT_EQ(LessEqual, cap->sense);
	EXPECT_DOUBLE_EQ(5000.0, cap->rhs);
	EXPECT_EQ("carbon", cap->owner);
	EXPECT_DOUBLE_EQ(12.0, coefficient(program, *cap, EMISSIONS, "coal", "2020_1"));
	EXPECT_DOUBLE_EQ(12.0, coefficient(program, *cap, EMISSIONS, "gas", "2020_4"));
	EXPECT_DOUBLE_EQ(0.0, coefficient(program, *cap, EMISSIONS, "coal", "2030_1"));
	EXPECT_EQ(8u, cap->terms.size());

	EXPECT_TRUE(findRow(program, "CarbonCap(p2030)") != NULL);
}

TEST_F(PolicyModuleTest, CarbonCostIsChargedPerTonne) {
	LinearProgram program = build(new CarbonPolicyModule());

	const CostComponent *cost = component(program, "carbon_cost");
	ASSERT_TRUE(cost != NULL);
	ASSERT_EQ(8u, cost->terms.size());		// p2030 only
	int col = program.findColumn(VariableKey(EMISSIONS, "coal", "2030_2"));
	bool found = false;
	for (int k=0; k<(int) cost->terms.size(); k++) {
		if (cost->terms[k].var == col) {
			EXPECT_DOUBLE_EQ(120.0, cost->terms[k].coef);
			found = true;
		}
	}
	EXPECT_TRUE(found);
}

TEST_F(PolicyModuleTest, WithoutCarbonModuleThereIsNoCap) {
	LinearProgram program = build(NULL);

	EXPECT_TRUE(findRow(program, "CarbonCap(p2020)") == NULL);
	EXPECT_TRUE(component(program, "carbon_cost") == NULL);
	EXPECT_TRUE(findRow(program, "EmissionsAccounting(coal,2020_1)") != NULL);
}

TEST_F(PolicyModuleTest, UncappedPeriodOnlyCarriesCost) {
	EntityCatalog priced = twoUnitCatalog();
	priced.addCarbonPolicy("p1", false, 0.0, 25.0);
	priced.finalize();

	ModelBuilder builder (priced, WrapAround);
	builder.addModule(PolicyModulePtr(new CarbonPolicyModule()));
	LinearProgram program = builder.build();

	EXPECT_TRUE(findRow(program, "CarbonCap(p1)") == NULL);
	ASSERT_TRUE(component(program, "carbon_cost") != NULL);
	ASSERT_EQ(1u, component(program, "carbon_cost")->terms.size());
	EXPECT_DOUBLE_EQ(25.0, component(program, "carbon_cost")->terms[0].coef);
}

/****************************************************************************
 * demand response
 ****************************************************************************/
TEST_F(PolicyModuleTest, ShiftedLoadIsConservedPerSeries) {
	LinearProgram program = build(new DemandResponseModule());

	const ProgramRow *conservation = findRow(program, "ShiftConservation(smelter,d2020)");
	ASSERT_TRUE(conservation != NULL);
	EXPECT_EQ(Equal, conservation->sense);
	EXPECT_DOUBLE_EQ(0.0, conservation->rhs);
	EXPECT_EQ(4u, conservation->terms.size());
	EXPECT_DOUBLE_EQ(1.0, coefficient(program, *conservation, DEMAND_SHIFT, "smelter", "2020_3"));

	const ProgramRow *balance = findRow(program, "EnergyBalance(a,2020_3)");
	ASSERT_TRUE(balance != NULL);
	EXPECT_DOUBLE_EQ(-1.0, coefficient(program, *balance, DEMAND_SHIFT, "smelter", "2020_3"));
	EXPECT_DOUBLE_EQ(0.0, coefficient(program, *findRow(program, "EnergyBalance(b,2020_3)"), DEMAND_SHIFT, "smelter", "2020_3"));
}

TEST_F(PolicyModuleTest, ActivationGapLimitsConsecutiveActivations) {
	LinearProgram program = build(new DemandResponseModule());

	const ProgramRow *up = findRow(program, "ShiftUpActivation(smelter,2020_1)");
	ASSERT_TRUE(up != NULL);
	EXPECT_DOUBLE_EQ(-5.0, coefficient(program, *up, DR_ACTIVE, "smelter", "2020_1"));

	const ProgramRow *down = findRow(program, "ShiftDownActivation(smelter,2020_2)");
	ASSERT_TRUE(down != NULL);
	EXPECT_EQ(GreaterEqual, down->sense);
	EXPECT_DOUBLE_EQ(10.0, coefficient(program, *down, DR_ACTIVE, "smelter", "2020_2"));

	const ProgramRow *window = findRow(program, "ActivationWindow(smelter,2020_1)");
	ASSERT_TRUE(window != NULL);
	EXPECT_DOUBLE_EQ(1.0, window->rhs);
	EXPECT_DOUBLE_EQ(1.0, coefficient(program, *window, DR_ACTIVE, "smelter", "2020_1"));
	EXPECT_DOUBLE_EQ(1.0, coefficient(program, *window, DR_ACTIVE, "smelter", "2020_4"));
	EXPECT_DOUBLE_EQ(0.0, coefficient(program, *window, DR_ACTIVE, "smelter", "2020_2"));

	int active = program.findColumn(VariableKey(DR_ACTIVE, "smelter", "2020_1"));
	ASSERT_GE(active, 0);
	EXPECT_EQ(BINARY, program.columns[active].type);
	EXPECT_TRUE(program.isMip());
}

TEST_F(PolicyModuleTest, NoActivationRowsWithoutGap) {
	EntityCatalog flexible = twoUnitCatalog();
	DemandResponseProgram dr;
	dr.name = "plant";
	dr.zoneName = "z1";
	dr.defaultShiftUp = 5.0;
	dr.defaultShiftDown = 5.0;
	flexible.addDemandResponseProgram(dr);
	flexible.finalize();

	ModelBuilder builder (flexible, WrapAround);
	builder.addModule(PolicyModulePtr(new DemandResponseModule()));
	LinearProgram program = builder.build();

	EXPECT_TRUE(findRow(program, "ShiftConservation(plant,day)") != NULL);
	EXPECT_TRUE(findRow(program, "ShiftUpActivation(plant,t1)") == NULL);
	EXPECT_FALSE(program.isMip());
}

namespace {

	/* one zone over a four-hour day, load 50, one program "plant" */
	LinearProgram buildFlexibleDay (const DemandResponseProgram &dr) {
		EntityCatalog catalog;
		addSingleDay(catalog, 4);
		catalog.addZone("z1");
		for (int t=1; t<=4; t++) catalog.setZoneLoad("z1", "t" + numToStr(t), 50.0);
		catalog.addGenerator(makeGenerator("thermal", "thermal", "z1", 100.0, 10.0, 1.0));
		catalog.addDemandResponseProgram(dr);
		catalog.finalize();

		ModelBuilder builder (catalog, WrapAround);
		builder.addModule(PolicyModulePtr(new DemandResponseModule()));
		return builder.build();
	}

	DemandResponseProgram plant () {
		DemandResponseProgram dr;
		dr.name = "plant";
		dr.zoneName = "z1";
		dr.defaultShiftUp = 5.0;
		dr.defaultShiftDown = 5.0;
		return dr;
	}
}

TEST_F(PolicyModuleTest, ShiftedLoadRecoversLinearly) {
	DemandResponseProgram dr = plant();
	dr.recoveryHours = 3.0;
	LinearProgram program = buildFlexibleDay(dr);

	const ProgramRow *recovery = findRow(program, "RecoveryDemand(plant,t1)");
	ASSERT_TRUE(recovery != NULL);
	EXPECT_EQ(Equal, recovery->sense);
	EXPECT_DOUBLE_EQ(1.0, coefficient(program, *recovery, DEMAND_RECOVERY, "plant", "t1"));
	EXPECT_NEAR(-2.0/3.0, coefficient(program, *recovery, DEMAND_SHIFT, "plant", "t4"), 1e-12);
	EXPECT_NEAR(-1.0/3.0, coefficient(program, *recovery, DEMAND_SHIFT, "plant", "t3"), 1e-12);
	EXPECT_DOUBLE_EQ(0.0, coefficient(program, *recovery, DEMAND_SHIFT, "plant", "t2"));
	EXPECT_DOUBLE_EQ(0.0, coefficient(program, *recovery, DEMAND_SHIFT, "plant", "t1"));

	const ProgramRow *balance = findRow(program, "EnergyBalance(z1,t1)");
	ASSERT_TRUE(balance != NULL);
	EXPECT_DOUBLE_EQ(-1.0, coefficient(program, *balance, DEMAND_RECOVERY, "plant", "t1"));
	EXPECT_DOUBLE_EQ(-1.0, coefficient(program, *balance, DEMAND_SHIFT, "plant", "t1"));

	const ProgramRow *conservation = findRow(program, "ShiftConservation(plant,day)");
	ASSERT_TRUE(conservation != NULL);
	EXPECT_EQ(8u, conservation->terms.size());
	EXPECT_DOUBLE_EQ(1.0, coefficient(program, *conservation, DEMAND_RECOVERY, "plant", "t3"));

	int column = program.findColumn(VariableKey(DEMAND_RECOVERY, "plant", "t2"));
	ASSERT_GE(column, 0);
	EXPECT_EQ(-HUGE_VAL, program.columns[column].lb);
}

TEST_F(PolicyModuleTest, RecoveryLooksBackAtMostOneLap) {
	DemandResponseProgram dr = plant();
	dr.recoveryHours = 10.0;
	LinearProgram program = buildFlexibleDay(dr);

	const ProgramRow *recovery = findRow(program, "RecoveryDemand(plant,t2)");
	ASSERT_TRUE(recovery != NULL);
	EXPECT_EQ(4u, recovery->terms.size());
	EXPECT_NEAR(-0.9, coefficient(program, *recovery, DEMAND_SHIFT, "plant", "t1"), 1e-12);
	EXPECT_NEAR(-0.8, coefficient(program, *recovery, DEMAND_SHIFT, "plant", "t4"), 1e-12);
	EXPECT_NEAR(-0.7, coefficient(program, *recovery, DEMAND_SHIFT, "plant", "t3"), 1e-12);
	EXPECT_DOUBLE_EQ(0.0, coefficient(program, *recovery, DEMAND_SHIFT, "plant", "t2"));
}

TEST_F(PolicyModuleTest, SeriesLimitsCapCumulativeShifts) {
	DemandResponseProgram dr = plant();
	dr.seriesShiftUpLimit = 8.0;
	LinearProgram program = buildFlexibleDay(dr);

	const ProgramRow *split = findRow(program, "ShiftSplit(plant,t2)");
	ASSERT_TRUE(split != NULL);
	EXPECT_EQ(Equal, split->sense);
	EXPECT_DOUBLE_EQ(1.0, coefficient(program, *split, DEMAND_SHIFT, "plant", "t2"));
	EXPECT_DOUBLE_EQ(-1.0, coefficient(program, *split, DEMAND_SHIFT_UP, "plant", "t2"));
	EXPECT_DOUBLE_EQ(1.0, coefficient(program, *split, DEMAND_SHIFT_DOWN, "plant", "t2"));

	const ProgramRow *limit = findRow(program, "SeriesShiftUpLimit(plant,day)");
	ASSERT_TRUE(limit != NULL);
	EXPECT_EQ(LessEqual, limit->sense);
	EXPECT_DOUBLE_EQ(8.0, limit->rhs);
	EXPECT_EQ(4u, limit->terms.size());
	EXPECT_DOUBLE_EQ(1.0, coefficient(program, *limit, DEMAND_SHIFT_UP, "plant", "t4"));
	EXPECT_TRUE(findRow(program, "SeriesShiftDownLimit(plant,day)") == NULL);

	int up = program.findColumn(VariableKey(DEMAND_SHIFT_UP, "plant", "t1"));
	ASSERT_GE(up, 0);
	EXPECT_DOUBLE_EQ(0.0, program.columns[up].lb);
	EXPECT_DOUBLE_EQ(5.0, program.columns[up].ub);
}

TEST_F(PolicyModuleTest, NoActivationWithinResponseTime) {
	DemandResponseProgram dr = plant();
	dr.activationGap = 2;
	dr.responseHours = 2.0;
	LinearProgram program = buildFlexibleDay(dr);

	const ProgramRow *first = findRow(program, "ResponseTime(plant,t1)");
	ASSERT_TRUE(first != NULL);
	EXPECT_EQ(Equal, first->sense);
	EXPECT_DOUBLE_EQ(1.0, coefficient(program, *first, DR_ACTIVE, "plant", "t1"));
	EXPECT_TRUE(findRow(program, "ResponseTime(plant,t2)") != NULL);
	EXPECT_TRUE(findRow(program, "ResponseTime(plant,t3)") == NULL);
}

/****************************************************************************
 * hydrogen
 ****************************************************************************/
TEST_F(PolicyModuleTest, ElectrolyzersFeedHydrogenBalance) {
	LinearProgram program = build(new HydrogenSupplyModule());

	const ProgramRow *production = findRow(program, "H2Production(elec,2020_2)");
	ASSERT_TRUE(production != NULL);
	EXPECT_DOUBLE_EQ(1.0, coefficient(program, *production, H2_PRODUCE, "elec", "2020_2"));
	EXPECT_DOUBLE_EQ(-20.0, coefficient(program, *production, H2_CONSUME, "elec", "2020_2"));

	const ProgramRow *capacity = findRow(program, "ElectrolyzerCapacity(elec,2030_1)");
	ASSERT_TRUE(capacity != NULL);
	EXPECT_DOUBLE_EQ(5.0, capacity->rhs);
	EXPECT_DOUBLE_EQ(-1.0, coefficient(program, *capacity, BUILD, "elec", "p2030"));

	const ProgramRow *energy = findRow(program, "EnergyBalance(a,2020_2)");
	ASSERT_TRUE(energy != NULL);
	EXPECT_DOUBLE_EQ(-1.0, coefficient(program, *energy, H2_CONSUME, "elec", "2020_2"));

	const ProgramRow *hydrogen = findRow(program, "HydrogenBalance(a,d2020)");
	ASSERT_TRUE(hydrogen != NULL);
	EXPECT_EQ(Equal, hydrogen->sense);
	EXPECT_DOUBLE_EQ(100.0, hydrogen->rhs);
	EXPECT_DOUBLE_EQ(1.0, coefficient(program, *hydrogen, H2_PRODUCE, "elec", "2020_4"));
	EXPECT_DOUBLE_EQ(1.0, coefficient(program, *hydrogen, H2_WITHDRAW, "a", "d2020"));
	EXPECT_DOUBLE_EQ(-1.0, coefficient(program, *hydrogen, H2_STORE, "a", "d2020"));
}

TEST_F(PolicyModuleTest, HydrogenStorageCyclesWithinPeriod) {
	LinearProgram program = build(new HydrogenSupplyModule());

	const ProgramRow *cycle = findRow(program, "HydrogenStorageCycle(a,p2030)");
	ASSERT_TRUE(cycle != NULL);
	EXPECT_DOUBLE_EQ(12.0, coefficient(program, *cycle, H2_STORE, "a", "d2030"));
	EXPECT_DOUBLE_EQ(-12.0, coefficient(program, *cycle, H2_WITHDRAW, "a", "d2030"));
	EXPECT_DOUBLE_EQ(0.0, coefficient(program, *cycle, H2_STORE, "a", "d2020"));

	const CostComponent *cost = component(program, "hydrogen_storage_cost");
	ASSERT_TRUE(cost != NULL);
	EXPECT_EQ(2u, cost->terms.size());
}

TEST_F(PolicyModuleTest, WithoutHydrogenModuleElectrolyzersStayIdle) {
	LinearProgram program = build(NULL);

	EXPECT_LT(program.findColumn(VariableKey(H2_CONSUME, "elec", "2020_1")), 0);
	EXPECT_TRUE(findRow(program, "HydrogenBalance(a,d2020)") == NULL);
}

/****************************************************************************
 * retrofit
 ****************************************************************************/
TEST_F(PolicyModuleTest, RetrofitIsLockedInAndUnavailableEarly) {
	LinearProgram program = build(new RetrofitModule());

	int early = program.findColumn(VariableKey(RETROFIT_SELECT, "coal", "p2020"));
	int late = program.findColumn(VariableKey(RETROFIT_SELECT, "coal", "p2030"));
	ASSERT_GE(early, 0);
	ASSERT_GE(late, 0);
	EXPECT_EQ(BINARY, program.columns[late].type);
	EXPECT_DOUBLE_EQ(0.0, program.columns[early].ub);
	EXPECT_DOUBLE_EQ(1.0, program.columns[late].ub);
	EXPECT_EQ("retrofit", program.columns[late].owner);

	const ProgramRow *lockIn = findRow(program, "RetrofitLockIn(coal,p2030)");
	ASSERT_TRUE(lockIn != NULL);
	EXPECT_EQ(GreaterEqual, lockIn->sense);
	EXPECT_DOUBLE_EQ(1.0, coefficient(program, *lockIn, RETROFIT_SELECT, "coal", "p2030"));
	EXPECT_DOUBLE_EQ(-1.0, coefficient(program, *lockIn, RETROFIT_SELECT, "coal", "p2020"));

	const CostComponent *cost = component(program, "retrofit_cost");
	ASSERT_TRUE(cost != NULL);
	ASSERT_EQ(1u, cost->terms.size());
	EXPECT_EQ(late, cost->terms[0].var);
	EXPECT_DOUBLE_EQ(1000.0, cost->terms[0].coef);
}

TEST_F(PolicyModuleTest, RetrofitLowersEmissionsRate) {
	LinearProgram program = build(new RetrofitModule());

	const ProgramRow *accounting = findRow(program, "EmissionsAccounting(coal,2030_1)");
	ASSERT_TRUE(accounting != NULL);
	EXPECT_DOUBLE_EQ(1.0, coefficient(program, *accounting, EMISSIONS, "coal", "2030_1"));
	EXPECT_DOUBLE_EQ(-1.0, coefficient(program, *accounting, DISPATCH, "coal", "2030_1"));
	EXPECT_NEAR(0.7, coefficient(program, *accounting, RETROFIT_DISPATCH, "coal", "2030_1"), 1e-12);

	const ProgramRow *gate = findRow(program, "RetrofitDispatchGate(coal,2030_1)");
	ASSERT_TRUE(gate != NULL);
	EXPECT_DOUBLE_EQ(-100.0, coefficient(program, *gate, RETROFIT_SELECT, "coal", "p2030"));

	const ProgramRow *link = findRow(program, "RetrofitDispatchLink(coal,2020_1)");
	ASSERT_TRUE(link != NULL);
	EXPECT_DOUBLE_EQ(-100.0, link->rhs);
	EXPECT_DOUBLE_EQ(-100.0, coefficient(program, *link, RETROFIT_SELECT, "coal", "p2020"));
}

TEST_F(PolicyModuleTest, CarbonCapSeesRetrofitWithAllModules) {
	LinearProgram program = buildAll();

	const ProgramRow *cap = findRow(program, "CarbonCap(p2030)");
	ASSERT_TRUE(cap != NULL);
	EXPECT_DOUBLE_EQ(12.0, coefficient(program, *cap, EMISSIONS, "coal", "2030_1"));

	const ProgramRow *accounting = findRow(program, "EmissionsAccounting(coal,2030_1)");
	ASSERT_TRUE(accounting != NULL);
	EXPECT_EQ("core", accounting->owner);
	EXPECT_NEAR(0.7, coefficient(program, *accounting, RETROFIT_DISPATCH, "coal", "2030_1"), 1e-12);
}

/****************************************************************************
 * createPolicyModules
 ****************************************************************************/
TEST_F(PolicyModuleTest, EveryModuleWithDataIsEnabledByDefault) {
	RunParameters runParam;
	ostringstream log;

	vector<PolicyModulePtr> modules = createPolicyModules(runParam, catalog, log);
	ASSERT_EQ(4u, modules.size());
	EXPECT_EQ("carbon", modules[0]->id());
	EXPECT_EQ("hydrogen", modules[1]->id());
	EXPECT_EQ("demand_response", modules[2]->id());
	EXPECT_EQ("retrofit", modules[3]->id());
	EXPECT_TRUE(log.str().empty());
}

TEST_F(PolicyModuleTest, MissingTablesDisableModules) {
	EntityCatalog plain = twoUnitCatalog();
	plain.addCarbonPolicy("p1", true, 50.0, 0.0);
	plain.finalize();

	RunParameters runParam;
	ostringstream log;
	vector<PolicyModulePtr> modules = createPolicyModules(runParam, plain, log);
	ASSERT_EQ(1u, modules.size());
	EXPECT_EQ("carbon", modules[0]->id());

	runParam.modulesSpecified = true;
	runParam.modules.insert(HYDROGEN_MODULE);
	modules = createPolicyModules(runParam, plain, log);
	EXPECT_TRUE(modules.empty());
	EXPECT_NE(string::npos, log.str().find("hydrogen"));
}

TEST_F(PolicyModuleTest, ModuleListSelectsModules) {
	RunParameters runParam;
	runParam.modulesSpecified = true;
	runParam.modules.insert(RETROFIT_MODULE);
	runParam.modules.insert(CARBON_MODULE);
	ostringstream log;

	vector<PolicyModulePtr> modules = createPolicyModules(runParam, catalog, log);
	ASSERT_EQ(2u, modules.size());
	EXPECT_EQ("carbon", modules[0]->id());
	EXPECT_EQ("retrofit", modules[1]->id());

	runParam.modules.clear();
	EXPECT_TRUE(createPolicyModules(runParam, catalog, log).empty());
}
