//
//  RetrofitModule.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include "RetrofitModule.hpp"

PolicyContribution RetrofitModule::contribute (const EntityCatalog &catalog, VariableRegistry &registry) const {
	PolicyContribution contribution;

	for (int i=0; i<(int) catalog.retrofitOptions().size(); i++) {
		addOption(catalog, registry, catalog.retrofitOptions()[i], contribution);
	}

	return contribution;
}

void RetrofitModule::addOption (const EntityCatalog &catalog, VariableRegistry &registry, const RetrofitOption &option, PolicyContribution &contribution) const {
	const Generator &gen = catalog.generators()[option.generatorId];
	const vector<InvestmentPeriod> &periods = catalog.periods();
	int lastPeriod = catalog.numPeriods() - 1;

	/* selection and lock-in */
	vector<VariableHandle> select (periods.size());
	for (int p=0; p<=lastPeriod; p++) {
		if (p < option.firstPeriodId) {
			select[p] = registry.allocate(gen.name, periods[p].name, RETROFIT_SELECT, VariableBounds(0.0, 0.0, BINARY));
		}
		else {
			select[p] = registry.allocate(gen.name, periods[p].name, RETROFIT_SELECT);
		}

		if (p > 0) {
			LinearExpr lockIn;
			lockIn.add(select[p], 1.0).add(select[p-1], -1.0);
			contribution.addConstraint("RetrofitLockIn", gen.name, periods[p].name, lockIn, GreaterEqual, 0.0);
		}
	}

	LinearExpr cost;
	cost.add(select[lastPeriod], option.cost);
	contribution.addObjective("retrofit_cost", cost);

	/* retrofitted dispatch */
	double bigM = gen.maxCapacity();
	for (int t=0; t<catalog.numTimepoints(); t++) {
		const Timepoint &tp = catalog.timepoints()[t];

		VariableHandle dispatch = registry.allocate(gen.name, tp.name, DISPATCH);
		VariableHandle retrofitted = registry.allocate(gen.name, tp.name, RETROFIT_DISPATCH);
		VariableHandle selected = select[tp.periodId];

		LinearExpr limit;
		limit.add(retrofitted, 1.0).add(dispatch, -1.0);
		contribution.addConstraint("RetrofitDispatchLimit", gen.name, tp.name, limit, LessEqual, 0.0);

		LinearExpr gate;
		gate.add(retrofitted, 1.0).add(selected, -bigM);
		contribution.addConstraint("RetrofitDispatchGate", gen.name, tp.name, gate, LessEqual, 0.0);

		// retrofitted >= dispatch - M * (1 - selected)
		LinearExpr link;
		link.add(retrofitted, 1.0).add(dispatch, -1.0).add(selected, -bigM);
		contribution.addConstraint("RetrofitDispatchLink", gen.name, tp.name, link, GreaterEqual, -bigM);

		contribution.addRateOverride(gen.name, tp.name, gen.postRetrofitEmissionRate, retrofitted);
	}
}
