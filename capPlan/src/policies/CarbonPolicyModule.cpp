//
//  CarbonPolicyModule.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include "CarbonPolicyModule.hpp"

PolicyContribution CarbonPolicyModule::contribute (const EntityCatalog &catalog, VariableRegistry &registry) const {
	PolicyContribution contribution;

	const vector<CarbonPolicy> &policies = catalog.carbonPolicies();
	for (int i=0; i<(int) policies.size(); i++) {
		const CarbonPolicy &policy = policies[i];
		const InvestmentPeriod &period = catalog.periods()[policy.periodId];

		LinearExpr emissions;		// t over the period
		for (int g=0; g<catalog.numGen(); g++) {
			const Generator &gen = catalog.generators()[g];
			if (!gen.emitsCarbon()) continue;

			for (int k=0; k<(int) period.timepoints.size(); k++) {
				const Timepoint &tp = catalog.timepoints()[ period.timepoints[k] ];
				emissions.add(registry.allocate(gen.name, tp.name, EMISSIONS), tp.weight);
			}
		}

		if (policy.hasCap) {
			contribution.addConstraint("CarbonCap", period.name, "", emissions, LessEqual, policy.cap);
		}
		if (policy.carbonCost > 0) {
			LinearExpr cost;
			cost.add(emissions, policy.carbonCost);
			contribution.addObjective("carbon_cost", cost);
		}
	}

	return contribution;
}
