//
//  PolicyModule.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include "PolicyModule.hpp"
#include "CarbonPolicyModule.hpp"
#include "HydrogenSupplyModule.hpp"
#include "DemandResponseModule.hpp"
#include "RetrofitModule.hpp"

namespace {

	bool hasData (const EntityCatalog &catalog, PolicyModuleId id) {
		switch (id) {
			case CARBON_MODULE:				return catalog.hasCarbonPolicy();
			case HYDROGEN_MODULE:			return catalog.hasHydrogenSupply();
			case DEMAND_RESPONSE_MODULE:	return catalog.hasDemandResponse();
			case RETROFIT_MODULE:			return catalog.hasRetrofitPlan();
		}
		return false;
	}

	PolicyModulePtr makeModule (PolicyModuleId id) {
		switch (id) {
			case CARBON_MODULE:				return PolicyModulePtr(new CarbonPolicyModule());
			case HYDROGEN_MODULE:			return PolicyModulePtr(new HydrogenSupplyModule());
			case DEMAND_RESPONSE_MODULE:	return PolicyModulePtr(new DemandResponseModule());
			case RETROFIT_MODULE:			return PolicyModulePtr(new RetrofitModule());
		}
		return PolicyModulePtr();
	}
}

/****************************************************************************
 * createPolicyModules
 * - Without a module list every module with input data is enabled.
 * - A listed module without its input table is disabled with a warning;
 * an absent table never means zero-valued policy data.
 ****************************************************************************/
vector<PolicyModulePtr> createPolicyModules (const RunParameters &runParam, const EntityCatalog &catalog, ostream &log) {
	const PolicyModuleId all[] = {CARBON_MODULE, HYDROGEN_MODULE, DEMAND_RESPONSE_MODULE, RETROFIT_MODULE};

	vector<PolicyModulePtr> modules;
	for (int i=0; i<4; i++) {
		PolicyModuleId id = all[i];

		if (runParam.modulesSpecified && runParam.modules.count(id) == 0) continue;

		if (!hasData(catalog, id)) {
			if (runParam.modulesSpecified) {
				log << "Warning:: module " << moduleName(id) << " is enabled but its input table is missing, module disabled." << endl;
			}
			continue;
		}
		modules.push_back(makeModule(id));
	}
	return modules;
}
