//
//  HydrogenSupplyModule.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef HydrogenSupplyModule_hpp
#define HydrogenSupplyModule_hpp

#include "PolicyModule.hpp"

/****************************************************************************
 * HydrogenSupplyModule
 * - Electrolyzers draw electricity from the balance of their zone and
 * produce hydrogen: production = consumption * conversion efficiency,
 * consumption bounded by the installed electrolyzer capacity.
 * - Hydrogen is balanced in kg per (zone, timeseries):
 *	 sum of duration * production + withdrawals - stores = demand
 * - Liquid storage moves hydrogen between the series of an investment
 * period; stores and withdrawals, scaled by the series repetitions, net to
 * zero over the period.
 ****************************************************************************/
class HydrogenSupplyModule : public PolicyModule {

public:
	string id () const { return "hydrogen"; }
	PolicyContribution contribute (const EntityCatalog &catalog, VariableRegistry &registry) const;

private:
	void addElectrolyzer (const EntityCatalog &catalog, VariableRegistry &registry, const Generator &gen, PolicyContribution &contribution) const;
	void addStorage (const EntityCatalog &catalog, VariableRegistry &registry, const HydrogenStorage &storage, PolicyContribution &contribution) const;
};

#endif /* HydrogenSupplyModule_hpp */
