//
//  DemandResponseModule.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef DemandResponseModule_hpp
#define DemandResponseModule_hpp

#include "PolicyModule.hpp"

/****************************************************************************
 * DemandResponseModule
 * - A signed shift per program and timepoint, within the program limits,
 * moves load in (+) or out of (-) the timepoint. It is withdrawn from the
 * energy balance of the program's zone.
 * - Shifts of a program sum to zero over every timeseries.
 * - Programs with an activation gap get a binary activation per timepoint
 * that gates the shift; at most one activation falls into any window of
 * gap consecutive timepoints of a series (the series wraps). No activation
 * falls into the response time at the start of a series.
 * - With a recovery time, shifted load comes back linearly over the
 * following timepoints; the recovery is withdrawn from the zone balance
 * and counted in the conservation of the series.
 * - Series limits cap the up and down shifts summed over a series.
 ****************************************************************************/
class DemandResponseModule : public PolicyModule {

public:
	string id () const { return "demand_response"; }
	PolicyContribution contribute (const EntityCatalog &catalog, VariableRegistry &registry) const;

private:
	VariableHandle addRecovery (const EntityCatalog &catalog, VariableRegistry &registry, const DemandResponseProgram &program,
								int t, PolicyContribution &contribution) const;
	void addActivation (const EntityCatalog &catalog, VariableRegistry &registry, const DemandResponseProgram &program, PolicyContribution &contribution) const;
};

#endif /* DemandResponseModule_hpp */
