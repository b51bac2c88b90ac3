//
//  CarbonPolicyModule.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef CarbonPolicyModule_hpp
#define CarbonPolicyModule_hpp

#include "PolicyModule.hpp"

/****************************************************************************
 * CarbonPolicyModule
 * - Per investment period with a cap:
 *	 sum over generators and timepoints of weight * emissions <= cap
 * - Per investment period with a carbon price, price * weight * emissions
 * enters the objective as "carbon_cost".
 * - Works on the emissions variables of the core. Their coefficients, and
 * with them the effect of retrofits, are set by the emissions accounting.
 ****************************************************************************/
class CarbonPolicyModule : public PolicyModule {

public:
	string id () const { return "carbon"; }
	PolicyContribution contribute (const EntityCatalog &catalog, VariableRegistry &registry) const;
};

#endif /* CarbonPolicyModule_hpp */
