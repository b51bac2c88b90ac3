//
//  RetrofitModule.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef RetrofitModule_hpp
#define RetrofitModule_hpp

#include "PolicyModule.hpp"

/****************************************************************************
 * RetrofitModule
 * - Per unit with a retrofit option, a binary selection per investment
 * period: fixed to 0 before the first candidate period, and once selected
 * it stays selected (sel(p) >= sel(p-1)). The one-time cost is paid on the
 * selection of the last period, which is 1 exactly when the unit was
 * retrofitted at some point.
 * - The retrofitted dispatch equals the dispatch when the unit is selected
 * and 0 otherwise (big-M on the dispatch bound). Its output is emitted at
 * the post-retrofit rate through an emissions-rate override.
 ****************************************************************************/
class RetrofitModule : public PolicyModule {

public:
	string id () const { return "retrofit"; }
	PolicyContribution contribute (const EntityCatalog &catalog, VariableRegistry &registry) const;

private:
	void addOption (const EntityCatalog &catalog, VariableRegistry &registry, const RetrofitOption &option, PolicyContribution &contribution) const;
};

#endif /* RetrofitModule_hpp */
