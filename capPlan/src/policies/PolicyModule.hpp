//
//  PolicyModule.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef PolicyModule_hpp
#define PolicyModule_hpp

#include <memory>
#include <string>
#include <vector>

#include "../config.hpp"
#include "../catalog/EntityCatalog.hpp"
#include "../model/VariableRegistry.hpp"
#include "../model/PolicyContribution.hpp"

using namespace std;

/****************************************************************************
 * PolicyModule
 * - A pluggable policy. contribute() reads the catalog, allocates the
 * variables it needs through the registry and returns its constraints,
 * objective terms, balance terms and emissions-rate overrides as data.
 * - Modules must not keep state between calls; the builder may call
 * contribute() on a fresh registry for every build.
 ****************************************************************************/
class PolicyModule {

public:
	virtual ~PolicyModule () {}

	virtual string id () const = 0;
	virtual PolicyContribution contribute (const EntityCatalog &catalog, VariableRegistry &registry) const = 0;
};

typedef std::shared_ptr<PolicyModule> PolicyModulePtr;

/* The modules enabled by the run parameters, in a fixed order. A module
 * whose input table is absent from the catalog is disabled. */
vector<PolicyModulePtr> createPolicyModules (const RunParameters &runParam, const EntityCatalog &catalog, ostream &log);

#endif /* PolicyModule_hpp */
