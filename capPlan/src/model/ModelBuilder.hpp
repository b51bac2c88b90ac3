//
//  ModelBuilder.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef ModelBuilder_hpp
#define ModelBuilder_hpp

#include <map>
#include <string>
#include <vector>

#include "../config.hpp"
#include "../catalog/EntityCatalog.hpp"
#include "../policies/PolicyModule.hpp"
#include "VariableRegistry.hpp"
#include "PolicyContribution.hpp"
#include "LinearProgram.hpp"

using namespace std;

/****************************************************************************
 * EmissionRateView
 * - Read-only projection of the emissions-rate overrides of all modules,
 * keyed by (generator, timepoint). The emissions accounting of the core
 * reads its coefficients from here, so the carbon cap sees the retrofit
 * decisions without the two modules knowing about each other.
 ****************************************************************************/
class EmissionRateView {

public:
	const RateOverride* find (const string &generator, const string &timepoint) const;	// NULL if the base rate applies
	int size () const { return (int) overrides.size(); }

private:
	friend class ModelBuilder;

	/* throws ModelCompositionError if (generator, timepoint) is already overridden differently */
	void add (const RateOverride &rateOverride, const string &owner);

	map<pair<string, string>, RateOverride>	overrides;
	map<pair<string, string>, string>		owners;
};

class ModelBuilder {

public:
	ModelBuilder (const EntityCatalog &catalog, StorageBoundary storageBoundary);

	void addModule (PolicyModulePtr module);	// throws ModelCompositionError on a duplicate id
	const vector<PolicyModulePtr>& getModules () const { return modules; }

	/* Composes the core and all modules into one canonical program.
	 * Throws ModelCompositionError or UnknownEntityError; nothing is solved. */
	LinearProgram build () const;

private:
	const EntityCatalog	&catalog;
	StorageBoundary		storageBoundary;
	vector<PolicyModulePtr> modules;

	struct OwnedConstraint {
		ContributedConstraint	con;
		string					owner;
	};

	struct Balance {
		Balance () : commodity(ELECTRICITY), demand(0.0) {}

		Commodity			commodity;
		string				node;
		string				period;
		LinearExpr			supply;
		double				demand;
		map<int, string>	counted;	// variable -> contribution that put it into this balance
	};

	/* state of one build */
	struct Composition {
		explicit Composition (const EntityCatalog &catalog) : registry(catalog) {}

		VariableRegistry					registry;
		map<string, OwnedConstraint>		constraints;
		map<string, LinearExpr>				costComponents;
		map<string, Balance>				balances;
		EmissionRateView					rates;
	};

	PolicyContribution coreContribution (VariableRegistry &registry) const;
	void merge (Composition &comp, const PolicyContribution &contribution, const string &owner) const;
	void addBalanceRows (Composition &comp) const;
	void addEmissionsAccounting (Composition &comp) const;
	LinearProgram canonicalize (const Composition &comp) const;

	void checkBalanceNode (Commodity commodity, const string &node, const string &period) const;
};

string balanceName (Commodity commodity, const string &node, const string &period);

#endif /* ModelBuilder_hpp */
