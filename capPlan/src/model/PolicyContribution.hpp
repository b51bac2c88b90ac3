//
//  PolicyContribution.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef PolicyContribution_hpp
#define PolicyContribution_hpp

#include <string>
#include <vector>

#include "Variable.hpp"
#include "LinearProgram.hpp"

using namespace std;

enum Commodity {
	ELECTRICITY,	// MW, balanced per (zone, timepoint)
	HYDROGEN		// kg, balanced per (zone, timeseries)
};

string commodityName (Commodity commodity);

/* expr (sense) rhs, over registry handles */
struct ContributedConstraint {
	ContributedConstraint () : sense(Equal), rhs(0.0) {}

	string		name;
	string		family;
	string		entity;
	string		index;
	LinearExpr	expr;
	RowSense	sense;
	double		rhs;
};

struct ObjectiveTerm {
	string		component;	// cost component the term is reported under
	LinearExpr	expr;
};

/* var * coef enters the supply side of the balance of (commodity, node, period) */
struct BalanceTerm {
	Commodity		commodity;
	string			node;		// load zone
	string			period;		// timepoint (electricity) or timeseries (hydrogen)
	VariableHandle	var;
	double			coef;
};

/* amount is added to the demand side of the balance of (commodity, node, period) */
struct BalanceDemand {
	Commodity	commodity;
	string		node;
	string		period;
	double		amount;
};

/* Output of var is emitted at rate instead of the unit's base rate. */
struct RateOverride {
	string			generator;
	string			timepoint;
	double			rate;		// t / MWh
	VariableHandle	var;		// share of the dispatch the rate applies to
};

/****************************************************************************
 * PolicyContribution
 * - What a policy module adds to the model, as plain data. Variables are
 * allocated through the registry while the contribution is computed; the
 * model builder merges all contributions and checks them for conflicts.
 ****************************************************************************/
struct PolicyContribution {
	vector<ContributedConstraint>	constraints;
	vector<ObjectiveTerm>			objectiveTerms;
	vector<BalanceTerm>				balanceTerms;
	vector<BalanceDemand>			balanceDemands;
	vector<RateOverride>			rateOverrides;

	void addConstraint (const string &family, const string &entity, const string &index,
						const LinearExpr &expr, RowSense sense, double rhs);
	void addObjective (const string &component, const LinearExpr &expr);
	void addBalanceTerm (Commodity commodity, const string &node, const string &period, VariableHandle var, double coef);
	void addBalanceDemand (Commodity commodity, const string &node, const string &period, double amount);
	void addRateOverride (const string &generator, const string &timepoint, double rate, VariableHandle var);
};

string rowName (const string &family, const string &entity, const string &index);

#endif /* PolicyContribution_hpp */
