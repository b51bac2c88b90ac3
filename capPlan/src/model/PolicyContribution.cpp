//
//  PolicyContribution.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include "PolicyContribution.hpp"

string commodityName (Commodity commodity) {
	switch (commodity) {
		case ELECTRICITY:	return "electricity";
		case HYDROGEN:		return "hydrogen";
	}
	return "unknown";
}

string rowName (const string &family, const string &entity, const string &index) {
	if (index.empty()) return family + "(" + entity + ")";
	return family + "(" + entity + "," + index + ")";
}

void PolicyContribution::addConstraint (const string &family, const string &entity, const string &index,
										const LinearExpr &expr, RowSense sense, double rhs) {
	ContributedConstraint con;
	con.name = rowName(family, entity, index);
	con.family = family;
	con.entity = entity;
	con.index = index;
	con.expr = expr;
	con.sense = sense;
	con.rhs = rhs;
	constraints.push_back(con);
}

void PolicyContribution::addObjective (const string &component, const LinearExpr &expr) {
	ObjectiveTerm term;
	term.component = component;
	term.expr = expr;
	objectiveTerms.push_back(term);
}

void PolicyContribution::addBalanceTerm (Commodity commodity, const string &node, const string &period, VariableHandle var, double coef) {
	BalanceTerm term;
	term.commodity = commodity;
	term.node = node;
	term.period = period;
	term.var = var;
	term.coef = coef;
	balanceTerms.push_back(term);
}

void PolicyContribution::addBalanceDemand (Commodity commodity, const string &node, const string &period, double amount) {
	BalanceDemand demand;
	demand.commodity = commodity;
	demand.node = node;
	demand.period = period;
	demand.amount = amount;
	balanceDemands.push_back(demand);
}

void PolicyContribution::addRateOverride (const string &generator, const string &timepoint, double rate, VariableHandle var) {
	RateOverride rateOverride;
	rateOverride.generator = generator;
	rateOverride.timepoint = timepoint;
	rateOverride.rate = rate;
	rateOverride.var = var;
	rateOverrides.push_back(rateOverride);
}
