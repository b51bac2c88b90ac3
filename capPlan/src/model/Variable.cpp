//
//  Variable.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include "Variable.hpp"
#include "../misc.hpp"

string kindName (VariableKind kind) {
	switch (kind) {
		case DISPATCH:			return "DISPATCH";
		case CHARGE:			return "CHARGE";
		case STATE_OF_CHARGE:	return "STATE_OF_CHARGE";
		case BUILD:				return "BUILD";
		case FLOW:				return "FLOW";
		case FLOW_REVERSE:		return "FLOW_REVERSE";
		case EMISSIONS:			return "EMISSIONS";
		case RETROFIT_SELECT:	return "RETROFIT_SELECT";
		case RETROFIT_DISPATCH:	return "RETROFIT_DISPATCH";
		case DEMAND_SHIFT:		return "DEMAND_SHIFT";
		case DEMAND_SHIFT_UP:	return "DEMAND_SHIFT_UP";
		case DEMAND_SHIFT_DOWN:	return "DEMAND_SHIFT_DOWN";
		case DEMAND_RECOVERY:	return "DEMAND_RECOVERY";
		case DR_ACTIVE:			return "DR_ACTIVE";
		case H2_CONSUME:		return "H2_CONSUME";
		case H2_PRODUCE:		return "H2_PRODUCE";
		case H2_STORE:			return "H2_STORE";
		case H2_WITHDRAW:		return "H2_WITHDRAW";
	}
	return "UNKNOWN";
}

bool kindIndexedByInvestmentPeriod (VariableKind kind) {
	return kind == BUILD || kind == RETROFIT_SELECT;
}

bool kindIndexedByTimeseries (VariableKind kind) {
	return kind == H2_STORE || kind == H2_WITHDRAW;
}

bool VariableKey::operator< (const VariableKey &other) const {
	if (kind != other.kind) return kind < other.kind;
	if (entity != other.entity) return entity < other.entity;
	return period < other.period;
}

bool VariableKey::operator== (const VariableKey &other) const {
	return kind == other.kind && entity == other.entity && period == other.period;
}

string VariableKey::toString () const {
	return kindName(kind) + "(" + entity + "," + period + ")";
}

string VariableBounds::toString () const {
	string typeName = (type == BINARY) ? "binary" : (type == INTEGER) ? "integer" : "continuous";
	return "[" + numToStr(lb) + ", " + numToStr(ub) + "] " + typeName;
}

LinearExpr& LinearExpr::add (VariableHandle var, double coef) {
	terms.push_back(Term(var.id, coef));
	return *this;
}

LinearExpr& LinearExpr::addConstant (double value) {
	constant += value;
	return *this;
}

LinearExpr& LinearExpr::add (const LinearExpr &other, double scale) {
	for (int i=0; i<(int) other.terms.size(); i++) {
		terms.push_back(Term(other.terms[i].var, other.terms[i].coef * scale));
	}
	constant += other.constant * scale;
	return *this;
}

namespace {
	bool byVariable (const Term &a, const Term &b) { return a.var < b.var; }
}

void LinearExpr::normalize () {
	stable_sort(terms.begin(), terms.end(), byVariable);

	vector<Term> merged;
	for (int i=0; i<(int) terms.size(); i++) {
		if (!merged.empty() && merged.back().var == terms[i].var) {
			merged.back().coef += terms[i].coef;
		}
		else {
			merged.push_back(terms[i]);
		}
	}

	terms.clear();
	for (int i=0; i<(int) merged.size(); i++) {
		if (merged[i].coef != 0.0) terms.push_back(merged[i]);
	}
}
