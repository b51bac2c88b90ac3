//
//  Variable.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef Variable_hpp
#define Variable_hpp

#include <string>
#include <vector>

using namespace std;

enum VariableKind {
	DISPATCH,			// MW produced (storage: discharged)
	CHARGE,				// MW charged into storage
	STATE_OF_CHARGE,	// MWh stored at the end of a timepoint
	BUILD,				// MW built up to and including an investment period (cumulative)
	FLOW,				// MW sent from origin to destination
	FLOW_REVERSE,		// MW sent from destination to origin
	EMISSIONS,			// t / h emitted
	RETROFIT_SELECT,	// 1 if the unit is retrofitted in or before an investment period
	RETROFIT_DISPATCH,	// MW produced in the retrofitted state
	DEMAND_SHIFT,		// MW of load moved into (+) or out of (-) a timepoint
	DEMAND_SHIFT_UP,	// positive part of the shift
	DEMAND_SHIFT_DOWN,	// negative part of the shift
	DEMAND_RECOVERY,	// MW of shifted load still recovering in a timepoint
	DR_ACTIVE,			// 1 if a demand response program is activated in a timepoint
	H2_CONSUME,			// MW drawn by an electrolyzer
	H2_PRODUCE,			// kg / h produced by an electrolyzer
	H2_STORE,			// kg moved into liquid storage over a series
	H2_WITHDRAW			// kg taken out of liquid storage over a series
};

enum VarType {
	CONTINUOUS,
	INTEGER,
	BINARY
};

string kindName (VariableKind kind);
bool kindIndexedByInvestmentPeriod (VariableKind kind);
bool kindIndexedByTimeseries (VariableKind kind);

/* (kind, entity, period) identifies a decision variable. */
struct VariableKey {
	VariableKey () : kind(DISPATCH) {}
	VariableKey (VariableKind kind, const string &entity, const string &period) : kind(kind), entity(entity), period(period) {}

	VariableKind kind;
	string entity;
	string period;

	bool operator< (const VariableKey &other) const;
	bool operator== (const VariableKey &other) const;
	string toString () const;
};

struct VariableBounds {
	VariableBounds () : lb(0.0), ub(0.0), type(CONTINUOUS) {}
	VariableBounds (double lb, double ub, VarType type) : lb(lb), ub(ub), type(type) {}

	double	lb;
	double	ub;
	VarType	type;

	bool operator== (const VariableBounds &other) const { return lb == other.lb && ub == other.ub && type == other.type; }
	string toString () const;
};

/* Index of a variable in the registry (allocation order, not model order). */
struct VariableHandle {
	VariableHandle () : id(-1) {}
	explicit VariableHandle (int id) : id(id) {}

	int id;

	bool valid () const { return id >= 0; }
	bool operator== (const VariableHandle &other) const { return id == other.id; }
	bool operator!= (const VariableHandle &other) const { return id != other.id; }
};

struct Term {
	Term () : var(-1), coef(0.0) {}
	Term (int var, double coef) : var(var), coef(coef) {}

	int		var;
	double	coef;
};

/* Affine expression over registry handles. */
class LinearExpr {

public:
	LinearExpr () : constant(0.0) {}

	LinearExpr& add (VariableHandle var, double coef);
	LinearExpr& addConstant (double value);
	LinearExpr& add (const LinearExpr &other, double scale);

	void normalize ();		// sorts terms by variable, merges duplicates, drops zero coefficients
	bool empty () const		{ return terms.empty(); }

	vector<Term>	terms;
	double			constant;
};

#endif /* Variable_hpp */
