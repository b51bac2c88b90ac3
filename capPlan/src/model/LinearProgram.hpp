//
//  LinearProgram.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef LinearProgram_hpp
#define LinearProgram_hpp

#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "Variable.hpp"

using namespace std;

enum RowSense {
	LessEqual,
	GreaterEqual,
	Equal
};

struct ProgramColumn {
	VariableKey	key;
	string		name;
	double		lb;
	double		ub;
	VarType		type;
	string		owner;
};

struct ProgramRow {
	ProgramRow () : sense(Equal), rhs(0.0) {}

	string			name;
	string			family;		// e.g. EnergyBalance, Capacity
	string			entity;
	string			index;		// timepoint, investment period or timeseries
	vector<Term>	terms;		// over columns, sorted by column
	RowSense		sense;
	double			rhs;
	string			owner;
};

/* One named share of the objective, reported after the solve. */
struct CostComponent {
	CostComponent () : constant(0.0) {}

	string			name;
	vector<Term>	terms;		// over columns
	double			constant;
};

/****************************************************************************
 * LinearProgram
 * - The composed (mixed-integer) linear program in canonical form: columns
 * ordered by variable key, rows by name, terms by column. Two builds of the
 * same scenario therefore produce identical programs.
 * - The objective is always minimized.
 ****************************************************************************/
class LinearProgram {

public:
	LinearProgram ();

	vector<ProgramColumn>	columns;
	vector<ProgramRow>		rows;
	vector<CostComponent>	costComponents;

	vector<Term>	objective;			// sum of the cost components
	double			objectiveConstant;

	int numCols () const { return (int) columns.size(); }
	int numRows () const { return (int) rows.size(); }
	bool isMip () const;

	void buildIndex ();
	int findColumn (const VariableKey &key) const;		// -1 if absent
	int findRow (const string &name) const;				// -1 if absent

	double evaluate (const vector<Term> &terms, double constant, const vector<double> &values) const;
	double rowActivity (int row, const vector<double> &values) const;

	void writeLP (ostream &out) const;		// CPLEX LP format
	string toLPString () const;

private:
	map<VariableKey, int>	mapKeyToColumn;
	map<string, int>		mapNameToRow;
};

string lpName (const string &name);		// name with LP-format-illegal characters replaced

#endif /* LinearProgram_hpp */
