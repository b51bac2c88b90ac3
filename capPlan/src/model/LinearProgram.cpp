//
//  LinearProgram.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include "LinearProgram.hpp"
#include "../misc.hpp"

namespace {

	const int termsPerLine = 4;

	string formatNumber (double value) {
		char buffer[32];
		snprintf(buffer, sizeof(buffer), "%.15g", value);
		return string(buffer);
	}

	string formatBound (double value) {
		if (value == HUGE_VAL)	return "+inf";
		if (value == -HUGE_VAL)	return "-inf";
		return formatNumber(value);
	}

	void writeTerms (ostream &out, const vector<Term> &terms, const vector<ProgramColumn> &columns) {
		if (terms.empty()) {
			out << " 0 " << lpName(columns.empty() ? "x" : columns[0].name);
			return;
		}
		for (int i=0; i<(int) terms.size(); i++) {
			if (i > 0 && i % termsPerLine == 0) out << endl << "     ";
			double coef = terms[i].coef;
			out << ((coef < 0) ? " - " : " + ") << formatNumber(fabs(coef)) << " " << lpName(columns[ terms[i].var ].name);
		}
	}
}

/* CPLEX LP names may use letters, digits and !"#$%&()/,.;?@_`'{}|~ */
string lpName (const string &name) {
	string legal = name;
	for (int i=0; i<(int) legal.size(); i++) {
		char c = legal[i];
		if (isalnum((unsigned char) c)) continue;
		if (strchr("!\"#$%&()/,.;?@_`'{}|~", c) != NULL && c != '\0') continue;
		legal[i] = '_';
	}
	if (!legal.empty() && (isdigit((unsigned char) legal[0]) || legal[0] == '.')) {
		legal = "_" + legal;
	}
	return legal;
}

LinearProgram::LinearProgram () : objectiveConstant(0.0) {}

bool LinearProgram::isMip () const {
	for (int j=0; j<(int) columns.size(); j++) {
		if (columns[j].type != CONTINUOUS) return true;
	}
	return false;
}

void LinearProgram::buildIndex () {
	mapKeyToColumn.clear();
	mapNameToRow.clear();
	for (int j=0; j<(int) columns.size(); j++)	mapKeyToColumn[ columns[j].key ] = j;
	for (int i=0; i<(int) rows.size(); i++)		mapNameToRow[ rows[i].name ] = i;
}

int LinearProgram::findColumn (const VariableKey &key) const {
	map<VariableKey, int>::const_iterator it = mapKeyToColumn.find(key);
	return (it == mapKeyToColumn.end()) ? -1 : it->second;
}

int LinearProgram::findRow (const string &name) const {
	map<string, int>::const_iterator it = mapNameToRow.find(name);
	return (it == mapNameToRow.end()) ? -1 : it->second;
}

double LinearProgram::evaluate (const vector<Term> &terms, double constant, const vector<double> &values) const {
	double result = constant;
	for (int i=0; i<(int) terms.size(); i++) {
		result += terms[i].coef * values[ terms[i].var ];
	}
	return result;
}

double LinearProgram::rowActivity (int row, const vector<double> &values) const {
	return evaluate(rows[row].terms, 0.0, values);
}

/****************************************************************************
 * writeLP
 * - Writes the program in CPLEX LP format. The text is a pure function of
 * the program, which makes it usable as a fingerprint of a build.
 ****************************************************************************/
void LinearProgram::writeLP (ostream &out) const {
	out << "\\ capPlan composed model" << endl;
	out << "\\ columns = " << columns.size() << ", rows = " << rows.size() << endl;

	out << "Minimize" << endl;
	out << " obj:";
	writeTerms(out, objective, columns);
	if (objectiveConstant != 0.0) {
		out << ((objectiveConstant < 0) ? " - " : " + ") << formatNumber(fabs(objectiveConstant));
	}
	out << endl;

	out << "Subject To" << endl;
	for (int i=0; i<(int) rows.size(); i++) {
		out << " " << lpName(rows[i].name) << ":";
		writeTerms(out, rows[i].terms, columns);
		switch (rows[i].sense) {
			case LessEqual:		out << " <= "; break;
			case GreaterEqual:	out << " >= "; break;
			case Equal:			out << " = ";  break;
		}
		out << formatNumber(rows[i].rhs) << endl;
	}

	out << "Bounds" << endl;
	for (int j=0; j<(int) columns.size(); j++) {
		const ProgramColumn &col = columns[j];
		if (col.type == BINARY && col.lb == 0.0 && col.ub == 1.0) continue;
		if (col.lb == -HUGE_VAL && col.ub == HUGE_VAL) {
			out << " " << lpName(col.name) << " free" << endl;
		}
		else if (col.lb == col.ub) {
			out << " " << lpName(col.name) << " = " << formatNumber(col.lb) << endl;
		}
		else {
			out << " " << formatBound(col.lb) << " <= " << lpName(col.name) << " <= " << formatBound(col.ub) << endl;
		}
	}

	bool header = false;
	for (int j=0; j<(int) columns.size(); j++) {
		if (columns[j].type != INTEGER) continue;
		if (!header) { out << "Generals" << endl; header = true; }
		out << " " << lpName(columns[j].name) << endl;
	}
	header = false;
	for (int j=0; j<(int) columns.size(); j++) {
		if (columns[j].type != BINARY) continue;
		if (!header) { out << "Binaries" << endl; header = true; }
		out << " " << lpName(columns[j].name) << endl;
	}
	out << "End" << endl;
}

string LinearProgram::toLPString () const {
	ostringstream out;
	writeLP(out);
	return out.str();
}
