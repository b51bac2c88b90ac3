//
//  ResultProjector.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include "Solution.hpp"

namespace {

	/* matrix cell a column value lands in, NULL for kinds without a table */
	double* cellOf (Solution &solution, const EntityCatalog &catalog, const VariableKey &key) {
		int t = catalog.findTimepoint(key.period);
		int p = catalog.findPeriod(key.period);
		int s = catalog.findTimeseries(key.period);

		switch (key.kind) {
			case DISPATCH:			return &solution.dispatch[ catalog.findGenerator(key.entity) ][t];
			case CHARGE:			return &solution.charge[ catalog.findGenerator(key.entity) ][t];
			case STATE_OF_CHARGE:	return &solution.stateOfCharge[ catalog.findGenerator(key.entity) ][t];
			case EMISSIONS:			return &solution.emissions[ catalog.findGenerator(key.entity) ][t];
			case RETROFIT_DISPATCH:	return &solution.retrofitDispatch[ catalog.findGenerator(key.entity) ][t];
			case H2_CONSUME:		return &solution.h2Consume[ catalog.findGenerator(key.entity) ][t];
			case H2_PRODUCE:		return &solution.h2Produce[ catalog.findGenerator(key.entity) ][t];
			case BUILD:				return &solution.build[ catalog.findGenerator(key.entity) ][p];
			case RETROFIT_SELECT:	return &solution.retrofitSelect[ catalog.findGenerator(key.entity) ][p];
			case FLOW:				return &solution.flow[ catalog.findLine(key.entity) ][t];
			case FLOW_REVERSE:		return &solution.flowReverse[ catalog.findLine(key.entity) ][t];
			case DEMAND_SHIFT:		return &solution.shift[ catalog.findProgram(key.entity) ][t];
			case DEMAND_RECOVERY:	return &solution.recovery[ catalog.findProgram(key.entity) ][t];
			case DR_ACTIVE:			return &solution.drActive[ catalog.findProgram(key.entity) ][t];
			case DEMAND_SHIFT_UP:
			case DEMAND_SHIFT_DOWN:
				break;
			case H2_STORE:			return &solution.h2Store[ catalog.findZone(key.entity) ][s];
			case H2_WITHDRAW:		return &solution.h2Withdraw[ catalog.findZone(key.entity) ][s];
		}
		return NULL;
	}
}

/****************************************************************************
 * projectSolution
 * - Values are taken only when the result has one per program column;
 * anything else (no solution, a malformed result) leaves the matrices at
 * zero and keeps the status and message for the caller.
 ****************************************************************************/
Solution projectSolution (const LinearProgram &program, const SolveResult &result, const EntityCatalog &catalog) {
	Solution solution;
	solution.allocateMem(catalog);
	solution.status = result.status;
	solution.message = result.message;

	solution.hasValues = result.hasValues && (int) result.values.size() == program.numCols();
	solution.hasDuals = solution.hasValues && result.hasDuals && (int) result.duals.size() == program.numRows();
	if (result.hasValues && !solution.hasValues) {
		solution.message += (solution.message.empty() ? "" : "; ") + string("solver values do not match the program, ignored");
	}
	if (!solution.hasValues) {
		return solution;
	}

	solution.objective = result.objective;

	for (int j=0; j<program.numCols(); j++) {
		double *cell = cellOf(solution, catalog, program.columns[j].key);
		if (cell != NULL) *cell = result.values[j];
	}

	for (int i=0; i<(int) program.costComponents.size(); i++) {
		const CostComponent &component = program.costComponents[i];
		solution.costComponents.push_back(make_pair(component.name, program.evaluate(component.terms, component.constant, result.values)));
	}

	for (int g=0; g<catalog.numGen(); g++) {
		for (int t=0; t<catalog.numTimepoints(); t++) {
			const Timepoint &tp = catalog.timepoints()[t];
			solution.periodEmissions[tp.periodId] += tp.weight * solution.emissions[g][t];
		}
	}

	if (solution.hasDuals) {
		for (int i=0; i<program.numRows(); i++) {
			const ProgramRow &row = program.rows[i];
			if (row.family == "EnergyBalance") {
				solution.energyBalanceDual[ catalog.findZone(row.entity) ][ catalog.findTimepoint(row.index) ] = result.duals[i];
			}
			else if (row.family == "Capacity") {
				solution.capacityDual[ catalog.findGenerator(row.entity) ][ catalog.findTimepoint(row.index) ] = result.duals[i];
			}
		}
	}

	return solution;
}
