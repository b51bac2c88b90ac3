//
//  DemandResponseModule.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include "DemandResponseModule.hpp"

PolicyContribution DemandResponseModule::contribute (const EntityCatalog &catalog, VariableRegistry &registry) const {
	PolicyContribution contribution;

	const vector<DemandResponseProgram> &programs = catalog.drPrograms();
	for (int d=0; d<(int) programs.size(); d++) {
		const DemandResponseProgram &program = programs[d];

		for (int s=0; s<(int) catalog.timeseries().size(); s++) {
			const Timeseries &series = catalog.timeseries()[s];

			LinearExpr netShift, shiftedUp, shiftedDown;
			for (int k=0; k<(int) series.timepoints.size(); k++) {
				int t = series.timepoints[k];
				const Timepoint &tp = catalog.timepoints()[t];

				VariableHandle shift = registry.allocate(program.name, tp.name, DEMAND_SHIFT);
				contribution.addBalanceTerm(ELECTRICITY, program.zoneName, tp.name, shift, -1.0);
				netShift.add(shift, 1.0);

				if (program.recovers()) {
					VariableHandle recovery = addRecovery(catalog, registry, program, t, contribution);
					contribution.addBalanceTerm(ELECTRICITY, program.zoneName, tp.name, recovery, -1.0);
					netShift.add(recovery, 1.0);
				}

				if (program.limitsSeriesShift()) {
					// shift = up - down
					VariableHandle up = registry.allocate(program.name, tp.name, DEMAND_SHIFT_UP);
					VariableHandle down = registry.allocate(program.name, tp.name, DEMAND_SHIFT_DOWN);
					LinearExpr split;
					split.add(shift, 1.0).add(up, -1.0).add(down, 1.0);
					contribution.addConstraint("ShiftSplit", program.name, tp.name, split, Equal, 0.0);
					shiftedUp.add(up, 1.0);
					shiftedDown.add(down, 1.0);
				}
			}
			contribution.addConstraint("ShiftConservation", program.name, series.name, netShift, Equal, 0.0);

			if (program.seriesShiftUpLimit < HUGE_VAL) {
				contribution.addConstraint("SeriesShiftUpLimit", program.name, series.name, shiftedUp, LessEqual, program.seriesShiftUpLimit);
			}
			if (program.seriesShiftDownLimit < HUGE_VAL) {
				contribution.addConstraint("SeriesShiftDownLimit", program.name, series.name, shiftedDown, LessEqual, program.seriesShiftDownLimit);
			}
		}

		if (program.activationGap > 0) {
			addActivation(catalog, registry, program, contribution);
		}
	}

	return contribution;
}

/****************************************************************************
 * addRecovery
 * - Load shifted i timepoints back is still recovering now by the fraction
 * 1 - i * duration / recoveryHours:
 *	 recovery(t) = sum_{i=1..n} (1 - i * duration / recoveryHours) * shift(t-i)
 * with n = recoveryHours / duration, at most one lap of the series.
 ****************************************************************************/
VariableHandle DemandResponseModule::addRecovery (const EntityCatalog &catalog, VariableRegistry &registry, const DemandResponseProgram &program,
												  int t, PolicyContribution &contribution) const {
	const Timepoint &tp = catalog.timepoints()[t];
	const Timeseries &series = catalog.timeseries()[tp.seriesId];
	double duration = series.tpDurationHours;

	VariableHandle recovery = registry.allocate(program.name, tp.name, DEMAND_RECOVERY);

	LinearExpr expr;
	expr.add(recovery, 1.0);
	int steps = min((int) (program.recoveryHours / duration + EPSzero), (int) series.timepoints.size() - 1);
	for (int i=1; i<=steps; i++) {
		double fraction = 1.0 - i * duration / program.recoveryHours;
		if (fraction <= EPSzero) break;
		int prev = catalog.previousTimepoint(t, i);
		expr.add(registry.allocate(program.name, catalog.timepoints()[prev].name, DEMAND_SHIFT), -fraction);
	}
	contribution.addConstraint("RecoveryDemand", program.name, tp.name, expr, Equal, 0.0);

	return recovery;
}

/****************************************************************************
 * addActivation
 *	 shift(t) <= up(t) * active(t)
 *	 shift(t) >= -down(t) * active(t)
 *	 active(t) + active(t-1) + ... + active(t-gap+1) <= 1
 *	 active(t) = 0 within the response time from the start of a series
 ****************************************************************************/
void DemandResponseModule::addActivation (const EntityCatalog &catalog, VariableRegistry &registry, const DemandResponseProgram &program, PolicyContribution &contribution) const {
	for (int t=0; t<catalog.numTimepoints(); t++) {
		const Timepoint &tp = catalog.timepoints()[t];

		VariableHandle shift = registry.allocate(program.name, tp.name, DEMAND_SHIFT);
		VariableHandle active = registry.allocate(program.name, tp.name, DR_ACTIVE);

		LinearExpr up;
		up.add(shift, 1.0).add(active, -program.shiftUp[t]);
		contribution.addConstraint("ShiftUpActivation", program.name, tp.name, up, LessEqual, 0.0);

		LinearExpr down;
		down.add(shift, 1.0).add(active, program.shiftDown[t]);
		contribution.addConstraint("ShiftDownActivation", program.name, tp.name, down, GreaterEqual, 0.0);

		const Timeseries &series = catalog.timeseries()[tp.seriesId];
		int position = t - series.timepoints[0];		// series members have consecutive ids
		if (position * series.tpDurationHours < program.responseHours - EPSzero) {
			LinearExpr preparing;
			preparing.add(active, 1.0);
			contribution.addConstraint("ResponseTime", program.name, tp.name, preparing, Equal, 0.0);
		}

		int seriesLength = (int) series.timepoints.size();
		int window = min(program.activationGap, seriesLength);
		if (window < 2) continue;

		LinearExpr activations;
		for (int k=0; k<window; k++) {
			int prev = catalog.previousTimepoint(t, k);
			activations.add(registry.allocate(program.name, catalog.timepoints()[prev].name, DR_ACTIVE), 1.0);
		}
		contribution.addConstraint("ActivationWindow", program.name, tp.name, activations, LessEqual, 1.0);
	}
}
