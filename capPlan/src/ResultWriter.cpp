//
//  ResultWriter.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include "Solution.hpp"

namespace {

	/* entity, period, value rows of one matrix */
	bool printTable (string filename, const string &header, const vector<string> &rowNames, const vector<string> &colNames,
					 const vector< vector<double> > &mat) {
		ofstream output;
		if (!open_file(output, filename)) return false;

		output << header << endl;
		output << setprecision(10);
		for (int i=0; i<(int) mat.size(); i++) {
			for (int j=0; j<(int) mat[i].size(); j++) {
				output << rowNames[i] << delimiter << colNames[j] << delimiter << mat[i][j] << endl;
			}
		}
		output.close();
		return true;
	}

	/* quoted CSV cell, embedded quotes doubled */
	string quoted (const string &text) {
		string cell = "\"";
		for (int i=0; i<(int) text.size(); i++) {
			if (text[i] == '"') cell += '"';
			cell += text[i];
		}
		return cell + "\"";
	}

	template <class record>
	vector<string> namesOf (const vector<record> &records) {
		vector<string> names;
		for (int i=0; i<(int) records.size(); i++) names.push_back(records[i].name);
		return names;
	}
}

/****************************************************************************
 * writeSolution
 * - summary.csv is always written. The decision tables follow only when
 * the solution carries values, the dual tables only when it carries duals.
 ****************************************************************************/
bool writeSolution (const Solution &solution, const EntityCatalog &catalog, string outputDir) {
	if (!make_dir(outputDir)) return false;
	string path = outputDir + "/";

	ofstream output;
	if (!open_file(output, path + "summary.csv")) return false;
	output << setprecision(10);
	output << "key" << delimiter << "value" << endl;
	output << "status" << delimiter << statusName(solution.status) << endl;
	output << "message" << delimiter << quoted(solution.message) << endl;
	if (solution.hasValues) {
		output << "objective" << delimiter << solution.objective << endl;
		for (int i=0; i<(int) solution.costComponents.size(); i++) {
			output << solution.costComponents[i].first << delimiter << solution.costComponents[i].second << endl;
		}
	}
	output.close();

	if (!solution.hasValues) return true;

	vector<string> gens = namesOf(catalog.generators());
	vector<string> tps = namesOf(catalog.timepoints());
	vector<string> periods = namesOf(catalog.periods());
	vector<string> series = namesOf(catalog.timeseries());
	vector<string> zones = namesOf(catalog.zones());
	vector<string> lines = namesOf(catalog.lines());
	vector<string> programs = namesOf(catalog.drPrograms());

	/* operations per generator and timepoint */
	if (!open_file(output, path + "dispatch.csv")) return false;
	output << setprecision(10);
	output << "generator,timepoint,dispatch_mw,charge_mw,state_of_charge_mwh,emissions_t_per_h,retrofitted_dispatch_mw" << endl;
	for (int g=0; g<catalog.numGen(); g++) {
		if (!catalog.generators()[g].dispatches()) continue;
		for (int t=0; t<catalog.numTimepoints(); t++) {
			output << gens[g] << delimiter << tps[t] << delimiter << solution.dispatch[g][t] << delimiter << solution.charge[g][t]
				   << delimiter << solution.stateOfCharge[g][t] << delimiter << solution.emissions[g][t]
				   << delimiter << solution.retrofitDispatch[g][t] << endl;
		}
	}
	output.close();

	bool status = true;
	status = status && printTable(path + "build.csv", "generator,period,build_mw", gens, periods, solution.build);
	status = status && printTable(path + "flows.csv", "line,timepoint,flow_mw", lines, tps, solution.flow);
	status = status && printTable(path + "flows_reverse.csv", "line,timepoint,flow_mw", lines, tps, solution.flowReverse);

	if (!open_file(output, path + "emissions.csv")) return false;
	output << setprecision(10);
	output << "period,emissions_t" << endl;
	for (int p=0; p<catalog.numPeriods(); p++) {
		output << periods[p] << delimiter << solution.periodEmissions[p] << endl;
	}
	output.close();

	if (catalog.hasRetrofitPlan()) {
		status = status && printTable(path + "retrofit.csv", "generator,period,selected", gens, periods, solution.retrofitSelect);
	}
	if (catalog.hasDemandResponse()) {
		status = status && printTable(path + "demand_response.csv", "program,timepoint,shift_mw", programs, tps, solution.shift);
		status = status && printTable(path + "demand_recovery.csv", "program,timepoint,recovery_mw", programs, tps, solution.recovery);
	}
	if (catalog.hasHydrogenSupply()) {
		status = status && printTable(path + "hydrogen_production.csv", "generator,timepoint,production_kg_per_h", gens, tps, solution.h2Produce);
		status = status && printTable(path + "hydrogen_consumption.csv", "generator,timepoint,consumption_mw", gens, tps, solution.h2Consume);
		status = status && printTable(path + "hydrogen_store.csv", "zone,timeseries,store_kg", zones, series, solution.h2Store);
		status = status && printTable(path + "hydrogen_withdraw.csv", "zone,timeseries,withdraw_kg", zones, series, solution.h2Withdraw);
	}

	if (solution.hasDuals) {
		status = status && printTable(path + "duals_energy_balance.csv", "zone,timepoint,dual", zones, tps, solution.energyBalanceDual);
		status = status && printTable(path + "duals_capacity.csv", "generator,timepoint,dual", gens, tps, solution.capacityDual);
	}

	return status;
}
