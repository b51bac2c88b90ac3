//
//  CatalogReader.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include "CatalogReader.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../misc.hpp"

/****************************************************************************
 * CsvTable
 ****************************************************************************/
bool CsvTable::open (const string &filename) {
	this->filename = filename;
	lineNumber = 0;
	columns.clear();
	record.clear();
	if (input.is_open()) input.close();
	input.clear();

	if (!file_exists(filename)) return false;
	if (!open_file(input, filename)) return false;

	string line;
	while (safeGetline(input, line)) {
		lineNumber++;
		if (trimString(line).empty()) continue;

		vector<string> header = splitString(line, delimiter);
		for (int c=0; c<(int) header.size(); c++) {
			columns[ toLower(header[c]) ] = c;
		}
		return true;
	}
	return false;
}

bool CsvTable::next () {
	string line;
	while (safeGetline(input, line)) {
		lineNumber++;
		string trimmed = trimString(line);
		if (trimmed.empty() || trimmed[0] == '#') continue;

		record = splitString(line, delimiter);
		return true;
	}
	input.close();
	return false;
}

bool CsvTable::has (const string &column) const {
	return columns.find(column) != columns.end();
}

bool CsvTable::blank (const string &column) const {
	return cell(column).empty();
}

string CsvTable::cell (const string &column) const {
	map<string, int>::const_iterator it = columns.find(column);
	if (it == columns.end() || it->second >= (int) record.size()) return "";
	return record[it->second];
}

string CsvTable::where (const string &column) const {
	return filename + ":" + numToStr(lineNumber) + " (" + column + ")";
}

string CsvTable::text (const string &column) const {
	if (!has(column)) {
		throw DataError(filename, "missing column '" + column + "'");
	}
	string value = cell(column);
	if (value.empty()) {
		throw DataError(where(column), "empty cell");
	}
	return value;
}

double CsvTable::number (const string &column) const {
	double value;
	if (!parseDouble(text(column), value)) {
		throw DataError(where(column), "'" + cell(column) + "' is not a number");
	}
	return value;
}

double CsvTable::number (const string &column, double defaultValue) const {
	if (cell(column).empty()) return defaultValue;
	return number(column);
}

int CsvTable::integer (const string &column, int defaultValue) const {
	if (cell(column).empty()) return defaultValue;
	int value;
	if (!parseInt(cell(column), value)) {
		throw DataError(where(column), "'" + cell(column) + "' is not an integer");
	}
	return value;
}

bool CsvTable::flag (const string &column, bool defaultValue) const {
	if (cell(column).empty()) return defaultValue;
	bool value;
	if (!parseBool(cell(column), value)) {
		throw DataError(where(column), "'" + cell(column) + "' is not a boolean");
	}
	return value;
}

/****************************************************************************
 * table readers
 ****************************************************************************/
namespace {

	bool openRequired (CsvTable &table, const string &inputDir, const string &name) {
		if (!table.open(inputDir + name)) {
			printf("> %s file not found (Required).\n", name.c_str());
			return false;
		}
		return true;
	}

	bool openOptional (CsvTable &table, const string &inputDir, const string &name) {
		return table.open(inputDir + name);
	}

	void readTime (CsvTable &periods, CsvTable &series, CsvTable &tps, EntityCatalog &catalog) {
		// without an order column, records are in chronological order
		int row = 0;
		while (periods.next()) {
			catalog.addInvestmentPeriod(periods.text("period"), periods.integer("order", row++), periods.number("duration_hours"));
		}
		while (series.next()) {
			catalog.addTimeseries(series.text("timeseries"), series.text("period"), series.number("duration_hours", 1.0));
		}
		row = 0;
		while (tps.next()) {
			catalog.addTimepoint(tps.text("timepoint"), tps.text("timeseries"), tps.integer("order", row++), tps.number("weight"));
		}
	}

	void readGenerators (CsvTable &table, EntityCatalog &catalog) {
		while (table.next()) {
			Generator gen;
			gen.name = table.text("generator");
			if (!gen.setType(table.text("type"))) {
				throw DataError(gen.name, "unknown technology '" + table.text("type") + "'");
			}
			gen.zoneName = table.text("zone");

			gen.existingCapacity = table.number("existing_mw", 0.0);
			gen.maxBuildCapacity = table.number("max_build_mw", 0.0);
			gen.integerBuild	 = table.flag("integer_build", false);

			gen.variableCost	 = table.number("variable_cost", 0.0);
			gen.fixedCost		 = table.number("fixed_cost", 0.0);
			gen.capitalCost		 = table.number("capital_cost", 0.0);

			gen.emissionRate			 = table.number("emission_rate", 0.0);
			gen.retrofitEligible		 = table.flag("retrofit_eligible", false);
			gen.postRetrofitEmissionRate = table.number("post_retrofit_rate", 0.0);

			gen.storageHours		 = table.number("storage_hours", 0.0);
			gen.chargeEfficiency	 = table.number("charge_efficiency", 1.0);
			gen.conversionEfficiency = table.number("conversion_efficiency", 0.0);

			catalog.addGenerator(gen);
		}
	}

	void readLines (CsvTable &table, EntityCatalog &catalog) {
		while (table.next()) {
			Line line;
			line.name = table.text("line");
			line.origName = table.text("from");
			line.destName = table.text("to");
			line.capacity = table.number("capacity_mw");
			line.lossFactor = table.number("loss_factor", 0.0);
			line.bidirectional = table.flag("bidirectional", true);
			catalog.addLine(line);
		}
	}

	void readDemandResponse (CsvTable &programs, CsvTable &limits, bool hasLimits, EntityCatalog &catalog) {
		while (programs.next()) {
			DemandResponseProgram program;
			program.name = programs.text("program");
			program.zoneName = programs.text("zone");
			program.defaultShiftUp = programs.number("shift_up_mw", 0.0);
			program.defaultShiftDown = programs.number("shift_down_mw", 0.0);
			program.activationGap = programs.integer("activation_gap", 0);
			program.responseHours = programs.number("response_hours", 0.0);
			program.recoveryHours = programs.number("recovery_hours", 0.0);
			program.seriesShiftUpLimit = programs.number("series_shift_up_mw", HUGE_VAL);
			program.seriesShiftDownLimit = programs.number("series_shift_down_mw", HUGE_VAL);
			catalog.addDemandResponseProgram(program);
		}
		while (hasLimits && limits.next()) {
			catalog.setDemandResponseLimit(limits.text("program"), limits.text("timepoint"),
										   limits.number("shift_up_mw"), limits.number("shift_down_mw"));
		}
	}
}

/****************************************************************************
 * readCatalog
 * - Required: periods, timeseries, timepoints, zones, generators.
 * - Optional core tables: loads (missing load is 0), capacity_factors
 * (missing factor is 1), lines.
 * - Policy tables are optional; a missing table leaves its policy out of
 * the catalog, which disables the module.
 ****************************************************************************/
bool readCatalog (string inputDir, EntityCatalog &catalog) {
	if (!inputDir.empty() && inputDir[inputDir.size()-1] != '/') inputDir += "/";

	CsvTable periods, series, tps, zones, gens;
	bool status = openRequired(periods, inputDir, "periods.csv")
				&& openRequired(series, inputDir, "timeseries.csv")
				&& openRequired(tps, inputDir, "timepoints.csv")
				&& openRequired(zones, inputDir, "zones.csv")
				&& openRequired(gens, inputDir, "generators.csv");
	if (!status) {
		printf("Error: Input data in %s could not be read.\n", inputDir.c_str());
		return false;
	}

	readTime(periods, series, tps, catalog);

	while (zones.next()) {
		catalog.addZone(zones.text("zone"));
	}

	CsvTable table;
	if (openOptional(table, inputDir, "loads.csv")) {
		while (table.next()) catalog.setZoneLoad(table.text("zone"), table.text("timepoint"), table.number("load_mw"));
	}

	readGenerators(gens, catalog);

	if (openOptional(table, inputDir, "capacity_factors.csv")) {
		while (table.next()) catalog.setCapacityFactor(table.text("generator"), table.text("timepoint"), table.number("capacity_factor"));
	}

	if (openOptional(table, inputDir, "lines.csv")) {
		readLines(table, catalog);
	}

	/* policy tables */
	if (openOptional(table, inputDir, "carbon_policy.csv")) {
		while (table.next()) {
			bool hasCap = !table.blank("cap");
			catalog.addCarbonPolicy(table.text("period"), hasCap, table.number("cap", 0.0), table.number("carbon_cost", 0.0));
		}
	}

	if (openOptional(table, inputDir, "hydrogen_demand.csv")) {
		while (table.next()) catalog.addHydrogenDemand(table.text("zone"), table.text("timeseries"), table.number("demand_kg"));
	}
	if (openOptional(table, inputDir, "hydrogen_storage.csv")) {
		while (table.next()) catalog.addHydrogenStorage(table.text("zone"), table.number("capacity_kg"), table.number("cost_per_kg", 0.0));
	}

	CsvTable programs, limits;
	if (openOptional(programs, inputDir, "dr_programs.csv")) {
		bool hasLimits = openOptional(limits, inputDir, "dr_limits.csv");
		readDemandResponse(programs, limits, hasLimits, catalog);
	}

	if (openOptional(table, inputDir, "retrofit.csv")) {
		while (table.next()) {
			string firstPeriod = table.blank("first_period") ? "" : table.text("first_period");
			catalog.addRetrofitOption(table.text("generator"), table.number("cost", 0.0), firstPeriod);
		}
	}

	catalog.finalize();
	printf("Input data has been read successfully.\n");

	return true;
}

bool isScenarioDirectory (string inputDir) {
	if (!inputDir.empty() && inputDir[inputDir.size()-1] != '/') inputDir += "/";
	return file_exists(inputDir + "generators.csv");
}
