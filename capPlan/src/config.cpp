//
//  config.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include "config.hpp"
#include "errors.hpp"
#include "misc.hpp"

SolverOptions::SolverOptions () :
	backend("cplex"), timeLimit(0.0), mipGap(1e-4), threads(0),
	verbose(false), retrieveDuals(false), traceback(false), traceFile("failed_model.lp") {}

RunParameters::RunParameters () :
	modulesSpecified(false), storageBoundary(WrapAround), batchThreads(1) {}

bool parseModuleName (const std::string &name, PolicyModuleId &id) {
	string lower = toLower(trimString(name));

	if ( lower == "carbon" || lower == "carbon_policy" )
		id = CARBON_MODULE;
	else if ( lower == "hydrogen" || lower == "hydrogen_supply" )
		id = HYDROGEN_MODULE;
	else if ( lower == "demand_response" || lower == "dr" )
		id = DEMAND_RESPONSE_MODULE;
	else if ( lower == "retrofit" )
		id = RETROFIT_MODULE;
	else
		return false;

	return true;
}

std::string moduleName (PolicyModuleId id) {
	switch (id) {
		case CARBON_MODULE:				return "carbon";
		case HYDROGEN_MODULE:			return "hydrogen";
		case DEMAND_RESPONSE_MODULE:	return "demand_response";
		case RETROFIT_MODULE:			return "retrofit";
	}
	return "unknown";
}

namespace {

	double toNumber (const string &field, const string &value) {
		double temp;
		if ( !parseDouble(value, temp) ) {
			throw ConfigurationError("run parameter '" + field + "' expects a number, found '" + value + "'");
		}
		return temp;
	}

	bool toFlag (const string &field, const string &value) {
		bool temp;
		if ( !parseBool(value, temp) ) {
			throw ConfigurationError("run parameter '" + field + "' expects 0/1, found '" + value + "'");
		}
		return temp;
	}
}

/****************************************************************************
 * readRunfile
 * - Reads the run parameters of a scenario from inputDir/scenario.txt, one
 * "key value..." pair per line. Lines starting with '#' are comments.
 * - Missing file: defaults are kept and false is returned. An unknown key
 * is reported and skipped; a malformed value throws ConfigurationError.
 * - "modules" lists the enabled policy modules. "modules none" enables no
 * module at all; without the line every module with input data runs.
 ****************************************************************************/
bool readRunfile (std::string inputDir, RunParameters &runParam) {
	ifstream fptr;
	string	 line, field1, field2;

	if (!inputDir.empty() && inputDir[inputDir.size()-1] != '/') inputDir += "/";

	string filename = inputDir + "scenario.txt";
	if ( !file_exists(filename) || !open_file(fptr, filename) ) {
		return false;
	}

	while ( safeGetline(fptr, line) ) {
		istringstream iss(line);
		if ( !(iss >> field1) || field1[0] == '#' )
			continue;

		if ( field1 == "modules" ) {
			runParam.modules.clear();
			runParam.modulesSpecified = true;
			while ( iss >> field2 ) {
				if ( toLower(field2) == "none" )
					continue;
				PolicyModuleId id;
				if ( !parseModuleName(field2, id) ) {
					throw ConfigurationError("unknown policy module '" + field2 + "' in " + filename);
				}
				runParam.modules.insert(id);
			}
			continue;
		}

		if ( !(iss >> field2) ) {
			throw ConfigurationError("run parameter '" + field1 + "' has no value in " + filename);
		}

		if ( field1 == "solver" )
			runParam.solver.backend = toLower(field2);
		else if ( field1 == "storage_boundary" ) {
			if ( toLower(field2) == "wrap" )
				runParam.storageBoundary = WrapAround;
			else if ( toLower(field2) == "reset" )
				runParam.storageBoundary = ResetEmpty;
			else
				throw ConfigurationError("storage_boundary must be 'wrap' or 'reset', found '" + field2 + "'");
		}
		else if ( field1 == "time_limit" )
			runParam.solver.timeLimit = toNumber(field1, field2);
		else if ( field1 == "mip_gap" )
			runParam.solver.mipGap = toNumber(field1, field2);
		else if ( field1 == "threads" )
			runParam.solver.threads = (int) toNumber(field1, field2);
		else if ( field1 == "verbose" )
			runParam.solver.verbose = toFlag(field1, field2);
		else if ( field1 == "duals" )
			runParam.solver.retrieveDuals = toFlag(field1, field2);
		else if ( field1 == "traceback" )
			runParam.solver.traceback = toFlag(field1, field2);
		else if ( field1 == "batch_threads" )
			runParam.batchThreads = (int) toNumber(field1, field2);
		else {
			perror(("Warning:: Unidentified run parameter '" + field1 + "' in the file.\n").c_str());
		}
	}
	fptr.close();

	if ( runParam.solver.mipGap < 0 || runParam.solver.threads < 0 || runParam.batchThreads < 1 ) {
		throw ConfigurationError("mip_gap and threads must be non-negative, batch_threads positive");
	}

	return true;
}//END readRunfile()

void printRunParameters (const RunParameters &runParam, std::ostream &out) {
	out << "------------------------------------------------------------------" << endl;
	out << "Policy modules     : ";
	if ( !runParam.modulesSpecified )
		out << "every module with input data";
	else if ( runParam.modules.empty() )
		out << "none";
	else {
		for (set<PolicyModuleId>::const_iterator it = runParam.modules.begin(); it != runParam.modules.end(); ++it)
			out << moduleName(*it) << " ";
	}
	out << endl;
	out << "Storage boundary   : " << (runParam.storageBoundary == WrapAround ? "wrap" : "reset") << endl;
	out << "Solver             : " << runParam.solver.backend;
	if ( runParam.solver.timeLimit > 0 ) out << ", time limit " << runParam.solver.timeLimit << " s";
	out << ", MIP gap " << runParam.solver.mipGap << endl;
	if ( runParam.solver.retrieveDuals ) out << "Dual values of the balance and capacity rows are retrieved." << endl;
	if ( runParam.batchThreads > 1 ) out << "Scenarios are solved on " << runParam.batchThreads << " threads." << endl;
	out << "------------------------------------------------------------------" << endl;
}
