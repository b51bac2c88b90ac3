//
//  EntityCatalog.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include "EntityCatalog.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../misc.hpp"

namespace {

	bool byPeriodOrdinal (const InvestmentPeriod &a, const InvestmentPeriod &b) {
		if (a.ordinal != b.ordinal) return a.ordinal < b.ordinal;
		return a.name < b.name;
	}

	template <class record>
	void stageUnique (map<string, record> &staged, const string &name, const record &rec, const string &kind) {
		if (name.empty()) {
			throw DataError(kind, "record without a name");
		}
		// names are joined with these into variable and row keys
		if (name.find_first_of("(),") != string::npos) {
			throw DataError(name, kind + " name contains one of '(', ')' or ','");
		}
		if (staged.find(name) != staged.end()) {
			throw DataError(name, "duplicate " + kind);
		}
		staged.insert(make_pair(name, rec));
	}

	template <class record>
	map<string, int> indexByName (const vector<record> &records) {
		map<string, int> index;
		for (int i=0; i<(int) records.size(); i++) {
			index[records[i].name] = i;
		}
		return index;
	}

	int lookup (const map<string, int> &index, const string &name) {
		map<string, int>::const_iterator it = index.find(name);
		return (it == index.end()) ? -1 : it->second;
	}
}

EntityCatalog::EntityCatalog () : finalized(false) {}

void EntityCatalog::checkOpen (const string &identifier) const {
	if (finalized) {
		throw DataError(identifier, "catalog is already finalized");
	}
}

void EntityCatalog::addInvestmentPeriod (const string &name, int ordinal, double durationHours) {
	checkOpen(name);
	if (!(durationHours > 0) || std::isinf(durationHours)) {
		throw DataError(name, "investment period duration must be positive and finite");
	}

	InvestmentPeriod period;
	period.name = name;
	period.ordinal = ordinal;
	period.durationHours = durationHours;
	stageUnique(stagedPeriods, name, period, "investment period");
}

void EntityCatalog::addTimeseries (const string &name, const string &periodName, double tpDurationHours) {
	checkOpen(name);
	if (!(tpDurationHours > 0) || std::isinf(tpDurationHours)) {
		throw DataError(name, "timepoint duration must be positive and finite");
	}

	Timeseries series;
	series.name = name;
	series.periodName = periodName;
	series.tpDurationHours = tpDurationHours;
	stageUnique(stagedSeries, name, series, "timeseries");
}

void EntityCatalog::addTimepoint (const string &name, const string &seriesName, int ordinal, double weight) {
	checkOpen(name);
	if (!(weight > 0) || std::isinf(weight)) {
		throw DataError(name, "timepoint weight must be positive and finite");
	}

	Timepoint tp;
	tp.name = name;
	tp.seriesName = seriesName;
	tp.ordinal = ordinal;
	tp.weight = weight;
	stageUnique(stagedTimepoints, name, tp, "timepoint");
}

void EntityCatalog::addZone (const string &name) {
	checkOpen(name);

	LoadZone zone;
	zone.name = name;
	stageUnique(stagedZones, name, zone, "load zone");
}

void EntityCatalog::setZoneLoad (const string &zoneName, const string &tpName, double load) {
	checkOpen(zoneName);
	if (!(load >= 0) || std::isinf(load)) {
		throw DataError(zoneName, "load at " + tpName + " must be non-negative and finite");
	}
	stagedLoads[make_pair(zoneName, tpName)] = load;
}

void EntityCatalog::addGenerator (const Generator &gen) {
	checkOpen(gen.name);
	stageUnique(stagedGens, gen.name, gen, "generator");
}

void EntityCatalog::setCapacityFactor (const string &genName, const string &tpName, double factor) {
	checkOpen(genName);
	if (!(factor >= 0 && factor <= 1)) {
		throw DataError(genName, "capacity factor at " + tpName + " must lie in [0, 1]");
	}
	stagedCapFactors[make_pair(genName, tpName)] = factor;
}

void EntityCatalog::addLine (const Line &line) {
	checkOpen(line.name);
	stageUnique(stagedLines, line.name, line, "transmission line");
}

void EntityCatalog::addCarbonPolicy (const string &periodName, bool hasCap, double cap, double carbonCost) {
	checkOpen(periodName);
	if (hasCap && (!(cap >= 0) || std::isinf(cap))) {
		throw DataError(periodName, "carbon cap must be non-negative and finite");
	}
	if (!(carbonCost >= 0) || std::isinf(carbonCost)) {
		throw DataError(periodName, "carbon cost must be non-negative and finite");
	}

	CarbonPolicy policy;
	policy.periodName = periodName;
	policy.hasCap = hasCap;
	policy.cap = hasCap ? cap : 0.0;
	policy.carbonCost = carbonCost;
	if (stagedCarbon.find(periodName) != stagedCarbon.end()) {
		throw DataError(periodName, "duplicate carbon policy for investment period");
	}
	stagedCarbon[periodName] = policy;
}

void EntityCatalog::addHydrogenDemand (const string &zoneName, const string &seriesName, double demandKg) {
	checkOpen(zoneName);
	if (!(demandKg >= 0) || std::isinf(demandKg)) {
		throw DataError(zoneName, "hydrogen demand for " + seriesName + " must be non-negative and finite");
	}

	pair<string, string> key (zoneName, seriesName);
	if (stagedH2Demand.find(key) != stagedH2Demand.end()) {
		throw DataError(zoneName, "duplicate hydrogen demand for " + seriesName);
	}
	HydrogenDemand demand;
	demand.zoneName = zoneName;
	demand.seriesName = seriesName;
	demand.demandKg = demandKg;
	stagedH2Demand[key] = demand;
}

void EntityCatalog::addHydrogenStorage (const string &zoneName, double capacityKg, double costPerKg) {
	checkOpen(zoneName);
	if (!(capacityKg >= 0) || !(costPerKg >= 0) || std::isinf(costPerKg)) {
		throw DataError(zoneName, "hydrogen storage capacity and cost must be non-negative");
	}
	if (stagedH2Storage.find(zoneName) != stagedH2Storage.end()) {
		throw DataError(zoneName, "duplicate hydrogen storage");
	}
	HydrogenStorage storage;
	storage.zoneName = zoneName;
	storage.capacityKg = capacityKg;
	storage.costPerKg = costPerKg;
	stagedH2Storage[zoneName] = storage;
}

void EntityCatalog::addDemandResponseProgram (const DemandResponseProgram &program) {
	checkOpen(program.name);
	if (!(program.defaultShiftUp >= 0) || !(program.defaultShiftDown >= 0) || program.activationGap < 0) {
		throw DataError(program.name, "shift limits and activation gap must be non-negative");
	}
	if (!(program.responseHours >= 0) || std::isinf(program.responseHours) || !(program.recoveryHours >= 0) || std::isinf(program.recoveryHours)) {
		throw DataError(program.name, "response and recovery times must be non-negative and finite");
	}
	if (!(program.seriesShiftUpLimit >= 0) || !(program.seriesShiftDownLimit >= 0)) {
		throw DataError(program.name, "series shift limits must be non-negative");
	}
	stageUnique(stagedPrograms, program.name, program, "demand response program");
}

void EntityCatalog::setDemandResponseLimit (const string &programName, const string &tpName, double shiftUp, double shiftDown) {
	checkOpen(programName);
	if (!(shiftUp >= 0) || !(shiftDown >= 0)) {
		throw DataError(programName, "shift limits at " + tpName + " must be non-negative");
	}
	stagedDRLimits[make_pair(programName, tpName)] = make_pair(shiftUp, shiftDown);
}

void EntityCatalog::addRetrofitOption (const string &genName, double cost, const string &firstPeriodName) {
	checkOpen(genName);
	if (!(cost >= 0) || std::isinf(cost)) {
		throw DataError(genName, "retrofit cost must be non-negative and finite");
	}

	RetrofitOption option;
	option.generatorName = genName;
	option.cost = cost;
	option.firstPeriodName = firstPeriodName;
	if (stagedRetrofit.find(genName) != stagedRetrofit.end()) {
		throw DataError(genName, "duplicate retrofit option");
	}
	stagedRetrofit[genName] = option;
}

/****************************************************************************
 * finalize
 * - Resolves all name references into ids, checks the data invariants and
 * fixes the canonical order of every entity list.
 * - Throws DataError with the offending identifier on the first violation.
 ****************************************************************************/
void EntityCatalog::finalize () {
	if (finalized) return;

	finalizeTime();
	finalizeZones();
	finalizeGenerators();
	finalizeLines();
	finalizePolicies();

	finalized = true;
}

void EntityCatalog::finalizeTime () {
	if (stagedPeriods.empty() || stagedTimepoints.empty()) {
		throw DataError("catalog", "at least one investment period and one timepoint are required");
	}

	/* investment periods in chronological order */
	periodList.clear();
	for (map<string, InvestmentPeriod>::iterator it = stagedPeriods.begin(); it != stagedPeriods.end(); ++it) {
		periodList.push_back(it->second);
	}
	sort(periodList.begin(), periodList.end(), byPeriodOrdinal);
	for (int p=0; p<(int) periodList.size(); p++) {
		periodList[p].id = p;
		if (p > 0 && periodList[p].ordinal == periodList[p-1].ordinal) {
			throw DataError(periodList[p].name, "shares its ordinal with " + periodList[p-1].name);
		}
	}
	mapPeriodNameToIndex = indexByName(periodList);

	/* timeseries grouped by period, then by name */
	vector< vector<Timeseries> > seriesByPeriod (periodList.size());
	for (map<string, Timeseries>::iterator it = stagedSeries.begin(); it != stagedSeries.end(); ++it) {
		int p = lookup(mapPeriodNameToIndex, it->second.periodName);
		if (p < 0) {
			throw DataError(it->first, "references undefined investment period '" + it->second.periodName + "'");
		}
		it->second.periodId = p;
		seriesByPeriod[p].push_back(it->second);
	}
	seriesList.clear();
	for (int p=0; p<(int) periodList.size(); p++) {
		for (int s=0; s<(int) seriesByPeriod[p].size(); s++) {
			seriesByPeriod[p][s].id = (int) seriesList.size();
			periodList[p].timeseries.push_back(seriesByPeriod[p][s].id);
			seriesList.push_back(seriesByPeriod[p][s]);
		}
	}
	mapSeriesNameToIndex = indexByName(seriesList);

	/* timepoints grouped by series, in chronological order */
	vector< map<int, Timepoint> > tpBySeries (seriesList.size());
	for (map<string, Timepoint>::iterator it = stagedTimepoints.begin(); it != stagedTimepoints.end(); ++it) {
		int s = lookup(mapSeriesNameToIndex, it->second.seriesName);
		if (s < 0) {
			throw DataError(it->first, "references undefined timeseries '" + it->second.seriesName + "'");
		}
		if (tpBySeries[s].find(it->second.ordinal) != tpBySeries[s].end()) {
			throw DataError(it->first, "shares its ordinal with " + tpBySeries[s][it->second.ordinal].name);
		}
		it->second.seriesId = s;
		it->second.periodId = seriesList[s].periodId;
		tpBySeries[s][it->second.ordinal] = it->second;
	}
	tpList.clear();
	for (int s=0; s<(int) seriesList.size(); s++) {
		if (tpBySeries[s].empty()) {
			throw DataError(seriesList[s].name, "timeseries has no timepoints");
		}
		double weightSum = 0.0;
		for (map<int, Timepoint>::iterator it = tpBySeries[s].begin(); it != tpBySeries[s].end(); ++it) {
			Timepoint tp = it->second;
			tp.id = (int) tpList.size();
			seriesList[s].timepoints.push_back(tp.id);
			periodList[tp.periodId].timepoints.push_back(tp.id);
			weightSum += tp.weight;
			tpList.push_back(tp);
		}
		seriesList[s].scale = weightSum / (seriesList[s].timepoints.size() * seriesList[s].tpDurationHours);
	}
	mapTpNameToIndex = indexByName(tpList);

	/* weights of a period must cover its modeled duration */
	for (int p=0; p<(int) periodList.size(); p++) {
		if (periodList[p].timepoints.empty()) {
			throw DataError(periodList[p].name, "investment period has no timepoints");
		}
		double weightSum = 0.0;
		for (int i=0; i<(int) periodList[p].timepoints.size(); i++) {
			weightSum += tpList[ periodList[p].timepoints[i] ].weight;
		}
		if (fabs(weightSum - periodList[p].durationHours) > weightTolerance * max(1.0, periodList[p].durationHours)) {
			throw DataError(periodList[p].name, "timepoint weights sum to " + numToStr(weightSum)
							+ " hours, modeled duration is " + numToStr(periodList[p].durationHours) + " hours");
		}
	}
}

void EntityCatalog::finalizeZones () {
	if (stagedZones.empty()) {
		throw DataError("catalog", "at least one load zone is required");
	}

	zoneList.clear();
	for (map<string, LoadZone>::iterator it = stagedZones.begin(); it != stagedZones.end(); ++it) {
		LoadZone zone = it->second;
		zone.id = (int) zoneList.size();
		zone.load.assign(tpList.size(), 0.0);
		zoneList.push_back(zone);
	}
	mapZoneNameToIndex = indexByName(zoneList);

	for (map<pair<string, string>, double>::iterator it = stagedLoads.begin(); it != stagedLoads.end(); ++it) {
		int z = lookup(mapZoneNameToIndex, it->first.first);
		if (z < 0) {
			throw DataError(it->first.first, "load given for undefined load zone");
		}
		int t = lookup(mapTpNameToIndex, it->first.second);
		if (t < 0) {
			throw DataError(it->first.second, "load given for undefined timepoint");
		}
		zoneList[z].load[t] = it->second;
	}
}

void EntityCatalog::finalizeGenerators () {
	genList.clear();
	for (map<string, Generator>::iterator it = stagedGens.begin(); it != stagedGens.end(); ++it) {
		Generator gen = it->second;
		gen.id = (int) genList.size();

		gen.zoneId = lookup(mapZoneNameToIndex, gen.zoneName);
		if (gen.zoneId < 0) {
			throw DataError(gen.name, "references undefined load zone '" + gen.zoneName + "'");
		}
		if (!(gen.existingCapacity >= 0) || std::isinf(gen.existingCapacity) || !(gen.maxBuildCapacity >= 0)) {
			throw DataError(gen.name, "capacities must be non-negative, existing capacity finite");
		}
		if (!(gen.emissionRate >= 0) || std::isinf(gen.emissionRate)) {
			throw DataError(gen.name, "emission rate must be non-negative and finite");
		}
		if (!std::isfinite(gen.variableCost) || !std::isfinite(gen.fixedCost) || !std::isfinite(gen.capitalCost)) {
			throw DataError(gen.name, "cost coefficients must be finite");
		}
		if (gen.isStorage() && (!(gen.storageHours > 0) || !(gen.chargeEfficiency > 0 && gen.chargeEfficiency <= 1))) {
			throw DataError(gen.name, "storage needs positive hours and a charge efficiency in (0, 1]");
		}
		if (gen.isElectrolyzer() && !(gen.conversionEfficiency > 0)) {
			throw DataError(gen.name, "electrolyzer needs a positive conversion efficiency");
		}
		if (gen.retrofitEligible && (!gen.isThermal() || !(gen.postRetrofitEmissionRate >= 0))) {
			throw DataError(gen.name, "only thermal units with a non-negative post-retrofit rate can be retrofit-eligible");
		}

		zoneList[gen.zoneId].connectedGenerators.push_back(gen.id);
		genList.push_back(gen);
	}
	mapGenNameToIndex = indexByName(genList);

	resize_matrix(capFactor, (int) genList.size(), (int) tpList.size());
	for (int g=0; g<(int) genList.size(); g++) {
		fill(capFactor[g].begin(), capFactor[g].end(), 1.0);
	}
	for (map<pair<string, string>, double>::iterator it = stagedCapFactors.begin(); it != stagedCapFactors.end(); ++it) {
		int g = lookup(mapGenNameToIndex, it->first.first);
		if (g < 0) {
			throw DataError(it->first.first, "capacity factor given for undefined generator");
		}
		int t = lookup(mapTpNameToIndex, it->first.second);
		if (t < 0) {
			throw DataError(it->first.second, "capacity factor given for undefined timepoint");
		}
		capFactor[g][t] = it->second;
	}
}

void EntityCatalog::finalizeLines () {
	lineList.clear();
	for (map<string, Line>::iterator it = stagedLines.begin(); it != stagedLines.end(); ++it) {
		Line line = it->second;
		line.id = (int) lineList.size();

		line.origId = lookup(mapZoneNameToIndex, line.origName);
		line.destId = lookup(mapZoneNameToIndex, line.destName);
		if (line.origId < 0 || line.destId < 0) {
			throw DataError(line.name, "references undefined load zone '" + (line.origId < 0 ? line.origName : line.destName) + "'");
		}
		if (line.origId == line.destId) {
			throw DataError(line.name, "origin and destination are the same zone");
		}
		if (!(line.capacity >= 0) || std::isinf(line.capacity)) {
			throw DataError(line.name, "capacity must be non-negative and finite");
		}
		if (!(line.lossFactor >= 0 && line.lossFactor < 1)) {
			throw DataError(line.name, "loss factor must lie in [0, 1)");
		}

		zoneList[line.origId].outgoingLines.push_back(line.id);
		zoneList[line.destId].incomingLines.push_back(line.id);
		lineList.push_back(line);
	}
	mapLineNameToIndex = indexByName(lineList);
}

void EntityCatalog::finalizePolicies () {
	/* carbon policy, in period order */
	carbonList.assign(periodList.size(), CarbonPolicy());
	vector<bool> hasPolicy (periodList.size(), false);
	for (map<string, CarbonPolicy>::iterator it = stagedCarbon.begin(); it != stagedCarbon.end(); ++it) {
		int p = lookup(mapPeriodNameToIndex, it->first);
		if (p < 0) {
			throw DataError(it->first, "carbon policy given for undefined investment period");
		}
		it->second.periodId = p;
		carbonList[p] = it->second;
		hasPolicy[p] = true;
	}
	vector<CarbonPolicy> given;
	for (int p=0; p<(int) periodList.size(); p++) {
		if (hasPolicy[p]) given.push_back(carbonList[p]);
	}
	carbonList = given;

	/* hydrogen */
	h2DemandList.clear();
	for (map<pair<string, string>, HydrogenDemand>::iterator it = stagedH2Demand.begin(); it != stagedH2Demand.end(); ++it) {
		HydrogenDemand demand = it->second;
		demand.zoneId = lookup(mapZoneNameToIndex, demand.zoneName);
		if (demand.zoneId < 0) {
			throw DataError(demand.zoneName, "hydrogen demand given for undefined load zone");
		}
		demand.seriesId = lookup(mapSeriesNameToIndex, demand.seriesName);
		if (demand.seriesId < 0) {
			throw DataError(demand.seriesName, "hydrogen demand given for undefined timeseries");
		}
		h2DemandList.push_back(demand);
	}
	h2StorageList.clear();
	for (map<string, HydrogenStorage>::iterator it = stagedH2Storage.begin(); it != stagedH2Storage.end(); ++it) {
		HydrogenStorage storage = it->second;
		storage.zoneId = lookup(mapZoneNameToIndex, storage.zoneName);
		if (storage.zoneId < 0) {
			throw DataError(storage.zoneName, "hydrogen storage given for undefined load zone");
		}
		h2StorageList.push_back(storage);
	}

	/* demand response */
	programList.clear();
	for (map<string, DemandResponseProgram>::iterator it = stagedPrograms.begin(); it != stagedPrograms.end(); ++it) {
		DemandResponseProgram program = it->second;
		program.id = (int) programList.size();
		program.zoneId = lookup(mapZoneNameToIndex, program.zoneName);
		if (program.zoneId < 0) {
			throw DataError(program.name, "references undefined load zone '" + program.zoneName + "'");
		}
		program.shiftUp.assign(tpList.size(), program.defaultShiftUp);
		program.shiftDown.assign(tpList.size(), program.defaultShiftDown);
		programList.push_back(program);
	}
	mapProgramNameToIndex = indexByName(programList);

	for (map<pair<string, string>, pair<double, double> >::iterator it = stagedDRLimits.begin(); it != stagedDRLimits.end(); ++it) {
		int d = lookup(mapProgramNameToIndex, it->first.first);
		if (d < 0) {
			throw DataError(it->first.first, "shift limits given for undefined demand response program");
		}
		int t = lookup(mapTpNameToIndex, it->first.second);
		if (t < 0) {
			throw DataError(it->first.second, "shift limits given for undefined timepoint");
		}
		programList[d].shiftUp[t] = it->second.first;
		programList[d].shiftDown[t] = it->second.second;
	}
	for (int d=0; d<(int) programList.size(); d++) {
		const LoadZone &zone = zoneList[ programList[d].zoneId ];
		for (int t=0; t<(int) tpList.size(); t++) {
			if (programList[d].shiftDown[t] > zone.load[t] + EPSzero) {
				throw DataError(programList[d].name, "shift-down limit at " + tpList[t].name + " exceeds the load of zone " + zone.name);
			}
		}
	}

	/* retrofit */
	retrofitList.clear();
	for (map<string, RetrofitOption>::iterator it = stagedRetrofit.begin(); it != stagedRetrofit.end(); ++it) {
		RetrofitOption option = it->second;
		option.generatorId = lookup(mapGenNameToIndex, option.generatorName);
		if (option.generatorId < 0) {
			throw DataError(option.generatorName, "retrofit option given for undefined generator");
		}
		const Generator &gen = genList[option.generatorId];
		if (!gen.retrofitEligible) {
			throw DataError(gen.name, "retrofit option given for a unit that is not retrofit-eligible");
		}
		if (std::isinf(gen.maxCapacity())) {
			throw DataError(gen.name, "retrofit-eligible unit needs a finite capacity bound");
		}
		if (option.firstPeriodName.empty()) {
			option.firstPeriodId = 0;
			option.firstPeriodName = periodList[0].name;
		}
		else {
			option.firstPeriodId = lookup(mapPeriodNameToIndex, option.firstPeriodName);
			if (option.firstPeriodId < 0) {
				throw DataError(gen.name, "retrofit references undefined investment period '" + option.firstPeriodName + "'");
			}
		}
		retrofitList.push_back(option);
	}
}

int EntityCatalog::findPeriod (const string &name) const		{ return lookup(mapPeriodNameToIndex, name); }
int EntityCatalog::findTimeseries (const string &name) const	{ return lookup(mapSeriesNameToIndex, name); }
int EntityCatalog::findTimepoint (const string &name) const		{ return lookup(mapTpNameToIndex, name); }
int EntityCatalog::findZone (const string &name) const			{ return lookup(mapZoneNameToIndex, name); }
int EntityCatalog::findGenerator (const string &name) const		{ return lookup(mapGenNameToIndex, name); }
int EntityCatalog::findLine (const string &name) const			{ return lookup(mapLineNameToIndex, name); }
int EntityCatalog::findProgram (const string &name) const		{ return lookup(mapProgramNameToIndex, name); }

double EntityCatalog::capacityFactor (int genId, int tpId) const {
	return capFactor[genId][tpId];
}

/****************************************************************************
 * previousTimepoint
 * - Returns the timepoint stepsBack positions earlier in the same series,
 * wrapping around its end (the series is treated as a cycle).
 ****************************************************************************/
int EntityCatalog::previousTimepoint (int tpId, int stepsBack) const {
	const vector<int> &members = seriesList[ tpList[tpId].seriesId ].timepoints;
	int n = (int) members.size();
	int pos = (int) (find(members.begin(), members.end(), tpId) - members.begin());
	int prev = ((pos - stepsBack) % n + n) % n;
	return members[prev];
}

const RetrofitOption* EntityCatalog::retrofitOption (int genId) const {
	for (int i=0; i<(int) retrofitList.size(); i++) {
		if (retrofitList[i].generatorId == genId) return &retrofitList[i];
	}
	return NULL;
}

const HydrogenStorage* EntityCatalog::hydrogenStorage (int zoneId) const {
	for (int i=0; i<(int) h2StorageList.size(); i++) {
		if (h2StorageList[i].zoneId == zoneId) return &h2StorageList[i];
	}
	return NULL;
}

const CarbonPolicy* EntityCatalog::carbonPolicy (int periodId) const {
	for (int i=0; i<(int) carbonList.size(); i++) {
		if (carbonList[i].periodId == periodId) return &carbonList[i];
	}
	return NULL;
}

double EntityCatalog::hydrogenDemand (int zoneId, int seriesId) const {
	for (int i=0; i<(int) h2DemandList.size(); i++) {
		if (h2DemandList[i].zoneId == zoneId && h2DemandList[i].seriesId == seriesId) return h2DemandList[i].demandKg;
	}
	return 0.0;
}

void EntityCatalog::summary (ostream &out) const {
	out << "------------------------------------------------------------------" << endl;
	out << "Investment periods = " << periodList.size() << ", timeseries = " << seriesList.size()
		<< ", timepoints = " << tpList.size() << endl;
	out << "Load zones = " << zoneList.size() << ", generators = " << genList.size()
		<< ", transmission lines = " << lineList.size() << endl;
	out << "Policy data:";
	if (hasCarbonPolicy())		out << " carbon";
	if (hasHydrogenSupply())	out << " hydrogen";
	if (hasDemandResponse())	out << " demand_response";
	if (hasRetrofitPlan())		out << " retrofit";
	if (!hasCarbonPolicy() && !hasHydrogenSupply() && !hasDemandResponse() && !hasRetrofitPlan()) out << " none";
	out << endl;
	out << "------------------------------------------------------------------" << endl;
}
