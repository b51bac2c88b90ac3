//
//  EntityCatalog.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef EntityCatalog_hpp
#define EntityCatalog_hpp

#include <stdio.h>
#include <vector>
#include <string>
#include <map>

#include "Generator.hpp"
#include "LoadZone.hpp"
#include "Line.hpp"
#include "TimePeriod.hpp"
#include "Policies.hpp"

using namespace std;

/****************************************************************************
 * EntityCatalog
 * - Owns every entity record of a scenario. Records are added by the data
 * loader in any order; finalize() validates references and invariants and
 * lays all records out in a canonical order (by name, time by chronology),
 * so ids do not depend on the order the loader produced them.
 * - After finalize() the catalog is read-only.
 ****************************************************************************/
class EntityCatalog {

public:
	EntityCatalog ();

	/* population (before finalize) */
	void addInvestmentPeriod (const string &name, int ordinal, double durationHours);
	void addTimeseries (const string &name, const string &periodName, double tpDurationHours);
	void addTimepoint (const string &name, const string &seriesName, int ordinal, double weight);
	void addZone (const string &name);
	void setZoneLoad (const string &zoneName, const string &tpName, double load);
	void addGenerator (const Generator &gen);
	void setCapacityFactor (const string &genName, const string &tpName, double factor);
	void addLine (const Line &line);
	void addCarbonPolicy (const string &periodName, bool hasCap, double cap, double carbonCost);
	void addHydrogenDemand (const string &zoneName, const string &seriesName, double demandKg);
	void addHydrogenStorage (const string &zoneName, double capacityKg, double costPerKg);
	void addDemandResponseProgram (const DemandResponseProgram &program);
	void setDemandResponseLimit (const string &programName, const string &tpName, double shiftUp, double shiftDown);
	void addRetrofitOption (const string &genName, double cost, const string &firstPeriodName);

	void finalize ();			// throws DataError
	bool isFinalized () const	{ return finalized; }

	/* entity access (after finalize) */
	const vector<InvestmentPeriod>&	periods () const	{ return periodList; }
	const vector<Timeseries>&		timeseries () const	{ return seriesList; }
	const vector<Timepoint>&		timepoints () const	{ return tpList; }
	const vector<LoadZone>&			zones () const		{ return zoneList; }
	const vector<Generator>&		generators () const	{ return genList; }
	const vector<Line>&				lines () const		{ return lineList; }
	const vector<DemandResponseProgram>& drPrograms () const	{ return programList; }
	const vector<CarbonPolicy>&		carbonPolicies () const		{ return carbonList; }
	const vector<HydrogenDemand>&	hydrogenDemands () const	{ return h2DemandList; }
	const vector<HydrogenStorage>&	hydrogenStorages () const	{ return h2StorageList; }
	const vector<RetrofitOption>&	retrofitOptions () const	{ return retrofitList; }

	int numPeriods () const		{ return (int) periodList.size(); }
	int numTimepoints () const	{ return (int) tpList.size(); }
	int numGen () const			{ return (int) genList.size(); }
	int numZones () const		{ return (int) zoneList.size(); }
	int numLines () const		{ return (int) lineList.size(); }

	/* lookups, -1 if the name is unknown */
	int findPeriod (const string &name) const;
	int findTimeseries (const string &name) const;
	int findTimepoint (const string &name) const;
	int findZone (const string &name) const;
	int findGenerator (const string &name) const;
	int findLine (const string &name) const;
	int findProgram (const string &name) const;

	/* derived data */
	double	capacityFactor (int genId, int tpId) const;
	int		previousTimepoint (int tpId, int stepsBack) const;	// wraps within the series
	const RetrofitOption*	retrofitOption (int genId) const;
	const HydrogenStorage*	hydrogenStorage (int zoneId) const;
	const CarbonPolicy*		carbonPolicy (int periodId) const;
	double	hydrogenDemand (int zoneId, int seriesId) const;

	/* policy data presence; an absent table means the policy is disabled */
	bool hasCarbonPolicy () const		{ return !carbonList.empty(); }
	bool hasHydrogenSupply () const		{ return !h2DemandList.empty() || !h2StorageList.empty(); }
	bool hasDemandResponse () const		{ return !programList.empty(); }
	bool hasRetrofitPlan () const		{ return !retrofitList.empty(); }

	void summary (ostream &out) const;

private:
	bool finalized;

	void checkOpen (const string &identifier) const;

	void finalizeTime ();
	void finalizeZones ();
	void finalizeGenerators ();
	void finalizeLines ();
	void finalizePolicies ();

	/* staged records, keyed by name for canonical order */
	map<string, InvestmentPeriod>		stagedPeriods;
	map<string, Timeseries>				stagedSeries;
	map<string, Timepoint>				stagedTimepoints;
	map<string, LoadZone>				stagedZones;
	map<string, Generator>				stagedGens;
	map<string, Line>					stagedLines;
	map<string, DemandResponseProgram>	stagedPrograms;
	map<string, CarbonPolicy>			stagedCarbon;
	map<pair<string, string>, HydrogenDemand>	stagedH2Demand;
	map<string, HydrogenStorage>		stagedH2Storage;
	map<string, RetrofitOption>			stagedRetrofit;

	map<pair<string, string>, double>	stagedLoads;		// (zone, timepoint)
	map<pair<string, string>, double>	stagedCapFactors;	// (generator, timepoint)
	map<pair<string, string>, pair<double, double> > stagedDRLimits;	// (program, timepoint)

	/* finalized records */
	vector<InvestmentPeriod>	periodList;
	vector<Timeseries>			seriesList;
	vector<Timepoint>			tpList;
	vector<LoadZone>			zoneList;
	vector<Generator>			genList;
	vector<Line>				lineList;
	vector<DemandResponseProgram> programList;
	vector<CarbonPolicy>		carbonList;
	vector<HydrogenDemand>		h2DemandList;
	vector<HydrogenStorage>		h2StorageList;
	vector<RetrofitOption>		retrofitList;

	vector< vector<double> >	capFactor;		// [generator][timepoint]

	map<string, int> mapPeriodNameToIndex;
	map<string, int> mapSeriesNameToIndex;
	map<string, int> mapTpNameToIndex;
	map<string, int> mapZoneNameToIndex;
	map<string, int> mapGenNameToIndex;
	map<string, int> mapLineNameToIndex;
	map<string, int> mapProgramNameToIndex;
};

#endif /* EntityCatalog_hpp */
