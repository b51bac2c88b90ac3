//
//  ModelBuilder.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include "ModelBuilder.hpp"
#include "../errors.hpp"
#include "../misc.hpp"

namespace {

	const string coreOwner = "core";

	bool byModuleId (const PolicyModulePtr &a, const PolicyModulePtr &b) {
		return a->id() < b->id();
	}

	bool sameContent (const ContributedConstraint &a, const ContributedConstraint &b) {
		if (a.sense != b.sense || a.rhs - a.expr.constant != b.rhs - b.expr.constant) return false;
		if (a.expr.terms.size() != b.expr.terms.size()) return false;
		for (int i=0; i<(int) a.expr.terms.size(); i++) {
			if (a.expr.terms[i].var != b.expr.terms[i].var || a.expr.terms[i].coef != b.expr.terms[i].coef) return false;
		}
		return true;
	}

	/* maps an expression over registry handles onto program columns */
	vector<Term> toColumns (const LinearExpr &expr, const vector<int> &columnOf) {
		LinearExpr mapped;
		for (int i=0; i<(int) expr.terms.size(); i++) {
			mapped.terms.push_back(Term(columnOf[ expr.terms[i].var ], expr.terms[i].coef));
		}
		mapped.normalize();
		return mapped.terms;
	}

	struct KeyOrder {
		KeyOrder (const VariableRegistry &registry) : registry(registry) {}
		bool operator() (int a, int b) const {
			return registry.definition(VariableHandle(a)).key < registry.definition(VariableHandle(b)).key;
		}
		const VariableRegistry &registry;
	};
}

string balanceName (Commodity commodity, const string &node, const string &period) {
	return rowName((commodity == ELECTRICITY) ? "EnergyBalance" : "HydrogenBalance", node, period);
}

/****************************************************************************
 * EmissionRateView
 ****************************************************************************/
void EmissionRateView::add (const RateOverride &rateOverride, const string &owner) {
	pair<string, string> key (rateOverride.generator, rateOverride.timepoint);

	map<pair<string, string>, RateOverride>::iterator it = overrides.find(key);
	if (it == overrides.end()) {
		overrides[key] = rateOverride;
		owners[key] = owner;
		return;
	}

	if (it->second.rate != rateOverride.rate || it->second.var != rateOverride.var) {
		throw ModelCompositionError(owners[key], owner, VariableKey(EMISSIONS, key.first, key.second).toString(),
									"emissions rate overridden as " + numToStr(it->second.rate) + " and as " + numToStr(rateOverride.rate));
	}
}

const RateOverride* EmissionRateView::find (const string &generator, const string &timepoint) const {
	map<pair<string, string>, RateOverride>::const_iterator it = overrides.find(make_pair(generator, timepoint));
	return (it == overrides.end()) ? NULL : &it->second;
}

/****************************************************************************
 * ModelBuilder
 ****************************************************************************/
ModelBuilder::ModelBuilder (const EntityCatalog &catalog, StorageBoundary storageBoundary) :
	catalog(catalog), storageBoundary(storageBoundary) {}

void ModelBuilder::addModule (PolicyModulePtr module) {
	if (module.get() == NULL) {
		throw ModelCompositionError("", "", "module", "null policy module");
	}
	for (int m=0; m<(int) modules.size(); m++) {
		if (modules[m]->id() == module->id()) {
			throw ModelCompositionError(modules[m]->id(), module->id(), "module " + module->id(), "module registered twice");
		}
	}
	modules.push_back(module);
}

/****************************************************************************
 * build
 * - The core allocates its variables first, so every shared quantity
 * (dispatch, emissions, build) is owned by the core. Modules then
 * contribute in the order of their ids, each under its own name.
 * - Balance rows and the emissions accounting are written last, once all
 * balance terms and rate overrides are known.
 ****************************************************************************/
LinearProgram ModelBuilder::build () const {
	if (!catalog.isFinalized()) {
		throw DataError("catalog", "catalog must be finalized before the model is built");
	}

	Composition comp (catalog);

	comp.registry.setActiveOwner(coreOwner);
	merge(comp, coreContribution(comp.registry), coreOwner);

	vector<PolicyModulePtr> ordered = modules;
	sort(ordered.begin(), ordered.end(), byModuleId);
	for (int m=0; m<(int) ordered.size(); m++) {
		comp.registry.setActiveOwner(ordered[m]->id());
		PolicyContribution contribution = ordered[m]->contribute(catalog, comp.registry);
		merge(comp, contribution, ordered[m]->id());
	}

	comp.registry.setActiveOwner(coreOwner);
	addEmissionsAccounting(comp);
	addBalanceRows(comp);

	return canonicalize(comp);
}

/****************************************************************************
 * coreContribution
 * - Dispatch, storage, investment and transmission, always present:
 *	 capacity: dispatch <= cf * (existing + build)
 *	 storage: soc(t) = soc(prev) + (charge * efficiency - discharge) * duration
 *	 transmission: forward + reverse <= capacity
 *	 build is cumulative and non-decreasing
 * - Energy balance terms and loads are handed over as balance data.
 ****************************************************************************/
PolicyContribution ModelBuilder::coreContribution (VariableRegistry &registry) const {
	PolicyContribution core;

	const vector<InvestmentPeriod> &periods = catalog.periods();
	const vector<Timeseries> &series = catalog.timeseries();
	const vector<Timepoint> &tps = catalog.timepoints();
	const vector<Generator> &gens = catalog.generators();
	const vector<Line> &lines = catalog.lines();
	int lastPeriod = catalog.numPeriods() - 1;

	/* investment */
	for (int g=0; g<catalog.numGen(); g++) {
		const Generator &gen = gens[g];

		LinearExpr fixedCost;
		for (int p=0; p<=lastPeriod; p++) {
			fixedCost.addConstant(gen.fixedCost * gen.existingCapacity);
		}

		if (gen.isBuildable()) {
			for (int p=0; p<=lastPeriod; p++) {
				VariableHandle build = registry.allocate(gen.name, periods[p].name, BUILD);
				fixedCost.add(build, gen.fixedCost);

				if (p > 0) {
					LinearExpr expr;
					expr.add(build, 1.0).add(registry.allocate(gen.name, periods[p-1].name, BUILD), -1.0);
					core.addConstraint("BuildMonotone", gen.name, periods[p].name, expr, GreaterEqual, 0.0);
				}
			}
			// new capacity of a period is build[p] - build[p-1], which telescopes to build[last]
			LinearExpr capital;
			capital.add(registry.allocate(gen.name, periods[lastPeriod].name, BUILD), gen.capitalCost);
			core.addObjective("capital_cost", capital);
		}
		core.addObjective("fixed_cost", fixedCost);
	}

	/* dispatch, capacity and storage */
	for (int g=0; g<catalog.numGen(); g++) {
		const Generator &gen = gens[g];
		if (!gen.dispatches()) continue;

		LinearExpr variableCost;
		for (int t=0; t<catalog.numTimepoints(); t++) {
			const Timepoint &tp = tps[t];
			const string &zoneName = catalog.zones()[gen.zoneId].name;

			VariableHandle dispatch = registry.allocate(gen.name, tp.name, DISPATCH);
			VariableHandle build;
			if (gen.isBuildable()) build = registry.allocate(gen.name, periods[tp.periodId].name, BUILD);

			core.addBalanceTerm(ELECTRICITY, zoneName, tp.name, dispatch, 1.0);
			variableCost.add(dispatch, tp.weight * gen.variableCost);

			if (gen.emitsCarbon()) {
				registry.allocate(gen.name, tp.name, EMISSIONS);
			}

			double cf = catalog.capacityFactor(g, t);
			LinearExpr capacity;
			capacity.add(dispatch, 1.0);
			if (build.valid()) capacity.add(build, -cf);
			core.addConstraint("Capacity", gen.name, tp.name, capacity, LessEqual, cf * gen.existingCapacity);

			if (!gen.isStorage()) continue;

			VariableHandle charge = registry.allocate(gen.name, tp.name, CHARGE);
			VariableHandle soc = registry.allocate(gen.name, tp.name, STATE_OF_CHARGE);
			core.addBalanceTerm(ELECTRICITY, zoneName, tp.name, charge, -1.0);

			LinearExpr chargeCap;
			chargeCap.add(charge, 1.0);
			if (build.valid()) chargeCap.add(build, -1.0);
			core.addConstraint("ChargeCapacity", gen.name, tp.name, chargeCap, LessEqual, gen.existingCapacity);

			LinearExpr energyCap;
			energyCap.add(soc, 1.0);
			if (build.valid()) energyCap.add(build, -gen.storageHours);
			core.addConstraint("EnergyCapacity", gen.name, tp.name, energyCap, LessEqual, gen.storageHours * gen.existingCapacity);

			double duration = series[tp.seriesId].tpDurationHours;
			bool firstOfSeries = (series[tp.seriesId].timepoints.front() == t);

			LinearExpr continuity;
			continuity.add(soc, 1.0);
			continuity.add(charge, -gen.chargeEfficiency * duration);
			continuity.add(dispatch, duration);
			if (!(firstOfSeries && storageBoundary == ResetEmpty)) {
				int prev = catalog.previousTimepoint(t, 1);
				continuity.add(registry.allocate(gen.name, tps[prev].name, STATE_OF_CHARGE), -1.0);
			}
			core.addConstraint("StorageBalance", gen.name, tp.name, continuity, Equal, 0.0);
		}
		core.addObjective("variable_cost", variableCost);
	}

	/* transmission */
	for (int l=0; l<catalog.numLines(); l++) {
		const Line &line = lines[l];
		const string &orig = catalog.zones()[line.origId].name;
		const string &dest = catalog.zones()[line.destId].name;

		for (int t=0; t<catalog.numTimepoints(); t++) {
			VariableHandle forward = registry.allocate(line.name, tps[t].name, FLOW);
			core.addBalanceTerm(ELECTRICITY, orig, tps[t].name, forward, -1.0);
			core.addBalanceTerm(ELECTRICITY, dest, tps[t].name, forward, 1.0 - line.lossFactor);

			if (!line.bidirectional) continue;

			VariableHandle reverse = registry.allocate(line.name, tps[t].name, FLOW_REVERSE);
			core.addBalanceTerm(ELECTRICITY, dest, tps[t].name, reverse, -1.0);
			core.addBalanceTerm(ELECTRICITY, orig, tps[t].name, reverse, 1.0 - line.lossFactor);

			LinearExpr expr;
			expr.add(forward, 1.0).add(reverse, 1.0);
			core.addConstraint("LineCapacity", line.name, tps[t].name, expr, LessEqual, line.capacity);
		}
	}

	/* loads */
	for (int z=0; z<catalog.numZones(); z++) {
		for (int t=0; t<catalog.numTimepoints(); t++) {
			core.addBalanceDemand(ELECTRICITY, catalog.zones()[z].name, tps[t].name, catalog.zones()[z].load[t]);
		}
	}

	return core;
}

void ModelBuilder::checkBalanceNode (Commodity commodity, const string &node, const string &period) const {
	int periodId = (commodity == ELECTRICITY) ? catalog.findTimepoint(period) : catalog.findTimeseries(period);
	if (catalog.findZone(node) < 0 || periodId < 0) {
		throw UnknownEntityError(node, period);
	}
}

/****************************************************************************
 * merge
 * - Adds one contribution to the composition. Detects, with both owners:
 *	 a constraint name used twice with different content
 *	 a variable counted in the same balance by two contributions
 *	 two different emissions-rate overrides for one (generator, timepoint)
 * - Identical constraints and overrides from two contributions are kept
 * once.
 ****************************************************************************/
void ModelBuilder::merge (Composition &comp, const PolicyContribution &contribution, const string &owner) const {

	for (int i=0; i<(int) contribution.constraints.size(); i++) {
		OwnedConstraint entry;
		entry.con = contribution.constraints[i];
		entry.con.expr.normalize();
		entry.owner = owner;

		map<string, OwnedConstraint>::iterator it = comp.constraints.find(entry.con.name);
		if (it == comp.constraints.end()) {
			comp.constraints[entry.con.name] = entry;
		}
		else if (!sameContent(it->second.con, entry.con)) {
			throw ModelCompositionError(it->second.owner, owner, entry.con.name, "constraint defined twice with different content");
		}
	}

	for (int i=0; i<(int) contribution.objectiveTerms.size(); i++) {
		comp.costComponents[ contribution.objectiveTerms[i].component ].add(contribution.objectiveTerms[i].expr, 1.0);
	}

	for (int i=0; i<(int) contribution.balanceTerms.size(); i++) {
		const BalanceTerm &term = contribution.balanceTerms[i];
		checkBalanceNode(term.commodity, term.node, term.period);

		string name = balanceName(term.commodity, term.node, term.period);
		Balance &balance = comp.balances[name];
		balance.commodity = term.commodity;
		balance.node = term.node;
		balance.period = term.period;

		map<int, string>::iterator it = balance.counted.find(term.var.id);
		if (it != balance.counted.end() && it->second != owner) {
			throw ModelCompositionError(it->second, owner, comp.registry.definition(term.var).key.toString(),
										"variable counted twice in " + name);
		}
		balance.counted[term.var.id] = owner;
		balance.supply.add(term.var, term.coef);
	}

	for (int i=0; i<(int) contribution.balanceDemands.size(); i++) {
		const BalanceDemand &demand = contribution.balanceDemands[i];
		checkBalanceNode(demand.commodity, demand.node, demand.period);

		string name = balanceName(demand.commodity, demand.node, demand.period);
		Balance &balance = comp.balances[name];
		balance.commodity = demand.commodity;
		balance.node = demand.node;
		balance.period = demand.period;
		balance.demand += demand.amount;
	}

	for (int i=0; i<(int) contribution.rateOverrides.size(); i++) {
		const RateOverride &rateOverride = contribution.rateOverrides[i];
		int g = catalog.findGenerator(rateOverride.generator);
		if (g < 0 || catalog.findTimepoint(rateOverride.timepoint) < 0) {
			throw UnknownEntityError(rateOverride.generator, rateOverride.timepoint);
		}
		if (!catalog.generators()[g].emitsCarbon()) {
			throw ModelCompositionError(coreOwner, owner, VariableKey(EMISSIONS, rateOverride.generator, rateOverride.timepoint).toString(),
										"emissions rate overridden for a unit without emissions accounting");
		}
		if (!(rateOverride.rate >= 0)) {
			throw ModelCompositionError(coreOwner, owner, VariableKey(EMISSIONS, rateOverride.generator, rateOverride.timepoint).toString(),
										"negative emissions rate");
		}
		comp.rates.add(rateOverride, owner);
	}
}

/****************************************************************************
 * addEmissionsAccounting
 * - emissions(g,t) = rate(g) * dispatch(g,t) + (override - rate(g)) * var
 * where the override, if any, comes from the rate view.
 ****************************************************************************/
void ModelBuilder::addEmissionsAccounting (Composition &comp) const {
	PolicyContribution accounting;

	for (int g=0; g<catalog.numGen(); g++) {
		const Generator &gen = catalog.generators()[g];
		if (!gen.emitsCarbon()) continue;

		for (int t=0; t<catalog.numTimepoints(); t++) {
			const string &tpName = catalog.timepoints()[t].name;

			LinearExpr expr;
			expr.add(comp.registry.allocate(gen.name, tpName, EMISSIONS), 1.0);
			expr.add(comp.registry.allocate(gen.name, tpName, DISPATCH), -gen.emissionRate);

			const RateOverride *rateOverride = comp.rates.find(gen.name, tpName);
			if (rateOverride != NULL) {
				expr.add(rateOverride->var, gen.emissionRate - rateOverride->rate);
			}
			accounting.addConstraint("EmissionsAccounting", gen.name, tpName, expr, Equal, 0.0);
		}
	}

	merge(comp, accounting, coreOwner);
}

void ModelBuilder::addBalanceRows (Composition &comp) const {
	PolicyContribution rows;

	for (map<string, Balance>::const_iterator it = comp.balances.begin(); it != comp.balances.end(); ++it) {
		const Balance &balance = it->second;
		rows.addConstraint((balance.commodity == ELECTRICITY) ? "EnergyBalance" : "HydrogenBalance",
						   balance.node, balance.period, balance.supply, Equal, balance.demand);
	}

	merge(comp, rows, coreOwner);
}

/****************************************************************************
 * canonicalize
 * - Columns by variable key, rows by name, terms by column. Allocation
 * order and module registration order leave no trace in the program.
 ****************************************************************************/
LinearProgram ModelBuilder::canonicalize (const Composition &comp) const {
	LinearProgram program;
	const VariableRegistry &registry = comp.registry;

	vector<int> order (registry.size());
	for (int v=0; v<registry.size(); v++) order[v] = v;
	sort(order.begin(), order.end(), KeyOrder(registry));

	vector<int> columnOf (registry.size(), -1);
	for (int j=0; j<(int) order.size(); j++) {
		const VariableDefinition &def = registry.definition(VariableHandle(order[j]));
		columnOf[ order[j] ] = j;

		ProgramColumn col;
		col.key = def.key;
		col.name = def.key.toString();
		col.lb = def.bounds.lb;
		col.ub = def.bounds.ub;
		col.type = def.bounds.type;
		col.owner = def.owner;
		program.columns.push_back(col);
	}

	for (map<string, OwnedConstraint>::const_iterator it = comp.constraints.begin(); it != comp.constraints.end(); ++it) {
		const ContributedConstraint &con = it->second.con;

		ProgramRow row;
		row.name = con.name;
		row.family = con.family;
		row.entity = con.entity;
		row.index = con.index;
		row.terms = toColumns(con.expr, columnOf);
		row.sense = con.sense;
		row.rhs = con.rhs - con.expr.constant;
		row.owner = it->second.owner;
		program.rows.push_back(row);
	}

	LinearExpr objective;
	for (map<string, LinearExpr>::const_iterator it = comp.costComponents.begin(); it != comp.costComponents.end(); ++it) {
		CostComponent component;
		component.name = it->first;
		component.terms = toColumns(it->second, columnOf);
		component.constant = it->second.constant;
		program.costComponents.push_back(component);

		for (int i=0; i<(int) component.terms.size(); i++) {
			objective.terms.push_back(component.terms[i]);
		}
		objective.constant += component.constant;
	}
	objective.normalize();
	program.objective = objective.terms;
	program.objectiveConstant = objective.constant;

	program.buildIndex();
	return program;
}
