//
//  HydrogenSupplyModule.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include "HydrogenSupplyModule.hpp"

PolicyContribution HydrogenSupplyModule::contribute (const EntityCatalog &catalog, VariableRegistry &registry) const {
	PolicyContribution contribution;

	for (int g=0; g<catalog.numGen(); g++) {
		if (catalog.generators()[g].isElectrolyzer()) {
			addElectrolyzer(catalog, registry, catalog.generators()[g], contribution);
		}
	}

	for (int i=0; i<(int) catalog.hydrogenStorages().size(); i++) {
		addStorage(catalog, registry, catalog.hydrogenStorages()[i], contribution);
	}

	for (int i=0; i<(int) catalog.hydrogenDemands().size(); i++) {
		const HydrogenDemand &demand = catalog.hydrogenDemands()[i];
		contribution.addBalanceDemand(HYDROGEN, demand.zoneName, demand.seriesName, demand.demandKg);
	}

	return contribution;
}

void HydrogenSupplyModule::addElectrolyzer (const EntityCatalog &catalog, VariableRegistry &registry, const Generator &gen, PolicyContribution &contribution) const {
	const string &zoneName = catalog.zones()[gen.zoneId].name;

	LinearExpr variableCost;
	for (int t=0; t<catalog.numTimepoints(); t++) {
		const Timepoint &tp = catalog.timepoints()[t];
		const Timeseries &series = catalog.timeseries()[tp.seriesId];

		VariableHandle consume = registry.allocate(gen.name, tp.name, H2_CONSUME);
		VariableHandle produce = registry.allocate(gen.name, tp.name, H2_PRODUCE);

		contribution.addBalanceTerm(ELECTRICITY, zoneName, tp.name, consume, -1.0);
		contribution.addBalanceTerm(HYDROGEN, zoneName, series.name, produce, series.tpDurationHours);
		variableCost.add(consume, tp.weight * gen.variableCost);

		LinearExpr conversion;
		conversion.add(produce, 1.0).add(consume, -gen.conversionEfficiency);
		contribution.addConstraint("H2Production", gen.name, tp.name, conversion, Equal, 0.0);

		LinearExpr capacity;
		capacity.add(consume, 1.0);
		if (gen.isBuildable()) {
			capacity.add(registry.allocate(gen.name, catalog.periods()[tp.periodId].name, BUILD), -1.0);
		}
		contribution.addConstraint("ElectrolyzerCapacity", gen.name, tp.name, capacity, LessEqual, gen.existingCapacity);
	}
	contribution.addObjective("variable_cost", variableCost);
}

void HydrogenSupplyModule::addStorage (const EntityCatalog &catalog, VariableRegistry &registry, const HydrogenStorage &storage, PolicyContribution &contribution) const {
	LinearExpr storageCost;

	for (int p=0; p<catalog.numPeriods(); p++) {
		const InvestmentPeriod &period = catalog.periods()[p];

		LinearExpr cycle;
		for (int k=0; k<(int) period.timeseries.size(); k++) {
			const Timeseries &series = catalog.timeseries()[ period.timeseries[k] ];

			VariableHandle store = registry.allocate(storage.zoneName, series.name, H2_STORE);
			VariableHandle withdraw = registry.allocate(storage.zoneName, series.name, H2_WITHDRAW);

			contribution.addBalanceTerm(HYDROGEN, storage.zoneName, series.name, withdraw, 1.0);
			contribution.addBalanceTerm(HYDROGEN, storage.zoneName, series.name, store, -1.0);

			cycle.add(store, series.scale).add(withdraw, -series.scale);
			storageCost.add(store, series.scale * storage.costPerKg);
		}
		contribution.addConstraint("HydrogenStorageCycle", storage.zoneName, period.name, cycle, Equal, 0.0);
	}
	contribution.addObjective("hydrogen_storage_cost", storageCost);
}
