//
//  VariableRegistry.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include "VariableRegistry.hpp"
#include "../errors.hpp"
#include "../misc.hpp"

VariableRegistry::VariableRegistry (const EntityCatalog &catalog) : catalog(catalog), activeOwner("core") {}

/****************************************************************************
 * resolve
 * - Maps the entity and period names of a key to catalog ids, checking that
 * the entity has the type the variable kind requires.
 ****************************************************************************/
void VariableRegistry::resolve (const VariableKey &key, int &entityId, int &periodId) const {
	if (!catalog.isFinalized()) {
		throw UnknownEntityError(key.entity, key.period);
	}

	switch (key.kind) {
		case FLOW:
		case FLOW_REVERSE:
			entityId = catalog.findLine(key.entity);
			break;
		case DEMAND_SHIFT:
		case DEMAND_SHIFT_UP:
		case DEMAND_SHIFT_DOWN:
		case DEMAND_RECOVERY:
		case DR_ACTIVE:
			entityId = catalog.findProgram(key.entity);
			break;
		case H2_STORE:
		case H2_WITHDRAW:
			entityId = catalog.findZone(key.entity);
			break;
		default:
			entityId = catalog.findGenerator(key.entity);
			break;
	}

	if (kindIndexedByInvestmentPeriod(key.kind))	periodId = catalog.findPeriod(key.period);
	else if (kindIndexedByTimeseries(key.kind))		periodId = catalog.findTimeseries(key.period);
	else											periodId = catalog.findTimepoint(key.period);

	if (entityId < 0 || periodId < 0) {
		throw UnknownEntityError(key.entity, key.period);
	}

	/* kinds restricted to a technology */
	if (key.kind == CHARGE || key.kind == STATE_OF_CHARGE) {
		if (!catalog.generators()[entityId].isStorage()) throw UnknownEntityError(key.entity + " (not a storage unit)", key.period);
	}
	else if (key.kind == H2_CONSUME || key.kind == H2_PRODUCE) {
		if (!catalog.generators()[entityId].isElectrolyzer()) throw UnknownEntityError(key.entity + " (not an electrolyzer)", key.period);
	}
	else if (key.kind == RETROFIT_SELECT || key.kind == RETROFIT_DISPATCH) {
		if (!catalog.generators()[entityId].retrofitEligible) throw UnknownEntityError(key.entity + " (not retrofit-eligible)", key.period);
	}
	else if (key.kind == DISPATCH || key.kind == EMISSIONS) {
		if (!catalog.generators()[entityId].dispatches()) throw UnknownEntityError(key.entity + " (does not produce electricity)", key.period);
	}
	else if (key.kind == FLOW_REVERSE) {
		if (!catalog.lines()[entityId].bidirectional) throw UnknownEntityError(key.entity + " (not bidirectional)", key.period);
	}
}

/****************************************************************************
 * defaultBounds
 * - Bounds and type of a variable kind as implied by the catalog data.
 ****************************************************************************/
VariableBounds VariableRegistry::defaultBounds (VariableKind kind, int entityId, int periodId) const {
	switch (kind) {
		case DISPATCH:
		case CHARGE:
		case RETROFIT_DISPATCH:
		case H2_CONSUME:
			return VariableBounds(0.0, catalog.generators()[entityId].maxCapacity(), CONTINUOUS);
		case STATE_OF_CHARGE: {
			const Generator &gen = catalog.generators()[entityId];
			return VariableBounds(0.0, gen.storageHours * gen.maxCapacity(), CONTINUOUS);
		}
		case BUILD: {
			const Generator &gen = catalog.generators()[entityId];
			return VariableBounds(0.0, gen.maxBuildCapacity, gen.integerBuild ? INTEGER : CONTINUOUS);
		}
		case FLOW:
		case FLOW_REVERSE:
			return VariableBounds(0.0, catalog.lines()[entityId].capacity, CONTINUOUS);
		case EMISSIONS:
		case H2_PRODUCE:
			return VariableBounds(0.0, HUGE_VAL, CONTINUOUS);
		case RETROFIT_SELECT:
		case DR_ACTIVE:
			return VariableBounds(0.0, 1.0, BINARY);
		case DEMAND_SHIFT: {
			const DemandResponseProgram &program = catalog.drPrograms()[entityId];
			return VariableBounds(-program.shiftDown[periodId], program.shiftUp[periodId], CONTINUOUS);
		}
		case DEMAND_SHIFT_UP:
			return VariableBounds(0.0, catalog.drPrograms()[entityId].shiftUp[periodId], CONTINUOUS);
		case DEMAND_SHIFT_DOWN:
			return VariableBounds(0.0, catalog.drPrograms()[entityId].shiftDown[periodId], CONTINUOUS);
		case DEMAND_RECOVERY:
			return VariableBounds(-HUGE_VAL, HUGE_VAL, CONTINUOUS);
		case H2_STORE:
		case H2_WITHDRAW: {
			const HydrogenStorage *storage = catalog.hydrogenStorage(entityId);
			return VariableBounds(0.0, (storage != NULL) ? storage->capacityKg : 0.0, CONTINUOUS);
		}
	}
	return VariableBounds(0.0, HUGE_VAL, CONTINUOUS);
}

VariableHandle VariableRegistry::insert (const VariableKey &key, const VariableBounds &bounds, int entityId, int periodId) {
	VariableDefinition def;
	def.key = key;
	def.bounds = bounds;
	def.owner = activeOwner;
	def.entityId = entityId;
	def.periodId = periodId;

	int index = (int) definitions.size();
	definitions.push_back(def);
	mapKeyToIndex[key] = index;
	return VariableHandle(index);
}

VariableHandle VariableRegistry::allocate (const string &entity, const string &period, VariableKind kind) {
	VariableKey key (kind, entity, period);

	map<VariableKey, int>::const_iterator it = mapKeyToIndex.find(key);
	if (it != mapKeyToIndex.end()) {
		return VariableHandle(it->second);
	}

	int entityId, periodId;
	resolve(key, entityId, periodId);
	return insert(key, defaultBounds(kind, entityId, periodId), entityId, periodId);
}

/****************************************************************************
 * allocate (explicit bounds)
 * - Same key, same bounds: the existing handle is returned.
 * - Same key, different bounds: two contributions disagree on what the
 * variable means, reported with both owners.
 ****************************************************************************/
VariableHandle VariableRegistry::allocate (const string &entity, const string &period, VariableKind kind, const VariableBounds &bounds) {
	VariableKey key (kind, entity, period);

	map<VariableKey, int>::const_iterator it = mapKeyToIndex.find(key);
	if (it != mapKeyToIndex.end()) {
		VariableDefinition &def = definitions[it->second];
		if (!(def.bounds == bounds)) {
			throw ModelCompositionError(def.owner, activeOwner, key.toString(),
										"defined as " + def.bounds.toString() + " and as " + bounds.toString());
		}
		return VariableHandle(it->second);
	}

	int entityId, periodId;
	resolve(key, entityId, periodId);
	return insert(key, bounds, entityId, periodId);
}

VariableHandle VariableRegistry::lookup (const string &entity, const string &period, VariableKind kind) const {
	map<VariableKey, int>::const_iterator it = mapKeyToIndex.find(VariableKey(kind, entity, period));
	if (it == mapKeyToIndex.end()) {
		return VariableHandle();
	}
	return VariableHandle(it->second);
}

const VariableDefinition& VariableRegistry::definition (VariableHandle handle) const {
	return definitions.at(handle.id);
}
