//
//  VariableRegistry.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef VariableRegistry_hpp
#define VariableRegistry_hpp

#include <map>
#include <string>
#include <vector>

#include "Variable.hpp"
#include "../catalog/EntityCatalog.hpp"

using namespace std;

struct VariableDefinition {
	VariableKey		key;
	VariableBounds	bounds;
	string			owner;		// contribution that fixed the semantics of the variable
	int				entityId;	// catalog id of the entity
	int				periodId;	// catalog id of the timepoint, investment period or timeseries
};

/****************************************************************************
 * VariableRegistry
 * - Allocates decision variables keyed by (kind, entity, period). Repeated
 * allocation of the same key returns the same handle, so the core and every
 * policy module refer to one physical quantity through one variable.
 * - Default bounds are derived from the catalog. A contribution that needs
 * different semantics allocates with explicit bounds; a second, different
 * definition of the same key is a ModelCompositionError.
 ****************************************************************************/
class VariableRegistry {

public:
	explicit VariableRegistry (const EntityCatalog &catalog);

	VariableHandle allocate (const string &entity, const string &period, VariableKind kind);
	VariableHandle allocate (const string &entity, const string &period, VariableKind kind, const VariableBounds &bounds);

	VariableHandle	lookup (const string &entity, const string &period, VariableKind kind) const;	// invalid handle if absent
	const VariableDefinition& definition (VariableHandle handle) const;
	int size () const { return (int) definitions.size(); }

	/* name recorded as owner of subsequent allocations */
	void setActiveOwner (const string &owner)	{ activeOwner = owner; }
	const string& getActiveOwner () const		{ return activeOwner; }

	VariableBounds defaultBounds (VariableKind kind, int entityId, int periodId) const;

	const EntityCatalog& getCatalog () const { return catalog; }

private:
	const EntityCatalog &catalog;

	vector<VariableDefinition>		definitions;
	map<VariableKey, int>			mapKeyToIndex;
	string							activeOwner;

	void resolve (const VariableKey &key, int &entityId, int &periodId) const;		// throws UnknownEntityError
	VariableHandle insert (const VariableKey &key, const VariableBounds &bounds, int entityId, int periodId);
};

#endif /* VariableRegistry_hpp */
