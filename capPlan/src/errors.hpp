//
//  errors.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef errors_hpp
#define errors_hpp

#include <stdexcept>
#include <string>

using namespace std;

class CapPlanError : public runtime_error {
public:
	explicit CapPlanError (const string &what) : runtime_error(what) {}
};

/* Missing, malformed or dangling input records. */
class DataError : public CapPlanError {
public:
	DataError (const string &identifier, const string &reason)
		: CapPlanError("Data error [" + identifier + "]: " + reason), identifier(identifier) {}

	const string identifier;	// offending record
};

/* Variable requested for an entity or period that is not in the catalog. */
class UnknownEntityError : public CapPlanError {
public:
	UnknownEntityError (const string &entity, const string &period)
		: CapPlanError("Unknown entity [" + entity + (period.empty() ? "" : ", " + period) + "]"),
		  entity(entity), period(period) {}

	const string entity;
	const string period;
};

/* Two contributions define the same quantity with different semantics. */
class ModelCompositionError : public CapPlanError {
public:
	ModelCompositionError (const string &firstModule, const string &secondModule, const string &key, const string &reason)
		: CapPlanError("Composition conflict between '" + firstModule + "' and '" + secondModule + "' on " + key + ": " + reason),
		  firstModule(firstModule), secondModule(secondModule), key(key) {}

	const string firstModule;
	const string secondModule;
	const string key;
};

class ConfigurationError : public CapPlanError {
public:
	explicit ConfigurationError (const string &what) : CapPlanError("Configuration error: " + what) {}
};

#endif /* errors_hpp */
