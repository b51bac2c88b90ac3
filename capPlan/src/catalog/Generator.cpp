//
//  Generator.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include "Generator.hpp"
#include "../misc.hpp"

Generator::Generator () :
	id(-1), type(OTHER), zoneId(-1),
	existingCapacity(0.0), maxBuildCapacity(0.0), integerBuild(false),
	variableCost(0.0), fixedCost(0.0), capitalCost(0.0),
	emissionRate(0.0), retrofitEligible(false), postRetrofitEmissionRate(0.0),
	storageHours(0.0), chargeEfficiency(1.0),
	conversionEfficiency(0.0) {}

bool Generator::setType (string typeName) {
	typeName = toLower(typeName);

	if (typeName == "thermal" || typeName == "coal" || typeName == "naturalgas" || typeName == "oil" || typeName == "biomass") {
		type = THERMAL;
	}
	else if (typeName == "wind") {
		type = WIND;
	}
	else if (typeName == "solar") {
		type = SOLAR;
	}
	else if (typeName == "hydro") {
		type = HYDRO;
	}
	else if (typeName == "storage" || typeName == "battery") {
		type = STORAGE;
	}
	else if (typeName == "electrolyzer" || typeName == "hydrogen") {
		type = ELECTROLYZER;
	}
	else if (typeName == "other") {
		type = OTHER;
	}
	else {
		return false;
	}
	return true;
}

string Generator::typeName () const {
	switch (type) {
		case THERMAL:		return "thermal";
		case WIND:			return "wind";
		case SOLAR:			return "solar";
		case HYDRO:			return "hydro";
		case STORAGE:		return "storage";
		case ELECTROLYZER:	return "electrolyzer";
		default:			return "other";
	}
}
