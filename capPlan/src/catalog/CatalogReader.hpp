//
//  CatalogReader.hpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#ifndef CatalogReader_hpp
#define CatalogReader_hpp

#include <fstream>
#include <map>
#include <string>
#include <vector>

#include "EntityCatalog.hpp"

using namespace std;

/****************************************************************************
 * CsvTable
 * - One comma-separated table with a header row; cells are addressed by
 * column name. Blank lines and lines starting with '#' are skipped.
 * - Malformed cells throw DataError naming the file, line and column.
 ****************************************************************************/
class CsvTable {

public:
	CsvTable () : lineNumber(0) {}

	bool open (const string &filename);		// false if the file does not exist or has no header
	bool next ();							// advances to the next record, false at the end

	bool	has (const string &column) const;
	bool	blank (const string &column) const;		// absent column or empty cell
	string	text (const string &column) const;
	double	number (const string &column) const;
	double	number (const string &column, double defaultValue) const;	// for an absent column or empty cell
	int		integer (const string &column, int defaultValue) const;
	bool	flag (const string &column, bool defaultValue) const;

	string where (const string &column) const;

private:
	ifstream			input;
	string				filename;
	int					lineNumber;
	map<string, int>	columns;
	vector<string>		record;

	string cell (const string &column) const;	// empty if the column is absent
};

/* Reads the tables of inputDir into the catalog and finalizes it.
 * Returns false if a required table is missing; throws DataError for
 * malformed or inconsistent records. */
bool readCatalog (string inputDir, EntityCatalog &catalog);

/* true if inputDir holds the tables of a single scenario */
bool isScenarioDirectory (string inputDir);

#endif /* CatalogReader_hpp */
