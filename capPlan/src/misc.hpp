#ifndef _MISC_H
#define _MISC_H

#include <iostream>
#include <sstream>
#include <iomanip>
#include <fstream>
#include <vector>
#include <algorithm>
#include <cmath>
#include <stdio.h>
#include <string.h>
#include <dirent.h>
#include <stdlib.h>
#include <map>
#include <climits>

using namespace std;

// Commonly used functions

/****************************************************************************
 * numToStr
 * - Converts numbers to string
 *****************************************************************************/
template <typename T>
string numToStr (T Number) {
	ostringstream ss;
	ss << Number;
	return ss.str();
}

istream& safeGetline(istream& is, string& t);

int getDirs (string dir, vector<string> &subdirs);

vector<string> splitString(const string &line, char delimiter);
string trimString(const string &str);
string toLower(string str);

bool file_exists (string filename);
bool open_file (ifstream &file, string filename);
bool open_file (ofstream &file, string filename);
bool make_dir (string dir);

void resize_matrix(vector< vector<double> > &mat, int rows, int cols);

bool parseDouble (const string &token, double &value);
bool parseInt (const string &token, int &value);
bool parseBool (const string &token, bool &value);

const std::string getCurrentDateTime();

double get_wall_time();

#endif
