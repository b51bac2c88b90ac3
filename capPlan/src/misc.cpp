#include "misc.hpp"

#include <sys/stat.h>
#include <errno.h>
#include <time.h>
#include <sys/time.h>

/****************************************************************************
 * safeGetline
 * - Works the same as getline, however, can handle issues where the end of
 * line tokens might be either '\n', '\r', or '\n\r'.
 *****************************************************************************/
istream& safeGetline(istream& is, string& t)
{
	t.clear();

	std::istream::sentry se(is, true);
	std::streambuf* sb = is.rdbuf();

	for(;;) {
		int c = sb->sbumpc();
		switch (c) {
		case '\n':
			return is;
		case '\r':
			if(sb->sgetc() == '\n')
				sb->sbumpc();
			return is;
		case std::streambuf::traits_type::eof():
			// Also handle the case when the last line has no line ending
			if(t.empty())
				is.setstate(std::ios::eofbit);
			return is;
		default:
			t += (char)c;
		}
	}
}

/* The subroutines lists all the sub-directories of a directory */
int getDirs (string dir, vector<string> &subdirs) {
	DIR *dp;
	struct dirent *dirp;

	if((dp  = opendir(dir.c_str())) == NULL) {
		cout << "Error opening directory : " << dir << endl;
		return 1;
	}

	while ((dirp = readdir(dp)) != NULL) {
		if ( dirp->d_type == DT_DIR && strcmp(dirp->d_name, ".") && strcmp(dirp->d_name, "..") )
			subdirs.push_back(string(dirp->d_name));
	}

	closedir(dp);

	// readdir order is filesystem dependent
	sort(subdirs.begin(), subdirs.end());
	return 0;
}//END getDirs()

/* The subroutine splits the line of type string along the delimiters into a vector of trimmed strings */
vector<string> splitString(const string &line, char delimiter) {

	stringstream ss(line);
	string item;
	vector<string> tokens;
	while (getline(ss, item, delimiter)) {
		tokens.push_back(trimString(item));
	}
	// a trailing delimiter means a trailing empty field
	if (!line.empty() && line[line.size()-1] == delimiter) {
		tokens.push_back("");
	}
	return tokens;
}//END splitString()

string trimString(const string &str) {
	size_t first = str.find_first_not_of(" \t\r\n\"");
	if (first == string::npos) return "";
	size_t last = str.find_last_not_of(" \t\r\n\"");
	return str.substr(first, last - first + 1);
}

string toLower(string str) {
	transform(str.begin(), str.end(), str.begin(), ::tolower);
	return str;
}

bool file_exists (string filename) {
	struct stat buffer;
	return ( stat(filename.c_str(), &buffer) == 0 );
}

bool open_file (ifstream &fptr, string filename) {

	fptr.open( filename.c_str() );
	if (fptr.fail()) {
		cout << "Error opening file: " << filename << endl;
		return false;
	}
	return true;
}

bool open_file (ofstream &fptr, string filename) {

	fptr.open( filename.c_str() );
	if (fptr.fail()) {
		cout << "Error opening file: " << filename << endl;
		return false;
	}
	return true;
}

bool make_dir (string dir) {
	if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
		cout << "Error creating directory: " << dir << endl;
		return false;
	}
	return true;
}

void resize_matrix(vector< vector<double> > &mat, int rows, int cols)
{
	mat.resize(rows);
	for (int i=0; i<rows; i++) mat[i].resize(cols, 0.0);
}

/****************************************************************************
 * parseDouble / parseInt / parseBool
 * - Strict conversions of a single table cell. "inf" and "-inf" are
 * accepted for doubles. Return false if the token is not a number.
 ****************************************************************************/
bool parseDouble (const string &token, double &value) {
	string t = toLower(trimString(token));
	if (t.empty()) return false;
	if (t == "inf" || t == "infinity" || t == "+inf") {
		value = HUGE_VAL;
		return true;
	}
	if (t == "-inf" || t == "-infinity") {
		value = -HUGE_VAL;
		return true;
	}
	char *end;
	value = strtod(t.c_str(), &end);
	return (*end == '\0');
}

bool parseInt (const string &token, int &value) {
	string t = trimString(token);
	if (t.empty()) return false;
	char *end;
	long v = strtol(t.c_str(), &end, 10);
	if (*end != '\0' || v > INT_MAX || v < INT_MIN) return false;
	value = (int) v;
	return true;
}

bool parseBool (const string &token, bool &value) {
	string t = toLower(trimString(token));
	if (t == "1" || t == "true" || t == "yes" || t == "y") {
		value = true;
		return true;
	}
	if (t == "0" || t == "false" || t == "no" || t == "n" || t.empty()) {
		value = false;
		return true;
	}
	return false;
}

// Get current date/time, format is YYYY-MM-DD.HH:mm:ss
const std::string getCurrentDateTime() {
	time_t     now = time(0);
	struct tm  tstruct;
	char       buf[80];
	tstruct = *localtime(&now);
	strftime(buf, sizeof(buf), "%Y-%m-%d %X", &tstruct);

	return buf;
}

// Get the wall time
double get_wall_time(){
	struct timeval time;
	if (gettimeofday(&time,NULL)){
		return 0;
	}
	return (double)time.tv_sec + (double)time.tv_usec * .000001;
}
