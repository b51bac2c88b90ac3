//
//  main.cpp
//  capPlan
//
//  Copyright © 2017 University of Southern California. All rights reserved.
//

#include "misc.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "Scenario.hpp"
#include "ScenarioBatch.hpp"
#include "catalog/CatalogReader.hpp"

/* flags given on the command line override the scenario files */
struct CmdLineOptions {
	CmdLineOptions () : verbose(false), traceback(false), duals(false), threads(-1) {}

	string	solver;
	bool	verbose;
	bool	traceback;
	bool	duals;
	int		threads;
};

void parseCmdLine(int argc, const char *argv[], string &inputDir, string &outputDir, CmdLineOptions &options);
void applyCmdLine(const CmdLineOptions &options, RunParameters &runParam);
std::shared_ptr<Scenario> setupScenario(const string &name, string inputDir, const CmdLineOptions &options);

int main(int argc, const char * argv[]) {
	string inputDir, outputDir;
	CmdLineOptions options;

	parseCmdLine(argc, argv, inputDir, outputDir, options);
	if (!make_dir(outputDir)) {
		return 1;
	}

	/* a directory with its own generator table is one scenario, otherwise every sub-directory is */
	vector<string> names, dirs;
	if ( isScenarioDirectory(inputDir) ) {
		names.push_back("scenario");
		dirs.push_back(inputDir);
	}
	else {
		vector<string> subdirs;
		if ( getDirs(inputDir, subdirs) ) {
			return 1;
		}
		for (int s=0; s<(int) subdirs.size(); s++) {
			if ( isScenarioDirectory(inputDir + "/" + subdirs[s]) ) {
				names.push_back(subdirs[s]);
				dirs.push_back(inputDir + "/" + subdirs[s]);
			}
		}
		if ( names.empty() ) {
			cout << "No scenario found in " << inputDir << endl;
			return 1;
		}
	}

	int batchThreads = 1;
	vector< std::shared_ptr<Scenario> > scenarios;
	vector<string> outputs;
	int numFailed = 0;
	for (int s=0; s<(int) names.size(); s++) {
		std::shared_ptr<Scenario> scenario = setupScenario(names[s], dirs[s], options);
		if ( scenario.get() == NULL ) {
			numFailed++;
			continue;
		}
		batchThreads = max(batchThreads, scenario->getRunParameters().batchThreads);
		scenarios.push_back(scenario);
		outputs.push_back( (names.size() == 1 && names[0] == "scenario") ? outputDir : outputDir + "/" + names[s] );
	}

	/* the solver backend of each scenario logs into the scenario's log file */
	double begin_t = get_wall_time();
	ScenarioBatch batch (batchThreads);
	for (int s=0; s<(int) scenarios.size(); s++) {
		batch.add(scenarios[s], outputs[s]);
	}
	batch.run();
	numFailed += batch.numFailed();

	cout << "------------------------------------------------------------------" << endl;
	cout << names.size() << " scenario(s), " << numFailed << " without an optimal result, "
		 << fixed << setprecision(2) << get_wall_time() - begin_t << " s." << endl;

	return (numFailed > 0) ? 1 : 0;
}

/****************************************************************************
 * setupScenario
 * - Reads the run parameters and the input tables of one scenario. Returns
 * NULL if the scenario cannot be set up; the reason is printed.
 ****************************************************************************/
std::shared_ptr<Scenario> setupScenario(const string &name, string inputDir, const CmdLineOptions &options) {
	try {
		RunParameters runParam;
		if ( !readRunfile(inputDir, runParam) ) {
			perror("Failed to read the scenario file, using the default parameters.\n");
		}
		applyCmdLine(options, runParam);
		printRunParameters(runParam, cout);

		EntityCatalog catalog;
		if ( !readCatalog(inputDir, catalog) ) {
			return std::shared_ptr<Scenario>();
		}
		catalog.summary(cout);

		return std::shared_ptr<Scenario>(new Scenario(name, catalog, runParam));
	}
	catch (CapPlanError &e) {
		printf("%-30s: Failed (%s).\n", name.c_str(), e.what());
		return std::shared_ptr<Scenario>();
	}
}

void applyCmdLine(const CmdLineOptions &options, RunParameters &runParam) {
	if ( !options.solver.empty() )	runParam.solver.backend = options.solver;
	if ( options.verbose )			runParam.solver.verbose = true;
	if ( options.traceback )		runParam.solver.traceback = true;
	if ( options.duals )			runParam.solver.retrieveDuals = true;
	if ( options.threads >= 0 )		runParam.solver.threads = options.threads;
}

void parseCmdLine(int argc, const char *argv[], string &inputDir, string &outputDir, CmdLineOptions &options)
{
	if (argc < 3) {
		cout << "Missing inputs. Please provide the following in the given order:\n  (1) input directory path,\n  (2) output directory path." << endl;
		cout << "Optional flags: -solver NAME, -verbose, -traceback, -duals, -threads N" << endl;
		exit(1);
	}

	inputDir	= argv[1];
	outputDir	= argv[2];

	for (int i=3; i<argc; i++) {
		if ( strcmp(argv[i], "-solver") == 0 && i+1 < argc ) {
			options.solver = toLower(argv[++i]);
		} else if ( strcmp(argv[i], "-verbose") == 0 ) {
			options.verbose = true;
		} else if ( strcmp(argv[i], "-traceback") == 0 ) {
			options.traceback = true;
		} else if ( strcmp(argv[i], "-duals") == 0 ) {
			options.duals = true;
		} else if ( strcmp(argv[i], "-threads") == 0 && i+1 < argc && parseInt(argv[i+1], options.threads) && options.threads >= 0 ) {
			i++;
		} else {
			cout << "Wrong input: " << argv[i] << endl;
			exit(1);
		}
	}
}//END parseCmdLine()
