#pragma once

#include <boost/program_options.hpp>
#include <ostream>

// Options accepted on the command line and in the config file.
boost::program_options::options_description recordMatchOptions();

// Runs one party of the record matching protocol. Computing parties write the
// match count to out and nothing else. Progress and errors go to err. Returns
// the process exit code.
int runRecordMatch(int argc, const char* const argv[], std::ostream& out, std::ostream& err);
