#include <iostream>

#include "record_match_app.h"

int main(int argc, char* argv[]) { return runRecordMatch(argc, argv, std::cout, std::cerr); }
