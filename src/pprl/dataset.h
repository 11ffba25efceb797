#pragma once

#include <string>
#include <vector>

namespace pprl {

// Splits delimited text into rows of fields. Quoted fields may contain the
// delimiter, line breaks and doubled quotes. Blank lines are skipped.
std::vector<std::vector<std::string>> parseDelimited(const std::string& text, char delimiter);

// Values of the column named `column` in the delimited file at `path`. The
// first row is the header. Rows that are too short yield an empty value so
// that record indices stay aligned with the file.
std::vector<std::string> readIdentifierColumn(const std::string& path, const std::string& column,
                                              char delimiter = ',');

};  // namespace pprl
