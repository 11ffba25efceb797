#include "dataset.h"

#include <boost/format.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace pprl {

std::vector<std::vector<std::string>> parseDelimited(const std::string& text, char delimiter) {
  std::vector<std::vector<std::string>> rows;
  std::vector<std::string> row;
  std::string field;
  bool in_quotes = false;
  bool row_has_data = false;

  auto end_field = [&]() {
    row.push_back(field);
    field.clear();
  };
  auto end_row = [&]() {
    end_field();
    if (row_has_data) {
      rows.push_back(std::move(row));
    }
    row.clear();
    row_has_data = false;
  };

  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];

    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }

    if (c == '"') {
      in_quotes = true;
      row_has_data = true;
    } else if (c == delimiter) {
      end_field();
      row_has_data = true;
    } else if (c == '\r') {
      if (i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      end_row();
    } else if (c == '\n') {
      end_row();
    } else {
      field.push_back(c);
      row_has_data = true;
    }
  }

  if (in_quotes) {
    throw std::invalid_argument("Unterminated quoted field.");
  }
  if (row_has_data || !field.empty()) {
    row_has_data = true;
    end_row();
  }

  return rows;
}

std::vector<std::string> readIdentifierColumn(const std::string& path, const std::string& column,
                                              char delimiter) {
  std::ifstream fin(path);
  if (!fin.good()) {
    throw std::runtime_error(boost::str(boost::format("Could not open dataset at %1%.") % path));
  }
  std::stringstream buf;
  buf << fin.rdbuf();

  auto text = buf.str();
  // UTF-8 byte order mark written by spreadsheet exports.
  if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
    text.erase(0, 3);
  }

  auto rows = parseDelimited(text, delimiter);
  if (rows.empty()) {
    throw std::invalid_argument(boost::str(boost::format("Dataset %1% has no header row.") % path));
  }

  const auto& header = rows[0];
  size_t col = header.size();
  for (size_t i = 0; i < header.size(); ++i) {
    if (header[i] == column) {
      col = i;
      break;
    }
  }
  if (col == header.size()) {
    throw std::invalid_argument(
        boost::str(boost::format("Column '%1%' not found in %2%.") % column % path));
  }

  std::vector<std::string> values;
  values.reserve(rows.size() - 1);
  for (size_t r = 1; r < rows.size(); ++r) {
    values.push_back(col < rows[r].size() ? rows[r][col] : std::string());
  }
  return values;
}

};  // namespace pprl
