#pragma once

#include "libwcal/data/microdata.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace wcal::io {

// Reads a header-first CSV into a MicrodataTable. A column is numeric when
// every non-empty cell parses as a number (empty cells become NaN) and
// categorical otherwise. Blank lines and lines starting with '#' are
// skipped. Throws std::runtime_error with the line number on malformed input.
data::MicrodataTable read_microdata_csv(std::istream& in,
                                        const std::string& weight_column = "weight");

data::MicrodataTable load_microdata_csv(const std::string& path,
                                        const std::string& weight_column = "weight");

// Writes every input column in order with the weight column replaced by
// calibrated, followed by original_weight and weight_adjustment.
void write_microdata_csv(std::ostream& out,
                         const data::MicrodataTable& records,
                         const std::vector<double>& calibrated);

void save_microdata_csv(const std::string& path,
                        const data::MicrodataTable& records,
                        const std::vector<double>& calibrated);

} // namespace wcal::io
