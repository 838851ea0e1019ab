#ifndef DSBOX_CSV_H_
#define DSBOX_CSV_H_

#include <string>
#include <istream>
#include <ostream>

#include <dsbox/result.h>

// RFC 4180 with the conventions of pandas' to_csv(index=False):
// header row of column names, nulls as empty fields, booleans as True/False
void WriteCsv(std::ostream&, const Table&);
std::string CellToCsvField(const Cell&);

// Cells are typed by their text: empty -> null, integer, float, True/False, else string.
// Rows get a 0-based integer index. Return false on unterminated quotes or ragged rows.
bool ReadCsv(std::istream&, Table&, std::string& error);
Cell ParseCsvField(const std::string& field, bool quoted);

#endif  // DSBOX_CSV_H_
