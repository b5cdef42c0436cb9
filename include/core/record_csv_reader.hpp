#pragma once

#include <string>
#include <vector>
#include "core/image_record.hpp"

/**
 * @brief Column names of the institutional record export
 */
struct RecordColumns
{
    std::string id = "ID";
    std::string accession = "CODE";
    std::string inventory = "NUMMER";
    std::string suffix = "CODE_1"; // Optional in the file
};

struct RecordReadResult
{
    bool success = false;
    std::string error_message;
    std::vector<ExternalRecord> records;
    size_t skipped_rows = 0; // Rows without an id or a derivable key
};

/**
 * @brief Reads external records from a CSV export
 *
 * The first row is the header. Fields may be quoted; quoted fields can hold
 * commas, doubled quotes and line breaks. HTML line-break fragments in cells
 * are replaced with a comma.
 */
class RecordCsvReader
{
public:
    explicit RecordCsvReader(RecordColumns columns = RecordColumns());

    RecordReadResult read(const std::string &path) const;

    RecordReadResult parse(const std::string &text) const;

    static std::vector<std::vector<std::string>> parseCsv(const std::string &text);

    // Replace <br> and <b> fragments with ","
    static std::string replaceHtmlBreaks(const std::string &cell);

private:
    // "12.0" as exported by spreadsheets becomes "12"
    static std::string normalizeInventory(const std::string &value);

    RecordColumns columns_;
};
