#include "core/record_csv_reader.hpp"
#include "core/record_keys.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>

RecordCsvReader::RecordCsvReader(RecordColumns columns)
    : columns_(std::move(columns))
{
}

RecordReadResult RecordCsvReader::read(const std::string &path) const
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        RecordReadResult result;
        result.error_message = "Cannot open record file: " + path;
        Logger::error(result.error_message);
        return result;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    RecordReadResult result = parse(buffer.str());
    if (result.success)
    {
        Logger::info("Read " + std::to_string(result.records.size()) + " external records from " + path +
                     " (" + std::to_string(result.skipped_rows) + " rows skipped)");
    }
    return result;
}

RecordReadResult RecordCsvReader::parse(const std::string &text) const
{
    RecordReadResult result;

    std::string body = text;
    if (body.compare(0, 3, "\xEF\xBB\xBF") == 0)
        body.erase(0, 3);

    auto rows = parseCsv(body);
    if (rows.empty())
    {
        result.error_message = "Record file has no header row";
        Logger::error(result.error_message);
        return result;
    }

    const auto &header = rows.front();
    auto column_index = [&header](const std::string &name) -> long
    {
        for (size_t i = 0; i < header.size(); ++i)
        {
            if (RecordKeys::trim(header[i]) == name)
                return static_cast<long>(i);
        }
        return -1;
    };

    long id_col = column_index(columns_.id);
    long acc_col = column_index(columns_.accession);
    long inv_col = column_index(columns_.inventory);
    long suffix_col = column_index(columns_.suffix);

    if (id_col < 0 || acc_col < 0 || inv_col < 0)
    {
        result.error_message = "Record file is missing a required column (" + columns_.id + ", " +
                               columns_.accession + " or " + columns_.inventory + ")";
        Logger::error(result.error_message);
        return result;
    }
    if (suffix_col < 0)
        Logger::debug("Suffix column " + columns_.suffix + " not present, using empty suffixes");

    auto cell = [](const std::vector<std::string> &row, long index) -> std::string
    {
        if (index < 0 || static_cast<size_t>(index) >= row.size())
            return "";
        return RecordKeys::trim(replaceHtmlBreaks(row[static_cast<size_t>(index)]));
    };

    for (size_t r = 1; r < rows.size(); ++r)
    {
        const auto &row = rows[r];
        // Blank line
        if (row.size() == 1 && RecordKeys::trim(row[0]).empty())
            continue;

        ExternalRecord record;
        record.record_id = cell(row, id_col);
        record.accession = cell(row, acc_col);
        record.inventory = normalizeInventory(cell(row, inv_col));
        record.suffix = cell(row, suffix_col);

        auto key = RecordKeys::deriveKey(record.accession, record.inventory, record.suffix);
        if (record.record_id.empty() || !key)
        {
            ++result.skipped_rows;
            Logger::debug("Skipping record row " + std::to_string(r + 1) + ": no id or key");
            continue;
        }
        record.code_and_number = *key;
        result.records.push_back(std::move(record));
    }

    result.success = true;
    return result;
}

std::vector<std::vector<std::string>> RecordCsvReader::parseCsv(const std::string &text)
{
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string field;
    bool in_quotes = false;
    bool row_started = false;

    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (in_quotes)
        {
            if (c == '"')
            {
                if (i + 1 < text.size() && text[i + 1] == '"')
                {
                    field += '"';
                    ++i;
                }
                else
                {
                    in_quotes = false;
                }
            }
            else
            {
                field += c;
            }
            continue;
        }

        switch (c)
        {
        case '"':
            in_quotes = true;
            row_started = true;
            break;
        case ',':
            row.push_back(std::move(field));
            field.clear();
            row_started = true;
            break;
        case '\r':
            break;
        case '\n':
            row.push_back(std::move(field));
            field.clear();
            rows.push_back(std::move(row));
            row.clear();
            row_started = false;
            break;
        default:
            field += c;
            row_started = true;
            break;
        }
    }

    if (row_started || !field.empty())
    {
        row.push_back(std::move(field));
        rows.push_back(std::move(row));
    }
    return rows;
}

std::string RecordCsvReader::replaceHtmlBreaks(const std::string &cell)
{
    std::string result = cell;
    for (const std::string fragment : {"<br>", "<b>"})
    {
        size_t pos = 0;
        while ((pos = result.find(fragment, pos)) != std::string::npos)
        {
            result.replace(pos, fragment.size(), ",");
            ++pos;
        }
    }
    return result;
}

std::string RecordCsvReader::normalizeInventory(const std::string &value)
{
    size_t dot = value.find('.');
    if (dot == std::string::npos || dot == 0)
        return value;
    auto is_digit = [](unsigned char c)
    { return std::isdigit(c) != 0; };
    bool integral = std::all_of(value.begin(), value.begin() + static_cast<long>(dot), is_digit) &&
                    dot + 1 < value.size() &&
                    std::all_of(value.begin() + static_cast<long>(dot) + 1, value.end(), [](char c)
                                { return c == '0'; });
    return integral ? value.substr(0, dot) : value;
}
