#include "CSV.h"
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <omp.h>
#include <stdexcept>
#include <utility>

namespace {

const char *const LATITUDE_COLUMN = "LATITUDE";
const char *const LONGITUDE_COLUMN = "LONGITUD";
const char *const FATALS_COLUMN = "FATALS";
const char *const YEAR_COLUMN = "YEAR";
const char *const COUNTY_COLUMN = "COUNTYNAME";
const char *const CITY_COLUMN = "CITYNAME";
const char *const WEATHER_COLUMN = "WEATHERNAME";
const char *const ROUTE_COLUMN = "ROUTENAME";

// FARS exports write these in place of an empty cell.
const char *const NULL_TOKEN = "NULL";
const char *const UNSPECIFIED_TOKEN = "Unspecified";
const int MISSING_INT = std::numeric_limits<int>::min();

bool isMissingValue(const std::string &field) {
    return field.empty() || field == NULL_TOKEN || field == UNSPECIFIED_TOKEN;
}

struct ColumnLayout {
    int latitude = -1;
    int longitude = -1;
    int fatals = -1;
    int year = -1;
    int county = -1;
    int city = -1;
    int weather = -1;
    int route = -1;
    std::vector<int> extra;
    size_t width = 0;
};

void stripCarriageReturn(std::string &line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

std::string optionalField(const std::vector<std::string> &fields, int index) {
    return index < 0 ? "" : parseString(fields[index]);
}

} // namespace

bool CrashRecord::hasValidLocation() const {
    return std::isfinite(latitude) && std::isfinite(longitude);
}

size_t CSV::size() const {
    return rows.size();
}

double parseDouble(const std::string &field) {
    if (isMissingValue(field)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    size_t consumed = 0;
    try {
        double value = std::stod(field, &consumed);
        return consumed == field.size() ? value : std::numeric_limits<double>::quiet_NaN();
    } catch (const std::logic_error&) {
        return std::numeric_limits<double>::quiet_NaN();
    }
}

int parseInt(const std::string &field) {
    if (isMissingValue(field)) {
        return MISSING_INT;
    }
    try {
        return std::stoi(field);
    } catch (const std::logic_error&) {
        return MISSING_INT;
    }
}

std::string parseString(const std::string &field) {
    return isMissingValue(field) ? std::string() : field;
}

std::string stripQuotes(const std::string &field) {
    const size_t n = field.size();
    if (n < 2 || field[0] != '"' || field[n - 1] != '"') {
        return field;
    }
    return std::string(field, 1, n - 2);
}

std::vector<std::string> splitCSVLine(const std::string &line) {
    std::vector<std::string> fields(1);
    bool quoted = false;
    for (char c : line) {
        if (c == '"') {
            quoted = !quoted;
        } else if (c == ',' && !quoted) {
            fields.back() = stripQuotes(fields.back());
            fields.emplace_back();
        } else {
            fields.back().push_back(c);
        }
    }
    fields.back() = stripQuotes(fields.back());
    return fields;
}

static bool resolveColumns(const std::vector<std::string> &header, ColumnLayout &layout,
                           std::vector<std::string> &extraColumns) {
    std::map<std::string, int *> known = {
        {LATITUDE_COLUMN, &layout.latitude}, {LONGITUDE_COLUMN, &layout.longitude},
        {FATALS_COLUMN, &layout.fatals},     {YEAR_COLUMN, &layout.year},
        {COUNTY_COLUMN, &layout.county},     {CITY_COLUMN, &layout.city},
        {WEATHER_COLUMN, &layout.weather},   {ROUTE_COLUMN, &layout.route},
    };

    for (size_t i = 0; i < header.size(); ++i) {
        auto it = known.find(header[i]);
        if (it != known.end() && *it->second < 0) {
            *it->second = static_cast<int>(i);
        } else {
            layout.extra.push_back(static_cast<int>(i));
            extraColumns.push_back(header[i]);
        }
    }
    layout.width = header.size();

    bool complete = true;
    if (layout.latitude < 0) {
        std::cerr << "Missing required column: " << LATITUDE_COLUMN << std::endl;
        complete = false;
    }
    if (layout.longitude < 0) {
        std::cerr << "Missing required column: " << LONGITUDE_COLUMN << std::endl;
        complete = false;
    }
    if (layout.fatals < 0) {
        std::cerr << "Missing required column: " << FATALS_COLUMN << std::endl;
        complete = false;
    }
    return complete;
}

CSV readCSV(std::istream &in) {
    CSV data;

    std::string headerLine;
    if (!std::getline(in, headerLine)) {
        std::cerr << "CSV input has no header row" << std::endl;
        return data;
    }
    stripCarriageReturn(headerLine);

    ColumnLayout layout;
    std::vector<std::string> extraColumns;
    if (!resolveColumns(splitCSVLine(headerLine), layout, extraColumns)) {
        return data;
    }
    data.extra_columns = extraColumns;

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        stripCarriageReturn(line);
        if (!line.empty()) {
            lines.push_back(line);
        }
    }

    int ignoredRows = 0;
    std::vector<CrashRecord> parsedRows(lines.size());
    std::vector<char> parsed(lines.size(), 0);

    #pragma omp parallel for reduction(+:ignoredRows)
    for (size_t i = 0; i < lines.size(); ++i) {
        auto fields = splitCSVLine(lines[i]);
        if (fields.size() < layout.width) {
            ignoredRows++;
            continue;
        }

        try {
            CrashRecord row;
            row.latitude = parseDouble(fields[layout.latitude]);
            row.longitude = parseDouble(fields[layout.longitude]);
            row.fatals = parseInt(fields[layout.fatals]);
            row.year = layout.year < 0 ? std::numeric_limits<int>::min() : parseInt(fields[layout.year]);
            row.county_name = optionalField(fields, layout.county);
            row.city_name = optionalField(fields, layout.city);
            row.weather_name = optionalField(fields, layout.weather);
            row.route_name = optionalField(fields, layout.route);
            row.extra.reserve(layout.extra.size());
            for (int column : layout.extra) {
                row.extra.push_back(parseString(fields[column]));
            }

            parsedRows[i] = std::move(row);
            parsed[i] = 1;
        } catch (const std::exception&) {
            ignoredRows++;
        }
    }

    data.rows.reserve(lines.size() - ignoredRows);
    for (size_t i = 0; i < parsedRows.size(); ++i) {
        if (parsed[i]) {
            data.rows.push_back(std::move(parsedRows[i]));
        }
    }
    data.ignored_rows = static_cast<size_t>(ignoredRows);

    std::cout << "Ignored Rows = " << ignoredRows << std::endl;
    std::cout << "Number of rows successfully parsed: " << data.size() << std::endl;
    return data;
}

CSV makeCSV(const std::string &filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Failed to open file: " << filename << std::endl;
        return CSV();
    }
    return readCSV(file);
}
