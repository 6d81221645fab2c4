#ifndef CSV_H
#define CSV_H

#include <istream>
#include <limits>
#include <string>
#include <vector>

struct CrashRecord {
    double latitude = std::numeric_limits<double>::quiet_NaN();
    double longitude = std::numeric_limits<double>::quiet_NaN();
    int fatals = std::numeric_limits<int>::min();
    int year = std::numeric_limits<int>::min();
    std::string county_name;
    std::string city_name;
    std::string weather_name;
    std::string route_name;
    // Values of CSV::extra_columns, in the same order.
    std::vector<std::string> extra;

    bool hasValidLocation() const;
};

class CSV {
public:
    std::vector<std::string> extra_columns;
    std::vector<CrashRecord> rows;
    size_t ignored_rows = 0;

    size_t size() const;
};

CSV makeCSV(const std::string &filename);
CSV readCSV(std::istream &in);

double parseDouble(const std::string &field);
int parseInt(const std::string &field);
std::string parseString(const std::string &field);
std::string stripQuotes(const std::string &field);
std::vector<std::string> splitCSVLine(const std::string &line);

#endif
