#pragma once
// Config Loader: feeds the banner file into an Inventory
//
// Format: one record per line, ';'-separated, no header:
//   url;total;category1[;category2...]
//
// Bad records are reported and skipped; loading always continues.

#include "inventory.hpp"
#include <istream>
#include <string>
#include <vector>

namespace rotator {

struct BannerRecord {
    std::string url;
    int64_t total = 0;
    std::vector<std::string> categories;
};

struct LoadError {
    size_t line = 0;
    std::string message;
};

struct LoadReport {
    size_t loaded = 0;
    size_t rejected = 0;    // failed validation
    size_t malformed = 0;   // could not be parsed into a record
    std::vector<LoadError> errors;

    size_t records() const { return loaded + rejected + malformed; }
};

// Split one line into fields, honoring double-quoted fields
std::vector<std::string> split_fields(const std::string& line, char delimiter = ';');

// Parse fields into a record. False with reason set when malformed.
bool parse_record(const std::vector<std::string>& fields, BannerRecord& out, std::string& reason);

class ConfigLoader {
public:
    static constexpr char DELIMITER = ';';
    static constexpr size_t MAX_REPORTED_ERRORS = 100;

    explicit ConfigLoader(Inventory& inventory) : inventory_(inventory) {}

    // Load every line of the stream
    LoadReport load(std::istream& in);

    // False if the file cannot be opened
    bool load_file(const std::string& path, LoadReport& report);

private:
    void record_error(LoadReport& report, size_t line, std::string message);

    Inventory& inventory_;
};

} // namespace rotator
