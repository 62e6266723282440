#include <rotator/config_loader.hpp>
#include <rotator/log.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>

namespace rotator {

std::vector<std::string> split_fields(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    bool field_started = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"' && !field_started) {
            quoted = true;
            field_started = true;
        } else if (c == delimiter) {
            fields.push_back(std::move(field));
            field.clear();
            field_started = false;
        } else {
            field += c;
            field_started = true;
        }
    }
    fields.push_back(std::move(field));
    return fields;
}

bool parse_record(const std::vector<std::string>& fields, BannerRecord& out, std::string& reason) {
    if (fields.size() < 2) {
        reason = "expected url;total;categories...";
        return false;
    }

    const std::string& amount = fields[1];
    if (amount.empty()) {
        reason = "missing impression amount";
        return false;
    }

    errno = 0;
    char* end = nullptr;
    long long total = std::strtoll(amount.c_str(), &end, 10);
    if (errno == ERANGE || end == amount.c_str() || *end != '\0') {
        reason = "impression amount is not an integer: '" + amount + "'";
        return false;
    }

    out.url = fields[0];
    out.total = total;
    out.categories.clear();
    for (size_t i = 2; i < fields.size(); ++i) {
        if (!fields[i].empty()) {
            out.categories.push_back(fields[i]);
        }
    }
    return true;
}

void ConfigLoader::record_error(LoadReport& report, size_t line, std::string message) {
    log_debug("loader", "line %zu: %s", line, message.c_str());
    if (report.errors.size() < MAX_REPORTED_ERRORS) {
        report.errors.push_back({line, std::move(message)});
    }
}

LoadReport ConfigLoader::load(std::istream& in) {
    LoadReport report;
    std::string line;
    size_t line_no = 0;
    BannerRecord record;
    std::string reason;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        if (!parse_record(split_fields(line, DELIMITER), record, reason)) {
            report.malformed++;
            record_error(report, line_no, reason);
            continue;
        }

        ValidationError err = inventory_.insert(std::move(record.url), record.total,
                                                record.categories);
        if (err != ValidationError::None) {
            report.rejected++;
            record_error(report, line_no, to_string(err));
            continue;
        }
        report.loaded++;
    }
    return report;
}

bool ConfigLoader::load_file(const std::string& path, LoadReport& report) {
    std::ifstream in(path);
    if (!in) {
        log_info("loader", "cannot open %s: %s", path.c_str(), strerror(errno));
        return false;
    }

    report = load(in);
    log_info("loader", "%s: loaded=%zu rejected=%zu malformed=%zu",
             path.c_str(), report.loaded, report.rejected, report.malformed);
    return true;
}

} // namespace rotator
