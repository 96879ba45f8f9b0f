#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include "common/Logger.h"

namespace signalbench {
namespace backtest {

namespace {
enum Column { DATE = 0, OPEN, HIGH, LOW, CLOSE, VOLUME, COLUMN_COUNT };

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

std::string lowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Column positions from a header row; nullopt when a required column is missing
std::optional<std::array<size_t, COLUMN_COUNT>> mapHeader(const std::vector<std::string>& header) {
    std::array<size_t, COLUMN_COUNT> index;
    index.fill(header.size());
    for (size_t i = 0; i < header.size(); ++i) {
        const std::string name = lowerCopy(header[i]);
        if (name == "date" || name == "time") index[DATE] = i;
        else if (name == "open") index[OPEN] = i;
        else if (name == "high") index[HIGH] = i;
        else if (name == "low") index[LOW] = i;
        else if (name == "close") index[CLOSE] = i;
        else if (name == "volume") index[VOLUME] = i;
    }
    for (size_t pos : index) {
        if (pos >= header.size()) {
            return std::nullopt;
        }
    }
    return index;
}
}

std::vector<Bar> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Bar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return bars;
    }

    std::array<size_t, COLUMN_COUNT> columns{DATE, OPEN, HIGH, LOW, CLOSE, VOLUME};
    std::string line;
    size_t line_no = 0;
    size_t skipped = 0;

    while (std::getline(file, line)) {
        ++line_no;
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.empty() || row[0].empty()) continue;

        if (!std::isdigit(static_cast<unsigned char>(row[0][0]))) {
            // Header row
            const auto mapped = mapHeader(row);
            if (mapped) {
                columns = *mapped;
            } else if (line_no == 1) {
                LOG_WARN("Unrecognized CSV header in {}, assuming date,open,high,low,close,volume", file_path);
            } else {
                ++skipped;
            }
            continue;
        }

        const size_t needed = *std::max_element(columns.begin(), columns.end()) + 1;
        if (row.size() < needed) {
            LOG_WARN("Skipping short row {} in {}: {}", line_no, file_path, line);
            ++skipped;
            continue;
        }

        const auto date = Date::parse(row[columns[DATE]]);
        if (!date) {
            LOG_WARN("Skipping row {} with bad date in {}: {}", line_no, file_path, line);
            ++skipped;
            continue;
        }

        try {
            Bar bar;
            bar.date = *date;
            bar.open = std::stod(row[columns[OPEN]]);
            bar.high = std::stod(row[columns[HIGH]]);
            bar.low = std::stod(row[columns[LOW]]);
            bar.close = std::stod(row[columns[CLOSE]]);
            bar.volume = std::stod(row[columns[VOLUME]]);
            if (!std::isfinite(bar.open) || !std::isfinite(bar.high) || !std::isfinite(bar.low) ||
                !std::isfinite(bar.close) || !std::isfinite(bar.volume)) {
                LOG_WARN("Skipping row {} with non-finite values in {}", line_no, file_path);
                ++skipped;
                continue;
            }
            bars.push_back(bar);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
            ++skipped;
        }
    }

    normalize(bars);
    LOG_INFO("Loaded {} bars from {} ({} rows skipped)", bars.size(), file_path, skipped);
    return bars;
}

void DataHistory::normalize(std::vector<Bar>& bars) {
    // Stable sort keeps file order within a date, so the last row of a date
    // is the one kept below
    std::stable_sort(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        return a.date < b.date;
    });

    std::vector<Bar> unique;
    unique.reserve(bars.size());
    for (const auto& bar : bars) {
        if (!unique.empty() && unique.back().date == bar.date) {
            unique.back() = bar;
        } else {
            unique.push_back(bar);
        }
    }
    bars.swap(unique);
}

std::vector<Bar> DataHistory::sliceUpTo(const std::vector<Bar>& bars, const Date& date) {
    auto end = std::upper_bound(bars.begin(), bars.end(), date,
                                [](const Date& d, const Bar& bar) { return d < bar.date; });
    return std::vector<Bar>(bars.begin(), end);
}

} // namespace backtest
} // namespace signalbench
