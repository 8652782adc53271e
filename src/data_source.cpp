#include "data_source.hpp"
#include "session_clock.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <map>

namespace zonetrade {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& line, char delim) {
    std::vector<std::string> parts;
    std::istringstream iss(line);
    std::string part;
    while (std::getline(iss, part, delim)) {
        parts.push_back(trim(part));
    }
    return parts;
}

void toLower(std::string& s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

int findColumn(const std::vector<std::string>& headers, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        for (std::size_t i = 0; i < headers.size(); ++i) {
            std::string h = headers[i];
            toLower(h);
            if (h == name) return static_cast<int>(i);
        }
    }
    return -1;
}

int resolutionMinutes(std::string r) {
    toLower(r);
    if (r.empty() || r == "1m") return 1;
    if (r == "5m") return 5;
    if (r == "15m") return 15;
    if (r == "30m") return 30;
    if (r == "1h" || r == "1hr" || r == "60m") return 60;
    return 0;
}

// Bucket key "YYYY-MM-DDTHH:MM" of the interval containing the timestamp
std::string periodKey(int year, int month, int day, int hour, int minute, int intervalMinutes) {
    int start = ((hour * 60 + minute) / intervalMinutes) * intervalMinutes;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d", year, month, day, start / 60, start % 60);
    return std::string(buf);
}

} // namespace

DataSource::DataSource(const std::string& filepath) : filepath_(filepath) {}

bool DataSource::load() {
    bars_.clear();
    std::ifstream f(filepath_);
    if (!f.is_open()) return false;

    std::string line;
    if (!std::getline(f, line)) return false;
    // tolerate a UTF-8 BOM in the header
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line = line.substr(3);
    std::vector<std::string> headers = split(line, ',');
    for (auto& h : headers) toLower(h);

    int iDate = findColumn(headers, {"timestamp", "date", "datetime", "time"});
    int iOpen = findColumn(headers, {"open", "o"});
    int iHigh = findColumn(headers, {"high", "h"});
    int iLow = findColumn(headers, {"low", "l"});
    int iClose = findColumn(headers, {"close", "c"});

    if (iDate < 0 || iOpen < 0 || iHigh < 0 || iLow < 0 || iClose < 0)
        return false;

    while (std::getline(f, line)) {
        auto bar = parseLine(line, headers);
        if (!bar) continue;
        bars_.push_back(*bar);
    }

    return true;
}

bool DataSource::aggregateBars(const std::string& resolution) {
    const int intervalMinutes = resolutionMinutes(resolution);
    if (intervalMinutes == 0) return false;
    if (intervalMinutes == 1) return true;

    std::map<std::string, Bar> keyToBar;
    for (const Bar& b : bars_) {
        int y, mo, d, h, mi;
        if (!parseTimestamp(b.timestamp, y, mo, d, h, mi)) continue;
        std::string key = periodKey(y, mo, d, h, mi, intervalMinutes);
        auto it = keyToBar.find(key);
        if (it == keyToBar.end()) {
            Bar agg = b;
            agg.timestamp = key;
            keyToBar[key] = agg;
        } else {
            Bar& agg = it->second;
            if (b.high > agg.high) agg.high = b.high;
            if (b.low < agg.low) agg.low = b.low;
            agg.close = b.close;
            agg.volume += b.volume;
        }
    }
    bars_.clear();
    for (const auto& p : keyToBar)
        bars_.push_back(p.second);
    return true;
}

std::optional<Bar> DataSource::parseLine(const std::string& line,
                                         const std::vector<std::string>& headers) const {
    auto parts = split(line, ',');
    if (parts.size() < 5) return std::nullopt;

    int iDate = findColumn(headers, {"timestamp", "date", "datetime", "time"});
    int iOpen = findColumn(headers, {"open", "o"});
    int iHigh = findColumn(headers, {"high", "h"});
    int iLow = findColumn(headers, {"low", "l"});
    int iClose = findColumn(headers, {"close", "c"});
    int iVol = findColumn(headers, {"volume", "vol", "v"});

    const int needed = std::max({iDate, iOpen, iHigh, iLow, iClose});
    if (needed < 0 || static_cast<std::size_t>(needed) >= parts.size()) return std::nullopt;

    Bar b;
    b.timestamp = parts[static_cast<std::size_t>(iDate)];
    try {
        b.open = std::stod(parts[static_cast<std::size_t>(iOpen)]);
        b.high = std::stod(parts[static_cast<std::size_t>(iHigh)]);
        b.low = std::stod(parts[static_cast<std::size_t>(iLow)]);
        b.close = std::stod(parts[static_cast<std::size_t>(iClose)]);
        if (iVol >= 0 && static_cast<std::size_t>(iVol) < parts.size())
            b.volume = std::stod(parts[static_cast<std::size_t>(iVol)]);
    } catch (...) {
        return std::nullopt;
    }
    if (b.high < b.low) return std::nullopt;
    return b;
}

} // namespace zonetrade
