#include "session_clock.hpp"

namespace zonetrade {

long daysFromCivil(int year, int month, int day) {
    year -= month <= 2 ? 1 : 0;
    const long era = (year >= 0 ? year : year - 399) / 400;
    const long yoe = static_cast<long>(year) - era * 400;
    const long doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

bool parseTimestamp(const std::string& ts, int& year, int& month, int& day, int& hour, int& minute) {
    year = month = day = hour = minute = 0;
    std::string s = ts;
    for (auto& c : s) if (c == '_') c = ':';
    std::string datePart, timePart;
    auto tPos = s.find('T');
    auto spPos = s.find(' ');
    if (tPos != std::string::npos) {
        datePart = s.substr(0, tPos);
        timePart = s.substr(tPos + 1);
    } else if (spPos != std::string::npos) {
        datePart = s.substr(0, spPos);
        timePart = s.substr(spPos + 1);
    } else {
        datePart = s;
    }
    if (datePart.size() < 10) return false;
    try {
        year = std::stoi(datePart.substr(0, 4));
        month = std::stoi(datePart.substr(5, 2));
        day = std::stoi(datePart.substr(8, 2));
    } catch (...) { return false; }
    if (month < 1 || month > 12 || day < 1 || day > 31) return false;
    if (!timePart.empty()) {
        auto colon1 = timePart.find(':');
        if (colon1 == std::string::npos) return false;
        try {
            hour = std::stoi(timePart.substr(0, colon1));
            minute = std::stoi(timePart.substr(colon1 + 1, 2));
        } catch (...) { return false; }
        if (hour < 0 || hour > 23 || minute < 0 || minute > 59) return false;
    }
    return true;
}

std::optional<SessionTime> TimestampSessionClock::sessionTime(const Bar& bar) const {
    int y, mo, d, h, mi;
    if (!parseTimestamp(bar.timestamp, y, mo, d, h, mi)) return std::nullopt;

    long total = daysFromCivil(y, mo, d) * 1440L + h * 60L + mi + offset_minutes_;
    long day = total / 1440L;
    long minute = total % 1440L;
    if (minute < 0) {
        minute += 1440L;
        --day;
    }

    SessionTime st;
    st.day_id = day;
    st.minute_of_day = static_cast<int>(minute);
    st.hhmm = static_cast<int>(minute / 60) * 100 + static_cast<int>(minute % 60);
    return st;
}

} // namespace zonetrade
