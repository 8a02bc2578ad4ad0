#include "data/bar_table.hpp"
#include "core/errors.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace data {

namespace {

std::string trim_lower(std::string s){
    auto not_space = [](unsigned char c){ return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

std::vector<std::string> split(const std::string& line){
    std::vector<std::string> out;
    std::stringstream ss(line);
    std::string x;
    while (std::getline(ss, x, ',')) out.push_back(x);
    if (!line.empty() && line.back() == ',') out.emplace_back();
    return out;
}

// Howard Hinnant days_from_civil
std::int64_t days_from_civil(int y, unsigned m, unsigned d){
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153*(m + (m > 2 ? -3 : 9)) + 2)/5 + d - 1;
    const unsigned doe = yoe * 365 + yoe/4 - yoe/100 + doy;
    return static_cast<std::int64_t>(era) * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

double parse_number(const std::string& field, const char* column, std::size_t line_no){
    const std::string f = trim_lower(field);
    char* end = nullptr;
    const double v = std::strtod(f.c_str(), &end);
    if (f.empty() || end != f.c_str() + f.size())
        throw core::SchemaError(fmt::format("line {}: column '{}' is not a number: '{}'", line_no, column, field));
    return v;
}

} // namespace

std::int64_t parse_timestamp_ms(const std::string& field){
    const std::string f = trim_lower(field);
    if (f.empty()) throw core::SchemaError("empty timestamp");

    if (f.find('-') == std::string::npos || f.front() == '-') {
        char* end = nullptr;
        const long long v = std::strtoll(f.c_str(), &end, 10);
        if (end != f.c_str() + f.size()) throw core::SchemaError(fmt::format("bad timestamp '{}'", field));
        // 1e11 alatt másodpercnek vesszük
        return (std::llabs(v) < 100'000'000'000LL) ? v * 1000 : v;
    }

    int y=0, mo=0, d=0, h=0, mi=0, s=0;
    const int n = std::sscanf(f.c_str(), "%d-%d-%d%*[ t]%d:%d:%d", &y, &mo, &d, &h, &mi, &s);
    if (n < 3 || mo < 1 || mo > 12 || d < 1 || d > 31 || h < 0 || h > 23 || mi < 0 || mi > 59 || s < 0 || s > 60)
        throw core::SchemaError(fmt::format("bad timestamp '{}'", field));
    const std::int64_t days = days_from_civil(y, static_cast<unsigned>(mo), static_cast<unsigned>(d));
    return ((days * 24 + h) * 60 + mi) * 60'000LL + s * 1000LL;
}

core::BarSeries load_bars_csv(const std::string& path){
    std::ifstream f(path);
    if (!f.good()) throw core::SchemaError(fmt::format("cannot open '{}'", path));

    std::string line;
    if (!std::getline(f, line)) throw core::SchemaError(fmt::format("'{}' is empty", path));

    // fejléc -> oszlop index
    int c_time=-1, c_open=-1, c_high=-1, c_low=-1, c_close=-1, c_vol=-1;
    const auto header = split(line);
    for (int i=0; i<(int)header.size(); ++i) {
        const auto h = trim_lower(header[i]);
        if (h=="time" || h=="timestamp" || h=="date" || h=="datetime" || h=="open_time") c_time = i;
        else if (h=="open")   c_open = i;
        else if (h=="high")   c_high = i;
        else if (h=="low")    c_low = i;
        else if (h=="close")  c_close = i;
        else if (h=="volume") c_vol = i;
    }
    std::vector<std::string> missing;
    if (c_time  < 0) missing.emplace_back("time");
    if (c_open  < 0) missing.emplace_back("open");
    if (c_high  < 0) missing.emplace_back("high");
    if (c_low   < 0) missing.emplace_back("low");
    if (c_close < 0) missing.emplace_back("close");
    if (!missing.empty())
        throw core::SchemaError(fmt::format("'{}': missing required column(s): {}", path, fmt::join(missing, ", ")));

    const int need = std::max({c_time, c_open, c_high, c_low, c_close, c_vol}) + 1;
    core::BarSeries out;
    std::size_t line_no = 1;
    while (std::getline(f, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        const auto cols = split(line);
        if ((int)cols.size() < need)
            throw core::SchemaError(fmt::format("'{}' line {}: expected {} fields, got {}", path, line_no, need, cols.size()));
        core::Bar b;
        b.open_time_ms = parse_timestamp_ms(cols[c_time]);
        b.open  = parse_number(cols[c_open],  "open",  line_no);
        b.high  = parse_number(cols[c_high],  "high",  line_no);
        b.low   = parse_number(cols[c_low],   "low",   line_no);
        b.close = parse_number(cols[c_close], "close", line_no);
        if (c_vol >= 0 && !trim_lower(cols[c_vol]).empty()) b.volume = parse_number(cols[c_vol], "volume", line_no);
        out.push_back(b);
    }
    spdlog::info("loaded {} bars from {}", out.size(), path);
    validate_bars(out);
    return out;
}

void validate_bars(const core::BarSeries& bars){
    for (std::size_t i=0; i<bars.size(); ++i) {
        const auto& b = bars[i];
        if (!std::isfinite(b.open) || !std::isfinite(b.high) || !std::isfinite(b.low) || !std::isfinite(b.close))
            throw core::SchemaError(fmt::format("bar {}: missing or non-finite OHLC value", i));
        if (b.high < b.low)
            throw core::SchemaError(fmt::format("bar {}: high {} < low {}", i, b.high, b.low));
        if (i > 0 && b.open_time_ms <= bars[i-1].open_time_ms)
            throw core::SchemaError(fmt::format("bar {}: timestamp {} not after previous {}",
                                                i, b.open_time_ms, bars[i-1].open_time_ms));
    }
}

} // namespace data
