#pragma once
#include <string>
#include "core/types.hpp"

namespace data {

// CSV bar tábla betöltése. Fejléc kötelező, oszlopsorrend tetszőleges
// (kis/nagybetű mindegy): time|timestamp|date|open_time, open, high, low, close,
// opcionálisan volume. Az idő epoch ms, epoch s, vagy YYYY-MM-DD[ HH:MM[:SS]] (UTC).
// Hiányzó oszlop, nem szám mező -> core::SchemaError.
core::BarSeries load_bars_csv(const std::string& path);

// Egy már beolvasott sor idő mezője epoch ms-ként
std::int64_t parse_timestamp_ms(const std::string& field);

// Szigorúan növekvő idő, véges OHLC, high >= low. Hibánál core::SchemaError.
void validate_bars(const core::BarSeries& bars);

} // namespace data
