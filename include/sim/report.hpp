#pragma once
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>
#include "sim/batch_runner.hpp"
#include "sim/optimizer.hpp"

namespace sim {

// JSON kimenet a charting / dashboard oldalnak. Nem véges szám -> null.
nlohmann::json to_json(const Stats& s);
nlohmann::json to_json(const exec::Trade& t);
nlohmann::json to_json(const std::vector<EquityPoint>& equity);
nlohmann::json to_json(const strategy::SignalRow& r, const std::optional<double>& chikou);
nlohmann::json to_json(const RunOutput& run, int kijun);
nlohmann::json to_json(const std::vector<SummaryRow>& summary);
nlohmann::json to_json(const SymbolOutcome& o);
nlohmann::json to_json(const OptimizeResult& r);

} // namespace sim
