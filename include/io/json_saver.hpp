#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "format/draw_format.hpp"

namespace gifdraw {

// {"frames": [[command...]...], "metadata": {...}} with keys in output order.
nlohmann::ordered_json to_json(const ConversionResult& result);

// Write to_json(result) with 2-space indent. Throws std::runtime_error on I/O failure.
void save_json(const std::string& path, const ConversionResult& result);

} // namespace gifdraw
