///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file airport_api_lookup.cpp
 * @brief AirportApiLookup implementation
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "http/airport_api_lookup.h"
#include "common/errors.h"
#include "logging/logger.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdlib>
#include <utility>

namespace FlightBridge {

using nlohmann::json;

namespace {

const char* const ICAO_PLACEHOLDER = "{icao}";

std::optional<double> ReadCoordinate(const json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end()) {
        return std::nullopt;
    }

    if (it->is_number()) {
        const double value = it->get<double>();
        return std::isfinite(value) ? std::optional<double>(value) : std::nullopt;
    }

    if (it->is_string()) {
        const std::string text = it->get<std::string>();
        if (text.empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        const double value = std::strtod(text.c_str(), &end);
        if (end == text.c_str() || *end != '\0' || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    }

    return std::nullopt;
}

} // namespace

AirportInfoResponse ParseAirportInfo(const std::string& body) {
    AirportInfoResponse result;

    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return result;
    }

    result.latitude = ReadCoordinate(doc, "latitude");
    result.longitude = ReadCoordinate(doc, "longitude");
    return result;
}

AirportApiLookup::AirportApiLookup(std::shared_ptr<HttpClient> http, std::string url_template)
    : http_(std::move(http)),
      url_template_(std::move(url_template)) {}

std::string AirportApiLookup::BuildUrl(const std::string& icao) const {
    const std::string escaped = UrlEscape(icao);
    std::string url = url_template_;
    const std::string placeholder = ICAO_PLACEHOLDER;
    size_t pos = 0;
    while ((pos = url.find(placeholder, pos)) != std::string::npos) {
        url.replace(pos, placeholder.size(), escaped);
        pos += escaped.size();
    }
    return url;
}

std::optional<GeoPosition> AirportApiLookup::Lookup(const std::string& icao) {
    if (!http_) {
        return std::nullopt;
    }

    HttpResponse response;
    try {
        response = http_->Get(BuildUrl(icao));
    } catch (const HttpError& ex) {
        LOG_WARN("Airport API request for {} failed: {}", icao, ex.what());
        return std::nullopt;
    }

    if (!response.Ok()) {
        LOG_WARN("Airport API returned HTTP {} for {}", response.status, icao);
        return std::nullopt;
    }

    const AirportInfoResponse info = ParseAirportInfo(response.body);
    if (!info.latitude || !info.longitude) {
        return std::nullopt;
    }
    if (std::fabs(*info.latitude) > 90.0 || std::fabs(*info.longitude) > 180.0) {
        LOG_WARN("Airport API returned out-of-range coordinates for {}", icao);
        return std::nullopt;
    }

    return GeoPosition{*info.latitude, *info.longitude};
}

} // namespace FlightBridge
