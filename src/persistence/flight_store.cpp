///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file flight_store.cpp
 * @brief RestFlightStore implementation
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "persistence/flight_store.h"
#include "common/errors.h"
#include "logging/logger.h"
#include "util/time_format.h"

#include <nlohmann/json.hpp>

#include <utility>

namespace FlightBridge {

using nlohmann::json;

namespace {

void SetIfPresent(json& target, const char* key, const std::optional<std::string>& value) {
    if (value) {
        target[key] = *value;
    }
}

} // namespace

std::string BuildFlightRecordJSON(const FlightRecord& record) {
    json body = json::object();
    SetIfPresent(body, "user_id", record.user_id);
    SetIfPresent(body, "origin", record.origin);
    SetIfPresent(body, "destination", record.destination);
    SetIfPresent(body, "aircraft_type", record.aircraft_type);
    body["departure_time"] = FormatIso8601Utc(record.departure_time);
    body["arrival_time"] = FormatIso8601Utc(record.arrival_time);
    body["flight_duration_seconds"] = record.flight_duration_seconds;
    body["distance_nm"] = record.distance_nm;
    body["max_altitude_ft"] = record.max_altitude_ft;
    body["landing_rating"] = record.landing_rating;
    body["landing_vs"] = record.landing_vs;
    body["landing_gforce"] = record.landing_gforce;
    SetIfPresent(body, "session_code", record.session_code);
    body["score"] = record.score;
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

RestFlightStore::RestFlightStore(std::shared_ptr<HttpClient> http, std::string base_url, std::string api_key)
    : http_(std::move(http)),
      base_url_(std::move(base_url)),
      api_key_(std::move(api_key)) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string RestFlightStore::Endpoint() const {
    return base_url_ + "/rest/v1/flights";
}

void RestFlightStore::SetUserToken(std::optional<std::string> token) {
    if (token && token->empty()) {
        token.reset();
    }
    std::lock_guard<std::mutex> lock(token_mutex_);
    user_token_ = std::move(token);
    LOG_DEBUG("Flight store user token {}", user_token_ ? "set" : "cleared");
}

HttpHeaders RestFlightStore::BuildHeaders() const {
    std::string bearer;
    {
        std::lock_guard<std::mutex> lock(token_mutex_);
        bearer = user_token_ ? *user_token_ : api_key_;
    }

    return HttpHeaders{
        {"Content-Type", "application/json"},
        {"apikey", api_key_},
        {"Authorization", "Bearer " + bearer},
        {"Prefer", "return=representation"},
    };
}

bool RestFlightStore::Save(const FlightRecord& record) {
    if (!http_) {
        return false;
    }

    HttpResponse response;
    try {
        response = http_->Post(Endpoint(), BuildFlightRecordJSON(record), BuildHeaders());
    } catch (const HttpError& ex) {
        LOG_ERROR("Saving flight failed: {}", ex.what());
        return false;
    }

    if (!response.Ok()) {
        LOG_ERROR("Saving flight failed: HTTP {} {}", response.status, response.body);
        return false;
    }

    LOG_INFO("Flight saved: {} -> {}", record.origin.value_or("?"), record.destination.value_or("?"));
    return true;
}

} // namespace FlightBridge
