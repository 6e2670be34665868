///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file flight_store.h
 * @brief Persistence sink for completed flights and its REST implementation
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "flight/flight_record.h"
#include "http/http_client.h"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace FlightBridge {

class FlightStore {
public:
    virtual ~FlightStore() = default;

    /// @return true when the record was accepted by the backend
    virtual bool Save(const FlightRecord& record) = 0;

    /// Credential of the signed-in viewer; nullopt on logout
    virtual void SetUserToken(std::optional<std::string> token) = 0;
};

/// snake_case request body; absent optionals are omitted, times are ISO-8601 UTC
std::string BuildFlightRecordJSON(const FlightRecord& record);

/**
 * @brief POSTs records to {base}/rest/v1/flights.
 *
 * The Authorization bearer is the user token when one is set, otherwise the
 * API key.
 */
class RestFlightStore : public FlightStore {
public:
    RestFlightStore(std::shared_ptr<HttpClient> http, std::string base_url, std::string api_key);

    bool Save(const FlightRecord& record) override;
    void SetUserToken(std::optional<std::string> token) override;

    std::string Endpoint() const;

private:
    HttpHeaders BuildHeaders() const;

    std::shared_ptr<HttpClient> http_;
    std::string base_url_;
    std::string api_key_;

    mutable std::mutex token_mutex_;
    std::optional<std::string> user_token_;
};

} // namespace FlightBridge
