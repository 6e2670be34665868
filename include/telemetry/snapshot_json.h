///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file snapshot_json.h
 * @brief Telemetry snapshot wire format
 *
 * The snapshot message is a flat object with camelCase keys and no "type"
 * field; clients tell it apart from other messages by that absence. Absent
 * strings are omitted rather than sent as null.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "telemetry/snapshot.h"

#include <optional>
#include <string>

namespace FlightBridge {

/// Snapshot message with "connected":true and the session code if any
std::string BuildSnapshotJSON(const Snapshot& snapshot, const std::optional<std::string>& session_code);

/// Placeholder sent to late joiners before telemetry flows: {"connected":false,"sessionCode":...}
std::string BuildDisconnectedJSON(const std::optional<std::string>& session_code);

/**
 * @brief Parse the same format back into a Snapshot (replay files).
 *
 * Missing keys keep their defaults; an optional "timestamp" in Unix
 * milliseconds sets captured_at. Returns nullopt for malformed JSON, a
 * non-object document, an integer field that does not fit an int, or a
 * timestamp the clock cannot represent.
 */
std::optional<Snapshot> ParseSnapshotJSON(const std::string& text);

} // namespace FlightBridge
