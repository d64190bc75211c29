#include "events/event_model.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

TEST_CASE("EventType maps to stable string values", "[core][events][json]") {
  using photoncount::events::EventType;
  using photoncount::events::ToJson;
  REQUIRE(ToJson(EventType::kSessionStarted) == "SESSION_STARTED");
  REQUIRE(ToJson(EventType::kCameraConnected) == "CAMERA_CONNECTED");
  REQUIRE(ToJson(EventType::kExposureConfigured) == "EXPOSURE_CONFIGURED");
  REQUIRE(ToJson(EventType::kAcquisitionStarted) == "ACQUISITION_STARTED");
  REQUIRE(ToJson(EventType::kCalibrationComplete) == "CALIBRATION_COMPLETE");
  REQUIRE(ToJson(EventType::kFrameFailed) == "FRAME_FAILED");
  REQUIRE(ToJson(EventType::kAcquisitionStopped) == "ACQUISITION_STOPPED");
  REQUIRE(ToJson(EventType::kSessionStopped) == "SESSION_STOPPED");
  REQUIRE(ToJson(EventType::kWarning) == "warning");
  REQUIRE(ToJson(EventType::kError) == "error");
}

TEST_CASE("Event JSON serialization includes timestamp type and payload", "[core][events][json]") {
  photoncount::events::Event event;
  event.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(2'000));
  event.type = photoncount::events::EventType::kSessionStarted;
  event.payload = {
      {"backend", "sim"},
      {"session_id", "session-2000"},
  };

  const std::string json = photoncount::events::ToJson(event);
  REQUIRE(
      json ==
      R"({"ts_utc":"1970-01-01T00:00:02.000Z","type":"SESSION_STARTED","payload":{"backend":"sim","session_id":"session-2000"}})");
}

TEST_CASE("Event payload values are JSON-escaped", "[core][events][json]") {
  photoncount::events::Event event;
  event.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(0));
  event.type = photoncount::events::EventType::kFrameFailed;
  event.payload = {{"error", "bad \"quote\"\nline"}};

  const std::string json = photoncount::events::ToJson(event);
  REQUIRE(json.find(R"("error":"bad \"quote\"\nline")") != std::string::npos);
}
