#pragma once

// Defaults shared by the load generator and the bundled target service.
namespace target_defaults
{
  constexpr int kPort = 8080;
  constexpr const char* kBaseUrl = "http://localhost:8080";
  constexpr const char* kHealthPath = "/health";

  // Simulated work on the target side
  constexpr int kSlowRouteMs = 2000;
  constexpr int kUserLookupMs = 100;
}
