#pragma once

#include <random>
#include <sstream>
#include <string>

#include "../http_session.hpp"
#include "TargetDefaults.h"

// Request builders for the routes of the target service.
namespace target_requests
{
  inline RequestSpec health() {
      return RequestSpec::Get(target_defaults::kHealthPath);
  }

  inline RequestSpec user(int id) {
      return RequestSpec::Get("/user/" + std::to_string(id));
  }

  inline std::string operands(double a, double b) {
      std::ostringstream ss;
      ss << "{\"a\": " << a << ", \"b\": " << b << "}";
      return ss.str();
  }

  inline RequestSpec add(double a, double b) {
      return RequestSpec::PostJson("/calculate/add", operands(a, b));
  }

  inline RequestSpec divide(double a, double b, Expectation expect = Expectation::Success) {
      return RequestSpec::PostJson("/calculate/divide", operands(a, b), expect);
  }

  inline RequestSpec slow() {
      return RequestSpec::Get("/simulate/slow");
  }

  inline RequestSpec simulated_error() {
      return RequestSpec::Get("/simulate/error", Expectation::Error);
  }
}
