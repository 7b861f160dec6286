#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace asyncquery::service {

/*
  Wraps one service call in a span plus request count and latency metrics.
  Failures are logged and rethrown for the transport layer to translate.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject_key, std::string_view subject, Fn&& fn) {
  asyncquery::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute(subject_key, subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto record     = [&](bool success) {
    asyncquery::observability::Metrics::Instance().RecordRequest(route, success);
    asyncquery::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      record(true);
      return;
    } else {
      auto result = fn();
      record(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    ASYNCQUERY_LOG_ERROR("RPC failed", {asyncquery::observability::StringField("route", route), asyncquery::observability::StringField("error", ex.what()),
                                        asyncquery::observability::StringField(subject_key, subject)});
    record(false);
    throw;
  }
}

} // namespace asyncquery::service
