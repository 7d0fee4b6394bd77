#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

namespace riskledger {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions that turn ITimeProvider epoch milliseconds into
//         trading days and printable dates.
//
// @details
// A "trading day" is the UTC calendar day (days since 1970-01-01). RiskGate
// compares tradingDay(now) against the day its counters were last reset;
// a different value means the counters belong to a previous session.
//
// All functions are inline and stateless — safe from any thread.
// -----------------------------------------------------------------------------

inline constexpr std::int64_t kMillisPerDay = 86'400'000;

// -------------------------------------------------------------------------
// tradingDay
// -------------------------------------------------------------------------
// @brief  Days since the epoch for the given epoch milliseconds. Floors
//         toward negative infinity so pre-epoch times map consistently.
// -------------------------------------------------------------------------
inline std::int64_t tradingDay(std::int64_t epoch_ms) {
  std::int64_t day = epoch_ms / kMillisPerDay;
  if (epoch_ms % kMillisPerDay < 0) {
    --day;
  }
  return day;
}

// -------------------------------------------------------------------------
// formatDay
// -------------------------------------------------------------------------
// @brief  Renders a day number as "YYYY-MM-DD" (proleptic Gregorian).
//
// @details
// Howard Hinnant's civil_from_days algorithm; exact for every int64 day
// that fits a 32-bit year.
// -------------------------------------------------------------------------
inline std::string formatDay(std::int64_t day) {
  std::int64_t z = day + 719468;
  std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  std::int64_t doe = z - era * 146097;
  std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  std::int64_t y = yoe + era * 400;
  std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  std::int64_t mp = (5 * doy + 2) / 153;
  std::int64_t d = doy - (153 * mp + 2) / 5 + 1;
  std::int64_t m = mp < 10 ? mp + 3 : mp - 9;
  if (m <= 2) {
    ++y;
  }

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04lld-%02lld-%02lld",
                static_cast<long long>(y), static_cast<long long>(m),
                static_cast<long long>(d));
  return buf;
}

// -------------------------------------------------------------------------
// formatTimestamp
// -------------------------------------------------------------------------
// @brief  Renders epoch milliseconds as "YYYY-MM-DDTHH:MM:SS.mmmZ".
// -------------------------------------------------------------------------
inline std::string formatTimestamp(std::int64_t epoch_ms) {
  std::int64_t day = tradingDay(epoch_ms);
  std::int64_t in_day = epoch_ms - day * kMillisPerDay;

  char buf[32];
  std::snprintf(buf, sizeof(buf), "T%02lld:%02lld:%02lld.%03lldZ",
                static_cast<long long>(in_day / 3'600'000),
                static_cast<long long>((in_day / 60'000) % 60),
                static_cast<long long>((in_day / 1000) % 60),
                static_cast<long long>(in_day % 1000));
  return formatDay(day) + buf;
}

}  // namespace riskledger
