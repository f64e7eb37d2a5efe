#pragma once

#include "duckdb/common/typedefs.hpp"

#include <chrono>

namespace duckdb {

using ExchangeClock = std::chrono::steady_clock;

// Duration-bounded backoff for one remote source.
//
// The first failure opens a failure streak. While the streak lasts, an attempt may only start
// `min_error_duration` after the previous attempt started. Once the streak lasted `max_error_duration`
// the budget is exhausted. Any success closes the streak.
class ErrorBudget {
public:
	ErrorBudget(std::chrono::milliseconds min_error_duration_p, std::chrono::milliseconds max_error_duration_p);

	void StartAttempt(ExchangeClock::time_point now);

	void Success();

	// Records a failed attempt. Returns true once the failure streak exhausted the budget.
	bool Failure(ExchangeClock::time_point now);

	// Earliest time the next attempt may start.
	ExchangeClock::time_point GetNextAttemptTime() const;

	bool InFailureStreak() const {
		return error_count > 0;
	}
	idx_t GetErrorCount() const {
		return error_count;
	}
	// Zero outside a failure streak.
	std::chrono::milliseconds GetFailureDuration(ExchangeClock::time_point now) const;

private:
	const std::chrono::milliseconds min_error_duration;
	const std::chrono::milliseconds max_error_duration;

	idx_t error_count = 0;
	ExchangeClock::time_point first_error_time;
	ExchangeClock::time_point last_attempt_start;
};

} // namespace duckdb
