#include "exchange/error_budget.hpp"

namespace duckdb {

ErrorBudget::ErrorBudget(std::chrono::milliseconds min_error_duration_p,
                         std::chrono::milliseconds max_error_duration_p)
    : min_error_duration(min_error_duration_p), max_error_duration(max_error_duration_p) {
}

void ErrorBudget::StartAttempt(ExchangeClock::time_point now) {
	last_attempt_start = now;
}

void ErrorBudget::Success() {
	error_count = 0;
	first_error_time = ExchangeClock::time_point();
}

bool ErrorBudget::Failure(ExchangeClock::time_point now) {
	++error_count;
	if (error_count == 1) {
		first_error_time = now;
	}
	auto failure_duration = now - first_error_time;
	return failure_duration >= min_error_duration && failure_duration >= max_error_duration;
}

ExchangeClock::time_point ErrorBudget::GetNextAttemptTime() const {
	if (error_count == 0) {
		return last_attempt_start;
	}
	return last_attempt_start + min_error_duration;
}

std::chrono::milliseconds ErrorBudget::GetFailureDuration(ExchangeClock::time_point now) const {
	if (error_count == 0) {
		return std::chrono::milliseconds(0);
	}
	return std::chrono::duration_cast<std::chrono::milliseconds>(now - first_error_time);
}

} // namespace duckdb
