#include "exchange/task_executor.hpp"

#include "duckdb/common/exception.hpp"

#include <condition_variable>
#include <map>
#include <mutex>
#include <utility>

namespace duckdb {

using TaskClock = std::chrono::steady_clock;

struct TaskExecutor::State {
	struct PendingTask {
		idx_t group;
		std::function<void()> task;
	};

	mutable std::mutex mu;
	std::condition_variable cv;
	// Ordered by due time, then by submission order.
	std::map<std::pair<TaskClock::time_point, idx_t>, PendingTask> pending;
	idx_t next_sequence = 0;
	idx_t next_group = NO_TASK_GROUP + 1;
	bool shutdown = false;

	idx_t thread_count = 0;
	idx_t active_tasks = 0;
	idx_t completed_tasks = 0;
	idx_t cancelled_tasks = 0;
};

TaskExecutor::TaskExecutor(string name_p, idx_t thread_count) : name(std::move(name_p)) {
	if (thread_count == 0) {
		throw InvalidInputException("Executor '%s' needs at least one thread", name);
	}
	state = std::make_shared<State>();
	state->thread_count = thread_count;
	workers.reserve(thread_count);
	for (idx_t idx = 0; idx < thread_count; ++idx) {
		workers.emplace_back(WorkerLoop, state);
	}
}

TaskExecutor::~TaskExecutor() {
	ShutdownNow();
	for (auto &worker : workers) {
		// The last owner may be released by one of our own tasks.
		if (worker.get_id() == std::this_thread::get_id()) {
			worker.detach();
			continue;
		}
		if (worker.joinable()) {
			worker.join();
		}
	}
}

void TaskExecutor::WorkerLoop(std::shared_ptr<State> state) {
	std::unique_lock<std::mutex> lock(state->mu);
	while (!state->shutdown) {
		if (state->pending.empty()) {
			state->cv.wait(lock);
			continue;
		}
		auto iter = state->pending.begin();
		auto due = iter->first.first;
		if (due > TaskClock::now()) {
			state->cv.wait_until(lock, due);
			continue;
		}
		auto task = std::move(iter->second.task);
		state->pending.erase(iter);
		++state->active_tasks;
		lock.unlock();

		task();
		// Captured state is released outside of the lock, it may own the executor.
		task = nullptr;

		lock.lock();
		--state->active_tasks;
		++state->completed_tasks;
	}
}

bool TaskExecutor::Execute(std::function<void()> task, idx_t group) {
	return Schedule(std::chrono::milliseconds(0), std::move(task), group);
}

bool TaskExecutor::Schedule(std::chrono::milliseconds delay, std::function<void()> task, idx_t group) {
	auto due = TaskClock::now() + delay;
	{
		std::lock_guard<std::mutex> lck(state->mu);
		if (state->shutdown) {
			return false;
		}
		auto key = std::make_pair(due, state->next_sequence++);
		state->pending.emplace(key, State::PendingTask {group, std::move(task)});
	}
	state->cv.notify_one();
	return true;
}

idx_t TaskExecutor::NewTaskGroup() {
	std::lock_guard<std::mutex> lck(state->mu);
	return state->next_group++;
}

idx_t TaskExecutor::CancelGroup(idx_t group) {
	if (group == NO_TASK_GROUP) {
		return 0;
	}
	vector<std::function<void()>> dropped;
	{
		std::lock_guard<std::mutex> lck(state->mu);
		for (auto iter = state->pending.begin(); iter != state->pending.end();) {
			if (iter->second.group != group) {
				++iter;
				continue;
			}
			dropped.emplace_back(std::move(iter->second.task));
			iter = state->pending.erase(iter);
		}
		state->cancelled_tasks += dropped.size();
	}
	return dropped.size();
}

void TaskExecutor::ShutdownNow() {
	std::map<std::pair<TaskClock::time_point, idx_t>, State::PendingTask> dropped;
	{
		std::lock_guard<std::mutex> lck(state->mu);
		if (state->shutdown) {
			return;
		}
		state->shutdown = true;
		state->cancelled_tasks += state->pending.size();
		dropped.swap(state->pending);
	}
	state->cv.notify_all();
}

bool TaskExecutor::IsShutdown() const {
	std::lock_guard<std::mutex> lck(state->mu);
	return state->shutdown;
}

TaskExecutorStats TaskExecutor::GetStats() const {
	std::lock_guard<std::mutex> lck(state->mu);
	TaskExecutorStats stats;
	stats.thread_count = state->thread_count;
	stats.queued_tasks = state->pending.size();
	stats.active_tasks = state->active_tasks;
	stats.completed_tasks = state->completed_tasks;
	stats.cancelled_tasks = state->cancelled_tasks;
	return stats;
}

} // namespace duckdb
