#pragma once

#include "duckdb/common/string.hpp"
#include "duckdb/common/typedefs.hpp"
#include "duckdb/common/vector.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <thread>

namespace duckdb {

// Tasks submitted without a group are never dropped by CancelGroup().
inline constexpr idx_t NO_TASK_GROUP = 0;

struct TaskExecutorStats {
	idx_t thread_count = 0;
	// Tasks waiting to run, delayed tasks included.
	idx_t queued_tasks = 0;
	idx_t active_tasks = 0;
	idx_t completed_tasks = 0;
	// Tasks dropped by CancelGroup() or ShutdownNow() before they ran.
	idx_t cancelled_tasks = 0;
};

// Fixed-size worker pool with delayed tasks.
//
// Concurrency is bounded by the thread count regardless of how many tasks are queued. Tasks carry an
// optional group so that an owner can drop everything it queued. Tasks must not throw.
class TaskExecutor {
public:
	TaskExecutor(string name_p, idx_t thread_count);
	// Drops queued tasks and joins the workers.
	~TaskExecutor();

	TaskExecutor(const TaskExecutor &) = delete;
	TaskExecutor &operator=(const TaskExecutor &) = delete;

	// Returns false and drops the task once the executor is shut down.
	bool Execute(std::function<void()> task, idx_t group = NO_TASK_GROUP);

	// Run `task` no sooner than `delay` from now.
	bool Schedule(std::chrono::milliseconds delay, std::function<void()> task, idx_t group = NO_TASK_GROUP);

	// Allocate a group id for CancelGroup().
	idx_t NewTaskGroup();

	// Drop queued tasks of `group`. Tasks already running are not interrupted.
	// Returns the number of dropped tasks.
	idx_t CancelGroup(idx_t group);

	// Drop every queued task and stop the workers without waiting for running tasks.
	void ShutdownNow();

	bool IsShutdown() const;

	TaskExecutorStats GetStats() const;

	const string &GetName() const {
		return name;
	}

private:
	struct State;
	static void WorkerLoop(std::shared_ptr<State> state);

	string name;
	std::shared_ptr<State> state;
	vector<std::thread> workers;
};

} // namespace duckdb
