#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <utility>
#include <thread>
#include <vector>

// 0 means "one worker per hardware thread"; never returns less than 1.
inline int resolve_thread_count(int requested) {
	if (requested > 0) return requested;
	const unsigned hw = std::thread::hardware_concurrency();
	return hw == 0 ? 1 : (int)hw;
}

// Starts a worker thread. Replaceable so callers can limit how threads are
// created; an empty spawner means plain std::thread.
using ThreadSpawner = std::function<std::thread(std::function<void()>)>;

/*
 Runs fn(i) for every i in [0, count), splitting the range into contiguous
 chunks over up to `threads` workers. fn must only touch state owned by index
 i. The first exception thrown by any worker is rethrown here after all
 workers have joined.

 If the system refuses to start a worker, the chunks that have no thread run
 on the calling thread instead; every started worker is still joined.
 */
inline void parallel_for(size_t count, int threads, const std::function<void(size_t)>& fn,
	const ThreadSpawner& spawn = ThreadSpawner()) {
	const size_t workers = std::min(count, (size_t)resolve_thread_count(threads));
	if (workers <= 1) {
		for (size_t i = 0; i < count; ++i) fn(i);
		return;
	}

	std::vector<std::exception_ptr> errors(workers);
	const size_t chunk = (count + workers - 1) / workers;
	auto run_chunk = [&fn, &errors, chunk, count](size_t w) {
		const size_t begin = w * chunk;
		const size_t end = std::min(count, begin + chunk);
		try {
			for (size_t i = begin; i < end; ++i) fn(i);
		}
		catch (...) {
			errors[w] = std::current_exception();
		}
	};

	std::vector<std::thread> pool;
	pool.reserve(workers);
	size_t started = 0;
	try {
		for (; started < workers; ++started) {
			std::function<void()> task = [&run_chunk, started]() { run_chunk(started); };
			if (spawn) pool.push_back(spawn(std::move(task)));
			else pool.emplace_back(std::move(task));
		}
	}
	catch (const std::exception&) {
		// out of threads: chunks [started, workers) fall through to the loop below
	}
	for (size_t w = started; w < workers; ++w) run_chunk(w);
	for (std::thread& t : pool) t.join();

	for (const std::exception_ptr& e : errors)
		if (e) std::rethrow_exception(e);
}
