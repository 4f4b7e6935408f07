#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

#include "compressor.hpp"
#include "parallel.hpp"
#include "test_util.hpp"

namespace {

	// Starts `allowed` threads, then fails the way std::thread does when the
	// system is out of threads.
	ThreadSpawner limited_spawner(std::atomic<int>& spawned, int allowed) {
		return [&spawned, allowed](std::function<void()> task) {
			if (spawned.load() >= allowed)
				throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
					"thread limit");
			++spawned;
			return std::thread(std::move(task));
		};
	}

} // namespace

TEST(Parallel, ResolvesThreadCount) {
	EXPECT_EQ(resolve_thread_count(3), 3);
	EXPECT_GE(resolve_thread_count(0), 1);
	EXPECT_GE(resolve_thread_count(-2), 1);
}

TEST(Parallel, VisitsEveryIndexOnce) {
	std::vector<int> hits(1000, 0);
	parallel_for(hits.size(), 7, [&hits](size_t i) { ++hits[i]; });
	for (size_t i = 0; i < hits.size(); ++i) ASSERT_EQ(hits[i], 1) << "index " << i;
}

TEST(Parallel, RunsUnstartedChunksInlineWhenSpawnFails) {
	for (int allowed : {0, 1, 3}) {
		std::atomic<int> spawned(0);
		std::vector<int> hits(500, 0);
		EXPECT_NO_THROW(parallel_for(hits.size(), 8, [&hits](size_t i) { ++hits[i]; },
			limited_spawner(spawned, allowed)));
		EXPECT_EQ(spawned.load(), allowed);
		for (size_t i = 0; i < hits.size(); ++i) ASSERT_EQ(hits[i], 1) << "allowed " << allowed << " index " << i;
	}
}

TEST(Parallel, WorkerErrorSurvivesSpawnFailure) {
	std::atomic<int> spawned(0);
	EXPECT_THROW(parallel_for(64, 4, [](size_t i) {
		if (i == 63) throw std::runtime_error("block failed");
	}, limited_spawner(spawned, 2)), std::runtime_error);
	EXPECT_EQ(spawned.load(), 2);
}

TEST(Parallel, ExcessiveThreadRequestStillCompresses) {
	const ImageRGBA in = color_noise_image(40, 40, 9);
	CompressOptions many;
	many.threads = 100000;
	EXPECT_EQ(compress_image(in, 0.5f, many).pixels, compress_image(in, 0.5f).pixels);
}
