#include <chrono>
#include <ctime>
#include <thread>

#include "gtest/gtest.h"

#include "FakeArchive.hpp"
#include "SyncScheduler.hpp"

namespace {
	// raises the cancellation flag from inside the n-th remote study query
	class CancellingDirectory final : public DirectoryService {
	public:
		CancellingDirectory(FakeArchive &archive, std::atomic<bool> &cancel, unsigned int cancel_after)
			: m_archive(archive),
			  m_cancel(cancel),
			  m_cancelAfter(cancel_after) {}

		OFCondition findStudies(const std::string &       date_from,
		                        const std::string &       date_to,
		                        std::vector<StudyRecord> &studies) override {
			if (++m_queries >= m_cancelAfter)
				m_cancel.store(true);
			return m_archive.findStudies(date_from, date_to, studies);
		}

		OFCondition findSeries(const std::string &study_uid, std::vector<SeriesRecord> &series) override {
			return m_archive.findSeries(study_uid, series);
		}

		unsigned int m_queries{0};

	private:
		FakeArchive &      m_archive;
		std::atomic<bool> &m_cancel;
		unsigned int       m_cancelAfter;
	};
}

TEST(SyncScheduler, StopsAfterCancellation) {
	FakeArchive         remote;
	FakeArchive         local;
	std::atomic<bool>   cancel{false};
	CancellingDirectory directory(remote, cancel, 3);
	SyncOptions         options{};

	SyncCycle     cycle(directory, local, remote, options, cancel);
	SyncScheduler scheduler(cycle, options, std::chrono::milliseconds{0}, cancel);
	scheduler.run();

	// the cycle that saw the cancellation still runs to completion
	ASSERT_EQ(3u, directory.m_queries);
	ASSERT_EQ(3u, scheduler.totals().m_cycles);
	ASSERT_EQ(0u, scheduler.totals().m_failed_cycles);
}

TEST(SyncScheduler, FailedCyclesDoNotStopLoop) {
	FakeArchive         remote;
	FakeArchive         local;
	std::atomic<bool>   cancel{false};
	CancellingDirectory directory(remote, cancel, 4);
	SyncOptions         options{};
	remote.m_failStudyQuery = true;

	SyncCycle     cycle(directory, local, remote, options, cancel);
	SyncScheduler scheduler(cycle, options, std::chrono::milliseconds{0}, cancel);
	scheduler.run();

	ASSERT_EQ(4u, scheduler.totals().m_cycles);
	ASSERT_EQ(4u, scheduler.totals().m_failed_cycles);
}

TEST(SyncScheduler, CancellationInterruptsPause) {
	FakeArchive       remote;
	FakeArchive       local;
	std::atomic<bool> cancel{false};
	SyncOptions       options{};

	SyncCycle     cycle(remote, local, remote, options, cancel);
	SyncScheduler scheduler(cycle, options, std::chrono::milliseconds{60000}, cancel);

	std::thread interrupter([&cancel] {
		std::this_thread::sleep_for(std::chrono::milliseconds{300});
		cancel.store(true);
	});

	const auto start = std::chrono::steady_clock::now();
	scheduler.run();
	const auto elapsed = std::chrono::steady_clock::now() - start;
	interrupter.join();

	ASSERT_EQ(1u, scheduler.totals().m_cycles);
	ASSERT_LT(elapsed, std::chrono::seconds{10});
}

TEST(SyncScheduler, RunOnceAccumulatesTotals) {
	FakeArchive       remote;
	FakeArchive       local;
	std::atomic<bool> cancel{false};
	SyncOptions       options{};
	options.m_policy.m_mode = SelectionMode::All;
	remote.m_destination    = &local;

	const auto now = SyncClock::now();
	const auto tt  = SyncClock::to_time_t(now - std::chrono::minutes{30});
	std::tm    tm  = *std::localtime(&tt);
	char       date[9];
	char       time[7];
	std::strftime(date, sizeof(date), "%Y%m%d", &tm);
	std::strftime(time, sizeof(time), "%H%M%S", &tm);
	remote.addStudy(FakeArchive::study("1.1", date, time),
	                {FakeArchive::series("1.1.1", "1.1", 1, 4), FakeArchive::series("1.1.2", "1.1", 2, 6)});

	SyncCycle     cycle(remote, local, remote, options, cancel);
	SyncScheduler scheduler(cycle, options, std::chrono::milliseconds{0}, cancel);

	const SyncCycleStats first = scheduler.runOnce();
	ASSERT_EQ(1u, first.m_cycle);
	ASSERT_EQ(2u, first.m_series_transferred);

	const SyncCycleStats second = scheduler.runOnce();
	ASSERT_EQ(2u, second.m_cycle);
	ASSERT_EQ(0u, second.m_series_transferred);

	ASSERT_EQ(2u, scheduler.totals().m_cycles);
	ASSERT_EQ(2u, scheduler.totals().m_series_transferred);
	ASSERT_EQ(10u, scheduler.totals().m_images_transferred);
}
