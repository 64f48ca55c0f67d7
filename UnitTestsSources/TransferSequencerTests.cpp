#include "gtest/gtest.h"

#include "fmt/format.h"

#include "FakeArchive.hpp"
#include "TransferSequencer.hpp"

namespace {
	class RecordingCallback final : public TransferCallback {
	public:
		std::vector<std::size_t> m_started;
		std::vector<std::size_t> m_finished;
		std::size_t              m_total{0};

		void transferStarted(const TransferProgressEvent &event) override {
			m_started.push_back(event.m_index);
			m_total = event.m_total;
		}

		void transferFinished(const TransferProgressEvent &event) override {
			m_finished.push_back(event.m_index);
		}
	};

	class TransferSequencerTest : public ::testing::Test {
	protected:
		void SetUp() override {
			const auto study = FakeArchive::study("1.1", "20250115", "100000");
			std::vector<SeriesRecord> series;
			for (int i = 1; i <= 4; ++i) {
				series.push_back(FakeArchive::series(fmt::format("1.1.{}", i), "1.1", i, 10u * i));

				TransferJob job{};
				job.m_study  = study;
				job.m_series = series.back();
				m_jobs.push_back(job);
			}
			m_remote.addStudy(study, series);
			m_remote.m_destination = &m_local;
		}

		FakeArchive              m_remote;
		FakeArchive              m_local;
		std::atomic<bool>        m_cancel{false};
		std::vector<TransferJob> m_jobs;
	};
}

TEST_F(TransferSequencerTest, FailureDoesNotStopBatch) {
	m_remote.m_failingMoves.insert("1.1.2");

	RecordingCallback callback;
	SyncCycleStats    stats{};
	const std::size_t started = TransferSequencer(m_remote, m_cancel, &callback).run(m_jobs, stats);

	ASSERT_EQ(4u, started);
	ASSERT_EQ(3u, stats.m_series_transferred);
	ASSERT_EQ(1u, stats.m_series_failed);
	ASSERT_EQ(10u + 30u + 40u, stats.m_images_transferred);

	ASSERT_TRUE(m_jobs[0].m_succeeded);
	ASSERT_FALSE(m_jobs[1].m_succeeded);
	ASSERT_NE(std::string::npos, m_jobs[1].m_error.find("fake move failure"));
	ASSERT_TRUE(m_jobs[2].m_succeeded);
	ASSERT_TRUE(m_jobs[3].m_succeeded);

	// strictly sequential, in batch order
	ASSERT_EQ((std::vector<std::string>{"1.1.1", "1.1.2", "1.1.3", "1.1.4"}), m_remote.m_moves);
	ASSERT_EQ((std::vector<std::size_t>{1, 2, 3, 4}), callback.m_started);
	ASSERT_EQ((std::vector<std::size_t>{1, 2, 3, 4}), callback.m_finished);
	ASSERT_EQ(4u, callback.m_total);

	ASSERT_EQ(4u, stats.m_jobs.size());
	for (std::size_t i = 0; i < m_jobs.size(); ++i) {
		ASSERT_TRUE(m_jobs[i].m_started_at.has_value());
		ASSERT_TRUE(m_jobs[i].m_completed_at.has_value());
		ASSERT_LE(*m_jobs[i].m_started_at, *m_jobs[i].m_completed_at);
		if (i > 0)
			ASSERT_LE(*m_jobs[i - 1].m_completed_at, *m_jobs[i].m_started_at);
	}

	ASSERT_EQ(nullptr, m_local.findLocalSeries("1.1", "1.1.2"));
	ASSERT_NE(nullptr, m_local.findLocalSeries("1.1", "1.1.4"));
}

TEST_F(TransferSequencerTest, CancellationBetweenJobs) {
	m_remote.m_cancelFlag       = &m_cancel;
	m_remote.m_cancelAfterMoves = 2;

	SyncCycleStats    stats{};
	const std::size_t started = TransferSequencer(m_remote, m_cancel).run(m_jobs, stats);

	// the move in flight when cancellation arrives still completes
	ASSERT_EQ(2u, started);
	ASSERT_EQ(2u, m_remote.m_moves.size());
	ASSERT_EQ(2u, stats.m_series_transferred);
	ASSERT_TRUE(m_jobs[1].m_succeeded);
	ASSERT_FALSE(m_jobs[2].m_started_at.has_value());
	ASSERT_FALSE(m_jobs[3].m_started_at.has_value());
	ASSERT_EQ(2u, stats.m_jobs.size());
}

TEST_F(TransferSequencerTest, CancelledBeforeStart) {
	m_cancel.store(true);

	SyncCycleStats stats{};
	ASSERT_EQ(0u, TransferSequencer(m_remote, m_cancel).run(m_jobs, stats));
	ASSERT_TRUE(m_remote.m_moves.empty());
	ASSERT_EQ(0u, stats.m_series_transferred);
}

TEST_F(TransferSequencerTest, ImageCountFallsBackToSeries) {
	class SilentMover final : public TransferService {
	public:
		OFCondition moveSeries(const std::string &, const std::string &, MoveProgress &progress) override {
			progress = MoveProgress{};
			return EC_Normal;
		}
	} mover;

	SyncCycleStats stats{};
	ASSERT_EQ(4u, TransferSequencer(mover, m_cancel).run(m_jobs, stats));
	ASSERT_EQ(10u + 20u + 30u + 40u, stats.m_images_transferred);
}
