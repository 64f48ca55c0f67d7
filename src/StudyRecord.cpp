#include "StudyRecord.hpp"

#include <algorithm>

#include "fmt/format.h"

static auto isDigits = [](std::string_view text) {
	return !text.empty() && std::ranges::all_of(text, [](const char c) { return c >= '0' && c <= '9'; });
};

std::chrono::duration<double> TransferJob::duration() const {
	if (!m_started_at || !m_completed_at)
		return std::chrono::duration<double>{0.0};
	return *m_completed_at - *m_started_at;
}

std::string TransferJob::classificationLabel() const {
	if (m_state == Completeness::Missing)
		return "New";
	return fmt::format("Completing {}/{} images", m_local_image_count, m_series.m_image_count);
}

double SyncCycleStats::throughput() const {
	const double minutes = m_transfer_elapsed.count() / 60.0;
	if (minutes <= 0.0)
		return 0.0;
	return m_images_transferred / minutes;
}

const char *completenessName(const Completeness state) {
	switch (state) {
		case Completeness::Missing:
			return "Missing";
		case Completeness::Incomplete:
			return "Incomplete";
		case Completeness::Complete:
			return "Complete";
	}
	return "Unknown";
}

const char *cycleStateName(const CycleState state) {
	switch (state) {
		case CycleState::QueryingRemote:
			return "QueryingRemote";
		case CycleState::QueryingLocal:
			return "QueryingLocal";
		case CycleState::Filtering:
			return "Filtering";
		case CycleState::Comparing:
			return "Comparing";
		case CycleState::Selecting:
			return "Selecting";
		case CycleState::Transferring:
			return "Transferring";
		case CycleState::Reporting:
			return "Reporting";
		case CycleState::Done:
			return "Done";
		case CycleState::CycleFailed:
			return "CycleFailed";
	}
	return "Unknown";
}

std::string formatDicomDate(std::string_view date) {
	if (date.length() != 8 || !isDigits(date))
		return std::string{date};
	return fmt::format("{}-{}-{}", date.substr(0, 4), date.substr(4, 2), date.substr(6, 2));
}

std::string formatDicomTime(std::string_view time) {
	if (time.length() < 6 || !isDigits(time.substr(0, 6)))
		return std::string{time.substr(0, 8)};
	return fmt::format("{}:{}:{}", time.substr(0, 2), time.substr(2, 2), time.substr(4, 2));
}
