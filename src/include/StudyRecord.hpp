#ifndef STUDYRECORD_HPP
#define STUDYRECORD_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using SyncClock = std::chrono::system_clock;

struct StudyRecord {
	std::string  m_study_uid{};
	std::string  m_patient_id{};
	std::string  m_patient_name{};
	std::string  m_study_date{};
	std::string  m_study_time{};
	std::string  m_description{};
	unsigned int m_image_count{0};

	StudyRecord() = default;

	StudyRecord(const std::string_view study_uid,
	            const std::string_view patient_name,
	            const std::string_view study_date,
	            const std::string_view study_time) : m_study_uid{study_uid},
	                                                 m_patient_name{patient_name},
	                                                 m_study_date{study_date},
	                                                 m_study_time{study_time} {}

	// studies are identified by their instance uid only
	bool operator==(const StudyRecord &other) const { return m_study_uid == other.m_study_uid; }
};

struct SeriesRecord {
	std::string  m_series_uid{};
	std::string  m_study_uid{};
	std::string  m_modality{};
	int          m_series_number{0};
	std::string  m_description{};
	unsigned int m_image_count{0};

	SeriesRecord() = default;

	SeriesRecord(const std::string_view series_uid,
	             const std::string_view study_uid,
	             const int              series_number,
	             const unsigned int     image_count) : m_series_uid{series_uid},
	                                                   m_study_uid{study_uid},
	                                                   m_series_number{series_number},
	                                                   m_image_count{image_count} {}
};

enum class Completeness { Missing, Incomplete, Complete };

struct CompletenessResult {
	SeriesRecord                m_remote{};
	std::optional<SeriesRecord> m_local{};
	Completeness                m_state{Completeness::Missing};

	unsigned int localImageCount() const { return m_local ? m_local->m_image_count : 0; }

	unsigned int missingImageCount() const {
		const unsigned int local = localImageCount();
		return m_remote.m_image_count > local ? m_remote.m_image_count - local : 0;
	}

	bool eligible() const { return m_state != Completeness::Complete; }
};

// one remote study with the classification of all of its remote series
struct StudyComparison {
	StudyRecord                     m_study{};
	bool                            m_missing_locally{false};
	std::vector<CompletenessResult> m_series{};
};

// sub-operation counters reported by a C-MOVE
struct MoveProgress {
	unsigned int m_remaining{0};
	unsigned int m_completed{0};
	unsigned int m_failed{0};
	unsigned int m_warning{0};
};

struct TransferJob {
	StudyRecord  m_study{};
	SeriesRecord m_series{};
	Completeness m_state{Completeness::Missing};
	unsigned int m_local_image_count{0};

	std::optional<SyncClock::time_point> m_started_at{};
	std::optional<SyncClock::time_point> m_completed_at{};
	bool                                 m_succeeded{false};
	std::string                          m_error{};
	MoveProgress                         m_progress{};

	std::chrono::duration<double> duration() const;

	// "New" or "Completing n/m images"
	std::string classificationLabel() const;
};

struct JobTiming {
	std::string           m_series_uid{};
	SyncClock::time_point m_started_at{};
	SyncClock::time_point m_completed_at{};
	bool                  m_succeeded{false};
};

enum class CycleState {
	QueryingRemote,
	QueryingLocal,
	Filtering,
	Comparing,
	Selecting,
	Transferring,
	Reporting,
	Done,
	CycleFailed
};

struct SyncCycleStats {
	unsigned long         m_cycle{0};
	std::string           m_date_from{};
	std::string           m_date_to{};
	SyncClock::time_point m_started_at{};

	unsigned int m_remote_studies{0};
	unsigned int m_remote_studies_in_window{0};
	unsigned int m_local_studies{0};
	unsigned int m_missing_studies{0};
	unsigned int m_series_considered{0};
	unsigned int m_series_selected{0};
	unsigned int m_series_transferred{0};
	unsigned int m_series_failed{0};
	unsigned int m_images_transferred{0};

	std::chrono::duration<double> m_elapsed{0.0};
	std::chrono::duration<double> m_transfer_elapsed{0.0};
	std::vector<JobTiming>        m_jobs{};

	CycleState  m_state{CycleState::QueryingRemote};
	CycleState  m_failed_step{CycleState::QueryingRemote};
	std::string m_error{};

	bool failed() const { return m_state == CycleState::CycleFailed; }

	// images per minute over the transfer phase
	double throughput() const;
};

const char *completenessName(Completeness state);

const char *cycleStateName(CycleState state);

// YYYYMMDD -> YYYY-MM-DD, anything else is returned unchanged
std::string formatDicomDate(std::string_view date);

// HHMMSS[.FFFFFF] -> HH:MM:SS, anything else is returned unchanged
std::string formatDicomTime(std::string_view time);

#endif //STUDYRECORD_HPP
