#ifndef STUDYCOMPARATOR_HPP
#define STUDYCOMPARATOR_HPP

#include <vector>

#include "dcmtk/config/osconfig.h"
#include "dcmtk/ofstd/ofcond.h"

#include "DicomServices.hpp"
#include "StudyRecord.hpp"

// remote studies whose instance uid does not exist locally, in remote order
std::vector<StudyRecord> findMissingStudies(const std::vector<StudyRecord> &remote_studies,
                                            const std::vector<StudyRecord> &local_studies);

Completeness classifySeries(const SeriesRecord &remote, const SeriesRecord *local);

// one result per remote series, ordered by series instance uid
std::vector<CompletenessResult> compareSeries(const std::vector<SeriesRecord> &remote_series,
                                              const std::vector<SeriesRecord> &local_series);

class StudyComparator {
public:
	StudyComparator(DirectoryService &remote, DirectoryService &local);

	/*
	 * Classifies every series of the remote studies against the local archive.
	 * Studies missing locally are classified from the remote series list only.
	 * Output keeps the order of remote_studies; a query failure aborts the
	 * comparison and is returned unchanged.
	 */
	OFCondition compare(const std::vector<StudyRecord> &remote_studies,
	                    const std::vector<StudyRecord> &local_studies,
	                    std::vector<StudyComparison> &  comparisons) const;

private:
	DirectoryService &m_remote;
	DirectoryService &m_local;
};

#endif //STUDYCOMPARATOR_HPP
