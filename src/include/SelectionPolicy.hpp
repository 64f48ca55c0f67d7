#ifndef SELECTIONPOLICY_HPP
#define SELECTIONPOLICY_HPP

#include <string>
#include <vector>

#include "StudyRecord.hpp"

enum class SelectionMode {
	Smallest, // lowest image count per study
	Threshold, // every series with fewer than m_min_images images
	All
};

struct SelectionPolicy {
	SelectionMode m_mode{SelectionMode::Smallest};
	unsigned int  m_min_images{0};
	unsigned int  m_min_missing_images{1};

	std::string describe() const;
};

const char *selectionModeName(SelectionMode mode);

/*
 * Builds the ordered transfer batch for one cycle: grouped by study in
 * discovery order, within a study by image count, series number and
 * series instance uid. Complete series are never selected.
 */
std::vector<TransferJob> selectTransferJobs(const std::vector<StudyComparison> &comparisons,
                                            const SelectionPolicy &              policy);

#endif //SELECTIONPOLICY_HPP
