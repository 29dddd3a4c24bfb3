#pragma once

#include "Cancellation.h"
#include "PrivacyDataset.h"

#include <vector>

namespace Microaggregation {
/**
 * @brief MDAV (maximum distance to average vector) grouping of rows on the given columns.
 * @details Numeric and date columns are standardized; categorical columns count a mismatch as one unit of
 * squared distance. Every group holds between k and 2k-1 rows, except when rows has fewer than k entries,
 * in which case all of them form one group.
 * @post Groups partition rows; each group lists dataset row indices in ascending order.
 */
std::vector<std::vector<size_t>> mdavGroups(const PrivacyDataset& data,
                                            const std::vector<size_t>& columns,
                                            const std::vector<size_t>& rows,
                                            size_t k,
                                            const CancelCheck& shouldCancel = {});
}
