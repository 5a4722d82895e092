#pragma once

#include "identity_index.hh"
#include "report.hh"

namespace uniqdir {

inline namespace detail_v1 {

/**
 * @brief filenames whose name occurs in exactly one compared directory
 */
report_t resolve_by_name(const identity_index_t &index);

/**
 * @brief files whose content occurs in exactly one compared directory,
 * regardless of name
 *
 * paths of every key spanning more than one directory are marked first,
 * then each directory's files are walked and kept only if unmarked and a
 * fresh lookup of the key still reports a single directory
 */
report_t resolve_by_content(const identity_index_t &index);

// dispatch on index.mode()
report_t resolve(const identity_index_t &index);

}  // namespace detail_v1

}  // namespace uniqdir
