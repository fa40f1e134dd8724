#pragma once

#include "backend/CatalogStore.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace musician::backend {

/**
 * Reconciler: files of an origin scan with no counterpart in a destination scan.
 *
 * Two records are "the same logical file" when their identity keys are equal:
 *   (song_title, or file_name when there is no title) + album_name
 * with a missing album treated as the empty string. This is a heuristic, not a
 * unique key: records lacking title, file name and album all share the empty
 * key and therefore match each other. Any number of destination matches
 * excludes an origin record.
 */
class Reconciler {
public:
    explicit Reconciler(const CatalogStore& store);

    // Count-only projection of the diff
    [[nodiscard]] int64_t count_diff(const std::string& origin_scan, const std::string& dest_scan) const;

    // Full paths of the diff, in origin insertion order
    [[nodiscard]] std::vector<std::string> compute_diff(const std::string& origin_scan,
                                                        const std::string& dest_scan) const;

    // SQL expression for the identity key of the row aliased as `alias`
    static std::string identity_key_sql(const std::string& alias);

private:
    static std::string diff_relation_sql();

    const CatalogStore& store_;
};

}  // namespace musician::backend
