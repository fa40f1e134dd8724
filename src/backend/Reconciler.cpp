#include "backend/Reconciler.hpp"
#include "util/Logger.hpp"

namespace musician::backend {

Reconciler::Reconciler(const CatalogStore& store) : store_(store) {}

std::string Reconciler::identity_key_sql(const std::string& alias) {
    // Must stay textually equivalent to idx_file_data_identity
    return "COALESCE(" + alias + ".song_title, " + alias + ".file_name, '') || COALESCE(" +
           alias + ".album_name, '')";
}

std::string Reconciler::diff_relation_sql() {
    // Left anti-join of origin against dest on the identity key; ?1 = origin, ?2 = dest
    return "FROM file_data origin "
           "WHERE origin.scan_name = ?1 "
           "AND NOT EXISTS ("
           "SELECT 1 FROM file_data dest "
           "WHERE dest.scan_name = ?2 "
           "AND " + identity_key_sql("dest") + " = " + identity_key_sql("origin") + ")";
}

int64_t Reconciler::count_diff(const std::string& origin_scan, const std::string& dest_scan) const {
    auto st = store_.prepare("SELECT COUNT(*) " + diff_relation_sql());
    st.bind(1, origin_scan);
    st.bind(2, dest_scan);
    int64_t count = st.step() ? st.column_int(0) : 0;

    util::Logger::info("Reconciler: " + std::to_string(count) + " files in '" + origin_scan +
                       "' missing from '" + dest_scan + "'");
    return count;
}

std::vector<std::string> Reconciler::compute_diff(const std::string& origin_scan,
                                                  const std::string& dest_scan) const {
    auto st = store_.prepare("SELECT origin.full_path " + diff_relation_sql() + " ORDER BY origin.id");
    st.bind(1, origin_scan);
    st.bind(2, dest_scan);

    std::vector<std::string> paths;
    while (st.step()) {
        paths.push_back(st.column_text(0));
    }

    util::Logger::info("Reconciler: Diff of '" + origin_scan + "' against '" + dest_scan +
                       "' has " + std::to_string(paths.size()) + " paths");
    return paths;
}

}  // namespace musician::backend
