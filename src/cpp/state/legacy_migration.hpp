#pragma once
// One-time conversion of the flat legacy layout
//   <root>/sessions/<session_id>.json
//   <root>/checkpoints/<checkpoint_id>.json
// into the directory-per-session layout. Not used by the engine itself.

#include <filesystem>
#include <string>
#include <vector>

#include "state_persistence.hpp"

namespace harvest {

struct MigrationReport {
    int sessions_migrated = 0;
    int sessions_skipped = 0;
    int checkpoints_migrated = 0;
    int checkpoints_skipped = 0;
    std::vector<std::string> errors;
};

MigrationReport migrate_legacy_layout(const std::filesystem::path& legacy_root,
                                      StatePersistence& persistence);

} // namespace harvest
