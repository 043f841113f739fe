#pragma once

#include "skytest/value.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace skytest {

struct SnapshotRecord {
    std::string name;
    std::string expected;
    std::string actual;
};

// Compares values against `.snap` files stored beside the test file:
// <dir>/__snapshots__/<file stem>/<test>__<name>.snap
class SnapshotManager {
public:
    explicit SnapshotManager(bool update_mode = false) : update_mode_(update_mode) {}

    void set_context(std::filesystem::path test_file, std::string test_name);

    bool update_mode() const { return update_mode_; }

    // Creates the snapshot when missing, overwrites it in update mode.
    // Throws SnapshotMismatch on a difference, error on I/O failure.
    void compare(const Value &value, std::string_view name);

    std::filesystem::path snapshot_path(std::string_view name) const;

    const std::vector<std::string>    &created() const { return created_; }
    const std::vector<std::string>    &updated() const { return updated_; }
    const std::vector<SnapshotRecord> &mismatches() const { return mismatches_; }

private:
    bool                        update_mode_;
    std::filesystem::path       test_file_;
    std::string                 test_name_;
    std::vector<std::string>    created_;
    std::vector<std::string>    updated_;
    std::vector<SnapshotRecord> mismatches_;
};

// Deterministic, indented text form used as snapshot content.
std::string serialize_value(const Value &value);

// Replaces characters that are unsafe in file names with '_'.
std::string sanitize_snapshot_name(std::string_view name);

} // namespace skytest
