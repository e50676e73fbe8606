#pragma once

#include <format>
#include <string>

#ifndef LEDGERSTORE_VERSION
#define LEDGERSTORE_VERSION "0.0.0-dev"
#endif
#ifndef LEDGERSTORE_GIT_COMMIT
#define LEDGERSTORE_GIT_COMMIT "unknown"
#endif
#ifndef LEDGERSTORE_GIT_BRANCH
#define LEDGERSTORE_GIT_BRANCH "unknown"
#endif
#ifndef LEDGERSTORE_BUILD_TIME
#define LEDGERSTORE_BUILD_TIME "unknown"
#endif

namespace ledgerstore {

/**
 * @brief Immutable build identity
 *
 * Built once at startup from the compile definitions set by CMake and
 * passed down by const reference.
 */
struct BuildInfo {
    std::string version;
    std::string git_commit;
    std::string git_branch;
    std::string build_time;

    static BuildInfo current() {
        return BuildInfo{
            LEDGERSTORE_VERSION,
            LEDGERSTORE_GIT_COMMIT,
            LEDGERSTORE_GIT_BRANCH,
            LEDGERSTORE_BUILD_TIME};
    }

    [[nodiscard]] std::string summary() const {
        return std::format("v{} ({}@{}, built {})", version, git_branch, git_commit, build_time);
    }
};

} // namespace ledgerstore
