#pragma once

#include <adr/interfaces.h>
#include <adr/logging.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace adr {

// Field and record separators used in the git log format string.
inline constexpr char kGitFieldSeparator = '\x1f';
inline constexpr char kGitRecordSeparator = '\x1e';

std::vector<std::string> BuildGitLogCommand(const WalkOptions &options);

// Parses `git log --raw --numstat` output produced with the format from
// BuildGitLogCommand. Throws HistoryError on a malformed record.
std::vector<CommitRecord> ParseGitLog(const std::string &output);

// fnmatch(3) glob, or a directory prefix such as "vendor" or "vendor/".
bool IsExcludedPath(const std::string &path,
                    const std::vector<std::string> &patterns);

// Removes excluded files. Commits left without files are dropped; commits
// that never touched a file are kept.
std::vector<CommitRecord>
ApplyExclusions(std::vector<CommitRecord> commits,
                const std::vector<std::string> &patterns);

class GitHistoryWalker : public HistoryWalker {
public:
  explicit GitHistoryWalker(std::shared_ptr<Logger> logger = nullptr);

  std::vector<CommitRecord> Walk(const WalkOptions &options) override;

private:
  std::shared_ptr<Logger> logger_;
};

class GitRevisionReader : public RevisionReader {
public:
  explicit GitRevisionReader(std::filesystem::path root);

  std::optional<std::string> Read(const std::string &revision,
                                  const std::string &path) const override;

private:
  std::filesystem::path root_;
};

} // namespace adr
