#include <adr/git_history_walker.h>

#include <adr/process.h>

#include <algorithm>
#include <map>
#include <sstream>
#include <utility>

#include <fnmatch.h>

namespace adr {
namespace {

constexpr std::size_t kHeaderFields = 6;

std::string TrimTrailing(std::string value) {
  while (!value.empty() &&
         (value.back() == '\n' || value.back() == '\r' || value.back() == ' ')) {
    value.pop_back();
  }
  return value;
}

std::vector<std::string> SplitWords(const std::string &value) {
  std::vector<std::string> words;
  std::istringstream stream(value);
  std::string word;
  while (stream >> word) {
    words.push_back(word);
  }
  return words;
}

FileStatus ParseStatus(char letter) {
  switch (letter) {
  case 'A':
    return FileStatus::kAdded;
  case 'D':
    return FileStatus::kDeleted;
  case 'T':
    return FileStatus::kTypeChanged;
  default:
    return FileStatus::kModified;
  }
}

int ParseLineCount(const std::string &value) {
  if (value == "-") {
    return 0;
  }
  try {
    return std::stoi(value);
  } catch (const std::exception &) {
    throw HistoryError("malformed numstat count: " + value);
  }
}

void ParseFileSection(const std::string &section, CommitRecord &commit) {
  std::map<std::string, std::size_t> index;
  const auto file_for = [&](const std::string &path) -> FileChange & {
    const auto found = index.find(path);
    if (found != index.end()) {
      return commit.files[found->second];
    }
    index.emplace(path, commit.files.size());
    commit.files.push_back(FileChange{path, FileStatus::kModified, 0, 0});
    return commit.files.back();
  };

  std::istringstream stream(section);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    if (line[0] == ':') {
      const auto tab = line.find('\t');
      if (tab == std::string::npos) {
        throw HistoryError("malformed raw diff line in " + commit.sha);
      }
      const auto words = SplitWords(line.substr(0, tab));
      if (words.size() < 5 || words[4].empty()) {
        throw HistoryError("malformed raw diff line in " + commit.sha);
      }
      file_for(line.substr(tab + 1)).status = ParseStatus(words[4][0]);
      continue;
    }

    const auto first_tab = line.find('\t');
    const auto second_tab = first_tab == std::string::npos
                                ? std::string::npos
                                : line.find('\t', first_tab + 1);
    if (second_tab == std::string::npos) {
      throw HistoryError("malformed numstat line in " + commit.sha);
    }
    auto &file = file_for(line.substr(second_tab + 1));
    file.additions = ParseLineCount(line.substr(0, first_tab));
    file.deletions =
        ParseLineCount(line.substr(first_tab + 1, second_tab - first_tab - 1));
  }
}

CommitRecord ParseRecord(const std::string &record) {
  std::vector<std::string> header;
  std::size_t position = 0;
  while (header.size() < kHeaderFields) {
    const auto separator = record.find(kGitFieldSeparator, position);
    if (separator == std::string::npos) {
      throw HistoryError("malformed git log record");
    }
    header.push_back(record.substr(position, separator - position));
    position = separator + 1;
  }

  CommitRecord commit;
  commit.sha = header[0];
  if (commit.sha.empty()) {
    throw HistoryError("git log record without a commit hash");
  }
  commit.parents = SplitWords(header[1]);
  commit.is_merge = commit.parents.size() > 1;
  commit.author = header[2];
  commit.author_email = header[3];
  try {
    commit.timestamp = std::stoll(header[4]);
  } catch (const std::exception &) {
    throw HistoryError("malformed timestamp for " + commit.sha);
  }
  commit.message = TrimTrailing(header[5]);
  ParseFileSection(record.substr(position), commit);
  return commit;
}

bool HasGlob(const std::string &pattern) {
  return pattern.find_first_of("*?[") != std::string::npos;
}

} // namespace

std::vector<std::string> BuildGitLogCommand(const WalkOptions &options) {
  std::vector<std::string> command = {"git",
                                      "-C",
                                      options.root_path,
                                      "-c",
                                      "core.quotepath=off",
                                      "log",
                                      "--raw",
                                      "--numstat",
                                      "--no-renames",
                                      "--no-color"};
  std::string format = "--format=";
  format += "%x1e%H%x1f%P%x1f%an%x1f%ae%x1f%at%x1f%B%x1f";
  command.push_back(format);
  if (options.max_commits > 0) {
    command.push_back("-n");
    command.push_back(std::to_string(options.max_commits));
  }
  if (!options.include_merge_commits) {
    command.push_back("--no-merges");
  }
  if (options.since) {
    command.push_back("--since=@" + std::to_string(*options.since));
  }
  if (options.until) {
    command.push_back("--until=@" + std::to_string(*options.until));
  }
  return command;
}

std::vector<CommitRecord> ParseGitLog(const std::string &output) {
  std::vector<CommitRecord> commits;
  std::size_t position = output.find(kGitRecordSeparator);
  while (position != std::string::npos) {
    const auto next = output.find(kGitRecordSeparator, position + 1);
    const auto record =
        output.substr(position + 1, next == std::string::npos
                                        ? std::string::npos
                                        : next - position - 1);
    commits.push_back(ParseRecord(record));
    position = next;
  }
  return commits;
}

bool IsExcludedPath(const std::string &path,
                    const std::vector<std::string> &patterns) {
  return std::any_of(
      patterns.begin(), patterns.end(), [&](const std::string &pattern) {
        if (pattern.empty()) {
          return false;
        }
        if (HasGlob(pattern)) {
          return ::fnmatch(pattern.c_str(), path.c_str(), 0) == 0;
        }
        auto prefix = pattern;
        if (prefix.back() != '/') {
          if (path == prefix) {
            return true;
          }
          prefix.push_back('/');
        }
        return path.rfind(prefix, 0) == 0;
      });
}

std::vector<CommitRecord>
ApplyExclusions(std::vector<CommitRecord> commits,
                const std::vector<std::string> &patterns) {
  if (patterns.empty()) {
    return commits;
  }
  std::vector<CommitRecord> kept;
  kept.reserve(commits.size());
  for (auto &commit : commits) {
    const auto touched = commit.files.size();
    commit.files.erase(std::remove_if(commit.files.begin(), commit.files.end(),
                                      [&](const FileChange &file) {
                                        return IsExcludedPath(file.path,
                                                              patterns);
                                      }),
                       commit.files.end());
    if (touched > 0 && commit.files.empty()) {
      continue;
    }
    kept.push_back(std::move(commit));
  }
  return kept;
}

GitHistoryWalker::GitHistoryWalker(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

std::vector<CommitRecord> GitHistoryWalker::Walk(const WalkOptions &options) {
  std::error_code error;
  if (!std::filesystem::is_directory(options.root_path, error)) {
    throw HistoryError("repository root is not a directory: " +
                       options.root_path);
  }

  const auto probe =
      RunProcess({"git", "-C", options.root_path, "rev-parse", "--git-dir"});
  if (probe.exit_code != 0) {
    throw HistoryError("not a git repository: " + options.root_path + ": " +
                       TrimTrailing(probe.error_output));
  }
  const auto head = RunProcess(
      {"git", "-C", options.root_path, "rev-parse", "-q", "--verify", "HEAD"});
  if (head.exit_code != 0) {
    logger_->Log(LogLevel::kInfo, "Repository has no commits",
                 {{"root", options.root_path}});
    return {};
  }

  const auto command = BuildGitLogCommand(options);
  const auto log = RunProcess(command);
  if (log.exit_code != 0) {
    throw HistoryError("git log failed with exit code " +
                       std::to_string(log.exit_code) + ": " +
                       TrimTrailing(log.error_output));
  }

  auto commits = ParseGitLog(log.output);
  const auto walked = commits.size();
  commits = ApplyExclusions(std::move(commits), options.exclude_paths);
  logger_->Log(LogLevel::kDebug, "Walked git history",
               {{"root", options.root_path},
                {"commits", std::to_string(walked)},
                {"after_exclusions", std::to_string(commits.size())}});
  return commits;
}

GitRevisionReader::GitRevisionReader(std::filesystem::path root)
    : root_(std::move(root)) {}

std::optional<std::string>
GitRevisionReader::Read(const std::string &revision,
                        const std::string &path) const {
  if (revision.empty()) {
    return std::nullopt;
  }
  const auto result = RunProcess(
      {"git", "-C", root_.string(), "show", revision + ":" + path});
  if (result.exit_code != 0) {
    return std::nullopt;
  }
  return result.output;
}

} // namespace adr
