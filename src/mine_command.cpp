#include <adr/mine_command.h>

#include <adr/cli_exit_codes.h>
#include <adr/component_registry.h>
#include <adr/dates.h>
#include <adr/mining_pipeline_builder.h>
#include <adr/pattern_data_source.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace {

using adr::MineOptions;

void PrintMineUsage() {
  std::cout
      << "Usage: adr-mine mine [options]\n"
      << "Options:\n"
      << "  --root <path>             Repository to mine (default: .)\n"
      << "  --since <date>            Earliest commit (epoch seconds or "
         "YYYY-MM-DD)\n"
      << "  --until <date>            Latest commit (epoch seconds or "
         "YYYY-MM-DD)\n"
      << "  --max-commits <n>         Newest commits to walk (default: 1000)\n"
      << "  --min-cluster-size <n>    Smallest cluster kept (default: 2)\n"
      << "  --min-confidence <x>      Confidence threshold in [0,1] "
         "(default: 0.5)\n"
      << "  --include-merges          Walk merge commits too\n"
      << "  --exclude <list>          Comma-separated globs or directories to "
         "skip\n"
      << "  --use-pattern-data        Append recorded pattern ids per file\n"
      << "  --pattern-data <path>     Pattern data file (default: "
         "<root>/.adr/patterns.tsv)\n"
      << "  --format <list>           Output formats (markdown,json)\n"
      << "  --out <path>              Directory for reports (default: root)\n"
      << "  --config <file>           Optional YAML config file\n"
      << "  --log-level <level>       Logging verbosity "
         "(error,warn,info,debug)\n"
      << "  --debug                   Shortcut for --log-level debug\n"
      << "  --verbose                 Include failure details in warnings\n"
      << "  --extractors <list>       Extractors to run (default: all)\n"
      << "  --synthesizer <name>      Narrative synthesizer to use\n"
      << "  --reporter <name>         Reporter to render outputs\n"
      << "  --cache                   Enable the extraction cache\n"
      << "  --cache-dir <path>        Override the cache directory\n"
      << "  --clean-cache             Remove the cache before running\n"
      << "  --jobs <n>                Extraction worker threads\n"
      << "  --synthesis-concurrency <n>  Concurrent narrative calls\n"
      << "  --synthesis-timeout-ms <n>   Timeout per narrative call\n"
      << "  --temporal-horizon <s>    Seconds at which temporal score is "
         "0.05\n"
      << "  --similarity-floor <x>    Minimum edge score (default: 0.3)\n"
      << "  --reason-floor <x>        Minimum reason contribution "
         "(default: 0.05)\n"
      << "  --max-lookback <n>        Compare only this many neighbours "
         "(0: all)\n"
      << "  --weights <t,f,p>         Temporal, file and pattern weights\n"
      << "  --help                    Show this message\n";
}

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "true" || normalized == "1" || normalized == "yes" ||
      normalized == "on") {
    return true;
  }
  if (normalized == "false" || normalized == "0" || normalized == "no" ||
      normalized == "off") {
    return false;
  }
  throw std::invalid_argument("Expected a boolean, got: " + value);
}

std::size_t ParseCount(const std::string &value, const std::string &name) {
  const auto trimmed = Trim(value);
  if (trimmed.empty() ||
      !std::all_of(trimmed.begin(), trimmed.end(),
                   [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
    throw std::invalid_argument(name + " must be a non-negative integer");
  }
  try {
    return static_cast<std::size_t>(std::stoull(trimmed));
  } catch (const std::out_of_range &) {
    throw std::invalid_argument(name + " is out of range");
  }
}

std::int64_t ParseInteger(const std::string &value, const std::string &name) {
  const auto count = ParseCount(value, name);
  if (count > static_cast<std::size_t>(
                  std::numeric_limits<std::int64_t>::max())) {
    throw std::invalid_argument(name + " is out of range");
  }
  return static_cast<std::int64_t>(count);
}

double ParseNumber(const std::string &value, const std::string &name) {
  std::size_t consumed = 0;
  double number = 0.0;
  try {
    number = std::stod(Trim(value), &consumed);
  } catch (const std::exception &) {
    throw std::invalid_argument(name + " must be a number");
  }
  if (consumed != Trim(value).size() || !std::isfinite(number)) {
    throw std::invalid_argument(name + " must be a finite number");
  }
  return number;
}

std::vector<std::string> SplitList(const std::string &raw) {
  std::vector<std::string> values;
  std::string current;
  for (const auto character : raw) {
    if (character == ',') {
      if (!Trim(current).empty()) {
        values.push_back(Trim(current));
      }
      current.clear();
    } else {
      current.push_back(character);
    }
  }
  if (!Trim(current).empty()) {
    values.push_back(Trim(current));
  }
  return values;
}

void AppendValues(const std::string &raw_values,
                  std::vector<std::string> &target) {
  for (auto value : SplitList(raw_values)) {
    if (std::find(target.begin(), target.end(), value) == target.end()) {
      target.push_back(std::move(value));
    }
  }
}

void AppendFormats(const std::string &raw_formats,
                   std::vector<std::string> &target) {
  for (auto format : SplitList(raw_formats)) {
    format = ToLower(format);
    if (format != "markdown" && format != "json") {
      throw std::invalid_argument("Unsupported format: " + format);
    }
    if (std::find(target.begin(), target.end(), format) == target.end()) {
      target.push_back(std::move(format));
    }
  }
}

void ApplyWeights(const std::string &raw, MineOptions &options) {
  const auto values = SplitList(raw);
  if (values.size() != 3) {
    throw std::invalid_argument(
        "--weights expects three comma-separated numbers");
  }
  options.weight_temporal = ParseNumber(values[0], "temporal weight");
  options.weight_file_overlap = ParseNumber(values[1], "file overlap weight");
  options.weight_pattern = ParseNumber(values[2], "pattern weight");
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool DispatchFlag(const std::string &argument, MineOptions &options) {
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
  } else if (argument == "--include-merges") {
    options.include_merge_commits = true;
  } else if (argument == "--use-pattern-data") {
    options.use_pattern_data = true;
  } else if (argument == "--verbose") {
    options.verbose = true;
  } else if (argument == "--debug") {
    options.log_level = adr::LogLevel::kDebug;
  } else if (argument == "--cache") {
    options.enable_cache = true;
  } else if (argument == "--clean-cache") {
    options.clean_cache = true;
  } else {
    return false;
  }
  return true;
}

bool DispatchValueOption(const std::vector<std::string> &arguments,
                         std::size_t &index, MineOptions &options) {
  const auto argument = arguments[index];
  const auto value = [&]() { return RequireValue(arguments, index, argument); };

  if (argument == "--root") {
    options.root = value();
  } else if (argument == "--out") {
    options.output_directory = value();
  } else if (argument == "--config") {
    options.config_file = value();
  } else if (argument == "--cache-dir") {
    options.cache_directory = value();
  } else if (argument == "--pattern-data") {
    options.pattern_data = value();
  } else if (argument == "--since") {
    options.since = adr::ParseDate(value());
  } else if (argument == "--until") {
    options.until = adr::ParseDate(value());
  } else if (argument == "--max-commits") {
    options.max_commits = ParseCount(value(), argument);
  } else if (argument == "--min-cluster-size") {
    options.min_cluster_size = ParseCount(value(), argument);
  } else if (argument == "--min-confidence") {
    options.min_confidence = ParseNumber(value(), argument);
  } else if (argument == "--exclude") {
    AppendValues(value(), options.exclude_paths);
  } else if (argument == "--format") {
    AppendFormats(value(), options.formats);
  } else if (argument == "--log-level") {
    options.log_level = adr::ParseLogLevel(value());
  } else if (argument == "--extractors") {
    AppendValues(value(), options.extractors);
  } else if (argument == "--synthesizer") {
    options.synthesizer = value();
  } else if (argument == "--reporter") {
    options.reporter = value();
  } else if (argument == "--jobs") {
    options.jobs = ParseCount(value(), argument);
  } else if (argument == "--synthesis-concurrency") {
    options.synthesis_concurrency = ParseCount(value(), argument);
  } else if (argument == "--synthesis-timeout-ms") {
    options.synthesis_timeout_ms = ParseInteger(value(), argument);
  } else if (argument == "--temporal-horizon") {
    options.temporal_horizon_seconds = ParseInteger(value(), argument);
  } else if (argument == "--similarity-floor") {
    options.similarity_floor = ParseNumber(value(), argument);
  } else if (argument == "--reason-floor") {
    options.reason_floor = ParseNumber(value(), argument);
  } else if (argument == "--max-lookback") {
    options.max_lookback = ParseCount(value(), argument);
  } else if (argument == "--weights") {
    ApplyWeights(value(), options);
  } else {
    return false;
  }
  return true;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"output", "out"},
      {"output_directory", "out"},
      {"format", "formats"},
      {"cache_directory", "cache_dir"},
      {"exclude", "exclude_paths"},
      {"include_merges", "include_merge_commits"},
      {"extractor", "extractors"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = adr::SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = adr::SupportedConfigKeys();
  if (std::find(supported.begin(), supported.end(), normalized) ==
      supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string or number");
  }
  return node.as<std::string>();
}

std::string ExtractPathLike(const YAML::Node &node,
                            const std::string &key_name) {
  if (node.IsScalar()) {
    return node.as<std::string>();
  }
  if (node.IsMap()) {
    for (const auto &candidate : {"path", "dir", "directory"}) {
      if (node[candidate]) {
        return ExtractStringScalar(node[candidate], key_name);
      }
    }
    throw std::invalid_argument("Config key '" + key_name +
                                "' map must contain 'path', 'dir', or "
                                "'directory'");
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or mapping");
}

using ListAppender = void (*)(const std::string &, std::vector<std::string> &);

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name,
                                     ListAppender appender) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      appender(child.as<std::string>(), values);
    }
    return values;
  }
  if (node.IsScalar()) {
    appender(node.as<std::string>(), values);
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

bool ExtractBool(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a boolean or boolean-like string");
  }
  return ParseBool(node.as<std::string>());
}

void ApplyWeightsNode(const YAML::Node &node, MineOptions &options) {
  if (!node.IsMap()) {
    throw std::invalid_argument(
        "Config key 'weights' must map temporal, file_overlap and pattern");
  }
  for (const auto &entry : node) {
    const auto name = NormalizeConfigKey(entry.first.as<std::string>());
    const auto value =
        ParseNumber(ExtractStringScalar(entry.second, "weights." + name),
                    "weights." + name);
    if (name == "temporal") {
      options.weight_temporal = value;
    } else if (name == "file_overlap") {
      options.weight_file_overlap = value;
    } else if (name == "pattern") {
      options.weight_pattern = value;
    } else {
      throw std::invalid_argument("Unknown weight: " + name +
                                  ". Supported: temporal, file_overlap, "
                                  "pattern");
    }
  }
}

void ApplyConfigEntry(const std::string &key, const YAML::Node &node,
                      MineOptions &options) {
  const auto scalar = [&]() { return ExtractStringScalar(node, key); };
  if (key == "root") {
    options.root = ExtractPathLike(node, key);
  } else if (key == "out") {
    options.output_directory = ExtractPathLike(node, key);
  } else if (key == "cache_dir") {
    options.cache_directory = ExtractPathLike(node, key);
  } else if (key == "pattern_data") {
    options.pattern_data = ExtractPathLike(node, key);
  } else if (key == "since") {
    options.since = adr::ParseDate(scalar());
  } else if (key == "until") {
    options.until = adr::ParseDate(scalar());
  } else if (key == "max_commits") {
    options.max_commits = ParseCount(scalar(), key);
  } else if (key == "min_cluster_size") {
    options.min_cluster_size = ParseCount(scalar(), key);
  } else if (key == "min_confidence") {
    options.min_confidence = ParseNumber(scalar(), key);
  } else if (key == "include_merge_commits") {
    options.include_merge_commits = ExtractBool(node, key);
  } else if (key == "exclude_paths") {
    options.exclude_paths = ExtractList(node, key, AppendValues);
  } else if (key == "use_pattern_data") {
    options.use_pattern_data = ExtractBool(node, key);
  } else if (key == "verbose") {
    options.verbose = ExtractBool(node, key);
  } else if (key == "formats") {
    options.formats = ExtractList(node, key, AppendFormats);
  } else if (key == "log_level") {
    options.log_level = adr::ParseLogLevel(scalar());
  } else if (key == "extractors") {
    options.extractors = ExtractList(node, key, AppendValues);
  } else if (key == "synthesizer") {
    options.synthesizer = scalar();
  } else if (key == "reporter") {
    options.reporter = scalar();
  } else if (key == "cache") {
    options.enable_cache = ExtractBool(node, key);
  } else if (key == "clean_cache") {
    options.clean_cache = ExtractBool(node, key);
  } else if (key == "jobs") {
    options.jobs = ParseCount(scalar(), key);
  } else if (key == "synthesis_concurrency") {
    options.synthesis_concurrency = ParseCount(scalar(), key);
  } else if (key == "synthesis_timeout_ms") {
    options.synthesis_timeout_ms = ParseInteger(scalar(), key);
  } else if (key == "temporal_horizon_seconds") {
    options.temporal_horizon_seconds = ParseInteger(scalar(), key);
  } else if (key == "similarity_floor") {
    options.similarity_floor = ParseNumber(scalar(), key);
  } else if (key == "reason_floor") {
    options.reason_floor = ParseNumber(scalar(), key);
  } else if (key == "max_lookback") {
    options.max_lookback = ParseCount(scalar(), key);
  } else if (key == "weights") {
    ApplyWeightsNode(node, options);
  } else {
    ThrowUnknownKey(key);
  }
}

MineOptions ApplyYamlConfig(const YAML::Node &root) {
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }
  MineOptions options;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    ApplyConfigEntry(key, entry.second, options);
  }
  return options;
}

void WriteFileIfContent(const std::filesystem::path &path,
                        const std::string &content) {
  if (content.empty()) {
    return;
  }
  std::ofstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content;
}

void WriteReports(const std::filesystem::path &directory,
                  const adr::Report &report) {
  std::filesystem::create_directories(directory);
  WriteFileIfContent(directory / "decisions.md", report.markdown);
  WriteFileIfContent(directory / "decisions.json", report.json);
}

adr::LoggingConfig BuildLoggingConfig(const MineOptions &options) {
  adr::LoggingConfig logging;
  logging.level = options.log_level.value_or(adr::LogLevel::kWarn);
  return logging;
}

} // namespace

namespace adr {

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {"root",
                                                "since",
                                                "until",
                                                "max_commits",
                                                "min_cluster_size",
                                                "min_confidence",
                                                "include_merge_commits",
                                                "exclude_paths",
                                                "use_pattern_data",
                                                "pattern_data",
                                                "verbose",
                                                "formats",
                                                "out",
                                                "log_level",
                                                "extractors",
                                                "synthesizer",
                                                "reporter",
                                                "cache",
                                                "cache_dir",
                                                "clean_cache",
                                                "jobs",
                                                "synthesis_concurrency",
                                                "synthesis_timeout_ms",
                                                "temporal_horizon_seconds",
                                                "similarity_floor",
                                                "reason_floor",
                                                "max_lookback",
                                                "weights"};
  return keys;
}

MineOptions ParseMineArguments(const std::vector<std::string> &arguments) {
  MineOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchFlag(arguments[i], options) &&
        !DispatchValueOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }
  return options;
}

MineOptions ParseConfigText(const std::string &yaml) {
  try {
    return ApplyYamlConfig(YAML::Load(yaml));
  } catch (const YAML::Exception &error) {
    throw std::invalid_argument(std::string("Invalid config: ") + error.what());
  }
}

MineOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  MineOptions options;
  try {
    options = ApplyYamlConfig(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception &error) {
    throw std::invalid_argument("Invalid config " + path.string() + ": " +
                                error.what());
  }
  options.config_file = path;
  return options;
}

MineOptions MergeOptions(const MineOptions &config_options,
                         const MineOptions &cli_options) {
  MineOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };
  const auto override_list = [](auto &target, const auto &source) {
    if (!source.empty()) {
      target = source;
    }
  };

  override_value(merged.root, cli_options.root);
  override_value(merged.output_directory, cli_options.output_directory);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.cache_directory, cli_options.cache_directory);
  override_value(merged.pattern_data, cli_options.pattern_data);
  override_value(merged.since, cli_options.since);
  override_value(merged.until, cli_options.until);
  override_value(merged.max_commits, cli_options.max_commits);
  override_value(merged.min_cluster_size, cli_options.min_cluster_size);
  override_value(merged.min_confidence, cli_options.min_confidence);
  override_value(merged.include_merge_commits,
                 cli_options.include_merge_commits);
  override_value(merged.use_pattern_data, cli_options.use_pattern_data);
  override_value(merged.verbose, cli_options.verbose);
  override_value(merged.log_level, cli_options.log_level);
  override_value(merged.synthesizer, cli_options.synthesizer);
  override_value(merged.reporter, cli_options.reporter);
  override_value(merged.enable_cache, cli_options.enable_cache);
  override_value(merged.clean_cache, cli_options.clean_cache);
  override_value(merged.jobs, cli_options.jobs);
  override_value(merged.synthesis_concurrency,
                 cli_options.synthesis_concurrency);
  override_value(merged.synthesis_timeout_ms,
                 cli_options.synthesis_timeout_ms);
  override_value(merged.temporal_horizon_seconds,
                 cli_options.temporal_horizon_seconds);
  override_value(merged.similarity_floor, cli_options.similarity_floor);
  override_value(merged.reason_floor, cli_options.reason_floor);
  override_value(merged.max_lookback, cli_options.max_lookback);
  override_value(merged.weight_temporal, cli_options.weight_temporal);
  override_value(merged.weight_file_overlap, cli_options.weight_file_overlap);
  override_value(merged.weight_pattern, cli_options.weight_pattern);
  override_list(merged.exclude_paths, cli_options.exclude_paths);
  override_list(merged.formats, cli_options.formats);
  override_list(merged.extractors, cli_options.extractors);
  return merged;
}

MineOptions ResolveMineOptions(const MineOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }
  MineOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }
  return MergeOptions(config_options, cli_options);
}

MiningOptions BuildMiningOptions(const MineOptions &options,
                                 const std::filesystem::path &root) {
  MiningOptions mining;
  mining.root_path = root.string();
  mining.since = options.since;
  mining.until = options.until;
  mining.max_commits = options.max_commits.value_or(mining.max_commits);
  mining.min_cluster_size =
      options.min_cluster_size.value_or(mining.min_cluster_size);
  mining.min_confidence = options.min_confidence.value_or(mining.min_confidence);
  mining.include_merge_commits =
      options.include_merge_commits.value_or(mining.include_merge_commits);
  mining.exclude_paths = options.exclude_paths;
  mining.use_pattern_data =
      options.use_pattern_data.value_or(mining.use_pattern_data);
  mining.verbose = options.verbose.value_or(mining.verbose);
  mining.weights.temporal =
      options.weight_temporal.value_or(mining.weights.temporal);
  mining.weights.file_overlap =
      options.weight_file_overlap.value_or(mining.weights.file_overlap);
  mining.weights.pattern =
      options.weight_pattern.value_or(mining.weights.pattern);
  if (options.temporal_horizon_seconds) {
    mining.temporal_horizon =
        std::chrono::seconds(*options.temporal_horizon_seconds);
  }
  mining.similarity_floor =
      options.similarity_floor.value_or(mining.similarity_floor);
  mining.reason_floor = options.reason_floor.value_or(mining.reason_floor);
  mining.max_lookback = options.max_lookback.value_or(mining.max_lookback);
  mining.extraction_jobs = options.jobs.value_or(mining.extraction_jobs);
  mining.synthesis_concurrency =
      options.synthesis_concurrency.value_or(mining.synthesis_concurrency);
  if (options.synthesis_timeout_ms) {
    mining.synthesis_timeout =
        std::chrono::milliseconds(*options.synthesis_timeout_ms);
  }
  ValidateMiningOptions(mining);
  return mining;
}

ExtractionCacheOptions BuildCacheOptions(const MineOptions &options) {
  ExtractionCacheOptions cache;
  cache.enabled = options.enable_cache.value_or(false);
  cache.clean = options.clean_cache.value_or(false);
  if (options.cache_directory) {
    cache.directory = *options.cache_directory;
  }
  return cache;
}

int RunMine(const std::vector<std::string> &arguments,
            const CancellationToken &cancellation) {
  const auto cli_options = ParseMineArguments(arguments);
  if (cli_options.show_help) {
    PrintMineUsage();
    return kExitSuccess;
  }

  const auto merged = ResolveMineOptions(cli_options);
  const auto root = std::filesystem::weakly_canonical(
      merged.root.value_or(std::filesystem::path(".")));
  auto logger = MakeLogger(BuildLoggingConfig(merged), std::clog);
  const auto mining_options = BuildMiningOptions(merged, root);

  const auto registry = MakeComponentRegistryWithDefaults();
  MiningPipelineBuilder builder(registry);
  builder.WithOptions(mining_options)
      .WithLogger(logger)
      .WithCacheOptions(BuildCacheOptions(merged))
      .WithCancellation(cancellation)
      .WithExtractorNames(merged.extractors);
  if (merged.synthesizer) {
    builder.WithSynthesizerName(*merged.synthesizer);
  }
  if (mining_options.use_pattern_data && merged.pattern_data) {
    builder.WithPatternData(std::make_shared<TsvPatternDataSource>(
        TsvPatternDataSource::Load(*merged.pattern_data)));
  }
  auto reporter = registry.CreateReporter(merged.reporter.value_or(""));
  auto miner = builder.Build();

  const auto result = miner->Mine(mining_options);

  ReportContext context;
  context.root_path = root.string();
  context.formats = merged.formats.empty()
                        ? std::vector<std::string>{"markdown"}
                        : merged.formats;
  const auto report = reporter->Render(result, context);
  WriteReports(merged.output_directory.value_or(root), report);

  std::cout << "Mined " << result.decisions.size() << " decision(s) from "
            << result.summary.commits_walked << " commit(s)";
  if (!result.errors.empty()) {
    std::cout << " (" << MiningErrorKindName(result.errors.front().kind)
              << ": " << result.errors.front().message << ")";
  }
  std::cout << "\n";
  return MiningExitCode(result);
}

CacheCleanOptions
ParseCacheCleanArguments(const std::vector<std::string> &arguments) {
  CacheCleanOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &arg = arguments[i];
    if (arg == "--root") {
      options.root = RequireValue(arguments, i, "--root");
      continue;
    }
    if (arg == "--cache-dir") {
      options.cache_directory = RequireValue(arguments, i, "--cache-dir");
      continue;
    }
    if (arg == "--help" || arg == "-h") {
      options.show_help = true;
      return options;
    }
    throw std::invalid_argument("Unknown cache argument: " + arg);
  }
  return options;
}

int RunCacheClean(const std::vector<std::string> &arguments) {
  const auto options = ParseCacheCleanArguments(arguments);
  if (options.show_help) {
    std::cout << "Usage: adr-mine cache clean [--root <path>] [--cache-dir "
                 "<path>]\n";
    return kExitSuccess;
  }

  const auto root = std::filesystem::weakly_canonical(
      options.root.value_or(std::filesystem::path(".")));
  ExtractionCacheOptions cache_options;
  if (options.cache_directory) {
    cache_options.directory = *options.cache_directory;
  }
  const ExtractionCache cache(cache_options, root, nullptr);
  if (!std::filesystem::exists(cache.Directory())) {
    std::cout << "No cache directory found at " << cache.Directory().string()
              << "\n";
    return kExitSuccess;
  }
  cache.Clean();
  std::cout << "Removed cache at " << cache.Directory().string() << "\n";
  return kExitSuccess;
}

int RunCacheCommand(const std::vector<std::string> &arguments) {
  if (arguments.empty()) {
    std::cout << "Cache subcommand requires an action (e.g., clean).\n";
    return kExitUsageError;
  }
  const std::string &action = arguments.front();
  if (action == "clean") {
    const std::vector<std::string> clean_args(arguments.begin() + 1,
                                              arguments.end());
    return RunCacheClean(clean_args);
  }
  std::cout << "Unknown cache subcommand: " << action << "\n";
  return kExitUsageError;
}

} // namespace adr
