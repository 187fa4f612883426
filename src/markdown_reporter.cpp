#include <adr/markdown_reporter.h>

#include <adr/dates.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace adr {
namespace {

template <typename Collection, typename Formatter>
std::string Join(const Collection &items, const std::string &delimiter,
                 Formatter formatter) {
  std::ostringstream output;
  bool first = true;
  std::for_each(items.begin(), items.end(), [&](const auto &item) {
    if (!first) {
      output << delimiter;
    }
    output << formatter(item);
    first = false;
  });
  return output.str();
}

std::string JoinJsonArray(const std::vector<std::string> &values) {
  return Join(values, ",", [](const std::string &value) {
    return "\"" + EscapeJsonString(value) + "\"";
  });
}

std::string FormatScore(double value) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(3) << value;
  return stream.str();
}

// Keeps table rows on one line.
std::string EscapeTableCell(const std::string &value) {
  std::string escaped;
  for (const auto character : value) {
    if (character == '|') {
      escaped.append("\\|");
    } else if (character == '\n') {
      escaped.append("<br>");
    } else if (character != '\r') {
      escaped.push_back(character);
    }
  }
  return escaped;
}

bool ShouldRenderFormat(const std::vector<std::string> &formats,
                        const std::string &format) {
  if (formats.empty()) {
    return format == "markdown";
  }
  return std::find(formats.begin(), formats.end(), format) != formats.end();
}

std::string ReferenceKindName(AdrReference::Kind kind) {
  return kind == AdrReference::Kind::kCommit ? "commit" : "file";
}

std::string BuildSummaryMarkdown(const DecisionMiningResult &result,
                                 const ReportContext &context,
                                 const std::string &timestamp) {
  const auto &summary = result.summary;
  std::ostringstream section;
  section << "## Summary\n\n";
  section << "| Field | Value |\n";
  section << "| --- | --- |\n";
  section << "| Generated On | " << timestamp << " |\n";
  section << "| Repository | " << EscapeTableCell(context.root_path) << " |\n";
  section << "| Commits Walked | " << summary.commits_walked << " |\n";
  section << "| Commits Extracted | " << summary.commits_extracted << " |\n";
  section << "| Commits Clustered | " << summary.commits_clustered << " |\n";
  section << "| Clusters Formed | " << summary.clusters_formed << " |\n";
  section << "| Decisions | " << summary.decisions_synthesized << " |\n";
  section << "| Discarded By Threshold | " << summary.discarded_by_threshold
          << " |\n";
  section << "| Synthesis Failures | " << summary.synthesis_failures << " |\n";
  section << "| Duration (ms) | " << summary.duration_ms << " |\n\n";
  return section.str();
}

std::string BuildDecisionIndexMarkdown(const DecisionMiningResult &result) {
  std::ostringstream section;
  section << "## Decisions\n\n";
  section << "| Id | Category | Title | Commits | Confidence |\n";
  section << "| --- | --- | --- | --- | --- |\n";
  if (result.decisions.empty()) {
    section << "| None | - | - | - | - |\n\n";
    return section.str();
  }
  for (const auto &decision : result.decisions) {
    section << "| " << decision.id << " | " << decision.category << " | "
            << EscapeTableCell(decision.title) << " | "
            << decision.cluster.commits.size() << " | "
            << FormatScore(decision.confidence) << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildDecisionMarkdown(const MinedDecision &decision) {
  std::ostringstream section;
  section << "### " << decision.id << ": " << decision.title << "\n\n";
  section << "- Category: " << decision.category << "\n";
  section << "- Confidence: " << FormatScore(decision.confidence) << "\n";
  section << "- Similarity: " << FormatScore(decision.cluster.similarity_score)
          << "\n";
  section << "- Reasons: ";
  if (decision.cluster.reasons.empty()) {
    section << "None";
  } else {
    section << Join(decision.cluster.reasons, ", ",
                    [](const ClusterReason &reason) {
                      return ReasonKindName(reason.kind) + " (" +
                             FormatScore(reason.value) + ")";
                    });
  }
  section << "\n\n";

  section << "#### Context\n\n" << decision.adr.context << "\n\n";
  section << "#### Decision\n\n" << decision.adr.decision << "\n\n";
  section << "#### Consequences\n\n";
  if (decision.adr.consequences.empty()) {
    section << "- None\n";
  }
  for (const auto &consequence : decision.adr.consequences) {
    section << "- " << consequence << "\n";
  }
  section << "\n#### Alternatives Considered\n\n";
  if (decision.adr.alternatives.empty()) {
    section << "- None\n";
  }
  for (const auto &alternative : decision.adr.alternatives) {
    section << "- " << alternative << "\n";
  }

  section << "\n#### References\n\n";
  for (const auto &reference : decision.adr.references) {
    section << "- " << ReferenceKindName(reference.kind) << ": `"
            << reference.target << "`\n";
  }

  section << "\n#### Evidence\n\n";
  section << "| Signal | Metric | Value | Detail |\n";
  section << "| --- | --- | --- | --- |\n";
  for (const auto &entry : decision.adr.evidence) {
    section << "| " << entry.signal << " | " << entry.metric << " | "
            << FormatScore(entry.value) << " | "
            << (entry.detail.empty() ? "-" : EscapeTableCell(entry.detail))
            << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildDiagnosticsMarkdown(const DecisionMiningResult &result) {
  std::ostringstream section;
  section << "## Errors\n\n";
  if (result.errors.empty()) {
    section << "- None\n";
  }
  for (const auto &error : result.errors) {
    section << "- " << MiningErrorKindName(error.kind) << ": "
            << error.message << "\n";
  }
  section << "\n## Warnings\n\n";
  if (result.warnings.empty()) {
    section << "- None\n";
  }
  for (const auto &warning : result.warnings) {
    section << "- " << warning << "\n";
  }
  return section.str();
}

std::string BuildSummaryJson(const DecisionMiningResult &result) {
  const auto &summary = result.summary;
  std::ostringstream json;
  json << "\"summary\": {";
  json << "\"commits_walked\": " << summary.commits_walked << ",";
  json << "\"commits_extracted\": " << summary.commits_extracted << ",";
  json << "\"commits_clustered\": " << summary.commits_clustered << ",";
  json << "\"clusters_formed\": " << summary.clusters_formed << ",";
  json << "\"decisions_synthesized\": " << summary.decisions_synthesized
       << ",";
  json << "\"discarded_by_threshold\": " << summary.discarded_by_threshold
       << ",";
  json << "\"synthesis_failures\": " << summary.synthesis_failures << ",";
  json << "\"duration_ms\": " << summary.duration_ms << "}";
  return json.str();
}

std::string BuildDecisionJson(const MinedDecision &decision) {
  std::ostringstream json;
  json << "{\"id\": \"" << EscapeJsonString(decision.id) << "\",";
  json << "\"category\": \"" << EscapeJsonString(decision.category) << "\",";
  json << "\"title\": \"" << EscapeJsonString(decision.title) << "\",";
  json << "\"confidence\": " << FormatScore(decision.confidence) << ",";
  json << "\"cluster\": {";
  json << "\"commits\": [" << JoinJsonArray(decision.cluster.commits) << "],";
  json << "\"similarity_score\": "
       << FormatScore(decision.cluster.similarity_score) << ",";
  json << "\"edge_count\": " << decision.cluster.edge_count << ",";
  json << "\"reasons\": ["
       << Join(decision.cluster.reasons, ",",
               [](const ClusterReason &reason) {
                 return "{\"kind\": \"" + ReasonKindName(reason.kind) +
                        "\", \"value\": " + FormatScore(reason.value) +
                        ", \"contribution\": " +
                        FormatScore(reason.contribution) + "}";
               })
       << "]},";
  json << "\"context\": \"" << EscapeJsonString(decision.adr.context) << "\",";
  json << "\"decision\": \"" << EscapeJsonString(decision.adr.decision)
       << "\",";
  json << "\"consequences\": [" << JoinJsonArray(decision.adr.consequences)
       << "],";
  json << "\"alternatives\": [" << JoinJsonArray(decision.adr.alternatives)
       << "],";
  json << "\"references\": ["
       << Join(decision.adr.references, ",",
               [](const AdrReference &reference) {
                 return "{\"kind\": \"" + ReferenceKindName(reference.kind) +
                        "\", \"target\": \"" +
                        EscapeJsonString(reference.target) + "\"}";
               })
       << "],";
  json << "\"evidence\": ["
       << Join(decision.adr.evidence, ",",
               [](const EvidenceEntry &entry) {
                 return "{\"signal\": \"" + EscapeJsonString(entry.signal) +
                        "\", \"metric\": \"" + EscapeJsonString(entry.metric) +
                        "\", \"value\": " + FormatScore(entry.value) +
                        ", \"detail\": \"" + EscapeJsonString(entry.detail) +
                        "\"}";
               })
       << "]}";
  return json.str();
}

} // namespace

std::string EscapeJsonString(const std::string &value) {
  static const std::unordered_map<char, std::string> replacements{
      {'"', "\\\""},
      {'\\', "\\\\"},
      {'\n', "\\n"},
      {'\r', "\\r"},
      {'\t', "\\t"}};

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    const auto replacement = replacements.find(character);
    if (replacement != replacements.end()) {
      escaped.append(replacement->second);
    } else if (static_cast<unsigned char>(character) < 0x20) {
      char buffer[8];
      std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                    static_cast<unsigned>(static_cast<unsigned char>(character)));
      escaped.append(buffer);
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

Report MarkdownReporter::Render(const DecisionMiningResult &result,
                                const ReportContext &context) {
  const auto now = std::chrono::system_clock::to_time_t(
      std::chrono::system_clock::now());
  const auto timestamp = FormatUtcTimestamp(static_cast<std::int64_t>(now));

  Report report;
  if (ShouldRenderFormat(context.formats, "markdown")) {
    std::ostringstream output;
    output << "# Architectural Decisions\n\n";
    output << BuildSummaryMarkdown(result, context, timestamp);
    output << BuildDecisionIndexMarkdown(result);
    for (const auto &decision : result.decisions) {
      output << BuildDecisionMarkdown(decision);
    }
    output << BuildDiagnosticsMarkdown(result);
    report.markdown = output.str();
  }

  if (ShouldRenderFormat(context.formats, "json")) {
    std::ostringstream output;
    output << "{";
    output << "\"generated_on\": \"" << EscapeJsonString(timestamp) << "\",";
    output << "\"repository\": \"" << EscapeJsonString(context.root_path)
           << "\",";
    output << BuildSummaryJson(result) << ",";
    output << "\"decisions\": ["
           << Join(result.decisions, ",", BuildDecisionJson) << "],";
    output << "\"errors\": ["
           << Join(result.errors, ",",
                   [](const MiningError &error) {
                     return "{\"kind\": \"" + MiningErrorKindName(error.kind) +
                            "\", \"message\": \"" +
                            EscapeJsonString(error.message) + "\"}";
                   })
           << "],";
    output << "\"warnings\": [" << JoinJsonArray(result.warnings) << "]";
    output << "}";
    report.json = output.str();
  }
  return report;
}

} // namespace adr
