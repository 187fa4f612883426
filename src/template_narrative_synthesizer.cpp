#include <adr/template_narrative_synthesizer.h>

#include <adr/dates.h>
#include <adr/decision_categorizer.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

namespace adr {
namespace {

constexpr std::size_t kMaxListedFiles = 3;

std::string JoinWords(const std::vector<std::string> &words) {
  std::string joined;
  for (std::size_t i = 0; i < words.size(); ++i) {
    if (i > 0) {
      joined.append(i + 1 == words.size() ? " and " : ", ");
    }
    joined.append(words[i]);
  }
  return joined;
}

std::string Percent(double value) {
  std::ostringstream stream;
  stream << static_cast<int>(value * 100.0 + 0.5) << "%";
  return stream.str();
}

std::string Plural(std::size_t count, const std::string &noun) {
  return std::to_string(count) + " " + noun + (count == 1 ? "" : "s");
}

} // namespace

TemplateNarrativeSynthesizer::TemplateNarrativeSynthesizer()
    : alternatives_{
          {"architecture",
           {"Keep the existing structure and refactor incrementally",
            "Split the change into independent modules"}},
          {"technology",
           {"Stay on the current technology", "Evaluate a competing option"}},
          {"pattern", {"Inline the logic without a shared abstraction"}},
          {"convention", {"Leave conventions to individual contributors"}},
          {"security",
           {"Rely on perimeter controls", "Adopt a third-party security "
                                          "service"}},
          {"performance",
           {"Scale hardware instead of optimizing code",
            "Defer optimization until profiling demands it"}},
          {"testing", {"Rely on manual verification"}},
          {"deployment",
           {"Deploy manually", "Use a managed hosting platform"}},
          {"data-model",
           {"Keep the current schema", "Store the data in a schemaless "
                                       "store"}},
          {"api-design", {"Keep the existing interface unchanged"}},
          {"error-handling", {"Propagate failures to callers unchanged"}},
          {"documentation", {"Keep knowledge in code comments only"}},
      } {}

Narrative
TemplateNarrativeSynthesizer::Synthesize(const EvidencePackage &evidence) {
  Narrative narrative;
  if (evidence.commits.empty()) {
    return narrative;
  }
  narrative.context = BuildContext(evidence);
  narrative.decision = BuildDecision(evidence);
  narrative.consequences = BuildConsequences(evidence);

  const auto found = alternatives_.find(evidence.category);
  if (found != alternatives_.end()) {
    narrative.alternatives = found->second;
  } else {
    narrative.alternatives = {"Leave the affected code unchanged"};
  }
  return narrative;
}

std::string
TemplateNarrativeSynthesizer::BuildContext(const EvidencePackage &evidence) const {
  std::set<std::string> authors;
  std::set<std::string> files;
  auto first = evidence.commits.front().timestamp;
  auto last = first;
  for (const auto &commit : evidence.commits) {
    if (!commit.author.empty()) {
      authors.insert(commit.author);
    }
    files.insert(commit.files.begin(), commit.files.end());
    first = std::min(first, commit.timestamp);
    last = std::max(last, commit.timestamp);
  }

  std::ostringstream context;
  context << Plural(evidence.commits.size(), "commit");
  if (!authors.empty()) {
    context << " by "
            << JoinWords(std::vector<std::string>(authors.begin(),
                                                  authors.end()));
  }
  const auto first_date = FormatUtcDate(first);
  const auto last_date = FormatUtcDate(last);
  if (first_date == last_date) {
    context << " on " << first_date;
  } else {
    context << " between " << first_date << " and " << last_date;
  }
  context << " touched " << Plural(files.size(), "file") << ".";

  std::vector<std::string> reasons;
  for (const auto &reason : evidence.reasons) {
    reasons.push_back(ReasonKindName(reason.kind) + " (" +
                      Percent(reason.value) + ")");
  }
  if (!reasons.empty()) {
    context << " The commits are linked by " << JoinWords(reasons) << ".";
  }
  context << " Overall similarity is " << Percent(evidence.similarity_score)
          << ".";
  return context.str();
}

std::string TemplateNarrativeSynthesizer::BuildDecision(
    const EvidencePackage &evidence) const {
  const auto *chosen = &evidence.commits.front();
  for (const auto &commit : evidence.commits) {
    if (DecisionCategorizer::IsTrivialMessage(commit.message)) {
      continue;
    }
    if (DecisionCategorizer::IsTrivialMessage(chosen->message) ||
        commit.extraction.significance > chosen->extraction.significance) {
      chosen = &commit;
    }
  }

  auto decision = DescribeMessage(chosen->message);
  if (decision.empty()) {
    decision = "Consolidate " + evidence.category + " changes";
  } else {
    decision[0] = static_cast<char>(
        std::toupper(static_cast<unsigned char>(decision[0])));
  }
  return decision;
}

std::vector<std::string> TemplateNarrativeSynthesizer::BuildConsequences(
    const EvidencePackage &evidence) const {
  std::vector<std::string> consequences;
  std::set<std::string> seen;
  const auto add = [&](std::string text) {
    if (seen.insert(text).second) {
      consequences.push_back(std::move(text));
    }
  };

  std::size_t functions_added = 0;
  std::size_t functions_modified = 0;
  for (const auto &commit : evidence.commits) {
    const auto &extraction = commit.extraction;
    for (const auto &[name, kind] : extraction.dependencies) {
      switch (kind) {
      case ChangeKind::kAdded:
        add("Introduces dependency " + name);
        break;
      case ChangeKind::kRemoved:
        add("Drops dependency " + name);
        break;
      case ChangeKind::kModified:
      case ChangeKind::kRenamed:
        add("Changes the version of dependency " + name);
        break;
      }
    }
    for (const auto &function : extraction.functions) {
      switch (function.kind) {
      case ChangeKind::kAdded:
        ++functions_added;
        break;
      case ChangeKind::kRemoved:
        add("Removes " + function.name);
        break;
      case ChangeKind::kModified:
        ++functions_modified;
        break;
      case ChangeKind::kRenamed:
        add("Renames " + function.previous_name + " to " + function.name);
        break;
      }
    }
    for (const auto &signal : extraction.architectural_signals) {
      add("Shows structural signal " + signal);
    }
  }
  if (functions_added > 0) {
    add("Adds " + Plural(functions_added, "function"));
  }
  if (functions_modified > 0) {
    add("Changes the signature of " + Plural(functions_modified, "function"));
  }

  if (consequences.empty()) {
    std::set<std::string> files;
    for (const auto &commit : evidence.commits) {
      files.insert(commit.files.begin(), commit.files.end());
    }
    std::vector<std::string> listed;
    for (const auto &file : files) {
      if (listed.size() == kMaxListedFiles) {
        break;
      }
      listed.push_back(file);
    }
    if (!listed.empty()) {
      add("Concentrates change in " + JoinWords(listed));
    }
  }
  return consequences;
}

} // namespace adr
