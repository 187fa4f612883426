#pragma once

#include <adr/interfaces.h>

#include <string>

namespace adr {

// Renders decisions.md and decisions.json. Formats are "markdown" and
// "json"; no formats means markdown only.
class MarkdownReporter : public Reporter {
public:
  Report Render(const DecisionMiningResult &result,
                const ReportContext &context) override;
};

std::string EscapeJsonString(const std::string &value);

} // namespace adr
