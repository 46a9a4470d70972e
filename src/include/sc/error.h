#pragma once

#include <sc/issue.h>
#include <sc/payload.h>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace sc {

// Form-level messages plus messages grouped by the first path element.
struct FlattenedError {
    std::vector<std::string> form_errors;
    std::map<std::string, std::vector<std::string> > field_errors;
};

using IssueMapper = std::function<std::string(const Issue&)>;

// The result of a failed parse: an ordered, non-empty list of issues.
//
// Union branches and the nested issues of invalid_key / invalid_element are
// expanded by flatten(), treeify() and format(); their paths are resolved
// against the path of the issue that carries them.
class ValidationError {
  public:
    explicit ValidationError(std::vector<Issue> issues, ReportFormat report_format = ReportFormat::Pretty);

    const std::vector<Issue>& issues() const noexcept { return m_issues; }
    size_t size() const noexcept { return m_issues.size(); }
    const Issue& front() const { return m_issues.front(); }
    ReportFormat report_format() const noexcept { return m_report_format; }

    FlattenedError flatten(const IssueMapper& mapper = {}) const;

    // {"errors": [...], "properties": {key: tree}, "items": [tree | null]}
    Value treeify(const IssueMapper& mapper = {}) const;

    // {"_errors": [...], key: {"_errors": [...], ...}}; indices become string keys
    Value format(const IssueMapper& mapper = {}) const;

    // One "✖ message" line per issue, shallow paths first, each followed by
    // "  → at a.b[0]" when the issue has a path.
    std::string prettify() const;

    // Rendering chosen by the report format of the parse that produced it.
    std::string to_string() const;

  private:
    std::vector<Issue> m_issues;
    ReportFormat m_report_format;
};

std::ostream& operator<<(std::ostream& os, const ValidationError& e);

// Thrown by must_parse and by validated functions.
class ParseError : public std::runtime_error {
  public:
    explicit ParseError(ValidationError error);
    const ValidationError& error() const noexcept { return m_error; }

  private:
    ValidationError m_error;
};

}  // namespace sc
