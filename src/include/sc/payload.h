#pragma once

#include <sc/issue.h>
#include <sc/value.h>
#include <string>
#include <utility>
#include <vector>

namespace sc {

enum class ReportFormat { Tree, Flat, Pretty };

// Caller-supplied options for one parse call.
struct ParseContext {
    // Consulted after check and schema hooks, before the process config.
    ErrorMap error_map;
    // Locale id used to pick a registered locale error map; empty means the
    // process default locale.
    std::string locale;
    // Treat `strip` objects as `strict`.
    bool strict = false;
    // Every check behaves as aborting.
    bool abort_early = false;
    ReportFormat report_format = ReportFormat::Pretty;
    // Copy the offending input into finalised issues.
    bool report_input = false;
};

// Scratch record carried through one parse: the in-flight value, the issues
// collected so far (paths relative to this payload) and the absolute path of
// this payload inside the root value.
struct Payload {
    Value value;
    std::vector<RawIssue> issues;
    Path path;
    const ParseContext* ctx = nullptr;

    Payload() = default;
    explicit Payload(Value v, const ParseContext* c = nullptr) : value(std::move(v)), ctx(c) {}

    bool ok() const noexcept { return issues.empty(); }

    void add_issue(RawIssue issue) { issues.push_back(std::move(issue)); }

    // Child payload for the element at `key`.
    Payload child(const PathKey& key, Value v) const {
        Payload p(std::move(v), ctx);
        p.path = path;
        p.path.push_back(key);
        return p;
    }

    // Child payload at the same position (pipes, unions, wrappers).
    Payload sibling(Value v) const {
        Payload p(std::move(v), ctx);
        p.path = path;
        return p;
    }

    // Append issues collected by a child payload, prefixing their paths with `key`.
    void merge_child(const PathKey& key, std::vector<RawIssue>&& child_issues) {
        for (auto& iss : child_issues) {
            iss.path.insert(iss.path.begin(), key);
            issues.push_back(std::move(iss));
        }
    }

    void merge(std::vector<RawIssue>&& other) {
        for (auto& iss : other) issues.push_back(std::move(iss));
    }
};

}  // namespace sc
