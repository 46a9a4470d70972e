#include <sc/error.h>
#include <algorithm>
#include <sstream>

namespace sc {

namespace {
    std::string key_string(const PathKey& key) {
        if (auto idx = std::get_if<int64_t>(&key)) return std::to_string(*idx);
        return std::get<std::string>(key);
    }

    Path join(const Path& prefix, const Path& rest) {
        Path out = prefix;
        out.insert(out.end(), rest.begin(), rest.end());
        return out;
    }

    // Visit every leaf issue with its absolute path. Union branches and the
    // nested issues of key/element failures are expanded in place.
    void walk(const std::vector<Issue>& issues, const Path& prefix,
              const std::function<void(const Path&, const Issue&)>& leaf) {
        for (auto const& issue : issues) {
            Path full = join(prefix, issue.path);
            if (issue.code == IssueCode::InvalidUnion && !issue.branches.empty()) {
                for (auto const& branch : issue.branches) walk(branch, full, leaf);
                continue;
            }
            if ((issue.code == IssueCode::InvalidKey || issue.code == IssueCode::InvalidElement) &&
                !issue.issues.empty()) {
                walk(issue.issues, full, leaf);
                continue;
            }
            leaf(full, issue);
        }
    }

    Value empty_tree() {
        Value t = Value::object();
        t["errors"] = Value::array();
        return t;
    }

    std::string message_of(const Issue& issue, const IssueMapper& mapper) {
        return mapper ? mapper(issue) : issue.message;
    }
}  // namespace

ValidationError::ValidationError(std::vector<Issue> issues, ReportFormat report_format)
    : m_issues(std::move(issues)), m_report_format(report_format) {
    if (m_issues.empty()) throw std::logic_error("ValidationError requires at least one issue");
}

FlattenedError ValidationError::flatten(const IssueMapper& mapper) const {
    FlattenedError out;
    walk(m_issues, {}, [&](const Path& path, const Issue& issue) {
        if (path.empty())
            out.form_errors.push_back(message_of(issue, mapper));
        else
            out.field_errors[key_string(path.front())].push_back(message_of(issue, mapper));
    });
    return out;
}

Value ValidationError::treeify(const IssueMapper& mapper) const {
    Value root = empty_tree();
    walk(m_issues, {}, [&](const Path& path, const Issue& issue) {
        Value* node = &root;
        for (auto const& key : path) {
            if (auto idx = std::get_if<int64_t>(&key)) {
                Value& items = (*node)["items"];
                if (items.isNull()) items = Value::array();
                size_t at = static_cast<size_t>(*idx);
                while (items.size() <= at) items.push_back(empty_tree());
                node = &items[at];
            } else {
                Value& props = (*node)["properties"];
                if (props.isNull()) props = Value::object();
                Value& child = props[std::get<std::string>(key)];
                if (child.isNull()) child = empty_tree();
                node = &child;
            }
        }
        (*node)["errors"].push_back(message_of(issue, mapper));
    });
    return root;
}

Value ValidationError::format(const IssueMapper& mapper) const {
    Value root = Value::object();
    root["_errors"] = Value::array();
    walk(m_issues, {}, [&](const Path& path, const Issue& issue) {
        Value* node = &root;
        for (auto const& key : path) {
            Value& child = (*node)[key_string(key)];
            if (child.isNull()) {
                child = Value::object();
                child["_errors"] = Value::array();
            }
            node = &child;
        }
        (*node)["_errors"].push_back(message_of(issue, mapper));
    });
    return root;
}

std::string ValidationError::prettify() const {
    std::vector<const Issue*> sorted;
    for (auto const& issue : m_issues) sorted.push_back(&issue);
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Issue* a, const Issue* b) { return a->path.size() < b->path.size(); });

    std::ostringstream ss;
    bool first = true;
    for (auto const* issue : sorted) {
        if (!first) ss << "\n";
        first = false;
        ss << "✖ " << issue->message;
        if (!issue->path.empty()) ss << "\n  → at " << to_dot_path(issue->path);
    }
    return ss.str();
}

std::string ValidationError::to_string() const {
    switch (m_report_format) {
        case ReportFormat::Tree:
            return treeify().dump(2);
        case ReportFormat::Flat: {
            FlattenedError flat = flatten();
            std::ostringstream ss;
            bool first = true;
            for (auto const& msg : flat.form_errors) {
                if (!first) ss << "\n";
                first = false;
                ss << msg;
            }
            for (auto const& field : flat.field_errors) {
                for (auto const& msg : field.second) {
                    if (!first) ss << "\n";
                    first = false;
                    ss << field.first << ": " << msg;
                }
            }
            return ss.str();
        }
        case ReportFormat::Pretty:
            break;
    }
    return prettify();
}

std::ostream& operator<<(std::ostream& os, const ValidationError& e) {
    os << e.to_string();
    return os;
}

ParseError::ParseError(ValidationError error) : std::runtime_error(error.to_string()), m_error(std::move(error)) {}

}  // namespace sc
