#pragma once

#include <sc/schema.h>
#include <sc/value.h>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sc {

struct SchemaMeta {
    std::string title;
    std::string description;
    std::string version;
    // Anything else a consumer (documentation, schema export) wants to keep
    Value extra = Value::object();
};

// Side table of schema metadata and named schemas. Entries are keyed by
// schema identity: a modified copy of a registered schema is a different
// schema. Safe to use from several threads.
class Registry {
  public:
    Registry() = default;
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Replaces existing metadata for the same schema.
    Registry& add(const Schema& schema, SchemaMeta meta);
    std::optional<SchemaMeta> get(const Schema& schema) const;
    bool has(const Schema& schema) const;
    Registry& remove(const Schema& schema);

    // Visit every entry until `fn` returns false. The callback runs on a
    // snapshot, so it may call back into the registry.
    void for_each(const std::function<bool(const Schema&, const SchemaMeta&)>& fn) const;

    // Named schemas for cross references.
    Registry& define(const std::string& name, const Schema& schema);
    // Throws std::out_of_range for an unknown name.
    Schema lookup(const std::string& name) const;
    bool defined(const std::string& name) const;
    // Lazy schema resolving `name` on first use; the name may be defined after
    // the reference is created. Resolving after the registry is gone fails
    // the parse with a custom issue.
    Schema ref(const std::string& name) const;

    // Metadata of the first registered schema carrying `tag` as its brand.
    std::optional<SchemaMeta> by_brand(const std::string& tag) const;

    size_t size() const;
    void clear();

  private:
    struct Entry {
        Schema schema;
        SchemaMeta meta;
    };

    // Named schemas live apart from the registry so that ref() schemas can
    // hold them weakly and outlive it.
    struct NameTable {
        std::mutex mutex;
        std::map<std::string, Schema> schemas;

        Schema lookup(const std::string& name);
    };

    mutable std::mutex m_mutex;
    std::vector<Entry> m_entries;
    std::shared_ptr<NameTable> m_names = std::make_shared<NameTable>();

    std::vector<Entry>::const_iterator find(const Schema& schema) const;
};

// Process-wide registry.
Registry& global_registry();

}  // namespace sc
