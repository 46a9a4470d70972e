#include <sc/registry.h>
#include <sc/config.h>
#include <algorithm>
#include <stdexcept>

namespace sc {

std::vector<Registry::Entry>::const_iterator Registry::find(const Schema& schema) const {
    return std::find_if(m_entries.begin(), m_entries.end(),
                        [&schema](const Entry& e) { return e.schema.same_node(schema); });
}

Registry& Registry::add(const Schema& schema, SchemaMeta meta) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = find(schema);
    if (it != m_entries.end()) {
        m_entries[static_cast<size_t>(it - m_entries.begin())].meta = std::move(meta);
        return *this;
    }
    m_entries.push_back({schema, std::move(meta)});
    return *this;
}

std::optional<SchemaMeta> Registry::get(const Schema& schema) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = find(schema);
    if (it == m_entries.end()) return std::nullopt;
    return it->meta;
}

bool Registry::has(const Schema& schema) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return find(schema) != m_entries.end();
}

Registry& Registry::remove(const Schema& schema) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = find(schema);
    if (it != m_entries.end()) m_entries.erase(it);
    return *this;
}

void Registry::for_each(const std::function<bool(const Schema&, const SchemaMeta&)>& fn) const {
    std::vector<Entry> snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        snapshot = m_entries;
    }
    for (auto const& e : snapshot)
        if (!fn(e.schema, e.meta)) break;
}

Schema Registry::NameTable::lookup(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = schemas.find(name);
    if (it == schemas.end()) throw std::out_of_range("no schema named '" + name + "'");
    return it->second;
}

Registry& Registry::define(const std::string& name, const Schema& schema) {
    if (name.empty()) throw std::invalid_argument("define(): empty schema name");
    std::lock_guard<std::mutex> lock(m_names->mutex);
    m_names->schemas[name] = schema;
    debug_log("registry: defined '" + name + "' as " + kind_name(schema.kind()));
    return *this;
}

Schema Registry::lookup(const std::string& name) const { return m_names->lookup(name); }

bool Registry::defined(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_names->mutex);
    return m_names->schemas.count(name) == 1;
}

Schema Registry::ref(const std::string& name) const {
    std::weak_ptr<NameTable> names = m_names;
    return lazy([names, name] {
        auto table = names.lock();
        if (!table) throw std::runtime_error("schema '" + name + "' referenced after its registry was destroyed");
        return table->lookup(name);
    });
}

std::optional<SchemaMeta> Registry::by_brand(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto const& e : m_entries)
        if (e.schema.brand_name() == tag) return e.meta;
    return std::nullopt;
}

size_t Registry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

void Registry::clear() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.clear();
    }
    std::lock_guard<std::mutex> lock(m_names->mutex);
    m_names->schemas.clear();
}

Registry& global_registry() {
    static Registry registry;
    return registry;
}

}  // namespace sc
