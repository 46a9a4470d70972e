#include <sc/schema.h>
#include <algorithm>

namespace sc {

namespace {
    bool contains(const std::vector<std::string>& keys, const std::string& k) {
        return std::find(keys.begin(), keys.end(), k) != keys.end();
    }

    void require_known(const Shape& shape, const std::vector<std::string>& keys, const char* op) {
        for (auto const& k : keys) {
            bool found = false;
            for (auto const& f : shape) found = found || f.first == k;
            if (!found) throw std::invalid_argument(std::string(op) + "(): unrecognized key \"" + k + "\"");
        }
    }
}  // namespace

Schema object(Shape shape) {
    for (size_t i = 0; i < shape.size(); ++i)
        for (size_t j = i + 1; j < shape.size(); ++j)
            if (shape[i].first == shape[j].first)
                throw std::invalid_argument("object(): duplicate field \"" + shape[i].first + "\"");
    auto node = std::make_shared<SchemaNode>();
    node->kind = Kind::Object;
    node->shape = std::move(shape);
    return Schema(std::move(node));
}

const Shape& Schema::shape() const {
    require_kind({Kind::Object}, "shape");
    return m_node->shape;
}

UnknownKeys Schema::unknown_keys() const {
    require_kind({Kind::Object}, "unknown_keys");
    return m_node->unknown_keys;
}

// Derived objects drop the receiver's refinements: they were written
// against the old shape.
Schema Schema::pick(const std::vector<std::string>& keys) const {
    require_kind({Kind::Object}, "pick");
    require_known(m_node->shape, keys, "pick");
    auto node = clone();
    node->checks.clear();
    node->shape.clear();
    for (auto const& f : m_node->shape)
        if (contains(keys, f.first)) node->shape.push_back(f);
    return Schema(std::move(node));
}

Schema Schema::omit(const std::vector<std::string>& keys) const {
    require_kind({Kind::Object}, "omit");
    require_known(m_node->shape, keys, "omit");
    auto node = clone();
    node->checks.clear();
    node->shape.clear();
    for (auto const& f : m_node->shape)
        if (!contains(keys, f.first)) node->shape.push_back(f);
    return Schema(std::move(node));
}

Schema Schema::partial(const std::vector<std::string>& keys) const {
    require_kind({Kind::Object}, "partial");
    require_known(m_node->shape, keys, "partial");
    auto node = clone();
    node->checks.clear();
    for (auto& f : node->shape) {
        if (!keys.empty() && !contains(keys, f.first)) continue;
        if (f.second.kind() != Kind::Optional) f.second = f.second.optional();
    }
    return Schema(std::move(node));
}

Schema Schema::required(const std::vector<std::string>& keys) const {
    require_kind({Kind::Object}, "required");
    require_known(m_node->shape, keys, "required");
    auto node = clone();
    node->checks.clear();
    for (auto& f : node->shape) {
        if (!keys.empty() && !contains(keys, f.first)) continue;
        while (f.second.kind() == Kind::Optional) f.second = f.second.non_optional();
    }
    return Schema(std::move(node));
}

Schema Schema::extend(const Shape& fields) const {
    require_kind({Kind::Object}, "extend");
    auto node = clone();
    node->checks.clear();
    for (auto const& f : fields) {
        auto it = std::find_if(node->shape.begin(), node->shape.end(),
                               [&f](const std::pair<std::string, Schema>& e) { return e.first == f.first; });
        if (it != node->shape.end())
            it->second = f.second;
        else
            node->shape.push_back(f);
    }
    return Schema(std::move(node));
}

Schema Schema::merge(const Schema& other) const {
    require_kind({Kind::Object}, "merge");
    other.require_kind({Kind::Object}, "merge");
    Schema merged = extend(other.shape());
    auto node = std::make_shared<SchemaNode>(merged.node());
    node->unknown_keys = other.node().unknown_keys;
    node->rest = other.node().rest;
    return Schema(std::move(node));
}

Schema Schema::key_of() const {
    require_kind({Kind::Object}, "key_of");
    std::vector<Value> names;
    for (auto const& f : m_node->shape) names.push_back(f.first);
    return enum_of(std::move(names));
}

Schema Schema::strict() const {
    require_kind({Kind::Object}, "strict");
    auto node = clone();
    node->unknown_keys = UnknownKeys::Strict;
    node->rest.reset();
    return Schema(std::move(node));
}

Schema Schema::strip() const {
    require_kind({Kind::Object}, "strip");
    auto node = clone();
    node->unknown_keys = UnknownKeys::Strip;
    node->rest.reset();
    return Schema(std::move(node));
}

Schema Schema::passthrough() const {
    require_kind({Kind::Object}, "passthrough");
    auto node = clone();
    node->unknown_keys = UnknownKeys::Passthrough;
    node->rest.reset();
    return Schema(std::move(node));
}

Schema Schema::catchall(const Schema& rest) const {
    require_kind({Kind::Object}, "catchall");
    auto node = clone();
    node->unknown_keys = UnknownKeys::Catchall;
    node->rest = rest;
    return Schema(std::move(node));
}

}  // namespace sc
