#include <sc/merge.h>

namespace sc {

namespace {
    MergeResult conflict_at(Path path) {
        MergeResult r;
        r.ok = false;
        r.conflict = std::move(path);
        return r;
    }

    MergeResult merge_at(const Value& a, const Value& b, const Path& path) {
        if (a.isNull()) return MergeResult{true, b, {}};
        if (b.isNull()) return MergeResult{true, a, {}};
        if (a == b) return MergeResult{true, a, {}};

        if (a.isObject() && b.isObject()) {
            Value out = a;
            for (auto const& kv : b.asObject()) {
                if (!a.has(kv.first)) {
                    out[kv.first] = kv.second;
                    continue;
                }
                Path child = path;
                child.push_back(kv.first);
                MergeResult sub = merge_at(a.at(kv.first), kv.second, child);
                if (!sub.ok) return sub;
                out[kv.first] = std::move(sub.value);
            }
            return MergeResult{true, std::move(out), {}};
        }

        if (a.isArray() && b.isArray()) {
            if (a.size() != b.size()) return conflict_at(path);
            Value out = Value::array();
            for (size_t i = 0; i < a.size(); ++i) {
                Path child = path;
                child.push_back(static_cast<int64_t>(i));
                MergeResult sub = merge_at(a.at(i), b.at(i), child);
                if (!sub.ok) return sub;
                out.push_back(std::move(sub.value));
            }
            return MergeResult{true, std::move(out), {}};
        }

        if (a.isPointer() && b.isPointer() && a.pointee() && b.pointee()) {
            MergeResult sub = merge_at(*a.pointee(), *b.pointee(), path);
            if (!sub.ok) return sub;
            return MergeResult{true, Value::pointer(std::move(sub.value)), {}};
        }

        return conflict_at(path);
    }
}  // namespace

MergeResult merge_values(const Value& a, const Value& b) { return merge_at(a, b, {}); }

}  // namespace sc
