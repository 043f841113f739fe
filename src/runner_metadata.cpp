#include "runner_metadata.h"

#include <fmt/format.h>

namespace skytest::runner {

namespace {

const DictValue *dict_global(const Namespace &globals, std::string_view name) {
    auto it = globals.find(std::string(name));
    if (it == globals.end() || it->second.kind() != Value::Kind::Dict)
        return nullptr;
    return it->second.as_dict().get();
}

// `True`/`False` or a reason string (which implies true).
void read_flag(const DictValue &d, std::string_view key, bool &flag, std::string &reason) {
    const Value *v = d.find(key);
    if (!v)
        return;
    if (v->kind() == Value::Kind::Bool) {
        flag = v->as_bool();
    } else if (v->is_string()) {
        flag   = true;
        reason = v->as_string();
    }
}

} // namespace

std::string ParamCase::virtual_name(std::string_view test) const { return fmt::format("{}[{}]", test, name); }

std::vector<std::string> find_test_functions(const Namespace &globals, std::string_view prefix) {
    std::vector<std::string> names;
    for (const auto &[name, value] : globals) {
        if (value.is_callable() && name.rfind(prefix, 0) == 0)
            names.push_back(name);
    }
    return names; // Namespace is ordered
}

std::map<std::string, TestMeta> extract_test_meta(const Namespace &globals) {
    std::map<std::string, TestMeta> out;
    const DictValue                *meta = dict_global(globals, kTestMetaName);
    if (!meta)
        return out;
    for (const auto &[key, value] : meta->entries) {
        if (!key.is_string() || value.kind() != Value::Kind::Dict)
            continue;
        const DictValue &d = *value.as_dict();
        TestMeta         m;
        read_flag(d, "skip", m.skip, m.skip_reason);
        read_flag(d, "xfail", m.xfail, m.xfail_reason);
        if (const Value *markers = d.find("markers"); markers && markers->elements()) {
            for (const auto &marker : *markers->elements()) {
                if (marker.is_string())
                    m.markers.push_back(marker.as_string());
            }
        }
        out.emplace(key.as_string(), std::move(m));
    }
    return out;
}

std::map<std::string, std::vector<ParamCase>> extract_test_params(const Namespace &globals) {
    std::map<std::string, std::vector<ParamCase>> out;
    const DictValue                              *params = dict_global(globals, kTestParamsName);
    if (!params)
        return out;
    for (const auto &[key, value] : params->entries) {
        if (!key.is_string() || value.kind() != Value::Kind::List)
            continue;
        std::vector<ParamCase> cases;
        std::size_t            idx = 0;
        for (const auto &c : value.as_list()->items) {
            if (c.kind() == Value::Kind::Dict) {
                ParamCase pc{fmt::format("{}", idx), c};
                if (const Value *name = c.as_dict()->find("name"); name && name->is_string())
                    pc.name = name->as_string();
                cases.push_back(std::move(pc));
            }
            ++idx;
        }
        if (!cases.empty())
            out.emplace(key.as_string(), std::move(cases));
    }
    return out;
}

} // namespace skytest::runner
