#include "skytest/snapshot.h"

#include "skytest/engine.h"
#include "skytest/errors.h"
#include "text_diff.h"

#include <algorithm>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <system_error>

namespace skytest {

namespace fs = std::filesystem;

namespace {

void serialize(const Value &v, int indent, std::string &out);

template <typename Items> void serialize_block(std::string_view open, std::string_view close, const Items &items, int indent, std::string &out) {
    const std::string ind(static_cast<std::size_t>(indent) * 2, ' ');
    out += open;
    out += '\n';
    for (const auto &item : items) {
        out += ind;
        out += "  ";
        serialize(item, indent + 1, out);
        out += ",\n";
    }
    out += ind;
    out += close;
}

void serialize(const Value &v, int indent, std::string &out) {
    switch (v.kind()) {
    case Value::Kind::None:
    case Value::Kind::Bool:
    case Value::Kind::Int:
    case Value::Kind::String:
    case Value::Kind::Bytes: out += v.repr(); return;
    case Value::Kind::Float: out += fmt::format("{}", v.as_float()); return;
    case Value::Kind::List: {
        const auto &items = v.as_list()->items;
        if (items.empty()) {
            out += "[]";
            return;
        }
        serialize_block("[", "]", items, indent, out);
        return;
    }
    case Value::Kind::Tuple: {
        const auto &items = v.as_tuple()->items;
        if (items.empty()) {
            out += "()";
        } else if (items.size() == 1) {
            out += '(';
            serialize(items.front(), indent, out);
            out += ",)";
        } else {
            serialize_block("(", ")", items, indent, out);
        }
        return;
    }
    case Value::Kind::Dict: {
        auto entries = v.as_dict()->entries;
        if (entries.empty()) {
            out += "{}";
            return;
        }
        std::sort(entries.begin(), entries.end(), [](const auto &a, const auto &b) { return value_less(a.first, b.first); });
        const std::string ind(static_cast<std::size_t>(indent) * 2, ' ');
        out += "{\n";
        for (const auto &[key, val] : entries) {
            out += ind + "  ";
            serialize(key, indent + 1, out);
            out += ": ";
            serialize(val, indent + 1, out);
            out += ",\n";
        }
        out += ind + "}";
        return;
    }
    case Value::Kind::Set: {
        auto items = v.as_set()->items;
        if (items.empty()) {
            out += "set()";
            return;
        }
        std::sort(items.begin(), items.end(), value_less);
        serialize_block("set([", "])", items, indent, out);
        return;
    }
    case Value::Kind::Struct: {
        const auto &s = *v.as_struct();
        if (s.name == "struct") {
            auto fields = s.fields;
            std::sort(fields.begin(), fields.end(), [](const auto &a, const auto &b) { return a.first < b.first; });
            const std::string ind(static_cast<std::size_t>(indent) * 2, ' ');
            out += "struct(\n";
            for (const auto &[name, val] : fields) {
                out += ind + "  " + name + " = ";
                serialize(val, indent + 1, out);
                out += ",\n";
            }
            out += ind + ")";
            return;
        }
        break;
    }
    default: break;
    }
    out += fmt::format("<{}: {}>", v.type_name(), v.str());
}

std::string read_file(const fs::path &path, bool &found) {
    std::ifstream in(path, std::ios::binary);
    found = static_cast<bool>(in);
    if (!found)
        return {};
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void write_file(const fs::path &path, const std::string &content) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec)
        throw error(fmt::format("cannot create {}: {}", path.parent_path().string(), ec.message()));
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw error(fmt::format("cannot write {}", path.string()));
    out << content;
    if (!out)
        throw error(fmt::format("cannot write {}", path.string()));
}

} // namespace

std::string serialize_value(const Value &value) {
    std::string out;
    serialize(value, 0, out);
    return out;
}

std::string sanitize_snapshot_name(std::string_view name) {
    std::string out(name);
    for (char &ch : out) {
        switch (ch) {
        case '/':
        case '\\':
        case ':':
        case '*':
        case '?':
        case '"':
        case '<':
        case '>':
        case '|': ch = '_'; break;
        default: break;
        }
    }
    return out;
}

void SnapshotManager::set_context(fs::path test_file, std::string test_name) {
    test_file_ = std::move(test_file);
    test_name_ = std::move(test_name);
}

fs::path SnapshotManager::snapshot_path(std::string_view name) const {
    const fs::path dir = test_file_.parent_path() / "__snapshots__" / test_file_.stem();
    return dir / (sanitize_snapshot_name(test_name_) + "__" + sanitize_snapshot_name(name) + ".snap");
}

void SnapshotManager::compare(const Value &value, std::string_view name) {
    const std::string actual = serialize_value(value);
    const fs::path    path   = snapshot_path(name);

    bool              found    = false;
    const std::string expected = read_file(path, found);
    if (!found) {
        std::error_code ec;
        if (fs::exists(path, ec))
            throw error(fmt::format("failed to read snapshot \"{}\": {}", name, path.string()));
        write_file(path, actual);
        created_.emplace_back(name);
        return;
    }
    if (expected == actual)
        return;
    if (update_mode_) {
        write_file(path, actual);
        updated_.emplace_back(name);
        return;
    }
    mismatches_.push_back(SnapshotRecord{std::string(name), expected, actual});
    throw SnapshotMismatch(std::string(name), expected, actual, detail::unified_diff(expected, actual, "Expected", "Actual", 3));
}

} // namespace skytest
