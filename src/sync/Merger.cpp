#include "sync/Merger.hpp"
#include "fs/Hasher.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <set>

using namespace ts::sync;
using namespace ts::sync::model;
using namespace ts::log;

namespace {

YAML::Node parseMapping(const std::string_view doc, const char* side) {
    YAML::Node node;
    try {
        node = YAML::Load(std::string(doc));
    } catch (const YAML::Exception& e) {
        throw ts::ParseError(std::string("The ") + side + " document is not valid YAML: " + e.what());
    }

    if (!node || node.IsNull()) return YAML::Node(YAML::NodeType::Map);
    if (!node.IsMap()) throw ts::ParseError(std::string("The ") + side + " document is not a mapping");
    return node;
}

std::string keyString(const YAML::Node& key) {
    return key.IsScalar() ? key.Scalar() : YAML::Dump(key);
}

YAML::Node sortedCopy(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Map: {
        std::vector<std::pair<YAML::Node, YAML::Node>> entries;
        for (const auto& kv : node) entries.emplace_back(kv.first, kv.second);
        std::ranges::stable_sort(entries, [](const auto& a, const auto& b) { return keyString(a.first) < keyString(b.first); });

        YAML::Node out(YAML::NodeType::Map);
        for (const auto& [k, v] : entries) out.force_insert(YAML::Clone(k), sortedCopy(v));
        return out;
    }
    case YAML::NodeType::Sequence: {
        YAML::Node out(YAML::NodeType::Sequence);
        for (const auto& child : node) out.push_back(sortedCopy(child));
        return out;
    }
    default:
        return YAML::Clone(node);
    }
}

std::string emit(const YAML::Node& node) {
    YAML::Emitter out;
    out << sortedCopy(node);
    std::string text = out.c_str();
    if (text.empty() || text.back() != '\n') text += '\n';
    return text;
}

bool sameValue(const YAML::Node& a, const YAML::Node& b) {
    if (a.Type() != b.Type()) return false;
    if (a.IsScalar()) return a.Scalar() == b.Scalar();
    return emit(a) == emit(b);
}

// key string -> (key node, value node), duplicates keep the first occurrence
std::map<std::string, std::pair<YAML::Node, YAML::Node>> entriesOf(const YAML::Node& map) {
    std::map<std::string, std::pair<YAML::Node, YAML::Node>> out;
    for (const auto& kv : map) out.emplace(keyString(kv.first), std::make_pair(kv.first, kv.second));
    return out;
}

std::string join(const std::string& path, const std::string& key) {
    return path.empty() ? key : path + "." + key;
}

}

Merger::Merger(const ConflictStrategy strategy, std::map<std::string, std::string> keyedLists)
    : strategy_(strategy), keyedLists_(std::move(keyedLists)) {}

std::string Merger::canonical(const std::string_view doc) {
    return emit(parseMapping(doc, "given"));
}

MergeResult Merger::merge(const std::string_view local,
                          const std::string_view remote,
                          const std::optional<std::time_t> localMtime,
                          const std::optional<std::time_t> remoteUpdatedAt) const {
    const auto l = parseMapping(local, "local");
    const auto r = parseMapping(remote, "remote");

    MergeResult result;
    const Pass pass{pickSide(strategy_, localMtime, remoteUpdatedAt).value_or(Side::Local), &result.decisions};

    result.text = emit(mergeMaps(l, r, "", pass));
    result.fingerprint = fs::Hasher::digest(result.text);

    for (const auto& d : result.decisions)
        Registry::merge()->info("[Merger] {} -> {} ({})", d.path, to_string(d.winner), to_string(strategy_));
    Registry::merge()->debug("[Merger] Merged document with {} conflicting value(s)", result.decisions.size());

    return result;
}

YAML::Node Merger::mergeNodes(const YAML::Node& l, const YAML::Node& r, const std::string& path, const Pass& pass) const {
    if (sameValue(l, r)) return l;
    if (l.IsMap() && r.IsMap()) return mergeMaps(l, r, path, pass);

    pass.decisions->push_back({path, pass.winner});
    return pass.winner == Side::Local ? l : r;
}

YAML::Node Merger::mergeMaps(const YAML::Node& l, const YAML::Node& r, const std::string& path, const Pass& pass) const {
    const auto le = entriesOf(l);
    const auto re = entriesOf(r);

    YAML::Node out(YAML::NodeType::Map);

    for (const auto& [k, kv] : le) {
        const auto it = re.find(k);
        if (it == re.end()) {
            out.force_insert(kv.first, kv.second);
            continue;
        }

        const auto& rv = it->second.second;
        const auto keyed = keyedLists_.find(k);
        if (keyed != keyedLists_.end() && kv.second.IsSequence() && rv.IsSequence())
            out.force_insert(kv.first, mergeKeyedList(kv.second, rv, k, keyed->second, join(path, k), pass));
        else
            out.force_insert(kv.first, mergeNodes(kv.second, rv, join(path, k), pass));
    }

    for (const auto& [k, kv] : re)
        if (!le.contains(k)) out.force_insert(kv.first, kv.second);

    return out;
}

YAML::Node Merger::mergeKeyedList(const YAML::Node& l, const YAML::Node& r, const std::string& section,
                                  const std::string& key, const std::string& path, const Pass& pass) const {
    // entries without a usable identifier, and repeated identifiers, fall back to their position
    const auto identify = [&](const YAML::Node& seq) {
        std::vector<std::pair<std::string, YAML::Node>> out;
        std::set<std::string> seen;
        for (std::size_t i = 0; i < seq.size(); ++i) {
            const YAML::Node entry = seq[i];
            std::string id;
            if (entry.IsMap() && entry[key] && entry[key].IsScalar()) id = entry[key].Scalar();
            if (id.empty() || seen.contains(id)) id = section + "#" + std::to_string(i);
            seen.insert(id);
            out.emplace_back(std::move(id), entry);
        }
        return out;
    };

    const auto local = identify(l);
    const auto remote = identify(r);

    std::map<std::string, YAML::Node> remoteById;
    for (const auto& [id, entry] : remote) remoteById.emplace(id, entry);

    YAML::Node out(YAML::NodeType::Sequence);
    std::set<std::string> placed;

    for (const auto& [id, entry] : local) {
        placed.insert(id);
        const auto it = remoteById.find(id);
        if (it == remoteById.end()) out.push_back(entry);
        else out.push_back(mergeNodes(entry, it->second, path + "[" + key + "=" + id + "]", pass));
    }

    for (const auto& [id, entry] : remote)
        if (!placed.contains(id)) out.push_back(entry);

    return out;
}
