#include "export/TreeJsonExporter.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace PT {

namespace {

using Json = nlohmann::ordered_json;

struct ExportStats {
    std::size_t nodeCount         = 0;
    std::size_t childrenTruncated = 0;
};

auto nodeToJson(Category const& node, std::size_t depth, TreeJsonOptions const& options, ExportStats& stats) -> Json {
    ++stats.nodeCount;

    Json json;
    json["code"]   = node.code;
    json["name"]   = node.name;
    json["depth"]  = node.depth;
    json["weight"] = node.weight;

    Json indices = Json::object();
    for (auto const period : kPeriods) {
        indices[options.periodKeys[periodSlot(period)]] = node.value(period);
    }
    json["indices"] = std::move(indices);

    json["variation"] = Json{
            {"monthly", node.variation.monthly},
            {"trimester", node.variation.trimester},
            {"yearly", node.variation.yearly},
    };

    if (node.isLeaf()) {
        return json;
    }
    if (depth >= options.maxDepth) {
        stats.childrenTruncated += node.children.size();
        json["children_truncated"] = node.children.size();
        return json;
    }
    Json children = Json::array();
    for (auto const& child : node.children) {
        children.push_back(nodeToJson(*child, depth + 1, options, stats));
    }
    json["children"] = std::move(children);
    return json;
}

} // namespace

auto TreeJsonExporter::Export(CategoryTree const& tree, TreeJsonOptions const& options) -> Expected<std::string> {
    ExportStats stats;
    Json        document = Json::object();
    if (tree.valid()) {
        document = nodeToJson(*tree.root(), 0, options, stats);
    }
    if (options.includeMetadata) {
        document["_meta"] = Json{
                {"generation", tree.generation()},
                {"node_count", stats.nodeCount},
                {"children_truncated", stats.childrenTruncated},
        };
    }
    try {
        return document.dump(options.dumpIndent);
    } catch (nlohmann::json::exception const& error) {
        return std::unexpected(Error{Error::Code::MalformedInput, error.what()});
    }
}

} // namespace PT
