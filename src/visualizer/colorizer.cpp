#include "visualizer/colorizer.hpp"

#include "pattern/patternParser.hpp"
#include "source/sourceParser.hpp"

#include <llvm/Support/raw_ostream.h>

#include <algorithm>

namespace treepat {

Colorizer::Colorizer(std::string pattern, CompilerOptions options)
    : patternSource(std::move(pattern)),
      patternData(PatternParser(patternSource).parse()),
      compiler(std::move(options)),
      matcherData(compiler.compile(*patternData)),
      debug(compiler.options().debug) {}

ColorizerResult Colorizer::test(SourceTree tree) const {
  Trace trace;
  MatchResult returned = matcherData.match(tree.root, trace);
  log("ran " + patternSource + " against " + tree.buffer->name() + ": " +
      (returned.matched ? "matched" : "no match") + ", " +
      std::to_string(trace.visits().size()) + " of " +
      std::to_string(nodeIds().size()) + " positions visited");
  return ColorizerResult(*this, std::move(trace), std::move(returned),
                         std::move(tree));
}

ColorizerResult Colorizer::test(const std::string &source) const {
  return test(SourceParser(source).parse());
}

void Colorizer::log(const std::string &message) const {
  if (debug) {
    llvm::errs() << "[treepat] " << message << "\n";
  }
}

DisplayAttribute ColorizerResult::status(const Node &node) const {
  std::optional<NodeId> id = traceData.binding(node);
  if (!id || *id >= colorizerData->nodeIds().size()) {
    return DisplayAttribute::NotVisitable;
  }
  return displayAttributeFor(traceData.matched(*id));
}

std::vector<std::pair<const Node *, DisplayAttribute>>
ColorizerResult::matchMap() const {
  std::vector<std::pair<const Node *, DisplayAttribute>> map;
  if (!treeData.root) {
    return map;
  }
  map.emplace_back(treeData.root.get(), status(*treeData.root));
  treeData.root->eachDescendant([this, &map](const Node &node) {
    map.emplace_back(&node, status(node));
  });
  return map;
}

std::vector<DisplayAttribute> ColorizerResult::colorMap() const {
  size_t size = treeData.buffer ? treeData.buffer->size() : 0;
  std::vector<DisplayAttribute> colors(size, DisplayAttribute::NotVisitable);
  for (const auto &[node, attribute] : matchMap()) {
    if (!node->range) {
      continue;
    }
    size_t end = std::min(node->range->end, size);
    for (size_t offset = node->range->begin; offset < end; ++offset) {
      colors[offset] = attribute;
    }
  }
  return colors;
}

Json ColorizerResult::toJson() const {
  const Colorizer &colorizer = *colorizerData;

  Json captures = Json::array();
  for (const Value &capture : returnedData.captures) {
    captures.push_back(capture.toString());
  }

  Json positions = Json::array();
  const NodeIds &ids = colorizer.nodeIds();
  for (NodeId id = 0; id < ids.size(); ++id) {
    const PatternNode &node = ids.node(id);
    positions.push_back({
        {"id", id},
        {"type", std::string(patternTypeToString(node.type))},
        {"pattern",
         colorizer.pattern().substr(node.range.begin, node.range.size())},
        {"status", std::string(displayAttributeToString(
                       displayAttributeFor(traceData.matched(id))))},
    });
  }

  // Runs of equal attributes
  Json spans = Json::array();
  std::vector<DisplayAttribute> colors = colorMap();
  size_t begin = 0;
  for (size_t offset = 1; offset <= colors.size(); ++offset) {
    if (offset == colors.size() || colors[offset] != colors[begin]) {
      spans.push_back({
          {"begin", begin},
          {"end", offset},
          {"attribute",
           std::string(displayAttributeToString(colors[begin]))},
      });
      begin = offset;
    }
  }

  Json result;
  result["pattern"] = colorizer.pattern();
  result["source"] = treeData.buffer ? treeData.buffer->text() : "";
  result["matched"] = returnedData.matched;
  result["captures"] = captures;
  result["trace"] = positions;
  result["spans"] = spans;
  return result;
}

} // namespace treepat
