// wfgraph/render/graphviz_reader.cpp - Read back rendered .gv documents
#include "wfgraph/render/graphviz_reader.hpp"

#include <cctype>
#include <cstdint>
#include <map>
#include <tuple>
#include <utility>
#include <vector>

#include "wfgraph/basic/errors.hpp"

namespace wfgraph
{

bool operator<(const RenderedEdge & a, const RenderedEdge & b)
{
  return std::tie(a.script, a.artifact, a.direction, a.accessors) <
         std::tie(b.script, b.artifact, b.direction, b.accessors);
}

bool operator==(const RenderedEdge & a, const RenderedEdge & b)
{
  return a.script == b.script && a.artifact == b.artifact && a.direction == b.direction &&
         a.accessors == b.accessors;
}

// ============================================================================
// RenderedGraph
// ============================================================================

namespace
{

RenderedEdge to_rendered(const Edge & edge)
{
  RenderedEdge r;
  r.script = edge.script;
  r.artifact = edge.artifact;
  r.direction = edge.direction;
  r.accessors = edge.accessors;
  return r;
}

}  // namespace

RenderedGraph RenderedGraph::from(const DependencyGraph & graph)
{
  RenderedGraph view;
  for (const auto & s : graph.scripts()) view.scripts.insert(s);
  for (const auto & a : graph.artifacts()) view.artifacts.insert(a);
  for (const auto * e : graph.edges()) view.edges.insert(to_rendered(*e));
  return view;
}

RenderedGraph RenderedGraph::from(const DependencyGraph & graph, std::string_view script)
{
  if (!graph.has_script(script)) {
    const std::string name(script);
    throw UnknownTarget(name, "unknown script '" + name + "'");
  }
  RenderedGraph view;
  view.scripts.emplace(script);
  for (const auto * e : graph.edges_of(script)) {
    view.artifacts.insert(e->artifact);
    view.edges.insert(to_rendered(*e));
  }
  return view;
}

// ============================================================================
// Lexer
// ============================================================================

namespace
{

enum class TokenKind : uint8_t {
  Id,
  LBrace,
  RBrace,
  LBracket,
  RBracket,
  Equals,
  Semicolon,
  Comma,
  Arrow,
  Eof,
};

struct Token
{
  TokenKind kind = TokenKind::Eof;
  std::string text;
  bool quoted = false;
  size_t line = 1;

  [[nodiscard]] bool is_keyword(std::string_view kw) const
  {
    return kind == TokenKind::Id && !quoted && text == kw;
  }
};

class GvLexer
{
public:
  explicit GvLexer(std::string_view src) : src_(src) {}

  std::vector<Token> lex_all()
  {
    std::vector<Token> tokens;
    while (true) {
      Token t = next_token();
      const bool done = t.kind == TokenKind::Eof;
      tokens.push_back(std::move(t));
      if (done) break;
    }
    return tokens;
  }

private:
  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }

  void advance() noexcept
  {
    if (src_[pos_] == '\n') ++line_;
    ++pos_;
  }

  void skip_whitespace_and_comments()
  {
    while (!eof()) {
      const char c = peek();
      if (std::isspace(static_cast<unsigned char>(c)) != 0) {
        advance();
      } else if (c == '/' && peek(1) == '/') {
        while (!eof() && peek() != '\n') advance();
      } else if (c == '#' && (pos_ == 0 || src_[pos_ - 1] == '\n')) {
        while (!eof() && peek() != '\n') advance();
      } else if (c == '/' && peek(1) == '*') {
        const size_t start_line = line_;
        advance();
        advance();
        while (!eof() && !(peek() == '*' && peek(1) == '/')) advance();
        if (eof()) throw GraphSyntaxError(start_line, "unterminated comment");
        advance();
        advance();
      } else {
        return;
      }
    }
  }

  static bool is_id_char(char c)
  {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '.' || c == '-' ||
           c == '#';
  }

  Token make(TokenKind kind, size_t width)
  {
    Token t;
    t.kind = kind;
    t.line = line_;
    t.text = std::string(src_.substr(pos_, width));
    for (size_t i = 0; i < width; ++i) advance();
    return t;
  }

  Token next_token()
  {
    skip_whitespace_and_comments();
    if (eof()) {
      Token t;
      t.line = line_;
      return t;
    }

    const char c = peek();
    switch (c) {
      case '{':
        return make(TokenKind::LBrace, 1);
      case '}':
        return make(TokenKind::RBrace, 1);
      case '[':
        return make(TokenKind::LBracket, 1);
      case ']':
        return make(TokenKind::RBracket, 1);
      case '=':
        return make(TokenKind::Equals, 1);
      case ';':
        return make(TokenKind::Semicolon, 1);
      case ',':
        return make(TokenKind::Comma, 1);
      case '"':
        return lex_quoted();
      default:
        break;
    }
    if (c == '-' && peek(1) == '>') {
      return make(TokenKind::Arrow, 2);
    }
    if (is_id_char(c)) {
      size_t width = 0;
      while (is_id_char(peek(width)) && !(peek(width) == '-' && peek(width + 1) == '>')) ++width;
      return make(TokenKind::Id, width);
    }
    throw GraphSyntaxError(line_, std::string("unexpected character '") + c + "'");
  }

  Token lex_quoted()
  {
    Token t;
    t.kind = TokenKind::Id;
    t.quoted = true;
    t.line = line_;
    advance();  // opening quote
    while (true) {
      if (eof()) throw GraphSyntaxError(t.line, "unterminated string");
      const char c = peek();
      if (c == '"') {
        advance();
        return t;
      }
      if (c == '\\' && (peek(1) == '"' || peek(1) == '\\')) {
        advance();
      }
      t.text += peek();
      advance();
    }
  }

  std::string_view src_;
  size_t pos_ = 0;
  size_t line_ = 1;
};

// ============================================================================
// Parser
// ============================================================================

struct ClusterScope
{
  std::string name;
  bool legend = false;
  std::string label;
  bool has_label = false;
  size_t line = 0;
};

struct NodeDecl
{
  std::string id;
  std::string name;
  size_t cluster = 0;
  size_t line = 0;
};

struct EdgeDecl
{
  std::string from;
  std::string to;
  std::string label;
  size_t line = 0;
};

using AttrList = std::map<std::string, std::string>;

class GvParser
{
public:
  explicit GvParser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

  RenderedGraph parse()
  {
    if (!current().is_keyword("digraph")) {
      fail("expected 'digraph'");
    }
    advance();
    if (current().kind == TokenKind::Id) advance();
    expect(TokenKind::LBrace, "'{'");
    parse_stmt_list();
    expect(TokenKind::RBrace, "'}'");
    if (current().kind != TokenKind::Eof) {
      fail("unexpected content after the closing '}'");
    }
    return assemble();
  }

private:
  [[nodiscard]] const Token & current() const { return tokens_[pos_]; }
  void advance()
  {
    if (pos_ + 1 < tokens_.size()) ++pos_;
  }

  [[noreturn]] void fail(const std::string & message) const
  {
    throw GraphSyntaxError(current().line, message);
  }

  Token expect(TokenKind kind, const char * what)
  {
    if (current().kind != kind) {
      const std::string got = current().kind == TokenKind::Eof ? "end of input" : "'" + current().text + "'";
      fail(std::string("expected ") + what + ", got " + got);
    }
    Token t = current();
    advance();
    return t;
  }

  [[nodiscard]] bool in_legend() const
  {
    for (size_t index : scopes_) {
      if (clusters_[index].legend) return true;
    }
    return false;
  }

  void parse_stmt_list()
  {
    while (current().kind != TokenKind::RBrace) {
      if (current().kind == TokenKind::Eof) {
        fail("missing '}'");
      }
      parse_stmt();
      while (current().kind == TokenKind::Semicolon || current().kind == TokenKind::Comma) {
        advance();
      }
    }
  }

  void parse_stmt()
  {
    if (current().is_keyword("subgraph") || current().kind == TokenKind::LBrace) {
      parse_subgraph();
      return;
    }

    const Token first = expect(TokenKind::Id, "a statement");

    if (current().kind == TokenKind::Equals) {
      advance();
      const Token value = expect(TokenKind::Id, "a value");
      if (!scopes_.empty() && first.text == "label") {
        auto & scope = clusters_[scopes_.back()];
        scope.label = value.text;
        scope.has_label = true;
      }
      return;
    }

    if (
      !first.quoted && (first.text == "graph" || first.text == "node" || first.text == "edge")) {
      (void)parse_attr_lists();
      return;
    }

    if (current().kind == TokenKind::Arrow) {
      advance();
      const Token target = expect(TokenKind::Id, "an edge target");
      if (current().kind == TokenKind::Arrow) {
        fail("edge chains are not supported");
      }
      const AttrList attrs = parse_attr_lists();
      if (in_legend()) return;

      EdgeDecl edge;
      edge.from = first.text;
      edge.to = target.text;
      edge.line = first.line;
      auto it = attrs.find("label");
      if (it != attrs.end()) edge.label = it->second;
      edges_.push_back(std::move(edge));
      return;
    }

    const AttrList attrs = parse_attr_lists();
    if (in_legend()) return;
    declare_node(first, attrs);
  }

  void parse_subgraph()
  {
    ClusterScope scope;
    scope.line = current().line;
    if (current().is_keyword("subgraph")) {
      advance();
      if (current().kind == TokenKind::Id) {
        scope.name = current().text;
        advance();
      }
    }
    scope.legend = scope.name == "cluster_legend";
    expect(TokenKind::LBrace, "'{'");

    clusters_.push_back(std::move(scope));
    scopes_.push_back(clusters_.size() - 1);
    parse_stmt_list();
    expect(TokenKind::RBrace, "'}'");
    scopes_.pop_back();
  }

  AttrList parse_attr_lists()
  {
    AttrList attrs;
    while (current().kind == TokenKind::LBracket) {
      advance();
      while (current().kind != TokenKind::RBracket) {
        const Token key = expect(TokenKind::Id, "an attribute name");
        expect(TokenKind::Equals, "'='");
        const Token value = expect(TokenKind::Id, "an attribute value");
        attrs[key.text] = value.text;
        if (current().kind == TokenKind::Comma || current().kind == TokenKind::Semicolon) {
          advance();
        }
      }
      advance();
    }
    return attrs;
  }

  void declare_node(const Token & id, const AttrList & attrs)
  {
    if (scopes_.empty()) {
      scripts_.insert(id.text);
      return;
    }
    // Artifact nodes live in a category cluster. The cluster label may
    // follow the nodes, so categories are resolved in assemble().
    NodeDecl node;
    node.id = id.text;
    auto it = attrs.find("label");
    node.name = it != attrs.end() ? it->second : id.text;
    node.cluster = scopes_.back();
    node.line = id.line;
    nodes_.push_back(std::move(node));
  }

  RenderedGraph assemble()
  {
    RenderedGraph view;
    view.scripts = scripts_;

    std::map<std::string, Artifact> artifact_ids;
    for (const auto & node : nodes_) {
      const ClusterScope & scope = clusters_[node.cluster];
      if (!scope.has_label) {
        throw GraphSyntaxError(scope.line, "cluster '" + scope.name + "' has no label");
      }
      Artifact artifact;
      artifact.category = scope.label;
      artifact.name_template = node.name;

      auto [it, inserted] = artifact_ids.emplace(node.id, artifact);
      if (!inserted && it->second != artifact) {
        throw GraphSyntaxError(node.line, "node '" + node.id + "' declared in two categories");
      }
      if (scripts_.count(node.id) > 0) {
        throw GraphSyntaxError(node.line, "node '" + node.id + "' is both a script and an artifact");
      }
      view.artifacts.insert(artifact);
    }

    for (const auto & edge : edges_) {
      RenderedEdge r;
      const Artifact * artifact = nullptr;
      if (scripts_.count(edge.from) > 0 && artifact_ids.count(edge.to) > 0) {
        r.script = edge.from;
        artifact = &artifact_ids.at(edge.to);
        r.direction = Direction::Write;
      } else if (artifact_ids.count(edge.from) > 0 && scripts_.count(edge.to) > 0) {
        r.script = edge.to;
        artifact = &artifact_ids.at(edge.from);
        r.direction = Direction::Read;
      } else {
        throw GraphSyntaxError(
          edge.line, "edge '" + edge.from + "' -> '" + edge.to +
                       "' must join a declared script and a declared artifact");
      }
      r.artifact = *artifact;
      r.accessors = parse_label(edge.label, edge.line);
      view.edges.insert(std::move(r));
    }

    return view;
  }

  static std::set<std::string> parse_label(const std::string & label, size_t line)
  {
    if (label.size() < 2 || label.front() != '(' || label.back() != ')') {
      throw GraphSyntaxError(line, "edge label '" + label + "' is not of the form (accessor)");
    }
    std::set<std::string> accessors;
    const std::string inner = label.substr(1, label.size() - 2);
    size_t start = 0;
    while (start <= inner.size()) {
      size_t comma = inner.find(',', start);
      if (comma == std::string::npos) comma = inner.size();
      std::string part = inner.substr(start, comma - start);
      const size_t b = part.find_first_not_of(' ');
      const size_t e = part.find_last_not_of(' ');
      if (b != std::string::npos) {
        accessors.insert(part.substr(b, e - b + 1));
      }
      start = comma + 1;
    }
    return accessors;
  }

  std::vector<Token> tokens_;
  size_t pos_ = 0;

  std::vector<ClusterScope> clusters_;
  std::vector<size_t> scopes_;  // open clusters, innermost last
  std::set<std::string> scripts_;
  std::vector<NodeDecl> nodes_;
  std::vector<EdgeDecl> edges_;
};

}  // namespace

RenderedGraph read_graphviz(std::string_view text)
{
  GvLexer lexer(text);
  GvParser parser(lexer.lex_all());
  return parser.parse();
}

}  // namespace wfgraph
