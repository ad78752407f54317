#include "internal/render/template_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <optional>

namespace colguard::render {

namespace {

// ------------------------------------------------------------
// Expression lexer
// ------------------------------------------------------------

enum class Tok {
  kIdent,
  kString,
  kInt,
  kFloat,
  kOp,
  kEnd,
};

struct Token {
  Tok         kind = Tok::kEnd;
  std::string text;
  std::size_t begin = 0;
  std::size_t end   = 0;
};

bool IsIdentStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool IsIdentChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Longest match first.
constexpr std::string_view kOperators[] = {"**", "//", "==", "!=", "<=", ">=", "(", ")", "[", "]", "{", "}", ",", ".",
                                           ":",  "|",  "=",  "<",  ">",  "+",  "-", "*", "/", "%", "~"};

std::vector<Token> Tokenize(std::string_view src) {
  std::vector<Token> out;
  std::size_t        i = 0;

  while (i < src.size()) {
    const char c = src[i];
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++i;
      continue;
    }

    Token tok;
    tok.begin = i;

    if (IsIdentStart(c)) {
      while (i < src.size() && IsIdentChar(src[i])) ++i;
      tok.kind = Tok::kIdent;
      tok.text = std::string(src.substr(tok.begin, i - tok.begin));
    } else if (std::isdigit(static_cast<unsigned char>(c))) {
      tok.kind = Tok::kInt;
      while (i < src.size() && std::isdigit(static_cast<unsigned char>(src[i]))) ++i;
      if (i + 1 < src.size() && src[i] == '.' && std::isdigit(static_cast<unsigned char>(src[i + 1]))) {
        tok.kind = Tok::kFloat;
        ++i;
        while (i < src.size() && std::isdigit(static_cast<unsigned char>(src[i]))) ++i;
      }
      tok.text = std::string(src.substr(tok.begin, i - tok.begin));
    } else if (c == '\'' || c == '"') {
      const char quote = c;
      ++i;
      std::string value;
      bool        closed = false;
      while (i < src.size()) {
        char ch = src[i++];
        if (ch == '\\' && i < src.size()) {
          char esc = src[i++];
          switch (esc) {
            case 'n': value.push_back('\n'); break;
            case 't': value.push_back('\t'); break;
            default: value.push_back(esc); break;
          }
          continue;
        }
        if (ch == quote) {
          closed = true;
          break;
        }
        value.push_back(ch);
      }
      if (!closed) {
        throw TemplateParseError("unterminated string literal in '" + std::string(src) + "'");
      }
      tok.kind = Tok::kString;
      tok.text = std::move(value);
    } else {
      for (auto op : kOperators) {
        if (src.substr(i, op.size()) == op) {
          tok.kind = Tok::kOp;
          tok.text = std::string(op);
          i += op.size();
          break;
        }
      }
      if (tok.kind != Tok::kOp) {
        throw TemplateParseError("unexpected character '" + std::string(1, c) + "' in '" + std::string(src) + "'");
      }
    }

    tok.end = i;
    out.push_back(std::move(tok));
  }

  Token end;
  end.kind  = Tok::kEnd;
  end.begin = end.end = src.size();
  out.push_back(end);
  return out;
}

// ------------------------------------------------------------
// Expression parser
// ------------------------------------------------------------

template <typename T>
TemplateExprPtr Make(T node) {
  auto expr  = std::make_unique<TemplateExpr>();
  expr->node = std::move(node);
  return expr;
}

/*
  Precedence, loosest first:
    a if c else b | or | and | not | comparisons, in, is
    ~ | + - | * / // % | ** | unary - | filters | . [] ()
*/
class ExprParser {
 public:
  explicit ExprParser(std::string_view src) : src_(src), tokens_(Tokenize(src)) {
  }

  TemplateExprPtr ParseAll() {
    auto expr = ParseExpr();
    ExpectEnd();
    return expr;
  }

  const Token& Peek(std::size_t ahead = 0) const {
    const auto idx = pos_ + ahead;
    return idx < tokens_.size() ? tokens_[idx] : tokens_.back();
  }

  bool PeekOp(std::string_view op, std::size_t ahead = 0) const {
    const auto& tok = Peek(ahead);
    return tok.kind == Tok::kOp && tok.text == op;
  }

  bool PeekWord(std::string_view word, std::size_t ahead = 0) const {
    const auto& tok = Peek(ahead);
    return tok.kind == Tok::kIdent && tok.text == word;
  }

  bool AtEnd() const {
    return Peek().kind == Tok::kEnd;
  }

  const Token& Next() {
    const Token& tok = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) ++pos_;
    return tok;
  }

  const Token& Expect(Tok kind, const char* what) {
    if (Peek().kind != kind) {
      throw TemplateParseError(std::string("expected ") + what + " in '" + std::string(src_) + "'");
    }
    return Next();
  }

  void ExpectOp(std::string_view op) {
    if (!PeekOp(op)) {
      throw TemplateParseError("expected '" + std::string(op) + "' in '" + std::string(src_) + "'");
    }
    Next();
  }

  void ExpectEnd() {
    if (!AtEnd()) throw Unsupported(Peek());
  }

  TemplateExprPtr ParseExpr() {
    auto then = ParseOr();
    if (!PeekWord("if")) return then;

    Next();
    CondExpr cond;
    cond.then      = std::move(then);
    cond.condition = ParseOr();
    if (PeekWord("else")) {
      Next();
      cond.otherwise = ParseExpr();
    }
    return Make(std::move(cond));
  }

  TemplateExprPtr ParseOr() {
    auto lhs = ParseAnd();
    while (PeekWord("or")) {
      Next();
      lhs = Make(BinaryExpr{"or", std::move(lhs), ParseAnd()});
    }
    return lhs;
  }

 private:
  TemplateExprPtr ParseAnd() {
    auto lhs = ParseNot();
    while (PeekWord("and")) {
      Next();
      lhs = Make(BinaryExpr{"and", std::move(lhs), ParseNot()});
    }
    return lhs;
  }

  TemplateExprPtr ParseNot() {
    if (PeekWord("not")) {
      Next();
      return Make(UnaryExpr{"not", ParseNot()});
    }
    return ParseCompare();
  }

  TemplateExprPtr ParseCompare() {
    auto lhs = ParseConcat();
    while (true) {
      const auto& tok = Peek();
      if (tok.kind == Tok::kOp && (tok.text == "==" || tok.text == "!=" || tok.text == "<" || tok.text == "<="
                                   || tok.text == ">" || tok.text == ">=")) {
        const auto op = Next().text;
        lhs           = Make(BinaryExpr{op, std::move(lhs), ParseConcat()});
      } else if (PeekWord("in")) {
        Next();
        lhs = Make(BinaryExpr{"in", std::move(lhs), ParseConcat()});
      } else if (PeekWord("not") && PeekWord("in", 1)) {
        Next();
        Next();
        lhs = Make(BinaryExpr{"not in", std::move(lhs), ParseConcat()});
      } else if (PeekWord("is")) {
        Next();
        TestExpr test;
        if (PeekWord("not")) {
          Next();
          test.negated = true;
        }
        test.name    = Expect(Tok::kIdent, "test name after 'is'").text;
        test.operand = std::move(lhs);
        lhs          = Make(std::move(test));
      } else {
        return lhs;
      }
    }
  }

  TemplateExprPtr ParseConcat() {
    auto lhs = ParseAdd();
    while (PeekOp("~")) {
      Next();
      lhs = Make(BinaryExpr{"~", std::move(lhs), ParseAdd()});
    }
    return lhs;
  }

  TemplateExprPtr ParseAdd() {
    auto lhs = ParseMul();
    while (PeekOp("+") || PeekOp("-")) {
      const auto op = Next().text;
      lhs           = Make(BinaryExpr{op, std::move(lhs), ParseMul()});
    }
    return lhs;
  }

  TemplateExprPtr ParseMul() {
    auto lhs = ParsePow();
    while (PeekOp("*") || PeekOp("/") || PeekOp("//") || PeekOp("%")) {
      const auto op = Next().text;
      lhs           = Make(BinaryExpr{op, std::move(lhs), ParsePow()});
    }
    return lhs;
  }

  TemplateExprPtr ParsePow() {
    auto lhs = ParseUnary();
    while (PeekOp("**")) {
      Next();
      lhs = Make(BinaryExpr{"**", std::move(lhs), ParseUnary()});
    }
    return lhs;
  }

  TemplateExprPtr ParseUnary() {
    if (PeekOp("-")) {
      Next();
      return Make(UnaryExpr{"-", ParseUnary()});
    }
    if (PeekOp("+")) {
      Next();
      return ParseUnary();
    }
    return ParseFilters();
  }

  TemplateExprPtr ParseFilters() {
    auto expr = ParsePostfix();
    while (PeekOp("|")) {
      Next();
      FilterExpr filter;
      filter.operand = std::move(expr);
      filter.name    = Expect(Tok::kIdent, "filter name after '|'").text;
      if (PeekOp("(")) {
        Next();
        std::vector<KeywordArg> kwargs;
        ParseArgs(filter.args, kwargs);
        if (!kwargs.empty()) {
          throw TemplateParseError("filter '" + filter.name + "' takes no keyword arguments");
        }
      }
      expr = Make(std::move(filter));
    }
    return expr;
  }

  TemplateExprPtr ParsePostfix() {
    auto expr = ParsePrimary();
    while (true) {
      if (PeekOp(".")) {
        Next();
        auto name = Expect(Tok::kIdent, "attribute name after '.'").text;
        expr      = Make(AttributeExpr{std::move(expr), std::move(name)});
      } else if (PeekOp("[")) {
        Next();
        auto index = ParseExpr();
        ExpectOp("]");
        expr = Make(SubscriptExpr{std::move(expr), std::move(index)});
      } else if (PeekOp("(")) {
        Next();
        CallExpr call;
        call.callee = std::move(expr);
        ParseArgs(call.args, call.kwargs);
        expr = Make(std::move(call));
      } else {
        return expr;
      }
    }
  }

  TemplateExprPtr ParsePrimary() {
    const Token& tok = Next();
    switch (tok.kind) {
      case Tok::kString: {
        // Adjacent literals concatenate.
        std::string value = tok.text;
        while (Peek().kind == Tok::kString) value += Next().text;
        return Make(LiteralExpr{Value(std::move(value))});
      }
      case Tok::kInt:
        return Make(LiteralExpr{Value(static_cast<std::int64_t>(std::strtoll(tok.text.c_str(), nullptr, 10)))});
      case Tok::kFloat:
        return Make(LiteralExpr{Value(std::strtod(tok.text.c_str(), nullptr))});
      case Tok::kIdent:
        if (tok.text == "true" || tok.text == "True") return Make(LiteralExpr{Value(true)});
        if (tok.text == "false" || tok.text == "False") return Make(LiteralExpr{Value(false)});
        if (tok.text == "none" || tok.text == "None") return Make(LiteralExpr{Value()});
        return Make(NameRef{tok.text});
      case Tok::kOp:
        break;
      case Tok::kEnd:
        throw Unsupported(tok);
    }

    if (tok.text == "(") {
      if (PeekOp(")")) {
        Next();
        return Make(ListExpr{});
      }
      auto first = ParseExpr();
      if (!PeekOp(",")) {
        ExpectOp(")");
        return first;
      }
      // Tuples evaluate as lists.
      ListExpr tuple;
      tuple.items.push_back(std::move(first));
      while (PeekOp(",")) {
        Next();
        if (PeekOp(")")) break;
        tuple.items.push_back(ParseExpr());
      }
      ExpectOp(")");
      return Make(std::move(tuple));
    }

    if (tok.text == "[") {
      ListExpr list;
      while (!PeekOp("]")) {
        list.items.push_back(ParseExpr());
        if (!PeekOp(",")) break;
        Next();
      }
      ExpectOp("]");
      return Make(std::move(list));
    }

    if (tok.text == "{") {
      DictExpr dict;
      while (!PeekOp("}")) {
        auto key = ParseExpr();
        ExpectOp(":");
        dict.entries.emplace_back(std::move(key), ParseExpr());
        if (!PeekOp(",")) break;
        Next();
      }
      ExpectOp("}");
      return Make(std::move(dict));
    }

    throw Unsupported(tok);
  }

  void ParseArgs(std::vector<TemplateExprPtr>& args, std::vector<KeywordArg>& kwargs) {
    while (!PeekOp(")")) {
      if (Peek().kind == Tok::kIdent && PeekOp("=", 1)) {
        KeywordArg kwarg;
        kwarg.name = Next().text;
        Next();
        kwarg.value = ParseExpr();
        kwargs.push_back(std::move(kwarg));
      } else {
        if (!kwargs.empty()) {
          throw TemplateParseError("positional argument after keyword argument in '" + std::string(src_) + "'");
        }
        args.push_back(ParseExpr());
      }
      if (!PeekOp(",")) break;
      Next();
    }
    ExpectOp(")");
  }

  TemplateParseError Unsupported(const Token& tok) const {
    if (tok.kind == Tok::kEnd) {
      return TemplateParseError("unexpected end of expression '" + std::string(src_) + "'");
    }
    return TemplateParseError("unsupported expression syntax near '" + std::string(src_.substr(tok.begin)) + "'");
  }

  std::string_view   src_;
  std::vector<Token> tokens_;
  std::size_t        pos_ = 0;
};

// ------------------------------------------------------------
// Segment scanning
// ------------------------------------------------------------

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

void TrimLeft(std::string& s) {
  std::size_t i = 0;
  while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  s.erase(0, i);
}

void TrimRight(std::string& s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
}

struct Tag {
  char        kind = 0;       // '{', '%', '#'
  std::size_t start = 0;      // offset of opening '{'
  std::size_t end   = 0;      // offset just past the closing delimiter
  bool        trim_before = false;
  bool        trim_after  = false;
  std::string inner;
};

std::size_t FindOpen(std::string_view text, std::size_t from) {
  while (true) {
    auto i = text.find('{', from);
    if (i == std::string_view::npos || i + 1 >= text.size()) return std::string_view::npos;
    const char next = text[i + 1];
    if (next == '{' || next == '%' || next == '#') return i;
    from = i + 1;
  }
}

// Reads the tag opening at `start`; quoted strings may contain the closer.
Tag ReadTag(std::string_view text, std::size_t start) {
  Tag tag;
  tag.kind  = text[start + 1];
  tag.start = start;

  std::size_t j = start + 2;
  if (j < text.size() && text[j] == '-') {
    tag.trim_before = true;
    ++j;
  }

  const char  close_char = tag.kind == '{' ? '}' : tag.kind;
  std::size_t k          = j;
  char        quote      = 0;
  while (k + 1 < text.size()) {
    const char c = text[k];
    if (tag.kind != '#') {
      if (quote) {
        if (c == '\\') {
          k += 2;
          continue;
        }
        if (c == quote) quote = 0;
        ++k;
        continue;
      }
      if (c == '\'' || c == '"') {
        quote = c;
        ++k;
        continue;
      }
    }
    if (c == close_char && text[k + 1] == '}') break;
    ++k;
  }

  if (k + 1 >= text.size()) {
    const char* opener = tag.kind == '{' ? "{{" : tag.kind == '%' ? "{%" : "{#";
    throw TemplateParseError(std::string("unterminated '") + opener + "' at offset " + std::to_string(start));
  }

  std::size_t inner_end = k;
  if (inner_end > j && text[inner_end - 1] == '-') {
    tag.trim_after = true;
    --inner_end;
  }

  tag.inner = std::string(Trim(text.substr(j, inner_end - j)));
  tag.end   = k + 2;
  return tag;
}

std::string FirstWord(const std::string& s) {
  std::size_t i = 0;
  while (i < s.size() && IsIdentChar(s[i])) ++i;
  return s.substr(0, i);
}

std::string AfterWord(const std::string& s) {
  return std::string(Trim(std::string_view(s).substr(FirstWord(s).size())));
}

// Next {% <keyword> %} at or after `from`.
std::optional<Tag> FindStatement(std::string_view text, std::size_t from, const std::string& keyword) {
  while (true) {
    auto open = FindOpen(text, from);
    if (open == std::string_view::npos) return std::nullopt;
    auto tag = ReadTag(text, open);
    if (tag.kind == '%' && FirstWord(tag.inner) == keyword) return tag;
    from = tag.end;
  }
}

model::Macro ParseMacroHeader(const std::string& inner) {
  // inner: macro name(a, b='x')
  ExprParser   parser(std::string_view(inner).substr(5));
  model::Macro macro;
  macro.name = parser.Expect(Tok::kIdent, "macro name").text;
  parser.ExpectOp("(");

  const std::string_view header(inner);
  if (parser.PeekOp(")")) {
    parser.Next();
    return macro;
  }

  while (true) {
    model::MacroParam param;
    param.name = parser.Expect(Tok::kIdent, "parameter name").text;
    if (parser.PeekOp("=")) {
      parser.Next();
      const auto begin = parser.Peek().begin;
      parser.ParseExpr();
      const auto end      = parser.Peek().begin;
      param.default_value = std::string(Trim(header.substr(5 + begin, end - begin)));
    }
    macro.params.push_back(std::move(param));

    const auto& sep = parser.Next();
    if (sep.kind == Tok::kOp && sep.text == ")") break;
    if (sep.kind != Tok::kOp || sep.text != ",") {
      throw TemplateParseError("malformed macro header '" + inner + "'");
    }
  }
  return macro;
}

// One scanned piece: literal text, {{ expr }} or {% statement %}.
struct Piece {
  enum class Kind {
    kText,
    kExpr,
    kStatement,
  };

  Kind        kind = Kind::kText;
  std::string text;
};

// {# #} comments are dropped; macro and raw blocks are handled here.
std::vector<Piece> Scan(std::string_view text, std::vector<model::Macro>& macros) {
  std::vector<Piece> out;
  std::size_t        pos       = 0;
  bool               trim_next = false;

  auto emit_text = [&](std::string chunk, bool trim_right) {
    if (trim_next) TrimLeft(chunk);
    trim_next = false;
    if (trim_right) TrimRight(chunk);
    if (chunk.empty()) return;
    if (!out.empty() && out.back().kind == Piece::Kind::kText) {
      out.back().text += chunk;
      return;
    }
    out.push_back(Piece{Piece::Kind::kText, std::move(chunk)});
  };

  while (pos < text.size()) {
    const auto open = FindOpen(text, pos);
    if (open == std::string_view::npos) {
      emit_text(std::string(text.substr(pos)), false);
      break;
    }

    Tag tag = ReadTag(text, open);
    emit_text(std::string(text.substr(pos, open - pos)), tag.trim_before);
    pos       = tag.end;
    trim_next = tag.trim_after;

    if (tag.kind == '#') continue;

    if (tag.kind == '{') {
      if (tag.inner.empty()) {
        throw TemplateParseError("empty expression at offset " + std::to_string(tag.start));
      }
      out.push_back(Piece{Piece::Kind::kExpr, tag.inner});
      continue;
    }

    const auto keyword = FirstWord(tag.inner);
    if (keyword == "macro") {
      auto macro = ParseMacroHeader(tag.inner);
      auto close = FindStatement(text, pos, "endmacro");
      if (!close) {
        throw TemplateParseError("macro '" + macro.name + "' has no endmacro");
      }
      std::string body(text.substr(pos, close->start - pos));
      if (tag.trim_after) TrimLeft(body);
      if (close->trim_before) TrimRight(body);
      macro.body = std::move(body);
      macros.push_back(std::move(macro));
      pos       = close->end;
      trim_next = close->trim_after;
    } else if (keyword == "raw") {
      auto close = FindStatement(text, pos, "endraw");
      if (!close) {
        throw TemplateParseError("raw block has no endraw");
      }
      std::string body(text.substr(pos, close->start - pos));
      if (tag.trim_after) TrimLeft(body);
      if (close->trim_before) TrimRight(body);
      trim_next = false;
      emit_text(std::move(body), false);
      pos       = close->end;
      trim_next = close->trim_after;
    } else {
      out.push_back(Piece{Piece::Kind::kStatement, tag.inner});
    }
  }
  return out;
}

// ------------------------------------------------------------
// Statement tree
// ------------------------------------------------------------

std::vector<std::string> ParseTargets(ExprParser& parser) {
  std::vector<std::string> targets;
  targets.push_back(parser.Expect(Tok::kIdent, "variable name").text);
  while (parser.PeekOp(",")) {
    parser.Next();
    targets.push_back(parser.Expect(Tok::kIdent, "variable name").text);
  }
  return targets;
}

class TreeBuilder {
 public:
  explicit TreeBuilder(std::vector<Piece> pieces) : pieces_(std::move(pieces)) {
  }

  Body ParseRoot() {
    std::string stop;
    return ParseBody({}, "", stop);
  }

 private:
  // Reads nodes until a {% stop %} statement, which is consumed and returned in `stop`.
  Body ParseBody(std::initializer_list<std::string_view> stops, const std::string& block, std::string& stop) {
    Body body;
    while (pos_ < pieces_.size()) {
      const auto& piece = pieces_[pos_++];
      switch (piece.kind) {
        case Piece::Kind::kText:
          body.push_back(Node{TextNode{piece.text}});
          break;
        case Piece::Kind::kExpr:
          body.push_back(Node{OutputNode{ParseExpression(piece.text)}});
          break;
        case Piece::Kind::kStatement: {
          const auto keyword = FirstWord(piece.text);
          if (std::find(stops.begin(), stops.end(), keyword) != stops.end()) {
            stop = piece.text;
            return body;
          }
          body.push_back(ParseStatement(keyword, piece.text));
          break;
        }
      }
    }

    if (stops.size() != 0) {
      throw TemplateParseError("'{% " + block + " %}' block is not closed");
    }
    return body;
  }

  Node ParseStatement(const std::string& keyword, const std::string& text) {
    if (keyword == "if") return Node{ParseIf(text)};
    if (keyword == "for") return Node{ParseFor(text)};
    if (keyword == "set") return ParseSet(text);
    if (keyword == "do") return Node{DoNode{ParseExpression(AfterWord(text))}};

    if (keyword == "elif" || keyword == "else" || keyword == "endif" || keyword == "endfor" || keyword == "endset"
        || keyword == "endmacro" || keyword == "endraw") {
      throw TemplateParseError("unexpected '{% " + text + " %}'");
    }
    throw TemplateParseError("unsupported statement '{% " + text + " %}'");
  }

  IfNode ParseIf(const std::string& text) {
    IfNode      node;
    auto        condition = ParseExpression(AfterWord(text));
    std::string stop;

    while (true) {
      auto body = ParseBody({"elif", "else", "endif"}, text, stop);
      node.branches.emplace_back(std::move(condition), std::move(body));

      const auto keyword = FirstWord(stop);
      if (keyword == "elif") {
        condition = ParseExpression(AfterWord(stop));
        continue;
      }
      if (keyword == "else") {
        node.otherwise = ParseBody({"endif"}, text, stop);
      }
      return node;
    }
  }

  ForNode ParseFor(const std::string& text) {
    const auto header = AfterWord(text);
    ExprParser parser(header);

    ForNode node;
    node.targets = ParseTargets(parser);
    if (!parser.PeekWord("in")) {
      throw TemplateParseError("expected 'in' in '{% " + text + " %}'");
    }
    parser.Next();
    node.iterable = parser.ParseOr();
    if (parser.PeekWord("if")) {
      parser.Next();
      node.filter = parser.ParseOr();
    }
    parser.ExpectEnd();

    std::string stop;
    node.body = ParseBody({"else", "endfor"}, text, stop);
    if (FirstWord(stop) == "else") {
      node.otherwise = ParseBody({"endfor"}, text, stop);
    }
    return node;
  }

  Node ParseSet(const std::string& text) {
    const auto header = AfterWord(text);
    ExprParser parser(header);
    auto       targets = ParseTargets(parser);

    if (parser.AtEnd()) {
      if (targets.size() != 1) {
        throw TemplateParseError("block set takes one name in '{% " + text + " %}'");
      }
      SetBlockNode block;
      block.name = targets.front();
      std::string stop;
      block.body = ParseBody({"endset"}, text, stop);
      return Node{std::move(block)};
    }

    parser.ExpectOp("=");
    SetNode node;
    node.targets = std::move(targets);
    node.value   = parser.ParseExpr();
    parser.ExpectEnd();
    return Node{std::move(node)};
  }

  std::vector<Piece> pieces_;
  std::size_t        pos_ = 0;
};

} // namespace

TemplateExprPtr ParseExpression(std::string_view text) {
  return ExprParser(text).ParseAll();
}

Template ParseTemplate(std::string_view text) {
  Template out;
  out.body = TreeBuilder(Scan(text, out.macros)).ParseRoot();
  return out;
}

std::vector<model::Macro> ParseMacroFile(std::string_view text, const std::filesystem::path& path) {
  auto parsed = ParseTemplate(text);
  for (auto& macro : parsed.macros) {
    macro.path = path;
  }
  return std::move(parsed.macros);
}

} // namespace colguard::render
