#include "query_classifier.hpp"

#include <cctype>
#include <string>
#include <vector>

#include <absl/strings/match.h>

#include "internal/util/errors.hpp"

namespace asyncquery::sql {

namespace {

enum class TokenKind {
  kWord,
  kString,
  kSymbol,
};

struct Token {
  TokenKind   kind;
  std::string text;
};

bool IsWordChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '*';
}

std::vector<Token> Tokenize(std::string_view query) {
  std::vector<Token> tokens;
  std::size_t        i = 0;
  while (i < query.size()) {
    const char c = query[i];
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++i;
      continue;
    }

    // Line comments.
    if (c == '-' && i + 1 < query.size() && query[i + 1] == '-') {
      while (i < query.size() && query[i] != '\n') ++i;
      continue;
    }

    if (c == '\'' || c == '"') {
      const auto close = query.find(c, i + 1);
      const auto end   = close == std::string_view::npos ? query.size() : close;
      tokens.push_back({TokenKind::kString, std::string(query.substr(i + 1, end - i - 1))});
      i = close == std::string_view::npos ? query.size() : close + 1;
      continue;
    }

    if (IsWordChar(c) || c == '`') {
      std::string word;
      while (i < query.size() && (IsWordChar(query[i]) || query[i] == '`')) {
        if (query[i] == '`') {
          const auto close = query.find('`', i + 1);
          const auto end   = close == std::string_view::npos ? query.size() : close;
          word.append(query.substr(i, end - i + 1));
          i = close == std::string_view::npos ? query.size() : close + 1;
          continue;
        }
        word.push_back(query[i++]);
      }
      tokens.push_back({TokenKind::kWord, std::move(word)});
      continue;
    }

    tokens.push_back({TokenKind::kSymbol, std::string(1, c)});
    ++i;
  }
  return tokens;
}

class Cursor {
 public:
  explicit Cursor(const std::vector<Token>& tokens) : tokens_(tokens) {
  }

  bool Done() const {
    return pos_ >= tokens_.size();
  }

  std::size_t Position() const {
    return pos_;
  }

  bool PeekKeyword(std::string_view keyword) const {
    return !Done() && tokens_[pos_].kind == TokenKind::kWord && absl::EqualsIgnoreCase(tokens_[pos_].text, absl::string_view(keyword.data(), keyword.size()));
  }

  bool AcceptKeyword(std::string_view keyword) {
    if (!PeekKeyword(keyword)) return false;
    ++pos_;
    return true;
  }

  std::optional<std::string> AcceptWord() {
    if (Done() || tokens_[pos_].kind != TokenKind::kWord) return std::nullopt;
    return tokens_[pos_++].text;
  }

 private:
  const std::vector<Token>& tokens_;
  std::size_t               pos_ = 0;
};

// IF EXISTS | IF NOT EXISTS
void SkipExistenceClause(Cursor& cursor) {
  if (!cursor.AcceptKeyword("IF")) return;
  cursor.AcceptKeyword("NOT");
  cursor.AcceptKeyword("EXISTS");
}

bool IsTrue(const Token& token) {
  return (token.kind == TokenKind::kWord || token.kind == TokenKind::kString) && absl::EqualsIgnoreCase(token.text, "true");
}

// Scans WITH ( key = value, ... ) option lists after `from` for auto_refresh.
bool ParseAutoRefresh(const std::vector<Token>& tokens, std::size_t from) {
  for (std::size_t i = from; i + 1 < tokens.size(); ++i) {
    if (tokens[i].kind != TokenKind::kWord || !absl::EqualsIgnoreCase(tokens[i].text, "WITH")) continue;
    if (tokens[i + 1].kind != TokenKind::kSymbol || tokens[i + 1].text != "(") continue;

    for (std::size_t j = i + 2; j + 2 < tokens.size(); ++j) {
      if (tokens[j].kind == TokenKind::kSymbol && tokens[j].text == ")") break;
      const bool is_key = (tokens[j].kind == TokenKind::kWord || tokens[j].kind == TokenKind::kString) &&
                          absl::EqualsIgnoreCase(tokens[j].text, "auto_refresh");
      if (is_key && tokens[j + 1].kind == TokenKind::kSymbol && tokens[j + 1].text == "=") {
        return IsTrue(tokens[j + 2]);
      }
    }
  }
  return false;
}

} // namespace

std::optional<model::IndexOperation> FlintQueryClassifier::Parse(std::string_view query) {
  const auto tokens = Tokenize(query);
  Cursor     cursor(tokens);

  model::IndexOperation operation;
  if (cursor.AcceptKeyword("CREATE")) {
    operation.action = model::IndexAction::kCreate;
  } else if (cursor.AcceptKeyword("REFRESH")) {
    operation.action = model::IndexAction::kRefresh;
  } else if (cursor.AcceptKeyword("DROP")) {
    operation.action = model::IndexAction::kDrop;
  } else {
    return std::nullopt;
  }

  if (cursor.AcceptKeyword("SKIPPING")) {
    if (!cursor.AcceptKeyword("INDEX")) return std::nullopt;
    SkipExistenceClause(cursor);
    if (!cursor.AcceptKeyword("ON")) return std::nullopt;
    auto table = cursor.AcceptWord();
    if (!table) return std::nullopt;
    operation.type  = model::IndexType::kSkipping;
    operation.table = model::FullyQualifiedTableName::Parse(*table);
  } else if (cursor.AcceptKeyword("INDEX")) {
    SkipExistenceClause(cursor);
    auto name = cursor.AcceptWord();
    if (!name || !cursor.AcceptKeyword("ON")) return std::nullopt;
    auto table = cursor.AcceptWord();
    if (!table) return std::nullopt;
    operation.type       = model::IndexType::kCovering;
    operation.index_name = *name;
    operation.table      = model::FullyQualifiedTableName::Parse(*table);
  } else if (cursor.AcceptKeyword("MATERIALIZED")) {
    if (!cursor.AcceptKeyword("VIEW")) return std::nullopt;
    SkipExistenceClause(cursor);
    auto name = cursor.AcceptWord();
    if (!name) return std::nullopt;
    operation.type       = model::IndexType::kMaterializedView;
    operation.index_name = *name;
    operation.table      = model::FullyQualifiedTableName::Parse(*name);
  } else {
    return std::nullopt;
  }

  if (operation.action == model::IndexAction::kCreate) {
    operation.auto_refresh = ParseAutoRefresh(tokens, cursor.Position());
  }
  return operation;
}

bool FlintQueryClassifier::IsIndexQuery(std::string_view query) const {
  return Parse(query).has_value();
}

model::IndexOperation FlintQueryClassifier::ExtractIndexOperation(std::string_view query) const {
  auto operation = Parse(query);
  if (!operation) {
    throw util::InvalidArgument("not an index query: " + std::string(query));
  }
  return *operation;
}

} // namespace asyncquery::sql
