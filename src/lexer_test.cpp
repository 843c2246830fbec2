#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include "lexer.h"

namespace {

int failures = 0;

bool should_run_test(const std::string &name) {
  static const char *filter = std::getenv("TEST_FILTER");
  if (!filter || *filter == '\0') {
    return true;
  }
  return name.find(filter) != std::string::npos;
}

void run_case(const std::string &name, const std::function<bool()> &body) {
  if (!should_run_test(name)) {
    return;
  }
  bool ok = body();
  std::cout << (ok ? "✓ " : "✗ ") << name << std::endl;
  if (!ok) {
    ++failures;
  }
}

std::vector<Token> lex(const std::string &source, std::vector<Diagnostic> *diagnostics = nullptr) {
  Lexer lexer(source);
  auto tokens = lexer.tokenize_all();
  if (diagnostics) {
    *diagnostics = lexer.diagnostics();
  }
  return tokens;
}

bool kinds_are(const std::vector<Token> &tokens, const std::vector<TokenKind> &expected) {
  if (tokens.size() != expected.size()) {
    std::cout << "  token count " << tokens.size() << ", expected " << expected.size() << std::endl;
    return false;
  }
  for (size_t i = 0; i < tokens.size(); ++i) {
    if (tokens[i].kind() != expected[i]) {
      std::cout << "  token " << i << " '" << tokens[i].text() << "' is " << tokenKindName(tokens[i].kind())
                << ", expected " << tokenKindName(expected[i]) << std::endl;
      return false;
    }
  }
  return true;
}

} // namespace

int main() {
  std::cout << "=== 词法分析测试 ===" << std::endl;

  run_case("keywords_and_identifiers", [] {
    auto tokens = lex("contract Vault { state { total: u64; } }");
    return kinds_are(tokens, {TokenKind::Keyword, TokenKind::Identifier, TokenKind::Punctuation, TokenKind::Keyword,
                              TokenKind::Punctuation, TokenKind::Identifier, TokenKind::Punctuation,
                              TokenKind::Identifier, TokenKind::Punctuation, TokenKind::Punctuation,
                              TokenKind::Punctuation, TokenKind::Eof});
  });

  run_case("numeric_literals", [] {
    auto tokens = lex("1_000 0xff 255u8 42i64");
    if (!kinds_are(tokens, {TokenKind::Number, TokenKind::Number, TokenKind::Number, TokenKind::Number,
                            TokenKind::Eof})) {
      return false;
    }
    return tokens[0].text() == "1_000" && tokens[1].text() == "0xff" && tokens[2].text() == "255u8" &&
           tokens[3].text() == "42i64";
  });

  run_case("string_and_bytes_literals", [] {
    auto tokens = lex(R"("a \"quoted\" word" b"raw")");
    return kinds_are(tokens, {TokenKind::String, TokenKind::Bytes, TokenKind::Eof});
  });

  run_case("intrinsics_are_not_identifiers", [] {
    auto tokens = lex("msg_sender block_timestamp sender");
    return kinds_are(tokens, {TokenKind::Intrinsic, TokenKind::Intrinsic, TokenKind::Identifier, TokenKind::Eof});
  });

  run_case("multi_character_operators", [] {
    auto tokens = lex("a += b -> c => d .. e == f && g");
    std::vector<std::string> ops;
    for (const auto &t: tokens) {
      if (t.kind() == TokenKind::Operator || t.kind() == TokenKind::Comparison ||
          t.kind() == TokenKind::Punctuation) {
        ops.push_back(t.text());
      }
    }
    return ops == std::vector<std::string>{"+=", "->", "=>", "..", "==", "&&"};
  });

  run_case("nested_block_comments", [] {
    std::vector<Diagnostic> diagnostics;
    auto tokens = lex("a /* outer /* inner */ still comment */ b // tail", &diagnostics);
    return diagnostics.empty() && kinds_are(tokens, {TokenKind::Identifier, TokenKind::Identifier, TokenKind::Eof});
  });

  run_case("unknown_character_recovers", [] {
    std::vector<Diagnostic> diagnostics;
    auto tokens = lex("a $$$ b", &diagnostics);
    return diagnostics.size() == 1 && diagnostics[0].code == DiagnosticCode::LexError &&
           diagnostics[0].span.begin == 2 &&
           kinds_are(tokens, {TokenKind::Identifier, TokenKind::Identifier, TokenKind::Eof});
  });

  run_case("invalid_utf8_byte_recovers", [] {
    std::vector<Diagnostic> diagnostics;
    auto tokens = lex("contract A { \xff }", &diagnostics);
    return diagnostics.size() == 1 && diagnostics[0].code == DiagnosticCode::LexError &&
           diagnostics[0].span.begin == 13 && diagnostics[0].span.end == 14 &&
           kinds_are(tokens, {TokenKind::Keyword, TokenKind::Identifier, TokenKind::Punctuation,
                              TokenKind::Punctuation, TokenKind::Eof});
  });

  run_case("non_ascii_bytes_outside_strings", [] {
    std::vector<Diagnostic> accent;
    auto tokens = lex("a \xc3\xa9 b", &accent);
    std::vector<Diagnostic> trailing;
    auto tail = lex("x\xff", &trailing);
    return accent.size() == 1 && accent[0].code == DiagnosticCode::LexError &&
           kinds_are(tokens, {TokenKind::Identifier, TokenKind::Identifier, TokenKind::Eof}) &&
           trailing.size() == 1 && trailing[0].span.begin == 1 &&
           kinds_are(tail, {TokenKind::Identifier, TokenKind::Eof});
  });

  run_case("unterminated_string_covers_rest", [] {
    std::string source = "let s = \"never closed";
    std::vector<Diagnostic> diagnostics;
    lex(source, &diagnostics);
    return diagnostics.size() == 1 && diagnostics[0].code == DiagnosticCode::LexError &&
           diagnostics[0].span.end == source.size();
  });

  run_case("unterminated_block_comment", [] {
    std::vector<Diagnostic> diagnostics;
    lex("a /* open", &diagnostics);
    return diagnostics.size() == 1 && diagnostics[0].code == DiagnosticCode::LexError;
  });

  run_case("deterministic_token_stream", [] {
    std::string source = "public fn f(x: u64) -> u64 { return x * 2u64; }";
    auto first = lex(source);
    auto second = lex(source);
    if (first.size() != second.size()) return false;
    for (size_t i = 0; i < first.size(); ++i) {
      if (first[i].kind() != second[i].kind() || first[i].text() != second[i].text() ||
          first[i].position() != second[i].position()) {
        return false;
      }
    }
    return true;
  });

  std::cout << (failures == 0 ? "全部通过" : "存在失败: " + std::to_string(failures)) << std::endl;
  return failures == 0 ? 0 : 1;
}
