#include "chromanet/io/weight_export.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <fstream>
#include <istream>
#include <iterator>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace chromanet::io {

namespace {

struct TensorSlot {
  const char* name;
  const char* rowDim;
  const char* colDim;  // nullptr for bias vectors
  nn::Matrix nn::NetworkParameters::*member;
};

const std::array<TensorSlot, 6> kTensorSlots = {{
    {"input_weights", "INPUT_SIZE", "HIDDEN_SIZE1", &nn::NetworkParameters::inputWeights},
    {"hidden_weights1", "HIDDEN_SIZE1", "HIDDEN_SIZE2", &nn::NetworkParameters::hiddenWeights1},
    {"hidden_weights2", "HIDDEN_SIZE2", "OUTPUT_SIZE", &nn::NetworkParameters::hiddenWeights2},
    {"hidden_bias1", "HIDDEN_SIZE1", nullptr, &nn::NetworkParameters::hiddenBias1},
    {"hidden_bias2", "HIDDEN_SIZE2", nullptr, &nn::NetworkParameters::hiddenBias2},
    {"output_bias", "OUTPUT_SIZE", nullptr, &nn::NetworkParameters::outputBias},
}};

// ---------------- reader ----------------

enum class Tok { Ident, Number, Punct, End };

struct Token {
  Tok kind = Tok::End;
  std::string text;
  int line = 0;
};

class Lexer {
 public:
  explicit Lexer(std::string src) : src_(std::move(src)) {}

  Token next() {
    skip_space_and_comments();
    Token t;
    t.line = line_;
    if (pos_ >= src_.size()) return t;

    const char c = src_[pos_];
    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
      t.kind = Tok::Ident;
      t.text = take_while([](char ch) { return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_'; });
    } else if (std::isdigit(static_cast<unsigned char>(c))) {
      t.kind = Tok::Number;
      t.text = take_while([](char ch) { return std::isalnum(static_cast<unsigned char>(ch)) != 0; });
    } else {
      t.kind = Tok::Punct;
      t.text.assign(1, c);
      ++pos_;
    }
    return t;
  }

 private:
  std::string src_;
  std::size_t pos_ = 0;
  int line_ = 1;

  template <class Pred>
  std::string take_while(Pred p) {
    const std::size_t start = pos_;
    while (pos_ < src_.size() && p(src_[pos_])) ++pos_;
    return src_.substr(start, pos_ - start);
  }

  void skip_space_and_comments() {
    while (pos_ < src_.size()) {
      const char c = src_[pos_];
      if (c == '\n') {
        ++line_;
        ++pos_;
      } else if (std::isspace(static_cast<unsigned char>(c))) {
        ++pos_;
      } else if (src_.compare(pos_, 2, "//") == 0 || c == '#') {
        while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
      } else if (src_.compare(pos_, 2, "/*") == 0) {
        const auto end = src_.find("*/", pos_ + 2);
        const std::size_t stop = end == std::string::npos ? src_.size() : end + 2;
        for (; pos_ < stop; ++pos_)
          if (src_[pos_] == '\n') ++line_;
      } else {
        return;
      }
    }
  }
};

class Parser {
 public:
  explicit Parser(std::string src) : lex_(std::move(src)) { advance(); }

  std::vector<ExportedTensor> parse_all() {
    std::vector<ExportedTensor> out;
    while (cur_.kind != Tok::End) out.push_back(parse_declaration());
    return out;
  }

 private:
  Lexer lex_;
  Token cur_;

  void advance() { cur_ = lex_.next(); }

  [[noreturn]] void fail(const std::string& what) const {
    throw std::runtime_error("Malformed weight file at line " + std::to_string(cur_.line) + ": " +
                             what + (cur_.kind == Tok::End ? " (end of input)" : " near '" + cur_.text + "'"));
  }

  void expect_punct(char c) {
    if (cur_.kind != Tok::Punct || cur_.text[0] != c) fail(std::string("expected '") + c + "'");
    advance();
  }

  bool accept_punct(char c) {
    if (cur_.kind == Tok::Punct && cur_.text[0] == c) {
      advance();
      return true;
    }
    return false;
  }

  std::uint32_t parse_literal() {
    if (cur_.kind != Tok::Number) fail("expected hex literal");
    std::uint32_t v = 0;
    try {
      v = parse_hex(cur_.text);
    } catch (const std::invalid_argument& e) {
      fail(e.what());
    }
    advance();
    return v;
  }

  // '{' lit (',' lit)* [','] '}'
  std::vector<std::uint32_t> parse_row() {
    std::vector<std::uint32_t> row;
    expect_punct('{');
    while (!accept_punct('}')) {
      row.push_back(parse_literal());
      if (!accept_punct(',')) {
        expect_punct('}');
        break;
      }
    }
    return row;
  }

  ExportedTensor parse_declaration() {
    if (cur_.kind != Tok::Ident || cur_.text != "uint32_t") fail("expected 'uint32_t'");
    advance();

    ExportedTensor t;
    if (cur_.kind != Tok::Ident) fail("expected array name");
    t.name = cur_.text;
    advance();

    while (accept_punct('[')) {
      if (cur_.kind != Tok::Ident && cur_.kind != Tok::Number) fail("expected dimension");
      t.dimNames.push_back(cur_.text);
      advance();
      expect_punct(']');
    }
    if (t.dimNames.empty() || t.dimNames.size() > 2) fail("expected one or two dimensions");
    expect_punct('=');

    if (t.dimNames.size() == 1) {
      t.bits = parse_row();
      t.isVector = true;
      t.rows = 1;
      t.cols = t.bits.size();
    } else {
      expect_punct('{');
      while (!accept_punct('}')) {
        const auto row = parse_row();
        if (t.rows == 0) t.cols = row.size();
        else if (row.size() != t.cols) fail("rows of '" + t.name + "' differ in length");
        t.bits.insert(t.bits.end(), row.begin(), row.end());
        ++t.rows;
        if (!accept_punct(',')) {
          expect_punct('}');
          break;
        }
      }
    }
    expect_punct(';');
    return t;
  }
};

}  // namespace

std::string format_hex(std::uint32_t bits) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string s = "0x00000000";
  for (int i = 9; i >= 2; --i) {
    s[static_cast<std::size_t>(i)] = kDigits[bits & 0xFu];
    bits >>= 4;
  }
  return s;
}

std::uint32_t parse_hex(std::string_view text) {
  if (text.size() < 3 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X'))
    throw std::invalid_argument("Hex literal must start with 0x: " + std::string(text));
  const std::string_view digits = text.substr(2);
  if (digits.size() > 8) throw std::invalid_argument("Hex literal wider than 32 bits: " + std::string(text));

  std::uint32_t v = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), v, 16);
  if (ec != std::errc{} || ptr != digits.data() + digits.size())
    throw std::invalid_argument("Invalid hex literal: " + std::string(text));
  return v;
}

std::vector<ExportedTensor> export_parameters(const nn::NetworkParameters& params) {
  std::vector<ExportedTensor> out;
  out.reserve(kTensorSlots.size());
  for (const auto& slot : kTensorSlots) {
    const nn::Matrix& m = params.*slot.member;
    ExportedTensor t;
    t.name = slot.name;
    t.dimNames.emplace_back(slot.rowDim);
    if (slot.colDim) t.dimNames.emplace_back(slot.colDim);
    t.isVector = slot.colDim == nullptr;
    t.rows = m.rows();
    t.cols = m.cols();
    t.bits.reserve(m.size());
    for (float v : m.data()) t.bits.push_back(float_to_bits(v));
    out.push_back(std::move(t));
  }
  return out;
}

nn::NetworkParameters import_parameters(const std::vector<ExportedTensor>& tensors,
                                        const nn::Topology& topology) {
  nn::NetworkParameters params = nn::NetworkParameters::zeros(topology);
  for (const auto& slot : kTensorSlots) {
    auto it = std::find_if(tensors.begin(), tensors.end(),
                           [&](const ExportedTensor& t) { return t.name == slot.name; });
    if (it == tensors.end())
      throw std::runtime_error(std::string("Weight tensor missing: ") + slot.name);

    nn::Matrix& m = params.*slot.member;
    if (it->rows != m.rows() || it->cols != m.cols() || it->bits.size() != m.size()) {
      throw std::runtime_error(std::string("Weight tensor '") + slot.name + "' has shape " +
                               std::to_string(it->rows) + "x" + std::to_string(it->cols) +
                               ", expected " + std::to_string(m.rows()) + "x" +
                               std::to_string(m.cols()));
    }
    std::transform(it->bits.begin(), it->bits.end(), m.data().begin(), bits_to_float);
  }
  return params;
}

void write_array_initializers(std::ostream& out, const std::vector<ExportedTensor>& tensors) {
  auto write_row = [&](const ExportedTensor& t, std::size_t r) {
    out << "{";
    for (std::size_t c = 0; c < t.cols; ++c) {
      if (c) out << ", ";
      out << format_hex(t.bits[r * t.cols + c]);
    }
    out << "}";
  };

  bool first = true;
  for (const auto& t : tensors) {
    if (!first) out << "\n";
    first = false;

    out << "uint32_t " << t.name;
    for (const auto& d : t.dimNames) out << "[" << d << "]";
    out << " = ";
    if (t.isVector) {
      write_row(t, 0);
      out << ";\n";
      continue;
    }
    out << "{\n";
    for (std::size_t r = 0; r < t.rows; ++r) {
      out << "    ";
      write_row(t, r);
      out << ",\n";
    }
    out << "};\n";
  }
}

std::vector<ExportedTensor> read_array_initializers(std::istream& in) {
  std::string src{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  if (in.bad()) throw std::runtime_error("Error while reading weight file");
  return Parser(std::move(src)).parse_all();
}

std::vector<ExportedTensor> read_weights_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Unable to open weight file: " + path);
  return read_array_initializers(in);
}

}  // namespace chromanet::io
