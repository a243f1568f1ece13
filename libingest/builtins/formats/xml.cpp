//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/defaults.hpp"
#include "ingest/detail/string.hpp"
#include "ingest/error.hpp"
#include "ingest/formats.hpp"
#include "ingest/logger.hpp"
#include "ingest/text_reader.hpp"

#include <caf/expected.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <expat.h>

namespace ingest {

namespace {

/// Separates namespace URI, local name, and prefix in names reported by
/// expat.
constexpr auto namespace_separator = XML_Char{'\x01'};

/// The number of bytes handed to expat at once.
constexpr auto xml_chunk_size = size_t{1} << 20;

// -- document model -----------------------------------------------------------

struct xml_element;
using xml_node = std::variant<std::string, std::unique_ptr<xml_element>>;

/// A namespace-qualified name.
struct xml_name {
  std::string uri;
  std::string local;
  std::string prefix;

  auto qualified() const -> std::string {
    return prefix.empty() ? local : fmt::format("{}:{}", prefix, local);
  }
};

struct xml_attribute {
  xml_name name;
  std::string value;
};

/// An XML element with its attributes, the namespaces it declares, and its
/// children. The document node is an element without name and parent.
struct xml_element {
  xml_name name;
  std::vector<xml_attribute> attributes;
  std::vector<std::pair<std::string, std::string>> namespaces;
  std::vector<xml_node> children;
  const xml_element* parent = nullptr;
  /// Position in document order; the document node has position 0.
  size_t order = 0;

  auto is_document() const -> bool {
    return parent == nullptr;
  }
};

auto as_element(const xml_node& node) -> const xml_element* {
  if (const auto* child = std::get_if<std::unique_ptr<xml_element>>(&node)) {
    return child->get();
  }
  return nullptr;
}

/// Splits a name in expat's triplet notation `uri SEP local SEP prefix`.
auto split_name(const XML_Char* raw) -> xml_name {
  auto parts = detail::split(raw, std::string_view{&namespace_separator, 1});
  switch (parts.size()) {
    case 1:
      return {.local = std::string{parts[0]}};
    case 2:
      return {.uri = std::string{parts[0]}, .local = std::string{parts[1]}};
    default:
      return {
        .uri = std::string{parts[0]},
        .local = std::string{parts[1]},
        .prefix = std::string{parts[2]},
      };
  }
}

/// Concatenates the text of an element and all its descendants.
void append_inner_text(std::string& out, const xml_element& element) {
  for (const auto& child : element.children) {
    if (const auto* text = std::get_if<std::string>(&child)) {
      out += *text;
    } else {
      append_inner_text(out, *as_element(child));
    }
  }
}

auto inner_text(const xml_element& element) -> std::string {
  auto result = std::string{};
  append_inner_text(result, element);
  return result;
}

using namespace_list = std::vector<std::pair<std::string, std::string>>;

void append_namespaces(std::string& out, const namespace_list& namespaces) {
  for (const auto& [prefix, uri] : namespaces) {
    if (prefix.empty()) {
      fmt::format_to(std::back_inserter(out), " xmlns=\"{}\"",
                     detail::xml_escape(uri, true));
    } else {
      fmt::format_to(std::back_inserter(out), " xmlns:{}=\"{}\"", prefix,
                     detail::xml_escape(uri, true));
    }
  }
}

/// Serializes an element including its own namespace declarations.
void append_outer_xml(std::string& out, const xml_element& element) {
  auto name = element.name.qualified();
  out += '<';
  out += name;
  append_namespaces(out, element.namespaces);
  for (const auto& attribute : element.attributes) {
    fmt::format_to(std::back_inserter(out), " {}=\"{}\"",
                   attribute.name.qualified(),
                   detail::xml_escape(attribute.value, true));
  }
  if (element.children.empty()) {
    out += " />";
    return;
  }
  out += '>';
  for (const auto& child : element.children) {
    if (const auto* text = std::get_if<std::string>(&child)) {
      out += detail::xml_escape(*text);
    } else {
      append_outer_xml(out, *as_element(child));
    }
  }
  fmt::format_to(std::back_inserter(out), "</{}>", name);
}

/// Returns the namespace bound to a prefix in the scope of an element. The
/// empty prefix denotes the default namespace.
auto lookup_namespace(const xml_element& element, std::string_view prefix)
  -> const std::string* {
  for (const auto* current = &element; current; current = current->parent) {
    for (const auto& [declared, uri] : current->namespaces) {
      if (declared == prefix) {
        return &uri;
      }
    }
  }
  return nullptr;
}

/// Collects the prefixes that the names in a subtree refer to.
void collect_prefixes(const xml_element& element,
                      std::vector<std::string>& out) {
  auto add = [&](const std::string& prefix) {
    if (std::find(out.begin(), out.end(), prefix) == out.end()) {
      out.push_back(prefix);
    }
  };
  if (not element.name.prefix.empty() or not element.name.uri.empty()) {
    add(element.name.prefix);
  }
  for (const auto& attribute : element.attributes) {
    if (not attribute.name.prefix.empty()) {
      add(attribute.name.prefix);
    }
  }
  for (const auto& child : element.children) {
    if (const auto* child_element = as_element(child)) {
      collect_prefixes(*child_element, out);
    }
  }
}

/// Serializes an element as a standalone fragment. Namespaces that the
/// fragment uses but that are declared by an ancestor are redeclared on the
/// fragment's outermost element.
auto outer_xml(const xml_element& element) -> std::string {
  auto inherited = namespace_list{};
  if (element.parent) {
    auto prefixes = std::vector<std::string>{};
    collect_prefixes(element, prefixes);
    for (const auto& prefix : prefixes) {
      auto declared_here
        = std::any_of(element.namespaces.begin(), element.namespaces.end(),
                      [&](const auto& entry) {
                        return entry.first == prefix;
                      });
      if (declared_here) {
        continue;
      }
      if (const auto* uri = lookup_namespace(*element.parent, prefix)) {
        inherited.emplace_back(prefix, *uri);
      }
    }
  }
  auto result = std::string{};
  append_outer_xml(result, element);
  if (not inherited.empty()) {
    // Splice the inherited declarations in right after the element name.
    auto declarations = std::string{};
    append_namespaces(declarations, inherited);
    result.insert(1 + element.name.qualified().size(), declarations);
  }
  return result;
}

// -- SAX to DOM ---------------------------------------------------------------

/// SAX handler state for building a DOM from XML.
struct sax_state {
  std::unique_ptr<xml_element> document = std::make_unique<xml_element>();
  std::vector<xml_element*> element_stack = {document.get()};
  std::vector<std::pair<std::string, std::string>> pending_namespaces;
  std::string text;
  size_t next_order = 0;
  XML_Parser parser = nullptr;
  /// Set when the input nests deeper than the supported maximum.
  bool too_deep = false;

  /// Attaches buffered character data to the current element. Whitespace-only
  /// text is insignificant and dropped.
  void flush_text() {
    if (text.empty()) {
      return;
    }
    if (not detail::is_blank(text)) {
      auto& children = element_stack.back()->children;
      if (not children.empty()
          and std::holds_alternative<std::string>(children.back())) {
        std::get<std::string>(children.back()) += text;
      } else {
        children.emplace_back(std::move(text));
      }
    }
    text.clear();
  }
};

/// RAII wrapper for libexpat XML_Parser.
struct xml_parser_deleter {
  void operator()(XML_Parser p) const noexcept {
    if (p) {
      XML_ParserFree(p);
    }
  }
};
using xml_parser_ptr
  = std::unique_ptr<std::remove_pointer_t<XML_Parser>, xml_parser_deleter>;

/// Expat SAX callbacks.
void XMLCALL start_namespace(void* user_data, const XML_Char* prefix,
                             const XML_Char* uri) {
  auto* state = static_cast<sax_state*>(user_data);
  state->pending_namespaces.emplace_back(prefix ? prefix : "",
                                         uri ? uri : "");
}

void XMLCALL start_element(void* user_data, const XML_Char* name,
                           const XML_Char** attrs) {
  auto* state = static_cast<sax_state*>(user_data);
  if (state->too_deep) {
    return;
  }
  // The stack holds the document node in addition to the open elements.
  if (state->element_stack.size() > defaults::format::xml_max_depth) {
    state->too_deep = true;
    XML_StopParser(state->parser, XML_FALSE);
    return;
  }
  state->flush_text();
  auto elem = std::make_unique<xml_element>();
  elem->name = split_name(name);
  elem->namespaces = std::exchange(state->pending_namespaces, {});
  elem->parent = state->element_stack.back();
  elem->order = ++state->next_order;
  for (int i = 0; attrs[i]; i += 2) {
    elem->attributes.push_back({split_name(attrs[i]), attrs[i + 1]});
  }
  auto* elem_ptr = elem.get();
  state->element_stack.back()->children.emplace_back(std::move(elem));
  state->element_stack.push_back(elem_ptr);
}

void XMLCALL end_element(void* user_data, const XML_Char*) {
  auto* state = static_cast<sax_state*>(user_data);
  if (state->too_deep) {
    return;
  }
  state->flush_text();
  if (state->element_stack.size() > 1) {
    state->element_stack.pop_back();
  }
}

void XMLCALL character_data(void* user_data, const XML_Char* s, int len) {
  auto* state = static_cast<sax_state*>(user_data);
  state->text.append(s, static_cast<size_t>(len));
}

/// Parses an XML document into a DOM tree rooted at a document node.
auto parse_xml_dom(std::string_view xml)
  -> caf::expected<std::unique_ptr<xml_element>> {
  // Input arrives as UTF-8 regardless of the declared encoding.
  auto parser
    = xml_parser_ptr{XML_ParserCreateNS("UTF-8", namespace_separator)};
  if (not parser) {
    return caf::make_error(ec::system_error, "failed to create XML parser");
  }
  auto state = sax_state{};
  state.parser = parser.get();
  XML_SetUserData(parser.get(), &state);
  XML_SetReturnNSTriplet(parser.get(), XML_TRUE);
  XML_SetElementHandler(parser.get(), start_element, end_element);
  XML_SetCharacterDataHandler(parser.get(), character_data);
  XML_SetStartNamespaceDeclHandler(parser.get(), start_namespace);
  do {
    auto chunk = xml.substr(0, xml_chunk_size);
    xml.remove_prefix(chunk.size());
    auto status = XML_Parse(parser.get(), chunk.data(),
                            static_cast<int>(chunk.size()),
                            xml.empty() ? XML_TRUE : XML_FALSE);
    if (status == XML_STATUS_ERROR and state.too_deep) {
      return caf::make_error(
        ec::parse_error,
        fmt::format("elements nest deeper than {} levels, line {}, position "
                    "{}",
                    defaults::format::xml_max_depth,
                    XML_GetCurrentLineNumber(parser.get()),
                    XML_GetCurrentColumnNumber(parser.get()) + 1));
    }
    if (status == XML_STATUS_ERROR) {
      return caf::make_error(
        ec::parse_error,
        fmt::format("{}, line {}, position {}",
                    XML_ErrorString(XML_GetErrorCode(parser.get())),
                    XML_GetCurrentLineNumber(parser.get()),
                    XML_GetCurrentColumnNumber(parser.get()) + 1));
    }
  } while (not xml.empty());
  return std::move(state.document);
}

// -- record paths -------------------------------------------------------------

/// Matches elements or attributes by name. An unprefixed name matches only
/// names without a namespace.
struct name_test {
  bool any_namespace = false;
  bool any_local = false;
  std::string uri;
  std::string local;

  auto matches(const xml_name& name) const -> bool {
    return (any_namespace or name.uri == uri)
           and (any_local or name.local == local);
  }
};

enum class predicate_kind {
  position,
  last,
  has_attribute,
  attribute_equals,
  has_child,
  child_equals,
};

struct predicate {
  predicate_kind kind = predicate_kind::position;
  int64_t position = 0;
  name_test name = {};
  std::string value = {};
};

enum class step_kind {
  self,
  parent,
  element,
};

struct step {
  step_kind kind = step_kind::element;
  /// Whether the step is preceded by `//`.
  bool descendants = false;
  name_test test = {};
  std::vector<predicate> predicates = {};
};

/// A parsed location path.
struct xpath {
  std::vector<step> steps;
};

/// Parses the supported subset of XPath 1.0 location paths: absolute and
/// relative paths, the `//` abbreviation, `.` and `..`, name tests with
/// optional prefix, wildcards, and the predicates `[n]`, `[last()]`,
/// `[@attr]`, `[@attr='value']`, `[child]`, and `[child='value']`.
class xpath_parser {
public:
  xpath_parser(std::string_view input,
               const std::optional<std::string>& xml_namespace)
    : input_{input}, xml_namespace_{xml_namespace} {
  }

  auto parse() -> caf::expected<xpath> {
    auto result = xpath{};
    skip_whitespace();
    if (at_end()) {
      return error("expression is empty");
    }
    // Relative paths start at the document node just like absolute ones.
    auto descendants = false;
    if (accept('/')) {
      descendants = accept('/');
      skip_whitespace();
      if (at_end()) {
        if (descendants) {
          return error("expected a location step");
        }
        return result;
      }
    }
    while (true) {
      auto next = parse_step();
      if (not next) {
        return std::move(next.error());
      }
      next->descendants = descendants;
      result.steps.push_back(std::move(*next));
      skip_whitespace();
      if (at_end()) {
        return result;
      }
      if (not accept('/')) {
        return unexpected();
      }
      descendants = accept('/');
      skip_whitespace();
    }
  }

private:
  auto at_end() const -> bool {
    return pos_ >= input_.size();
  }

  auto peek() const -> char {
    return at_end() ? '\0' : input_[pos_];
  }

  auto accept(char c) -> bool {
    if (peek() == c and not at_end()) {
      ++pos_;
      return true;
    }
    return false;
  }

  void skip_whitespace() {
    while (not at_end() and detail::is_space(input_[pos_])) {
      ++pos_;
    }
  }

  auto error(std::string_view what) const -> caf::error {
    return caf::make_error(ec::syntax_error, std::string{what});
  }

  auto unexpected() const -> caf::error {
    if (at_end()) {
      return error("unexpected end of expression");
    }
    return error(fmt::format("unexpected character '{}' at position {}",
                             peek(), pos_ + 1));
  }

  static auto is_name_start(char c) -> bool {
    return (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or c == '_'
           or static_cast<unsigned char>(c) >= 0x80;
  }

  static auto is_name_char(char c) -> bool {
    return is_name_start(c) or (c >= '0' and c <= '9') or c == '-' or c == '.';
  }

  auto parse_ncname() -> std::optional<std::string_view> {
    if (not is_name_start(peek())) {
      return std::nullopt;
    }
    auto begin = pos_;
    while (not at_end() and is_name_char(input_[pos_])) {
      ++pos_;
    }
    return input_.substr(begin, pos_ - begin);
  }

  auto resolve_prefix(std::string_view prefix) const
    -> caf::expected<std::string> {
    if (prefix == defaults::format::xml_namespace_prefix and xml_namespace_
        and not detail::is_blank(*xml_namespace_)) {
      return *xml_namespace_;
    }
    return error(fmt::format("namespace prefix '{}' is not defined", prefix));
  }

  auto parse_name_test() -> caf::expected<name_test> {
    auto result = name_test{};
    if (accept('*')) {
      result.any_namespace = true;
      result.any_local = true;
      return result;
    }
    auto first = parse_ncname();
    if (not first) {
      return unexpected();
    }
    if (peek() != ':') {
      result.local = std::string{*first};
      return result;
    }
    ++pos_;
    if (peek() == ':') {
      return error(fmt::format("unsupported axis '{}::'", *first));
    }
    auto uri = resolve_prefix(*first);
    if (not uri) {
      return std::move(uri.error());
    }
    result.uri = std::move(*uri);
    if (accept('*')) {
      result.any_local = true;
      return result;
    }
    auto second = parse_ncname();
    if (not second) {
      return unexpected();
    }
    result.local = std::string{*second};
    return result;
  }

  auto parse_literal() -> caf::expected<std::string> {
    auto quote = peek();
    if (quote != '\'' and quote != '"') {
      return unexpected();
    }
    ++pos_;
    auto end = input_.find(quote, pos_);
    if (end == std::string_view::npos) {
      return error("unterminated string literal");
    }
    auto result = std::string{input_.substr(pos_, end - pos_)};
    pos_ = end + 1;
    return result;
  }

  /// Parses an optional `= 'literal'` suffix.
  auto parse_comparison() -> caf::expected<std::optional<std::string>> {
    skip_whitespace();
    if (not accept('=')) {
      return std::optional<std::string>{};
    }
    skip_whitespace();
    auto literal = parse_literal();
    if (not literal) {
      return std::move(literal.error());
    }
    return std::optional<std::string>{std::move(*literal)};
  }

  auto parse_predicate() -> caf::expected<predicate> {
    auto result = predicate{};
    skip_whitespace();
    if (peek() >= '0' and peek() <= '9') {
      while (peek() >= '0' and peek() <= '9') {
        auto digit = int64_t{input_[pos_] - '0'};
        if (result.position
            > (std::numeric_limits<int64_t>::max() - digit) / 10) {
          return error("position out of range");
        }
        result.position = result.position * 10 + digit;
        ++pos_;
      }
      result.kind = predicate_kind::position;
    } else if (input_.substr(pos_).starts_with("last()")) {
      pos_ += 6;
      result.kind = predicate_kind::last;
    } else {
      auto attribute = accept('@');
      auto name = parse_name_test();
      if (not name) {
        return std::move(name.error());
      }
      result.name = std::move(*name);
      auto comparison = parse_comparison();
      if (not comparison) {
        return std::move(comparison.error());
      }
      if (*comparison) {
        result.value = std::move(**comparison);
        result.kind = attribute ? predicate_kind::attribute_equals
                                : predicate_kind::child_equals;
      } else {
        result.kind = attribute ? predicate_kind::has_attribute
                                : predicate_kind::has_child;
      }
    }
    skip_whitespace();
    if (not accept(']')) {
      return unexpected();
    }
    return result;
  }

  auto parse_step() -> caf::expected<step> {
    auto result = step{};
    if (accept('.')) {
      result.kind = accept('.') ? step_kind::parent : step_kind::self;
      return result;
    }
    if (peek() == '@') {
      return error("selecting attributes is not supported");
    }
    auto test = parse_name_test();
    if (not test) {
      return std::move(test.error());
    }
    result.test = std::move(*test);
    skip_whitespace();
    while (accept('[')) {
      auto pred = parse_predicate();
      if (not pred) {
        return std::move(pred.error());
      }
      result.predicates.push_back(std::move(*pred));
      skip_whitespace();
    }
    return result;
  }

  std::string_view input_;
  const std::optional<std::string>& xml_namespace_;
  size_t pos_ = 0;
};

void collect_descendants_or_self(const xml_element* element,
                                 std::vector<const xml_element*>& out) {
  out.push_back(element);
  for (const auto& child : element->children) {
    if (const auto* child_element = as_element(child)) {
      collect_descendants_or_self(child_element, out);
    }
  }
}

auto matches(const predicate& pred, const xml_element& element,
             size_t position, size_t size) -> bool {
  switch (pred.kind) {
    case predicate_kind::position:
      return pred.position >= 0
             and static_cast<size_t>(pred.position) == position;
    case predicate_kind::last:
      return position == size;
    case predicate_kind::has_attribute:
    case predicate_kind::attribute_equals:
      return std::any_of(element.attributes.begin(), element.attributes.end(),
                         [&](const xml_attribute& attribute) {
                           return pred.name.matches(attribute.name)
                                  and (pred.kind
                                         == predicate_kind::has_attribute
                                       or attribute.value == pred.value);
                         });
    case predicate_kind::has_child:
    case predicate_kind::child_equals:
      return std::any_of(element.children.begin(), element.children.end(),
                         [&](const xml_node& node) {
                           const auto* child = as_element(node);
                           return child and pred.name.matches(child->name)
                                  and (pred.kind == predicate_kind::has_child
                                       or inner_text(*child) == pred.value);
                         });
  }
  return false;
}

/// Evaluates a location path against a document and returns the selected
/// nodes in document order.
auto evaluate(const xpath& path, const xml_element& document)
  -> std::vector<const xml_element*> {
  auto context = std::vector<const xml_element*>{&document};
  for (const auto& step : path.steps) {
    auto next = std::vector<const xml_element*>{};
    for (const auto* node : context) {
      auto bases = std::vector<const xml_element*>{};
      if (step.descendants) {
        collect_descendants_or_self(node, bases);
      } else {
        bases.push_back(node);
      }
      for (const auto* base : bases) {
        switch (step.kind) {
          case step_kind::self:
            next.push_back(base);
            break;
          case step_kind::parent:
            if (base->parent) {
              next.push_back(base->parent);
            }
            break;
          case step_kind::element: {
            auto candidates = std::vector<const xml_element*>{};
            for (const auto& child : base->children) {
              const auto* child_element = as_element(child);
              if (child_element and step.test.matches(child_element->name)) {
                candidates.push_back(child_element);
              }
            }
            for (const auto& pred : step.predicates) {
              auto filtered = std::vector<const xml_element*>{};
              for (size_t i = 0; i < candidates.size(); ++i) {
                if (matches(pred, *candidates[i], i + 1, candidates.size())) {
                  filtered.push_back(candidates[i]);
                }
              }
              candidates = std::move(filtered);
            }
            next.insert(next.end(), candidates.begin(), candidates.end());
            break;
          }
        }
      }
    }
    std::sort(next.begin(), next.end(), [](const auto* lhs, const auto* rhs) {
      return lhs->order < rhs->order;
    });
    next.erase(std::unique(next.begin(), next.end()), next.end());
    context = std::move(next);
  }
  return context;
}

/// Selects the element children of the document element.
auto default_records(const xml_element& document)
  -> std::vector<const xml_element*> {
  auto result = std::vector<const xml_element*>{};
  for (const auto& node : document.children) {
    if (const auto* root = as_element(node)) {
      for (const auto& child : root->children) {
        if (const auto* child_element = as_element(child)) {
          result.push_back(child_element);
        }
      }
    }
  }
  return result;
}

/// Flattens a selected node into columns: namespace declarations as `@xmlns`
/// or `@prefix`, attributes as `@name`, and child elements by local name. A
/// child whose first child is an element is kept as XML text, other children
/// contribute their text content.
auto to_record(const xml_element& node) -> record {
  auto result = record{};
  for (const auto& [prefix, uri] : node.namespaces) {
    result.insert_or_assign(prefix.empty() ? std::string{"@xmlns"}
                                           : fmt::format("@{}", prefix),
                            uri);
  }
  for (const auto& attribute : node.attributes) {
    result.insert_or_assign(fmt::format("@{}", attribute.name.local),
                            attribute.value);
  }
  for (const auto& child : node.children) {
    const auto* element = as_element(child);
    if (not element) {
      continue;
    }
    const auto nested = not element->children.empty()
                        and as_element(element->children.front()) != nullptr;
    result.insert_or_assign(element->name.local, nested
                                                   ? outer_xml(*element)
                                                   : inner_text(*element));
  }
  if (result.empty() and not node.is_document()) {
    result.insert_or_assign("value", inner_text(node));
  }
  return result;
}

} // namespace

auto xml_parser::name() const -> std::string {
  return "XML";
}

auto xml_parser::parse(std::istream& input, format_config config,
                       std::stop_token stop) const -> generator<parsed_row> {
  auto reader = text_reader{input, resolve_encoding(config.encoding)};
  auto document = parse_xml_dom(reader.read_to_end());
  if (not document) {
    co_yield parsed_row::make_error(
      0, fmt::format("XML parse error: {}", message(document.error())));
    co_return;
  }
  auto nodes = std::vector<const xml_element*>{};
  auto path = std::string{};
  if (config.record_element and not detail::is_blank(*config.record_element)) {
    path = *config.record_element;
    auto expression = xpath_parser{path, config.xml_namespace}.parse();
    if (not expression) {
      co_yield parsed_row::make_error(
        0, fmt::format("XPath error '{}': {}", path,
                       message(expression.error())));
      co_return;
    }
    nodes = evaluate(*expression, **document);
  } else {
    for (const auto& node : (*document)->children) {
      if (const auto* root = as_element(node)) {
        path = fmt::format("/{}/*", root->name.qualified());
      }
    }
    nodes = default_records(**document);
  }
  if (nodes.empty()) {
    INGEST_WARN("xml parser: no nodes matched path '{}'", path);
    co_return;
  }
  INGEST_DEBUG("xml parser selected {} nodes with path '{}'", nodes.size(),
               path);
  auto line_number = int64_t{0};
  for (const auto* node : nodes) {
    if (stop.stop_requested()) {
      throw operation_cancelled{};
    }
    co_yield parsed_row::make(++line_number, to_record(*node));
  }
}

} // namespace ingest
