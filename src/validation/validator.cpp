#include <mnemo/validation/validator.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include <boost/regex.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

using namespace mnemo::schema;

namespace mnemo::validation {

namespace {

constexpr auto kReplacementCharacter = std::string_view{"\xEF\xBF\xBD"};
constexpr auto kUrlSpamCount = std::size_t{8};
constexpr auto kRepeatedTokenMinimum = std::size_t{12};
constexpr auto kRepeatedTokenShare = 0.35;

const boost::regex& base64_pattern() {
  static const auto pattern =
      boost::regex{R"(\b(?:[A-Za-z0-9+/]{80,}={0,2})\b)"};
  return pattern;
}

const boost::regex& repeat_pattern() {
  static const auto pattern = boost::regex{R"(([\s\S])\1{15,})"};
  return pattern;
}

const boost::regex& url_pattern() {
  static const auto pattern = boost::regex{R"(https?://\S+)", boost::regex::icase};
  return pattern;
}

const boost::regex& html_pattern() {
  static const auto pattern = boost::regex{
      R"(<(?:!doctype|html|head|body|div|span|p|a|ul|ol|li|table|script|style)\b[^>]*>)",
      boost::regex::icase};
  return pattern;
}

const boost::regex& markdown_pattern() {
  static const auto pattern = boost::regex{
      R"((^|\n)[ \t]{0,3}(#{1,6}\s|[-*+]\s|\d+\.\s|>|\|.+\|)|```|\[[^\]]+\]\([^)]+\))"};
  return pattern;
}

std::string lower(std::string_view value) {
  auto out = std::string{value};
  std::transform(std::begin(out), std::end(out), std::begin(out),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string_view trim(std::string_view value) {
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.front()))) {
    value.remove_prefix(1);
  }
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }
  return value;
}

std::string replace_all(std::string value,
                        const std::string_view from,
                        const std::string_view to) {
  auto position = std::size_t{};
  while ((position = value.find(from, position)) != std::string::npos) {
    value.replace(position, from.size(), to);
    position += to.size();
  }
  return value;
}

std::vector<std::string> tokenize(std::string_view content) {
  auto tokens = std::vector<std::string>{};
  auto current = std::string{};
  for (const auto c : content) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!current.empty()) {
        tokens.push_back(std::move(current));
        current.clear();
      }
      continue;
    }
    current.push_back(
        static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

void append_utf8(std::string& out, const uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

std::string decode_html_entities(std::string_view content) {
  static const auto named = std::unordered_map<std::string, std::string_view>{
      {"nbsp", " "}, {"amp", "&"},  {"lt", "<"},
      {"gt", ">"},   {"quot", "\""}, {"#39", "'"}};

  auto out = std::string{};
  out.reserve(content.size());
  auto i = std::size_t{};
  while (i < content.size()) {
    if (content[i] != '&') {
      out.push_back(content[i++]);
      continue;
    }
    auto end = content.find(';', i);
    if (end == std::string_view::npos || end - i > 10) {
      out.push_back(content[i++]);
      continue;
    }
    auto entity = lower(content.substr(i + 1, end - i - 1));
    if (auto it = named.find(entity); it != std::end(named)) {
      out.append(it->second);
      i = end + 1;
      continue;
    }
    if (entity.size() > 1 && entity[0] == '#') {
      auto hex = entity[1] == 'x';
      auto digits = std::string_view{entity}.substr(hex ? 2 : 1);
      auto valid = !digits.empty() &&
                   std::all_of(std::begin(digits), std::end(digits),
                               [hex](unsigned char c) {
                                 return hex ? std::isxdigit(c) != 0
                                            : std::isdigit(c) != 0;
                               });
      auto code_point = valid && digits.size() <= 8
                            ? std::stoul(std::string{digits}, nullptr,
                                         hex ? 16 : 10)
                            : 0ul;
      // Surrogates and values past U+10FFFF have no UTF-8 form; leave those
      // entities as written.
      if (code_point > 0 && code_point <= 0x10FFFF &&
          (code_point < 0xD800 || code_point > 0xDFFF)) {
        append_utf8(out, static_cast<uint32_t>(code_point));
        i = end + 1;
        continue;
      }
    }
    out.push_back(content[i++]);
  }
  return out;
}

struct complexity_t final {
  double complexity_score{};
  double length_penalty{};
};

complexity_t score_length_complexity(std::string_view content) {
  auto tokens = tokenize(content);
  if (tokens.empty()) {
    return {0.0, 0.3};
  }

  auto unique = std::unordered_set<std::string>{std::begin(tokens),
                                                std::end(tokens)};
  auto unique_ratio =
      static_cast<double>(unique.size()) / static_cast<double>(tokens.size());
  auto punctuation = std::count_if(
      std::begin(content), std::end(content), [](const char c) {
        return std::string_view{".,;:!?()[]{}"}.find(c) !=
               std::string_view::npos;
      });
  auto punctuation_ratio =
      static_cast<double>(punctuation) /
      static_cast<double>(std::max<std::size_t>(1, content.size()));
  auto normalized_length = std::min(
      1.0, std::log10(static_cast<double>(content.size()) + 10.0) / 4.0);

  auto result = complexity_t{};
  result.complexity_score = unique_ratio * 0.65 + normalized_length * 0.25 +
                            std::min(1.0, punctuation_ratio * 20.0) * 0.1;
  if (tokens.size() < 5) {
    result.complexity_score -= 0.1;
  }
  result.complexity_score = std::clamp(result.complexity_score, 0.0, 1.0);

  auto length_ratio =
      static_cast<double>(content.size()) /
      static_cast<double>(std::max<std::size_t>(1, unique.size() * 12));
  if (length_ratio > 1.5) {
    result.length_penalty =
        std::clamp((length_ratio - 1.5) / 4.5, 0.0, 1.0) * 0.3;
  }
  return result;
}

validation_result_t rejection(const validation_input_t& input,
                              std::string reason) {
  auto result = validation_result_t{};
  result.accepted = false;
  result.source_type = canonicalize_source_type(input.source_type);
  result.source_id = input.source_id;
  result.rejection_reason = std::move(reason);
  return result;
}

}  // namespace

source_type_t canonicalize_source_type(const source_type_t type) {
  switch (type) {
    case source_type_t::user_input:
      return source_type_t::user_input;
    case source_type_t::tool_output:
      return source_type_t::tool_output;
    case source_type_t::web_scrape:
    case source_type_t::external:
      return source_type_t::web_scrape;
    case source_type_t::agent_inference:
    case source_type_t::system:
      return source_type_t::system;
  }
  return source_type_t::system;
}

double source_trust(const source_type_t type) {
  switch (canonicalize_source_type(type)) {
    case source_type_t::user_input:
      return kTrustUserInput;
    case source_type_t::tool_output:
      return kTrustToolOutput;
    case source_type_t::web_scrape:
      return kTrustWebScrape;
    default:
      return kTrustSystem;
  }
}

content_format_t detect_content_format(
    const std::string_view content,
    const std::optional<std::string>& declared_content_type) {
  if (declared_content_type) {
    auto declared = lower(trim(*declared_content_type));
    if (declared.find("json") != std::string::npos) {
      return content_format_t::json;
    }
    if (declared.find("html") != std::string::npos) {
      return content_format_t::html;
    }
    if (declared.find("markdown") != std::string::npos || declared == "md") {
      return content_format_t::markdown;
    }
    if (declared == "text") {
      return content_format_t::text;
    }
  }

  auto trimmed = trim(content);
  if (trimmed.empty()) {
    return content_format_t::text;
  }
  if ((trimmed.starts_with('{') && trimmed.ends_with('}')) ||
      (trimmed.starts_with('[') && trimmed.ends_with(']'))) {
    return content_format_t::json;
  }
  auto text = std::string{trimmed};
  if (boost::regex_search(text, html_pattern())) {
    return content_format_t::html;
  }
  if (boost::regex_search(text, markdown_pattern())) {
    return content_format_t::markdown;
  }
  return content_format_t::text;
}

bool has_encoding_artifacts(const std::string_view content) {
  if (content.find(kReplacementCharacter) != std::string_view::npos) {
    return true;
  }
  return std::any_of(std::begin(content), std::end(content), [](const char c) {
    auto byte = static_cast<unsigned char>(c);
    return (byte < 0x20 && byte != '\t' && byte != '\n' && byte != '\r') ||
           byte == 0x7F;
  });
}

std::string sanitize_html_to_text(const std::string_view content) {
  static const auto scripts =
      boost::regex{R"(<script[\s\S]*?</script>)", boost::regex::icase};
  static const auto styles =
      boost::regex{R"(<style[\s\S]*?</style>)", boost::regex::icase};
  static const auto comments = boost::regex{R"(<!--[\s\S]*?-->)"};
  static const auto tags = boost::regex{R"(<[^>]+>)"};
  static const auto whitespace = boost::regex{R"(\s+)"};

  auto text = std::string{content};
  text = boost::regex_replace(text, scripts, " ");
  text = boost::regex_replace(text, styles, " ");
  text = boost::regex_replace(text, comments, " ");
  text = boost::regex_replace(text, tags, " ");
  text = decode_html_entities(text);
  text = boost::regex_replace(text, whitespace, " ");
  return std::string{trim(text)};
}

std::string normalize_markdown(const std::string_view content) {
  static const auto blank_lines = boost::regex{R"(\n{3,})"};
  auto text = replace_all(std::string{content}, "\r\n", "\n");
  text = boost::regex_replace(text, blank_lines, "\n\n");
  return std::string{trim(text)};
}

std::vector<std::string> anomaly_flags(const std::string_view content) {
  auto flags = std::vector<std::string>{};
  auto text = std::string{content};

  if (boost::regex_search(text, base64_pattern())) {
    flags.emplace_back("base64_blob");
  }
  if (boost::regex_search(text, repeat_pattern())) {
    flags.emplace_back("repeated_characters");
  }
  auto urls = static_cast<std::size_t>(std::distance(
      boost::sregex_iterator{std::begin(text), std::end(text), url_pattern()},
      boost::sregex_iterator{}));
  if (urls >= kUrlSpamCount) {
    flags.emplace_back("url_spam_pattern");
  }

  auto tokens = tokenize(content);
  if (tokens.size() >= kRepeatedTokenMinimum) {
    auto counts = std::unordered_map<std::string, std::size_t>{};
    auto max_count = std::size_t{};
    for (const auto& token : tokens) {
      max_count = std::max(max_count, ++counts[token]);
    }
    if (static_cast<double>(max_count) / static_cast<double>(tokens.size()) >=
        kRepeatedTokenShare) {
      flags.emplace_back("repeated_tokens");
    }
  }
  return flags;
}

confidence_t compute_confidence_score(const source_type_t type,
                                      const std::string_view content) {
  static const auto penalties = std::unordered_map<std::string, double>{
      {"base64_blob", kPenaltyBase64Blob},
      {"repeated_characters", kPenaltyRepeatedCharacters},
      {"repeated_tokens", kPenaltyRepeatedTokens},
      {"url_spam_pattern", kPenaltyUrlSpam}};

  auto result = confidence_t{};
  result.anomaly_flags = anomaly_flags(content);
  auto complexity = score_length_complexity(content);

  auto anomaly_penalty = 0.0;
  for (const auto& flag : result.anomaly_flags) {
    if (auto it = penalties.find(flag); it != std::end(penalties)) {
      anomaly_penalty += it->second;
    }
  }

  result.confidence_score = std::clamp(
      source_trust(type) * 0.6 + complexity.complexity_score * 0.4 -
          anomaly_penalty - complexity.length_penalty,
      0.0, 1.0);
  return result;
}

validation_result_t validate_memory_entry(const validation_input_t& input,
                                          const validation_config_t& config) {
  auto source_type = canonicalize_source_type(input.source_type);
  auto notes = std::vector<std::string>{};

  auto content = replace_all(input.content, "\r\n", "\n");
  if (trim(content).empty()) {
    return rejection(input, "Memory content is empty");
  }
  if (has_encoding_artifacts(content)) {
    return rejection(input, "Memory content contains encoding artifacts");
  }

  auto detected = content_format_t::text;
  auto content_type = std::string{"text"};
  try {
    detected = detect_content_format(content, input.declared_content_type);
    switch (detected) {
      case content_format_t::json:
        content = std::string{trim(content)};
        content_type = "json";
        break;
      case content_format_t::html:
        content = sanitize_html_to_text(content);
        notes.emplace_back("HTML sanitized to plain text");
        break;
      case content_format_t::markdown:
        content = normalize_markdown(content);
        content_type = "markdown";
        notes.emplace_back("Markdown normalized");
        break;
      case content_format_t::text:
        content = std::string{trim(content)};
        break;
    }
  } catch (const std::runtime_error& e) {
    spdlog::warn("Normalization of memory from {} failed: {}", input.source_id,
                 e.what());
    return rejection(input, "Memory content could not be normalized");
  }

  if (trim(content).empty()) {
    return rejection(input, "Memory content is empty after normalization");
  }
  if (has_encoding_artifacts(content)) {
    return rejection(
        input, "Memory content contains encoding artifacts after normalization");
  }

  if (content.size() > config.max_entry_length) {
    if (content_type == "json") {
      return rejection(input, fmt::format("JSON memory exceeds max length ({})",
                                          config.max_entry_length));
    }
    auto cut = config.max_entry_length;
    while (cut > 0 &&
           (static_cast<unsigned char>(content[cut]) & 0xC0) == 0x80) {
      --cut;
    }
    content.resize(cut);
    notes.push_back(
        fmt::format("Content truncated to {} chars", config.max_entry_length));
  }

  auto confidence = confidence_t{};
  try {
    confidence = compute_confidence_score(source_type, content);
  } catch (const std::runtime_error& e) {
    spdlog::warn("Scoring of memory from {} failed: {}", input.source_id,
                 e.what());
    return rejection(input, "Memory content could not be scored");
  }

  auto result = validation_result_t{};
  result.accepted = true;
  result.quarantined = confidence.confidence_score < config.quarantine_threshold;
  result.source_type = source_type;
  result.source_id = input.source_id;
  result.normalized_content = std::move(content);
  result.normalized_content_type = std::move(content_type);
  result.detected_format = detected;
  result.confidence_score = confidence.confidence_score;
  result.anomaly_flags = std::move(confidence.anomaly_flags);
  result.validation_notes = std::move(notes);
  return result;
}

validator_t make_default_validator(validation_config_t config) {
  return [config](const validation_input_t& input) {
    return validate_memory_entry(input, config);
  };
}

}  // namespace mnemo::validation
