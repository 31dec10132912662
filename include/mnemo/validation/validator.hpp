#pragma once

#include <mnemo/schema/content_format.hpp>
#include <mnemo/schema/source_type.hpp>
#include <mnemo/schema/validation_config.hpp>
#include <mnemo/schema/validation_input.hpp>
#include <mnemo/schema/validation_result.hpp>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mnemo::validation {

/// Injectable ingestion collaborator used by the lifecycle manager.
using validator_t = std::function<mnemo::schema::validation_result_t(
    const mnemo::schema::validation_input_t&)>;

inline constexpr auto kTrustUserInput = 0.95;
inline constexpr auto kTrustSystem = 0.85;
inline constexpr auto kTrustToolOutput = 0.72;
inline constexpr auto kTrustWebScrape = 0.58;

inline constexpr auto kPenaltyBase64Blob = 0.35;
inline constexpr auto kPenaltyRepeatedCharacters = 0.2;
inline constexpr auto kPenaltyRepeatedTokens = 0.2;
inline constexpr auto kPenaltyUrlSpam = 0.15;

/// external folds into web_scrape and agent_inference into system.
mnemo::schema::source_type_t canonicalize_source_type(
    mnemo::schema::source_type_t type);

double source_trust(mnemo::schema::source_type_t type);

/// Declared type wins when it names a known format; otherwise the content
/// is sniffed for JSON brackets, HTML tags and markdown hints.
mnemo::schema::content_format_t detect_content_format(
    std::string_view content,
    const std::optional<std::string>& declared_content_type = std::nullopt);

/// Control characters other than tab, newline and carriage return, or the
/// U+FFFD replacement character.
bool has_encoding_artifacts(std::string_view content);

std::string sanitize_html_to_text(std::string_view content);
std::string normalize_markdown(std::string_view content);

std::vector<std::string> anomaly_flags(std::string_view content);

struct confidence_t final {
  double confidence_score{};
  std::vector<std::string> anomaly_flags;
};

/// clamp(trust * 0.6 + complexity * 0.4 - anomaly penalties - length
/// penalty).
confidence_t compute_confidence_score(mnemo::schema::source_type_t type,
                                      std::string_view content);

/// Default collaborator: rejects empty or corrupt content, normalizes by
/// detected format, truncates oversize text and quarantines low
/// confidence input.
mnemo::schema::validation_result_t validate_memory_entry(
    const mnemo::schema::validation_input_t& input,
    const mnemo::schema::validation_config_t& config =
        mnemo::schema::validation_config_t{});

validator_t make_default_validator(
    mnemo::schema::validation_config_t config =
        mnemo::schema::validation_config_t{});

}  // namespace mnemo::validation
