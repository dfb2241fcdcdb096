#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declare PCRE2 types to avoid header pollution
struct pcre2_real_code_8;

namespace csrfguard::http {

// PCRE2 wrapper for regex compilation and execution
// Thread-safe for read operations after compilation
class Regex {
public:
    // Compile a regex pattern
    // Returns nullopt if compilation fails
    [[nodiscard]] static std::optional<Regex> compile(std::string_view pattern);

    // Compile a regex pattern with error message
    [[nodiscard]] static std::optional<Regex> compile(std::string_view pattern,
                                                      std::string& error_message);

    // Move-only type (manages PCRE2 resources)
    Regex(Regex&& other) noexcept;
    Regex& operator=(Regex&& other) noexcept;
    ~Regex();

    // Delete copy operations
    Regex(const Regex&) = delete;
    Regex& operator=(const Regex&) = delete;

    // Extract capture groups from first match
    // Returns empty vector if no match
    // Index 0 is the full match, 1+ are capture groups
    [[nodiscard]] std::vector<std::string_view> extract_groups(std::string_view subject) const;

    // Get the pattern string
    [[nodiscard]] std::string_view pattern() const { return pattern_; }

private:
    explicit Regex(pcre2_real_code_8* code, std::string pattern);

    pcre2_real_code_8* code_;  // Compiled regex (owned)
    std::string pattern_;      // Original pattern (for debugging)
};

// Utility function for URL decoding
namespace url {

// URL decode a string (percent-decoding, '+' is a space)
// Returns nullopt if invalid encoding (e.g., incomplete % sequence)
[[nodiscard]] std::optional<std::string> decode(std::string_view str);

}  // namespace url

}  // namespace csrfguard::http
