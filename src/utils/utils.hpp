#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace Utils {
std::vector<std::string> split_string(const std::string &text, char delimiter);
std::vector<std::string_view> split_string_view(std::string_view str,
                                                char delimiter);
// Splits on any run of whitespace, dropping empty tokens
std::vector<std::string> split_whitespace(std::string_view text);
std::string join(const std::vector<std::string> &parts,
                 std::string_view separator);
uint64_t get_current_time_ms();
std::string url_decode(std::string_view encoded_string);

std::string to_lower_copy(std::string_view sv);
bool contains(std::string_view haystack, std::string_view needle);
bool starts_with(std::string_view text, std::string_view prefix);
bool ends_with(std::string_view text, std::string_view suffix);

// Components of a URL. Parsing never fails: anything that cannot be
// recognised is left empty.
struct UrlParts {
  std::string lowered; // the whole URL, lower-cased
  std::string scheme;
  std::string host; // lower-cased, no userinfo, no port, no leading "www."
  std::string path; // always starts with '/' when non-empty
  std::string query;
  std::vector<std::string> query_param_names;
};

UrlParts parse_url(std::string_view url);

// True when host equals domain or is a subdomain of it on a dot boundary.
bool host_matches_domain(std::string_view host, std::string_view domain);

// Writes to a temp file unique to the calling process and thread, then
// renames over the target. Concurrent writers each land a complete file; the
// last rename wins. Returns false on any filesystem error.
bool write_file_atomically(const std::string &path, const std::string &content);

template <typename T> std::optional<T> string_to_number(std::string_view s) {
  if (s.empty() || s == "-") {
    if constexpr (std::is_floating_point_v<T>)
      return static_cast<T>(0.0);
    if constexpr (std::is_integral_v<T>)
      return static_cast<T>(0);
    return std::nullopt;
  }

  T value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

  if (ec == std::errc() && ptr == s.data() + s.size())
    return value;
  return std::nullopt;
}

inline void ltrim_inplace(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
            return !std::isspace(ch);
          }));
}

inline void rtrim_inplace(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
}

inline void trim_inplace(std::string &s) {
  ltrim_inplace(s);
  rtrim_inplace(s);
}

inline std::string trim_copy(std::string_view sv) {
  std::string s{sv};
  trim_inplace(s);
  return s;
}
} // namespace Utils

#endif // UTILS_HPP
