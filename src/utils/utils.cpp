#include "utils/utils.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace Utils {

std::string url_decode(std::string_view encoded_string) {
  std::ostringstream decoded_stream;

  for (size_t i = 0; i < encoded_string.length(); i++) {
    if (encoded_string[i] == '%' && i + 2 < encoded_string.length()) {
      unsigned int decoded = 0;
      auto hex = encoded_string.substr(i + 1, 2);
      auto [ptr, ec] =
          std::from_chars(hex.data(), hex.data() + hex.size(), decoded, 16);
      if (ec == std::errc() && ptr == hex.data() + hex.size()) {
        decoded_stream << static_cast<char>(decoded);
        i += 2;
      } else {
        decoded_stream << '%';
      }
    } else if (encoded_string[i] == '+')
      decoded_stream << ' ';
    else
      decoded_stream << encoded_string[i];
  }
  return decoded_stream.str();
}

std::vector<std::string> split_string(const std::string &text, char delimiter) {
  std::vector<std::string> tokens;
  std::string current_token;
  std::istringstream token_stream(text);

  while (std::getline(token_stream, current_token, delimiter)) {
    tokens.push_back(current_token);
  }
  return tokens;
}

std::vector<std::string_view> split_string_view(std::string_view str,
                                                char delimiter) {
  std::vector<std::string_view> result;
  size_t start = 0;
  size_t end = str.find(delimiter);
  while (end != std::string_view::npos) {
    result.push_back(str.substr(start, end - start));
    start = end + 1;
    end = str.find(delimiter, start);
  }
  result.push_back(str.substr(start));
  return result;
}

std::vector<std::string> split_whitespace(std::string_view text) {
  std::vector<std::string> tokens;
  std::string current;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!current.empty()) {
        tokens.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(c);
    }
  }
  if (!current.empty())
    tokens.push_back(current);
  return tokens;
}

std::string join(const std::vector<std::string> &parts,
                 std::string_view separator) {
  std::string result;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0)
      result.append(separator);
    result.append(parts[i]);
  }
  return result;
}

uint64_t get_current_time_ms() {
  auto now = std::chrono::system_clock::now();
  auto epoch = now.time_since_epoch();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(epoch);
  return ms.count();
}

std::string to_lower_copy(std::string_view sv) {
  std::string s{sv};
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

bool starts_with(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() &&
         text.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view text, std::string_view suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

UrlParts parse_url(std::string_view url) {
  UrlParts parts;
  parts.lowered = to_lower_copy(trim_copy(url));
  std::string_view rest = parts.lowered;

  size_t scheme_end = rest.find("://");
  if (scheme_end != std::string_view::npos) {
    parts.scheme = std::string(rest.substr(0, scheme_end));
    rest.remove_prefix(scheme_end + 3);
  }

  size_t authority_end = rest.find_first_of("/?#");
  std::string_view authority = rest.substr(0, authority_end);
  rest = authority_end == std::string_view::npos ? std::string_view{}
                                                 : rest.substr(authority_end);

  size_t at = authority.rfind('@');
  if (at != std::string_view::npos)
    authority.remove_prefix(at + 1);
  if (!authority.empty() && authority.front() == '[') {
    // IPv6 literal keeps its colons
    size_t close = authority.find(']');
    authority = authority.substr(0, close == std::string_view::npos
                                        ? authority.size()
                                        : close + 1);
  } else {
    size_t colon = authority.find(':');
    if (colon != std::string_view::npos)
      authority = authority.substr(0, colon);
  }
  if (starts_with(authority, "www."))
    authority.remove_prefix(4);
  while (!authority.empty() && authority.back() == '.')
    authority.remove_suffix(1);
  parts.host = std::string(authority);

  size_t fragment = rest.find('#');
  if (fragment != std::string_view::npos)
    rest = rest.substr(0, fragment);

  size_t query_start = rest.find('?');
  parts.path = std::string(rest.substr(0, query_start));
  if (query_start != std::string_view::npos) {
    parts.query = std::string(rest.substr(query_start + 1));
    for (auto pair : split_string_view(parts.query, '&')) {
      if (pair.empty())
        continue;
      auto name = pair.substr(0, pair.find('='));
      if (!name.empty() &&
          std::find(parts.query_param_names.begin(),
                    parts.query_param_names.end(),
                    name) == parts.query_param_names.end())
        parts.query_param_names.emplace_back(name);
    }
  }
  return parts;
}

bool host_matches_domain(std::string_view host, std::string_view domain) {
  if (host.empty() || domain.empty())
    return false;
  if (host == domain)
    return true;
  return host.size() > domain.size() && ends_with(host, domain) &&
         host[host.size() - domain.size() - 1] == '.';
}

bool write_file_atomically(const std::string &path,
                           const std::string &content) {
  std::error_code ec;
  std::filesystem::path target(path);
  if (target.has_parent_path())
    std::filesystem::create_directories(target.parent_path(), ec);

  // One temp file per writer so concurrent saves never share it
  std::string temp_path =
      path + ".tmp." + std::to_string(::getpid()) + "." +
      std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()));
  {
    std::ofstream out(temp_path, std::ios::trunc);
    if (!out.is_open())
      return false;
    out << content;
    out.flush();
    if (!out.good())
      return false;
  }

  std::filesystem::rename(temp_path, target, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    return false;
  }
  return true;
}

} // namespace Utils
