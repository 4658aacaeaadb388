#include "io/metadata/http_metadata_fetcher.hpp"
#include "core/logger.hpp"
#include "httplib.h"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

namespace {

// Value of attr="..." or attr='...' inside a single tag
std::string attribute_value(const std::string &lowered_tag,
                            const std::string &original_tag,
                            const std::string &attr) {
  size_t pos = 0;
  while ((pos = lowered_tag.find(attr, pos)) != std::string::npos) {
    bool bounded = pos == 0 || std::isspace(static_cast<unsigned char>(
                                   lowered_tag[pos - 1]));
    size_t cursor = pos + attr.size();
    pos = cursor;
    if (!bounded)
      continue;
    while (cursor < lowered_tag.size() &&
           std::isspace(static_cast<unsigned char>(lowered_tag[cursor])))
      ++cursor;
    if (cursor >= lowered_tag.size() || lowered_tag[cursor] != '=')
      continue;
    ++cursor;
    while (cursor < lowered_tag.size() &&
           std::isspace(static_cast<unsigned char>(lowered_tag[cursor])))
      ++cursor;
    if (cursor >= lowered_tag.size())
      return {};
    char quote = lowered_tag[cursor];
    if (quote != '"' && quote != '\'')
      continue;
    size_t end = lowered_tag.find(quote, cursor + 1);
    if (end == std::string::npos)
      return {};
    return original_tag.substr(cursor + 1, end - cursor - 1);
  }
  return {};
}

std::string collapse_whitespace(const std::string &text) {
  return Utils::join(Utils::split_whitespace(text), " ");
}

} // namespace

HttpMetadataFetcher::HttpMetadataFetcher(
    const Config::MetadataFetchConfig &config)
    : config_(config) {}

PageMetadata HttpMetadataFetcher::fetch(const std::string &url) {
  // Group 1: scheme, group 2: host[:port], group 3: path and query
  static const std::regex url_regex(R"(^(https?)://([^/?#]+)([^#]*))",
                                    std::regex::icase);
  std::smatch match;
  if (!std::regex_search(url, match, url_regex))
    throw std::runtime_error("unsupported URL for metadata fetch: " + url);

  const bool is_https = Utils::to_lower_copy(match[1].str()) == "https";
  const std::string host = match[2].str();
  const std::string path = match[3].length() > 0 ? match[3].str() : "/";

  std::string body;
  const size_t max_bytes = config_.max_content_bytes;
  auto receive = [&](const char *data, size_t length) {
    size_t room = max_bytes > body.size() ? max_bytes - body.size() : 0;
    body.append(data, std::min(length, room));
    return body.size() < max_bytes;
  };

  int status = 0;
  auto send_request = [&](auto &client) {
    client.set_connection_timeout(config_.request_timeout_seconds, 0);
    client.set_read_timeout(config_.request_timeout_seconds, 0);
    client.set_follow_location(true);
    httplib::Headers headers = {{"User-Agent", config_.user_agent}};
    auto res = client.Get(path, headers, receive);
    if (res) {
      status = res->status;
    } else if (body.empty()) {
      throw std::runtime_error("fetch of " + url +
                               " failed: " + httplib::to_string(res.error()));
    }
  };

  if (is_https) {
    httplib::SSLClient client(host);
    send_request(client);
  } else {
    httplib::Client client(host);
    send_request(client);
  }

  if (status >= 400)
    throw std::runtime_error("fetch of " + url + " returned HTTP " +
                             std::to_string(status));

  PageMetadata metadata = PageMetadata::basic(url);
  metadata.content_length = body.size();
  extract_from_html(body, metadata);
  MetadataScoring::score_content(metadata);

  LOG(LogLevel::DEBUG, LogComponent::IO_FETCH,
      "Fetched " << url << " (" << body.size() << " bytes, title '"
                 << metadata.title << "')");
  return metadata;
}

void HttpMetadataFetcher::extract_from_html(const std::string &html,
                                            PageMetadata &metadata) {
  const std::string lowered = Utils::to_lower_copy(html);

  size_t title_open = lowered.find("<title");
  if (title_open != std::string::npos) {
    size_t content_start = lowered.find('>', title_open);
    size_t title_close = lowered.find("</title>", title_open);
    if (content_start != std::string::npos &&
        title_close != std::string::npos && content_start < title_close)
      metadata.title = collapse_whitespace(
          html.substr(content_start + 1, title_close - content_start - 1));
  }

  size_t pos = 0;
  while ((pos = lowered.find("<meta", pos)) != std::string::npos) {
    size_t end = lowered.find('>', pos);
    if (end == std::string::npos)
      break;
    const std::string lowered_tag = lowered.substr(pos, end - pos);
    const std::string tag = html.substr(pos, end - pos);
    pos = end;

    const std::string name =
        Utils::to_lower_copy(attribute_value(lowered_tag, tag, "name"));
    const std::string property =
        Utils::to_lower_copy(attribute_value(lowered_tag, tag, "property"));
    const std::string content = attribute_value(lowered_tag, tag, "content");
    if (content.empty())
      continue;

    if (name == "description" && metadata.description.empty())
      metadata.description = collapse_whitespace(content);
    else if (name == "keywords" && metadata.keywords.empty()) {
      for (auto &keyword : Utils::split_string(content, ','))
        if (!Utils::trim_copy(keyword).empty())
          metadata.keywords.push_back(Utils::trim_copy(keyword));
    } else if (property == "og:title")
      metadata.video_title = collapse_whitespace(content);
    else if (property == "og:description")
      metadata.video_description = collapse_whitespace(content);
  }

  // og: tags only describe a video on pages that actually embed one
  metadata.has_video = Utils::contains(lowered, "<video") ||
                       Utils::contains(lowered, "og:video");
  if (!metadata.has_video) {
    metadata.video_title.clear();
    metadata.video_description.clear();
  }
  metadata.has_forms = Utils::contains(lowered, "<form");
}
