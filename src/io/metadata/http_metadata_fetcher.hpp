#ifndef HTTP_METADATA_FETCHER_HPP
#define HTTP_METADATA_FETCHER_HPP

#include "core/config.hpp"
#include "io/metadata/metadata_fetcher.hpp"

#include <string>

// Fetches a page with cpp-httplib and lifts the handful of fields the
// classifier uses. This is not an HTML parser: only <title>, the description
// meta tags and a few presence markers are read.
class HttpMetadataFetcher : public IMetadataFetcher {
public:
  explicit HttpMetadataFetcher(const Config::MetadataFetchConfig &config);

  // Throws std::runtime_error on a malformed URL or a failed request
  PageMetadata fetch(const std::string &url) override;

  // Exposed for tests
  static void extract_from_html(const std::string &html,
                                PageMetadata &metadata);

private:
  Config::MetadataFetchConfig config_;
};

#endif // HTTP_METADATA_FETCHER_HPP
