#ifndef METADATA_FETCHER_HPP
#define METADATA_FETCHER_HPP

#include "models/page_metadata.hpp"

#include <string>

// Content-fetch collaborator. Implementations may block and may throw;
// BoundedMetadataSource puts the deadline and the error policy around them.
class IMetadataFetcher {
public:
  virtual ~IMetadataFetcher() = default;
  virtual PageMetadata fetch(const std::string &url) = 0;
};

#endif // METADATA_FETCHER_HPP
