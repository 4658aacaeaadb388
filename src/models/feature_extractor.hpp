#ifndef FEATURE_EXTRACTOR_HPP
#define FEATURE_EXTRACTOR_HPP

#include "models/features.hpp"
#include "models/page_metadata.hpp"

#include <chrono>
#include <string>
#include <vector>

// Wall-clock context for the temporal block. Passed in explicitly so the
// vector is a pure function of its inputs.
struct TimeContext {
  int hour = 0;    // 0-23, local time
  int weekday = 0; // 0 = Monday ... 6 = Sunday

  static TimeContext from_time_point(std::chrono::system_clock::time_point tp);
  static TimeContext now();
};

class FeatureExtractor {
public:
  // Always returns FeatureLayout::FEATURE_COUNT values. Missing metadata
  // reads as zero/empty; nothing here throws on malformed input.
  std::vector<double> extract(const PageMetadata &metadata,
                              const std::string &mission,
                              const TimeContext &when) const;

  // URL-only variant, equivalent to extract(PageMetadata::basic(url), ...)
  std::vector<double> extract(const std::string &url,
                              const std::string &mission,
                              const TimeContext &when) const;

  // The text the content-lexical block is computed over
  static std::string compose_content_text(const PageMetadata &metadata,
                                          const std::string &mission);

  // Stable pseudo-text feature in [0, 1)
  static double hash_feature(const std::string &key);

private:
  void fill_url_text(std::vector<double> &out, const std::string &url) const;
  void fill_mission_text(std::vector<double> &out,
                         const std::string &mission) const;
  void fill_content_text(std::vector<double> &out,
                         const std::string &content_text) const;
  void fill_structural(std::vector<double> &out,
                       const PageMetadata &metadata) const;
  void fill_content(std::vector<double> &out,
                    const PageMetadata &metadata) const;
  void fill_temporal(std::vector<double> &out, const TimeContext &when) const;
};

#endif // FEATURE_EXTRACTOR_HPP
