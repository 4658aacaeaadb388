#ifndef DOMAIN_LISTS_HPP
#define DOMAIN_LISTS_HPP

// Curated lists behind the rule tier. Hosts match exactly or as a dot-bounded
// suffix; paths are matched per segment.
namespace DomainLists {

// Tier 1: short-form feeds, blocked before any allow rule
inline constexpr const char *YOUTUBE_SHORTS_MARKERS[] = {
    "/shorts", "el=shortspage", "reel_watch_sequence", "reel_item_watch",
    "youtubei/v1/reel"};
inline constexpr const char *INSTAGRAM_REEL_PATHS[] = {"/reels", "/reel/"};

// Tier 2: streaming and static-asset infrastructure
inline constexpr const char *INFRASTRUCTURE_HOSTS[] = {
    "googlevideo.com", "ggpht.com",  "ytimg.com",  "gstatic.com",
    "googleusercontent.com", "googleapis.com", "google.com"};
inline constexpr const char *YOUTUBE_INFRASTRUCTURE_PATHS[] = {
    "/api/stats", "/videoplayback", "/get_video_info", "/iframe_api",
    "/embed",     "/player",        "/s/player",       "/feather",
    "/iframe",    "/static",        "/yt",             "/accounts",
    "/channel",   "/user",          "/c",              "/playlist",
    "/results",   "/search"};

// Tier 3: productive and educational sites
inline constexpr const char *EDUCATIONAL_DOMAINS[] = {
    "github.com",         "stackoverflow.com",
    "wikipedia.org",      "docs.python.org",
    "python.org",         "realpython.com",
    "geeksforgeeks.org",  "tutorialspoint.com",
    "w3schools.com",      "mdn.io",
    "developer.mozilla.org", "kaggle.com",
    "coursera.org",       "edx.org",
    "udemy.com",          "freecodecamp.org",
    "leetcode.com",       "hackerrank.com",
    "codewars.com",       "exercism.io",
    "rust-lang.org",      "golang.org",
    "nodejs.org",         "reactjs.org",
    "vuejs.org",          "angular.io",
    "djangoproject.com",  "flask.palletsprojects.com",
    "fastapi.tiangolo.com", "pytorch.org",
    "tensorflow.org",     "scikit-learn.org",
    "pandas.pydata.org",  "numpy.org",
    "matplotlib.org",     "seaborn.pydata.org",
    "plotly.com",         "jupyter.org",
    "anaconda.com",       "conda.io"};

// Tier 4: known distractions
inline constexpr const char *DISTRACTION_DOMAINS[] = {
    "facebook.com",   "snapchat.com",    "reddit.com",     "9gag.com",
    "imgur.com",      "buzzfeed.com",    "vice.com",       "vox.com",
    "huffpost.com",   "dailymail.co.uk", "thesun.co.uk",   "tmz.com",
    "eonline.com",    "people.com",      "usmagazine.com", "justjared.com",
    "popsugar.com",   "refinery29.com",  "bustle.com",     "cosmopolitan.com",
    "elle.com",       "vogue.com",       "glamour.com",    "seventeen.com",
    "teenvogue.com",  "tumblr.com",      "deviantart.com", "flickr.com",
    "500px.com",      "behance.net",     "dribbble.com",   "artstation.com"};

// Tier 5: algorithmic feed pages
struct PlatformFeed {
  const char *host;
  const char *path;
};
inline constexpr PlatformFeed PLATFORM_FEEDS[] = {
    {"instagram.com", "/explore"}, {"x.com", "/home"},
    {"x.com", "/explore"},         {"twitter.com", "/home"},
    {"twitter.com", "/explore"},   {"youtube.com", "/feed"},
    {"youtube.com", "/trending"}};
inline constexpr const char *FEED_PATH_SEGMENTS[] = {
    "feed", "home", "timeline", "stories", "reels", "shorts"};

// Tier 6: video watch endpoints and the keywords that mark them educational
inline constexpr const char *VIDEO_PLATFORM_HOSTS[] = {"youtube.com",
                                                       "youtube-nocookie.com"};
inline constexpr const char *SHORT_LINK_HOSTS[] = {"youtu.be"};
inline constexpr const char *VIDEO_PLAYER_MARKERS[] = {"youtubei/v1/player"};
inline constexpr const char *EDUCATIONAL_URL_KEYWORDS[] = {
    "tutorial", "course", "learn", "education", "how to", "guide", "lesson"};

// Tier 7
inline constexpr const char *SEARCH_ENGINES[] = {"google.com", "bing.com",
                                                 "duckduckgo.com", "yahoo.com"};

} // namespace DomainLists

#endif // DOMAIN_LISTS_HPP
